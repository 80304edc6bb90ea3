#pragma once

#include "combat_rules.hpp"
#include "common.hpp"
#include "floor.hpp"

#include <cstdint>
#include <functional>
#include <vector>

enum class ProjectileKind : uint8_t {
    Arrow = 0,
    FireOil,
};

constexpr float ARROW_SPEED = 8.0f;
constexpr float ARROW_MAX_DISTANCE = 50.0f;
constexpr float FIRE_OIL_SPEED = 10.0f;
constexpr float FIRE_OIL_MAX_DISTANCE = 12.0f;
constexpr int FIRE_OIL_RADIUS = 4;
constexpr int FIRE_OIL_DAMAGE = 8;
constexpr float FIRE_OIL_BURN_SEC = 3.0f;

struct Projectile {
    ProjectileKind kind = ProjectileKind::Arrow;

    float x = 0.0f;
    float y = 0.0f;
    Vec2i dir{1, 0};
    float speed = ARROW_SPEED;
    float maxDistance = ARROW_MAX_DISTANCE;
    float traveled = 0.0f;
    double spawnTime = 0.0;
    bool dead = false;

    int damage = 1;
    DamageType type = DamageType::Physical;

    Vec2i tile() const;
    int impactRadius() const { return kind == ProjectileKind::FireOil ? FIRE_OIL_RADIUS : 1; }
    const char* glyph() const;
};

Projectile makeArrow(Vec2i from, Vec2i dir, int damage, double now);
Projectile makeFireOil(Vec2i from, Vec2i dir, double now);

// Returns true if an entity occupies the tile (the shooter excluded).
using OccupiedFn = std::function<bool(Vec2i tile)>;

struct ProjectileStep {
    bool stopped = false;
    Vec2i impact{};
};

// Moves the projectile by speed*dt along its direction in sub-steps of at most
// half a tile. Stops on a wall (impact = last open tile), an occupied tile, or
// the distance limit.
ProjectileStep advanceProjectile(Projectile& p, float dt, const Floor& floor, const OccupiedFn& occupied);

// Radius 1 is the single impact tile; larger radii are disks (dx^2+dy^2 <= r^2).
std::vector<Vec2i> impactArea(Vec2i center, int radius);
