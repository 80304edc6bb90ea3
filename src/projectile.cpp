#include "projectile.hpp"

#include <algorithm>
#include <cmath>

Vec2i Projectile::tile() const {
    return {static_cast<int>(std::lround(x)), static_cast<int>(std::lround(y))};
}

const char* Projectile::glyph() const {
    if (kind == ProjectileKind::FireOil) return "o";
    return dir.x != 0 ? "-" : "|";
}

Projectile makeArrow(Vec2i from, Vec2i dir, int damage, double now) {
    Projectile p;
    p.kind = ProjectileKind::Arrow;
    p.x = static_cast<float>(from.x);
    p.y = static_cast<float>(from.y);
    p.dir = {sign(dir.x), sign(dir.y)};
    p.speed = ARROW_SPEED;
    p.maxDistance = ARROW_MAX_DISTANCE;
    p.spawnTime = now;
    p.damage = std::max(1, damage);
    p.type = DamageType::Physical;
    return p;
}

Projectile makeFireOil(Vec2i from, Vec2i dir, double now) {
    Projectile p;
    p.kind = ProjectileKind::FireOil;
    p.x = static_cast<float>(from.x);
    p.y = static_cast<float>(from.y);
    p.dir = {sign(dir.x), sign(dir.y)};
    p.speed = FIRE_OIL_SPEED;
    p.maxDistance = FIRE_OIL_MAX_DISTANCE;
    p.spawnTime = now;
    p.damage = FIRE_OIL_DAMAGE;
    p.type = DamageType::Fire;
    return p;
}

ProjectileStep advanceProjectile(Projectile& p, float dt, const Floor& floor, const OccupiedFn& occupied) {
    ProjectileStep out;
    if (p.dead) return out;
    if (isZero(p.dir)) {
        p.dead = true;
        out.stopped = true;
        out.impact = p.tile();
        return out;
    }

    float remaining = std::max(0.0f, p.speed * dt);
    Vec2i lastTile = p.tile();
    while (remaining > 0.0f) {
        const float step = std::min(0.5f, remaining);
        remaining -= step;

        p.x += static_cast<float>(p.dir.x) * step;
        p.y += static_cast<float>(p.dir.y) * step;
        p.traveled += step;

        const Vec2i t = p.tile();
        if (!floor.isWalkable(t)) {
            p.dead = true;
            out.stopped = true;
            out.impact = lastTile;
            return out;
        }
        if (t != lastTile && occupied && occupied(t)) {
            p.dead = true;
            out.stopped = true;
            out.impact = t;
            return out;
        }
        lastTile = t;

        if (p.traveled >= p.maxDistance) {
            p.dead = true;
            out.stopped = true;
            out.impact = t;
            return out;
        }
    }
    return out;
}

std::vector<Vec2i> impactArea(Vec2i center, int radius) {
    if (radius <= 1) return {center};
    std::vector<Vec2i> out;
    for (int dy = -radius; dy <= radius; ++dy) {
        for (int dx = -radius; dx <= radius; ++dx) {
            if (dx * dx + dy * dy <= radius * radius) out.push_back({center.x + dx, center.y + dy});
        }
    }
    return out;
}
