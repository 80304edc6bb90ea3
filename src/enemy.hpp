#pragma once

#include "boss.hpp"
#include "combat_rules.hpp"
#include "common.hpp"
#include "content.hpp"
#include "cooldown.hpp"
#include "status_effects.hpp"

#include <optional>
#include <string>
#include <vector>

constexpr int ENEMY_ATTACK_TICKS = 65;
constexpr float ENEMY_MOVE_ACCUM_CAP = 2.0f;

struct Enemy {
    int id = 0;
    std::string name;
    Vec2i pos{};

    float speed = 0.1f;     // tiles per tick
    float baseSpeed = 0.1f; // restored after temporary boosts
    int maxHp = 10;
    int hp = 10;
    Rarity rarity = Rarity::Fighter;
    Element element = Element::Undead;

    std::vector<EnemyAttack> attacks;
    std::vector<Cooldown> attackCooldowns; // parallel to attacks
    std::optional<EnemyUltimate> ultimate;
    Cooldown ultimateCooldown;
    std::vector<Buff> buffs;

    int detectionRadius = 5;
    Vec2i spawn{};
    std::optional<int> leashRadius;

    float moveAccum = 0.0f;
    int attackTicks = 0;
    float knockX = 0.0f;
    float knockY = 0.0f;
    std::optional<double> damagedAt;

    StatusEffects status;
    float dotCarry = 0.0f;
    float regenCarry = 0.0f;

    bool dead = false;
    bool collision = true;

    std::optional<BossState> boss;

    bool alive() const { return !dead && hp > 0; }
    bool isGhost() const { return element == Element::Ghost; }
    bool isBoss() const { return boss.has_value() || rarity == Rarity::Boss; }

    // Percent of max health in [0,100]; max health floors at 1.
    float healthPercent() const;

    // Clamps hp into [0, maxHp] and flags death at zero.
    void setHp(int v);
};

// Builds a catalog enemy. Detection radius follows rarity and difficulty.
Enemy makeEnemy(const EnemyTemplate& t, int id, Vec2i pos, Difficulty d);

// Builds a roster boss (boss floors).
Enemy makeBoss(BossKind k, int id, Vec2i pos, Difficulty d, double now);

// Damage roll for a catalog attack (inclusive range).
int rollAttackDamage(const EnemyAttack& a, RNG& rng);

// Ultimate damage: base * power multiplier, at least 1.
int ultimateDamage(const EnemyUltimate& u);
