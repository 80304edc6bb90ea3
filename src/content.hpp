#pragma once

#include "attack_pattern.hpp"
#include "combat_rules.hpp"
#include "common.hpp"
#include "status_effects.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

// Enemy catalog: plain records assembled into Enemies at spawn time.

struct AttackEffect {
    StatusKind kind = StatusKind::Cripple;
    float duration = 1.0f;
    float dps = 0.0f;
};

struct EnemyAttack {
    std::string name;
    int minDamage = 1;
    int maxDamage = 1;
    DamageType type = DamageType::Physical;
    int reach = 1;
    int areaRadius = 0;
    std::optional<AttackEffect> effect;
    float cooldown = 2.0f;
    AttackPattern pattern;
};

enum class UltimatePower : uint8_t {
    Weak = 0,
    Average,
    Devastating,
};

// Weak 1.0, Average 1.5, Devastating 2.5
float ultimatePowerMultiplier(UltimatePower p);

struct EnemyUltimate {
    std::string name;
    UltimatePower power = UltimatePower::Weak;
    int baseDamage = 0;
    int areaRadius = 1;
    float cooldown = 20.0f;
    AttackPattern pattern;
};

struct EnemyTemplate {
    std::string name;
    Rarity rarity = Rarity::Fighter;
    Element element = Element::Undead;
    int hp = 10;
    float speed = 0.1f; // tiles per tick
    std::vector<EnemyAttack> attacks;
    std::optional<EnemyUltimate> ultimate;
    std::vector<Buff> buffs;
};

const std::vector<EnemyTemplate>& enemyCatalog();
const EnemyTemplate* findEnemyTemplate(const std::string& name);

// Templates that may spawn on regular floors of a difficulty.
std::vector<const EnemyTemplate*> rosterFor(Difficulty d);

// Inclusive enemy count range per regular floor.
std::pair<int, int> enemyCountRange(Difficulty d);

const char* rarityGlyph(Rarity r);
Color rarityColor(Rarity r);
