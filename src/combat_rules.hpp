#pragma once

#include "rng.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class DamageType : uint8_t {
    Physical = 0,
    Magic,
    Fire,
    Holy,
    Poison,
};

enum class Element : uint8_t {
    Undead = 0,
    Ghost,
};

enum class Rarity : uint8_t {
    Fighter = 0,
    Guard,
    Champion,
    Elite,
    Boss,
};

enum class Difficulty : uint8_t {
    Easy = 0,
    Normal,
    Hard,
    Death,
};

enum class BuffKind : uint8_t {
    Armor = 0,         // amount = % damage reduction
    Sharpness,         // amount = % bonus damage dealt
    Speed,             // amount = % movement bonus
    Regeneration,      // amount = HP per second
    BloodFrenzy,       // x1.5 damage dealt below half health
    PhaseShift,        // 20% chance to ignore a hit
    EchoAmplification, // +25% magic damage dealt
};

struct Buff {
    BuffKind kind = BuffKind::Armor;
    int amount = 0;
};

constexpr int ARMOR_CAP = 75;
constexpr float CRIT_MULTIPLIER = 1.5f;

const char* damageTypeName(DamageType t);
const char* elementName(Element e);
const char* rarityName(Rarity r);
const char* difficultyName(Difficulty d);
bool parseDifficulty(const std::string& s, Difficulty& out);

// Easy 1.0, Normal 1.5, Hard 2.0, Death 3.0
float difficultyMultiplier(Difficulty d);

// Multiplier applied to the detection radius (Easy 0.7 .. Death 1.8).
float detectionDifficultyMultiplier(Difficulty d);

// Number of floors in a run; the last is the boss floor.
int maxLevelsFor(Difficulty d);

int rarityGoldBase(Rarity r);
int rarityBaseDetection(Rarity r);
int rarityFallbackDamage(Rarity r);

int detectionRadius(Rarity r, Difficulty d);

// ceil(base * difficulty * loot)
uint32_t goldDrop(Rarity r, Difficulty d, float lootMultiplier = 1.0f);

uint32_t addGoldSaturating(uint32_t gold, uint64_t amount);

// Type advantage of `t` against a target of the given element (no element = 1.0).
float typeMultiplier(std::optional<Element> target, DamageType t);

// Sum of Armor buffs clamped to [0, ARMOR_CAP].
int totalArmor(const std::vector<Buff>& buffs);

bool hasBuff(const std::vector<Buff>& buffs, BuffKind k);
int buffAmount(const std::vector<Buff>& buffs, BuffKind k);

struct DamageInput {
    int baseDamage = 0;
    DamageType type = DamageType::Physical;

    const std::vector<Buff>* attackerBuffs = nullptr;
    int attackerHp = 1;
    int attackerMaxHp = 1;

    std::optional<Element> targetElement;
    const std::vector<Buff>* targetBuffs = nullptr;

    float critChance = 0.0f;
};

struct DamageResult {
    int damage = 1;
    bool critical = false;
};

// Attacker buffs -> type advantage -> armor -> crit -> ceil, at least 1.
// The RNG is only consulted when critChance > 0.
DamageResult resolveDamage(const DamageInput& in, RNG& rng);
