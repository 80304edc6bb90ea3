#pragma once

#include "attack_pattern.hpp"
#include "cooldown.hpp"

#include <cstdint>
#include <vector>

enum class BossKind : uint8_t {
    GoblinOverlord = 0,
    SkeletalKnight,
    FlameSorcerer,
    ShadowAssassin,
    CorruptedWarden,
};

constexpr int BOSS_KIND_COUNT = 5;

enum class BossPhase : uint8_t {
    First = 0,
    Second,
    Third,
};

const char* bossName(BossKind k);
const char* bossPhaseName(BossPhase p);

struct BossProfile {
    BossKind kind = BossKind::GoblinOverlord;
    int maxHp = 100;
    int baseDamage = 10;
    int attackRadius = 2;
    std::vector<AttackPattern> patterns;
};

const BossProfile& bossProfile(BossKind k);

constexpr float BOSS_LOOT_MULTIPLIER = 3.0f;
constexpr double BOSS_SPECIAL_COOLDOWN = 8.0;
constexpr double BOSS_PHASE_TRANSITION_SEC = 1.5;

// Boss movement rates in tiles per tick.
constexpr float BOSS_BASE_SPEED = 0.125f;
constexpr float GOBLIN_RUSH_SPEED = 0.2f;
constexpr float ASSASSIN_RUSH_SPEED = 0.3f;

// Phase by HP band: >=66% First, 33..66% Second, <33% Third.
BossPhase phaseForHealth(int hp, int maxHp);

// 1.0 / 1.2 / 1.5
float enrageFor(BossPhase p);

// 1.0 / 1.1 / 1.3
float phaseDamageMultiplier(BossPhase p);

enum class BossSpecial : uint8_t {
    None = 0,
    SpeedBoost,
    Defensive,
    Heal,
};

struct BossState {
    BossKind kind = BossKind::GoblinOverlord;
    BossPhase phase = BossPhase::First;
    float enrage = 1.0f;
    size_t patternIndex = 0;
    std::vector<AttackPattern> patterns;
    int baseDamage = 10;
    int attackRadius = 2;
    int maxBaseHp = 100;
    float lootMultiplier = BOSS_LOOT_MULTIPLIER;

    Cooldown specialCooldown{BOSS_SPECIAL_COOLDOWN};
    Cooldown transitionCooldown{BOSS_PHASE_TRANSITION_SEC};

    // Remaining seconds of an active special state (speed boost or guard).
    float specialTimer = 0.0f;
    bool defensive = false;
};

BossState makeBossState(BossKind k, double now);

// Recomputes the phase from HP. Returns true when the phase changed; the
// transition cooldown is then restarted.
bool updateBossPhase(BossState& b, int hp, double now);

// (int)(base * phase * enrage), at least 1.
int effectiveDamage(const BossState& b);

// Current rotation pattern; advances the index modulo the pattern count.
AttackPattern nextBossPattern(BossState& b);

struct BossSpecialResult {
    BossSpecial effect = BossSpecial::None;
    float newSpeed = 0.0f; // SpeedBoost
    int heal = 0;          // Heal
};

// Fires the boss-specific ability when its cooldown is ready and no phase
// transition is in progress. Returns None otherwise.
BossSpecialResult tryBossSpecial(BossState& b, double now);

// Counts down the active special state. Returns true when it just ended.
bool tickBossSpecial(BossState& b, float dt);

// CorruptedWarden only: 1/2/3 HP per tick by phase.
int bossRegenPerTick(const BossState& b);
