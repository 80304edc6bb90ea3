#pragma once

#include "common.hpp"
#include "cooldown.hpp"
#include "items.hpp"
#include "skill_tree.hpp"
#include "status_effects.hpp"
#include "ultimate.hpp"
#include "weapons.hpp"

#include <cstdint>
#include <optional>
#include <string>

constexpr int PLAYER_BASE_HP = 100;
constexpr int PLAYER_BASE_DAMAGE = 5;
constexpr int PLAYER_ATTACK_LENGTH = 2;
constexpr int PLAYER_ATTACK_WIDTH = 1;
constexpr int PLAYER_DASH_DISTANCE = 5;

constexpr double PLAYER_DASH_COOLDOWN = 7.0;
constexpr double PLAYER_ATTACK_COOLDOWN = 0.5;
constexpr double PLAYER_BOW_COOLDOWN = 0.3;
constexpr double PLAYER_BLOCK_COOLDOWN = 6.0;
constexpr double PLAYER_BLOCK_GUARD_SEC = 1.0;

// Player moves at most once per this many ticks.
constexpr int PLAYER_MOVE_TICKS = 2;

struct Player {
    std::string name = "Player";
    Vec2i pos{};
    Vec2i facing{1, 0}; // last non-zero movement direction

    int hp = PLAYER_BASE_HP;
    int maxHp = PLAYER_BASE_HP;
    int attackDamage = PLAYER_BASE_DAMAGE;
    int attackLength = PLAYER_ATTACK_LENGTH;
    int attackWidth = PLAYER_ATTACK_WIDTH;
    int dashDistance = PLAYER_DASH_DISTANCE;

    Cooldown dashCooldown{PLAYER_DASH_COOLDOWN};
    Cooldown attackCooldown{PLAYER_ATTACK_COOLDOWN};
    Cooldown bowCooldown{PLAYER_BOW_COOLDOWN};
    Cooldown blockCooldown{PLAYER_BLOCK_COOLDOWN};
    std::optional<double> blockedAt;

    Ultimate ultimate;
    WeaponInventory weapons;
    ConsumableInventory consumables;
    StatusEffects status;
    float dotCarry = 0.0f;
    SkillTree skills;

    uint32_t gold = 0;
    uint32_t enemiesKilled = 0;

    std::optional<uint64_t> lastMoveTick;
    bool actedThisFloor = false;

    float knockX = 0.0f;
    float knockY = 0.0f;

    bool alive() const { return hp > 0; }
    float healthPercent() const;

    // Clamps into [0, maxHp].
    void setHp(int v);
    // Returns the amount actually restored.
    int heal(int amount);

    // Base HP scaled by the skill tree.
    int skillMaxHp() const;
    // Recomputes maxHp from the skill tree, keeping the current HP ratio.
    void applySkillBonuses();
    // Spends gold on a rank and refreshes maxHp on success.
    SkillPurchase purchaseSkill(SkillPath p);

    bool isBlocking(double now) const;
    bool isInvulnerable(double now) const;
    bool isRaging(double now) const;

    // Ticks between moves after speed modifiers (Rage moves every tick,
    // Cripple doubles the gate).
    int moveGateTicks(double now) const;
    bool canMove(uint64_t tick, double now) const;

    // (weapon damage + (attackDamage - base)) * skill damage * rage, at least 1.
    int weaponDamage(const Weapon& w, double now) const;
};
