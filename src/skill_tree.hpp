#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

enum class SkillPath : uint8_t {
    Warrior = 0, // +15% max HP per level
    Mage,        // +20% damage per level
    Rogue,       // +25% speed per level
    Balanced,    // +8% to all three per level
};

constexpr int SKILL_PATH_COUNT = 4;
constexpr int SKILL_MAX_LEVEL = 5;

const char* skillPathName(SkillPath p);

enum class SkillPurchase : uint8_t {
    Ok = 0,
    MaxLevel,
    NotEnoughGold,
    PathLocked, // a different exclusive path was already chosen
};

const char* skillPurchaseMessage(SkillPurchase r);

class SkillTree {
public:
    // 100 + 50 * current level
    int costFor(SkillPath p) const;
    int level(SkillPath p) const { return levels_[static_cast<size_t>(p)]; }
    std::optional<SkillPath> chosen() const { return chosen_; }

    SkillPurchase canPurchase(SkillPath p, uint32_t gold) const;

    // Deducts the cost from `gold` on success.
    SkillPurchase purchase(SkillPath p, uint32_t& gold);

    float healthMultiplier() const;
    float damageMultiplier() const;
    float speedMultiplier() const;

    // Restores levels (save/load); values are clamped to [0, SKILL_MAX_LEVEL].
    void restore(const std::array<int, SKILL_PATH_COUNT>& levels, std::optional<SkillPath> chosen);
    const std::array<int, SKILL_PATH_COUNT>& levels() const { return levels_; }

private:
    std::array<int, SKILL_PATH_COUNT> levels_{};
    std::optional<SkillPath> chosen_;
};
