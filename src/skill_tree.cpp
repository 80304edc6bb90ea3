#include "skill_tree.hpp"

#include <algorithm>

namespace {

bool isExclusive(SkillPath p) {
    return p != SkillPath::Balanced;
}

// Path bonuses multiply with each other.
float balancedBonus(const SkillTree& t) {
    return 1.0f + 0.08f * t.level(SkillPath::Balanced);
}

} // namespace

const char* skillPathName(SkillPath p) {
    switch (p) {
        case SkillPath::Warrior:  return "Warrior";
        case SkillPath::Mage:     return "Mage";
        case SkillPath::Rogue:    return "Rogue";
        case SkillPath::Balanced: return "Balanced";
        default:                  return "?";
    }
}

const char* skillPurchaseMessage(SkillPurchase r) {
    switch (r) {
        case SkillPurchase::Ok:            return "SKILL LEARNED.";
        case SkillPurchase::MaxLevel:      return "THAT PATH IS ALREADY MASTERED.";
        case SkillPurchase::NotEnoughGold: return "NOT ENOUGH GOLD.";
        case SkillPurchase::PathLocked:    return "YOU HAVE ALREADY CHOSEN ANOTHER PATH.";
        default:                           return "";
    }
}

int SkillTree::costFor(SkillPath p) const {
    return 100 + 50 * level(p);
}

SkillPurchase SkillTree::canPurchase(SkillPath p, uint32_t gold) const {
    if (level(p) >= SKILL_MAX_LEVEL) return SkillPurchase::MaxLevel;
    if (isExclusive(p) && chosen_ && *chosen_ != p) return SkillPurchase::PathLocked;
    if (gold < static_cast<uint32_t>(costFor(p))) return SkillPurchase::NotEnoughGold;
    return SkillPurchase::Ok;
}

SkillPurchase SkillTree::purchase(SkillPath p, uint32_t& gold) {
    const SkillPurchase r = canPurchase(p, gold);
    if (r != SkillPurchase::Ok) return r;

    gold -= static_cast<uint32_t>(costFor(p));
    levels_[static_cast<size_t>(p)] += 1;
    if (isExclusive(p) && !chosen_) chosen_ = p;
    return SkillPurchase::Ok;
}

float SkillTree::healthMultiplier() const {
    return (1.0f + 0.15f * level(SkillPath::Warrior)) * balancedBonus(*this);
}

float SkillTree::damageMultiplier() const {
    return (1.0f + 0.20f * level(SkillPath::Mage)) * balancedBonus(*this);
}

float SkillTree::speedMultiplier() const {
    return (1.0f + 0.25f * level(SkillPath::Rogue)) * balancedBonus(*this);
}

void SkillTree::restore(const std::array<int, SKILL_PATH_COUNT>& levels, std::optional<SkillPath> chosen) {
    for (size_t i = 0; i < levels_.size(); ++i) levels_[i] = std::clamp(levels[i], 0, SKILL_MAX_LEVEL);
    chosen_ = chosen;
    if (chosen_ && !isExclusive(*chosen_)) chosen_.reset();
}
