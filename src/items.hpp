#pragma once

#include "combat_rules.hpp"
#include "common.hpp"
#include "rng.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class ItemTier : uint8_t {
    Common = 0,
    Rare,
    Epic,
    Exotic,
    Legendary,
    Mythic,
    Godly,
};

constexpr int ITEM_TIER_COUNT = 7;

const char* tierName(ItemTier t);
Color tierColor(ItemTier t);

// Base drop chance in percent (Common 50 .. Godly 0.5).
float tierBaseDropChance(ItemTier t);

// Easy 0.5, Normal 1.0, Hard 1.5, Death 2.5
float tierRarityMultiplier(Difficulty d);

// Rolls 0..100 and walks the tiers from rarest to most common, accumulating
// the difficulty-scaled chances (each capped at 100).
ItemTier determineTier(Difficulty d, RNG& rng);

enum class ConsumableKind : uint8_t {
    WeakHealingDraught = 0,
    BandageRoll,
    AntitoxinVial,
    FireOilFlask,
    BlessedBread,
};

constexpr int CONSUMABLE_KIND_COUNT = 5;

const char* consumableName(ConsumableKind k);
const char* consumableDescription(ConsumableKind k);
bool isStackable(ConsumableKind k);

constexpr int DRAUGHT_HEAL = 10;
constexpr int BANDAGE_HEAL = 6;
constexpr int BREAD_HEAL = 8;
constexpr float ANTITOXIN_IMMUNITY_SEC = 5.0f;

struct ConsumableStack {
    ConsumableKind kind = ConsumableKind::WeakHealingDraught;
    int quantity = 1;
};

class ConsumableInventory {
public:
    // Stackable kinds merge into an existing stack.
    void add(ConsumableKind k, int quantity = 1);

    // Decrements the stack at `index` and drops it at zero.
    // Returns the kind used, or nothing for an empty slot.
    std::optional<ConsumableKind> useItem(size_t index);

    const std::vector<ConsumableStack>& stacks() const { return stacks_; }
    size_t size() const { return stacks_.size(); }
    bool empty() const { return stacks_.empty(); }
    int countOf(ConsumableKind k) const;
    void clear() { stacks_.clear(); }

private:
    std::vector<ConsumableStack> stacks_;
};

ConsumableKind randomConsumable(RNG& rng);
