#include "items.hpp"

#include <algorithm>

const char* tierName(ItemTier t) {
    switch (t) {
        case ItemTier::Common:    return "Common";
        case ItemTier::Rare:      return "Rare";
        case ItemTier::Epic:      return "Epic";
        case ItemTier::Exotic:    return "Exotic";
        case ItemTier::Legendary: return "Legendary";
        case ItemTier::Mythic:    return "Mythic";
        case ItemTier::Godly:     return "Godly";
    }
    return "Common";
}

Color tierColor(ItemTier t) {
    switch (t) {
        case ItemTier::Common:    return colors::DarkGray;
        case ItemTier::Rare:      return colors::Cyan;
        case ItemTier::Epic:      return Color{0, 0, 238, 255};
        case ItemTier::Exotic:    return colors::Yellow;
        case ItemTier::Legendary: return colors::Gold;
        case ItemTier::Mythic:    return Color{255, 200, 80, 255};
        case ItemTier::Godly:     return Color{255, 255, 210, 255};
    }
    return colors::DarkGray;
}

float tierBaseDropChance(ItemTier t) {
    switch (t) {
        case ItemTier::Common:    return 50.0f;
        case ItemTier::Rare:      return 25.0f;
        case ItemTier::Epic:      return 15.0f;
        case ItemTier::Exotic:    return 5.0f;
        case ItemTier::Legendary: return 3.0f;
        case ItemTier::Mythic:    return 1.5f;
        case ItemTier::Godly:     return 0.5f;
    }
    return 0.0f;
}

float tierRarityMultiplier(Difficulty d) {
    switch (d) {
        case Difficulty::Easy:   return 0.5f;
        case Difficulty::Normal: return 1.0f;
        case Difficulty::Hard:   return 1.5f;
        case Difficulty::Death:  return 2.5f;
    }
    return 1.0f;
}

ItemTier determineTier(Difficulty d, RNG& rng) {
    const float roll = rng.next01() * 100.0f;
    const float mult = tierRarityMultiplier(d);

    float cumulative = 0.0f;
    for (int i = ITEM_TIER_COUNT - 1; i >= 0; --i) {
        const ItemTier t = static_cast<ItemTier>(i);
        cumulative += std::min(100.0f, tierBaseDropChance(t) * mult);
        if (roll < cumulative) return t;
    }
    return ItemTier::Common;
}

const char* consumableName(ConsumableKind k) {
    switch (k) {
        case ConsumableKind::WeakHealingDraught: return "Weak Healing Draught";
        case ConsumableKind::BandageRoll:        return "Bandage Roll";
        case ConsumableKind::AntitoxinVial:      return "Antitoxin Vial";
        case ConsumableKind::FireOilFlask:       return "Fire Oil Flask";
        case ConsumableKind::BlessedBread:       return "Blessed Bread";
    }
    return "Weak Healing Draught";
}

const char* consumableDescription(ConsumableKind k) {
    switch (k) {
        case ConsumableKind::WeakHealingDraught: return "SOUR, CLOUDY, AND VAGUELY ALIVE.";
        case ConsumableKind::BandageRoll:        return "CLEAN-ISH LINEN. STOPS BLEEDING.";
        case ConsumableKind::AntitoxinVial:      return "CURES POISON AND WARDS AGAINST IT FOR A WHILE.";
        case ConsumableKind::FireOilFlask:       return "LAMP OIL WITH VIOLENT INTENT. THROWN AHEAD OF YOU.";
        case ConsumableKind::BlessedBread:       return "DRY. HOLY. COMFORTING.";
    }
    return "";
}

bool isStackable(ConsumableKind k) {
    return k != ConsumableKind::FireOilFlask;
}

void ConsumableInventory::add(ConsumableKind k, int quantity) {
    if (quantity <= 0) return;
    if (isStackable(k)) {
        for (auto& s : stacks_) {
            if (s.kind == k) {
                s.quantity += quantity;
                return;
            }
        }
        stacks_.push_back({k, quantity});
        return;
    }
    for (int i = 0; i < quantity; ++i) stacks_.push_back({k, 1});
}

std::optional<ConsumableKind> ConsumableInventory::useItem(size_t index) {
    if (index >= stacks_.size()) return std::nullopt;
    ConsumableStack& s = stacks_[index];
    const ConsumableKind k = s.kind;
    s.quantity -= 1;
    if (s.quantity <= 0) {
        stacks_.erase(stacks_.begin() + static_cast<std::ptrdiff_t>(index));
    }
    return k;
}

int ConsumableInventory::countOf(ConsumableKind k) const {
    int n = 0;
    for (const auto& s : stacks_) {
        if (s.kind == k) n += s.quantity;
    }
    return n;
}

ConsumableKind randomConsumable(RNG& rng) {
    return static_cast<ConsumableKind>(rng.range(0, CONSUMABLE_KIND_COUNT - 1));
}
