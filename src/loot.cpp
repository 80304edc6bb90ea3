#include "loot.hpp"

#include "rng.hpp"

const char* dropKindName(DropKind k) {
    switch (k) {
        case DropKind::Consumable: return "Consumable";
        case DropKind::Gold:       return "Gold";
        case DropKind::Weapon:     return "Weapon";
        default:                   return "?";
    }
}

const char* ItemDrop::glyph() const {
    switch (kind) {
        case DropKind::Gold:       return "$";
        case DropKind::Weapon:     return ")";
        case DropKind::Consumable: return "!";
        default:                   return "?";
    }
}

Color ItemDrop::color() const {
    if (kind == DropKind::Gold) return colors::Gold;
    return tierColor(tier);
}

std::string ItemDrop::label() const {
    switch (kind) {
        case DropKind::Gold:   return std::to_string(gold) + " GOLD";
        case DropKind::Weapon: return weapon ? toUpper(weapon->name) : std::string("WEAPON");
        case DropKind::Consumable:
        default:               return toUpper(consumableName(consumable));
    }
}

ItemDrop makeGoldDrop(Vec2i pos, uint32_t amount) {
    ItemDrop d;
    d.kind = DropKind::Gold;
    d.gold = amount;
    d.pos = pos;
    return d;
}

ItemDrop makeConsumableDrop(Vec2i pos, ConsumableKind k, ItemTier tier) {
    ItemDrop d;
    d.kind = DropKind::Consumable;
    d.consumable = k;
    d.pos = pos;
    d.tier = tier;
    return d;
}

ItemDrop makeWeaponDrop(Vec2i pos, const Weapon& w) {
    ItemDrop d;
    d.kind = DropKind::Weapon;
    d.weapon = w;
    d.pos = pos;
    d.tier = w.tier;
    return d;
}

Vec2i dropPosition(const Floor& floor, Vec2i origin, const TileTakenFn& taken) {
    static const Vec2i kOffsets[4] = {{1, 0}, {-1, 0}, {0, 1}, {0, -1}};
    for (const Vec2i& o : kOffsets) {
        const Vec2i p = origin + o;
        if (!floor.isWalkable(p)) continue;
        if (taken && taken(p)) continue;
        return p;
    }
    return origin;
}

std::vector<ItemDrop> scatterFloorItems(const Floor& floor, uint64_t seed, Difficulty d, int count, Vec2i avoid) {
    std::vector<ItemDrop> out;
    if (count <= 0 || floor.openTileCount() <= 1) return out;

    RNG rng(hashCombine(foldSeed(seed), tag32("ITEMS")));
    const int maxAttempts = count * 200;
    for (int attempt = 0; attempt < maxAttempts && static_cast<int>(out.size()) < count; ++attempt) {
        const Vec2i p{rng.range(1, floor.width - 2), rng.range(1, floor.height - 2)};
        if (!floor.isWalkable(p) || p == avoid) continue;

        bool used = false;
        for (const auto& it : out) {
            if (it.pos == p) {
                used = true;
                break;
            }
        }
        if (used) continue;

        const ItemTier tier = determineTier(d, rng);
        out.push_back(makeConsumableDrop(p, randomConsumable(rng), tier));
    }
    return out;
}
