#pragma once

#include "common.hpp"
#include "floor.hpp"
#include "items.hpp"
#include "weapons.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

enum class DropKind : uint8_t {
    Consumable = 0,
    Gold,
    Weapon,
};

const char* dropKindName(DropKind k);

struct ItemDrop {
    DropKind kind = DropKind::Gold;
    ConsumableKind consumable = ConsumableKind::WeakHealingDraught;
    uint32_t gold = 0;
    std::optional<Weapon> weapon;

    Vec2i pos{};
    float age = 0.0f; // seconds on the ground
    ItemTier tier = ItemTier::Common;

    const char* glyph() const;
    Color color() const;
    std::string label() const;
};

ItemDrop makeGoldDrop(Vec2i pos, uint32_t amount);
ItemDrop makeConsumableDrop(Vec2i pos, ConsumableKind k, ItemTier tier);
ItemDrop makeWeaponDrop(Vec2i pos, const Weapon& w);

// Returns true when a tile already holds something that blocks a new drop.
using TileTakenFn = std::function<bool(Vec2i)>;

// First free walkable tile among +x, -x, +y, -y; falls back to `origin`.
Vec2i dropPosition(const Floor& floor, Vec2i origin, const TileTakenFn& taken);

// Scatters `count` consumables over open tiles, avoiding `avoid`.
// Pure function of (floor, seed, difficulty).
std::vector<ItemDrop> scatterFloorItems(const Floor& floor, uint64_t seed, Difficulty d, int count, Vec2i avoid);
