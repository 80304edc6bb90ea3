#pragma once

#include "common.hpp"
#include "world.hpp"

#include <string>
#include <vector>

// Read-only per-tick view of the World for renderers.
//
// Tiles cover only the viewport (camera offset .. offset + view size); entity
// lists are limited to what is inside it.

struct TileView {
    const char* glyph = " ";
    Color color{};
};

struct EnemyView {
    int id = 0;
    Vec2i pos{};
    const char* glyph = "?";
    Color color{};
    int hp = 0;
    int maxHp = 1;
    std::string name;
    bool boss = false;
};

struct ProjectileView {
    Vec2i pos{};
    const char* glyph = "*";
    Color color{};
};

struct AnimationView {
    std::vector<Vec2i> tiles;
    Color color{};
    const char* glyph = "*";
};

struct ItemView {
    Vec2i pos{};
    const char* glyph = "?";
    Color color{};
};

struct InventoryEntryView {
    std::string name;
    const char* description = "";
    int quantity = 0;
};

struct CooldownView {
    double remaining = 0.0;
    double duration = 0.0;
};

struct WorldSnapshot {
    int floorW = 0;
    int floorH = 0;
    int viewW = 0;
    int viewH = 0;
    Vec2i camera{};
    std::vector<TileView> tiles; // viewW * viewH, row-major

    Vec2i player{};
    int hp = 0;
    int maxHp = 1;
    uint32_t gold = 0;
    int floorLevel = 1;
    int maxLevels = 1;
    std::string weaponName;
    std::vector<std::string> statusTags;
    float ultimateCharge = 0.0f;

    CooldownView dash;
    CooldownView attack;
    CooldownView ultimate;
    CooldownView block;

    std::vector<EnemyView> enemies;
    std::vector<ProjectileView> projectiles;
    std::vector<AnimationView> animations;
    std::vector<ItemView> items;

    bool paused = false;
    bool dead = false;
    bool victory = false;
    bool inventoryOpen = false;
    std::vector<InventoryEntryView> inventory;
    size_t inventoryCursor = 0;
    uint64_t tick = 0;

    const TileView& tileAt(int vx, int vy) const { return tiles[static_cast<size_t>(vy * viewW + vx)]; }
};

WorldSnapshot makeSnapshot(const World& w);
