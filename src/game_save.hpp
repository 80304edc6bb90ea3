#pragma once

#include "common.hpp"
#include "world.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

constexpr uint32_t SAVE_MAGIC = 0x56534343u; // 'CCSV'
constexpr uint32_t SAVE_VERSION = 1u;
constexpr const char* SAVE_FILE_NAME = "cryptcrawl_save.dat";

struct PlayerStats {
    int32_t attackDamage = PLAYER_BASE_DAMAGE;
    int32_t attackLength = PLAYER_ATTACK_LENGTH;
    int32_t attackWidth = PLAYER_ATTACK_WIDTH;
    int32_t dashDistance = PLAYER_DASH_DISTANCE;
    int32_t health = PLAYER_BASE_HP;
    int32_t maxHealth = PLAYER_BASE_HP;
    uint32_t gold = 0;
    uint32_t enemiesKilled = 0;
};

inline bool operator==(const PlayerStats& a, const PlayerStats& b) {
    return a.attackDamage == b.attackDamage && a.attackLength == b.attackLength &&
           a.attackWidth == b.attackWidth && a.dashDistance == b.dashDistance && a.health == b.health &&
           a.maxHealth == b.maxHealth && a.gold == b.gold && a.enemiesKilled == b.enemiesKilled;
}

struct SavedConsumable {
    uint8_t kind = 0;
    int32_t quantity = 1;
};

// Flat save payload. Enemies, projectiles and drops are not stored: the floor
// is regenerated from its seed on load.
struct GameSave {
    std::string playerName = "Player";
    PlayerStats stats;
    int32_t floorLevel = 1;
    int32_t maxLevels = 10;
    Vec2i position{};
    std::string difficulty = "Normal";
    double timeElapsed = 0.0;
    uint64_t floorSeed = 0;

    std::vector<std::string> weapons; // catalog names
    uint32_t currentWeapon = 0;
    std::vector<SavedConsumable> consumables;

    std::array<int32_t, SKILL_PATH_COUNT> skillLevels{};
    int32_t chosenPath = -1; // -1 = none
    uint8_t ultimateKind = 0;
};

GameSave makeSave(const World& w);

// World configuration for resuming a save (unknown difficulty -> Normal).
WorldConfig configFromSave(const GameSave& s, const WorldConfig& base);

// Regenerates the saved floor and restores the player. Loaded values are
// validated: HP is clamped, an unwalkable position is moved to the nearest
// walkable tile, unknown weapons/consumables/enums fall back to defaults.
void applySave(World& w, const GameSave& s);

// Serialization: magic, version, fields, CRC32 footer.
std::string encodeSave(const GameSave& s);
bool decodeSave(const std::string& bytes, GameSave& out, std::string* err = nullptr);

// Writes through a ".tmp" file and renames over the target.
bool saveGameToFile(const std::string& path, const GameSave& s, std::string* err = nullptr);
bool loadGameFromFile(const std::string& path, GameSave& out, std::string* err = nullptr);
