#pragma once

#include "common.hpp"
#include "floor.hpp"
#include "rng.hpp"

#include <vector>

constexpr int SPAWN_MIN_PLAYER_DISTANCE = 10;
constexpr int SPAWN_MIN_SPACING = 5;

struct SpawnRequest {
    Vec2i player{};
    std::vector<Vec2i> occupied; // existing enemies and spawns
    int minPlayerDistance = SPAWN_MIN_PLAYER_DISTANCE;
    int minSpacing = SPAWN_MIN_SPACING;
    int attempts = 500;
    int maxCount = -1; // < 0 = no limit
};

// Samples interior tiles and keeps those that are walkable, not on or
// 4-adjacent to the player, not already occupied, at least minPlayerDistance
// (Manhattan) from the player and at least minSpacing from every accepted spawn.
// Returns an empty list on a floor without open tiles.
std::vector<Vec2i> findSpawnPositions(const Floor& floor, const SpawnRequest& req, RNG& rng);
