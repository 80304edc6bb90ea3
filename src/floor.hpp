#pragma once

#include "common.hpp"
#include "rng.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class TileType : uint8_t {
    Wall = 0,
    Open,
};

// A 4-connected open region. Every open tile belongs to exactly one room.
struct Room {
    int id = 0;
    Vec2i centroid{};
    std::vector<Vec2i> tiles;
};

constexpr int FLOOR_WIDTH = 180;
constexpr int FLOOR_HEIGHT = 60;
constexpr int FLOOR_FILL_PERCENT = 45;
constexpr int FLOOR_SMOOTH_ITERATIONS = 5;
constexpr int FLOOR_BIG_AREA_ITERATIONS = 3;

// Cellular-automata cave floor.
//
// generate() is a pure function of (width, height, seed): identical inputs give
// identical tiles and identical room decompositions. After generation the floor
// is immutable; the outer border is always wall and all open tiles form a single
// connected room.
class Floor {
public:
    int width = 0;
    int height = 0;
    uint64_t seed = 0;
    std::vector<TileType> tiles;

    std::vector<Room> rooms;
    std::vector<int> roomIndex; // per tile; -1 for walls

    Floor() = default;
    Floor(int w, int h); // all wall

    static Floor generate(int w, int h, uint64_t seed);

    // Builds a floor from text rows ('#' = wall, anything else = open).
    // Used for scripted arenas; the border is taken as given.
    static Floor fromRows(const std::vector<std::string>& rows);

    bool inBounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < width && y < height;
    }

    TileType at(int x, int y) const { return tiles[static_cast<size_t>(y * width + x)]; }

    bool isWalkable(int x, int y) const {
        return inBounds(x, y) && at(x, y) == TileType::Open;
    }
    bool isWalkable(Vec2i p) const { return isWalkable(p.x, p.y); }

    // Out-of-bounds counts as wall.
    bool isWall(int x, int y) const { return !isWalkable(x, y); }

    int roomAt(int x, int y) const;
    int openTileCount() const;

    // Random tile of the largest room. Empty when the floor has no open tiles.
    std::optional<Vec2i> findPlayerSpawn(RNG& rng) const;

    // Closest walkable tile to `from` by BFS over the grid (walls included).
    std::optional<Vec2i> nearestWalkable(Vec2i from) const;

    // Re-floods open regions into rooms and rebuilds the tile->room index.
    void detectRooms();

private:
    void set(int x, int y, TileType t) { tiles[static_cast<size_t>(y * width + x)] = t; }

    void fillNoise(RNG& rng);
    void smooth();
    int countWallsWithin(int x, int y, int distance) const;
    void connectRegions();
    void carveTunnel(Vec2i from, Vec2i to);
};

// Flood-fills all open regions with a 4-neighborhood (row-major discovery order).
std::vector<std::vector<Vec2i>> floodOpenRegions(const Floor& f);
