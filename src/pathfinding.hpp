#pragma once

#include "common.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <unordered_map>
#include <vector>

// A* over the 4-neighborhood grid with a Manhattan heuristic and uniform edge
// cost. The pathfinder is a free function: it holds no state and knows nothing
// about entities, so callers decide what "passable" means (ghosts ignore walls).
//
// Conventions:
//   - passable(x,y) should return true if the tile can be entered.
//   - The start tile is never tested against passable().
//   - Ties on f-score pop the entry that was pushed first.

using PassableFn = std::function<bool(int x, int y)>;

// Returns a path including {start, ..., goal}. Empty on failure.
// maxExpansions < 0 means unlimited.
std::vector<Vec2i> astarPath(
    int width,
    int height,
    Vec2i start,
    Vec2i goal,
    const PassableFn& passable,
    int maxExpansions = -1);

// Small (from, to) keyed cache for chase paths.
//
// Only valid for a single immutable floor: the owner must clear() it whenever a
// new floor is installed. When full, the whole cache is dropped.
class PathCache {
public:
    explicit PathCache(size_t capacity = 1024) : capacity_(capacity) {}

    const std::vector<Vec2i>* find(Vec2i from, Vec2i to, bool ghost);
    void store(Vec2i from, Vec2i to, bool ghost, std::vector<Vec2i> path);
    void clear();

    size_t size() const { return paths_.size(); }
    uint64_t hits() const { return hits_; }
    uint64_t misses() const { return misses_; }

private:
    struct Key {
        Vec2i from;
        Vec2i to;
        bool ghost = false;
        bool operator==(const Key& o) const { return from == o.from && to == o.to && ghost == o.ghost; }
    };
    struct KeyHash {
        size_t operator()(const Key& k) const noexcept;
    };

    size_t capacity_ = 1024;
    std::unordered_map<Key, std::vector<Vec2i>, KeyHash> paths_;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
};
