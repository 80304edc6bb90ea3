#pragma once

#include "common.hpp"

#include <algorithm>
#include <cstddef>
#include <vector>

constexpr int ENEMY_HASH_CELL = 8;

// Fixed-bucket spatial hash over entity ids.
//
// The World rebuilds it from live enemies whenever positions may have changed
// and queries it for tile lookups during hit resolution and spawn spacing.
// Buckets keep insertion order, so lookups are deterministic.
class SpatialHashGrid2D {
public:
    SpatialHashGrid2D() : SpatialHashGrid2D(0, 0, ENEMY_HASH_CELL) {}

    SpatialHashGrid2D(int worldW, int worldH, int cellSize)
        : worldW_(std::max(0, worldW)),
          worldH_(std::max(0, worldH)),
          cellSize_(std::max(1, cellSize)) {
        gridW_ = std::max(1, (worldW_ + cellSize_ - 1) / cellSize_);
        gridH_ = std::max(1, (worldH_ + cellSize_ - 1) / cellSize_);
        buckets_.resize(static_cast<size_t>(gridW_ * gridH_));
    }

    void clear() {
        for (auto& b : buckets_) b.clear();
        count_ = 0;
    }

    void insert(const Vec2i& p, int id) {
        buckets_[bucketIndex(p)].push_back(Entry{p, id});
        ++count_;
    }

    size_t size() const { return count_; }

    // Ids stored at exactly `p`, in insertion order.
    std::vector<int> idsAt(const Vec2i& p) const {
        std::vector<int> out;
        for (const Entry& e : buckets_[bucketIndex(p)]) {
            if (e.pos == p) out.push_back(e.id);
        }
        return out;
    }

    // Returns true if any inserted point is strictly closer than `distance`
    // (Manhattan) to `p`.
    bool anyWithinManhattan(const Vec2i& p, int distance) const {
        if (distance <= 0) return false;

        const int gx = p.x / cellSize_;
        const int gy = p.y / cellSize_;
        const int rCells = std::max(1, (distance + cellSize_ - 1) / cellSize_);

        for (int oy = -rCells; oy <= rCells; ++oy) {
            for (int ox = -rCells; ox <= rCells; ++ox) {
                const int nx = gx + ox;
                const int ny = gy + oy;
                if (nx < 0 || ny < 0 || nx >= gridW_ || ny >= gridH_) continue;
                const auto& bucket = buckets_[static_cast<size_t>(ny * gridW_ + nx)];
                for (const Entry& e : bucket) {
                    if (manhattan(p, e.pos) < distance) return true;
                }
            }
        }
        return false;
    }

private:
    struct Entry {
        Vec2i pos;
        int id = -1;
    };

    size_t bucketIndex(const Vec2i& p) const {
        const int gx = std::clamp(p.x / cellSize_, 0, gridW_ - 1);
        const int gy = std::clamp(p.y / cellSize_, 0, gridH_ - 1);
        return static_cast<size_t>(gy * gridW_ + gx);
    }

    int worldW_ = 0;
    int worldH_ = 0;
    int cellSize_ = 1;
    int gridW_ = 1;
    int gridH_ = 1;
    size_t count_ = 0;
    std::vector<std::vector<Entry>> buckets_;
};
