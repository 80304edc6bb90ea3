#include "spawn.hpp"

#include "spatial_hash.hpp"

#include <unordered_set>

std::vector<Vec2i> findSpawnPositions(const Floor& floor, const SpawnRequest& req, RNG& rng) {
    std::vector<Vec2i> out;
    if (floor.width < 3 || floor.height < 3) return out;
    if (floor.openTileCount() == 0) return out;

    std::unordered_set<uint64_t> blocked;
    for (const Vec2i& p : req.occupied) blocked.insert(packTile(p));
    blocked.insert(packTile(req.player));
    static const Vec2i kAdjacent[4] = {{1, 0}, {-1, 0}, {0, 1}, {0, -1}};
    for (const Vec2i& d : kAdjacent) blocked.insert(packTile(req.player + d));

    SpatialHashGrid2D accepted(floor.width, floor.height, ENEMY_HASH_CELL);

    for (int attempt = 0; attempt < req.attempts; ++attempt) {
        if (req.maxCount >= 0 && static_cast<int>(out.size()) >= req.maxCount) break;

        const Vec2i p{rng.range(1, floor.width - 2), rng.range(1, floor.height - 2)};
        if (blocked.count(packTile(p)) != 0) continue;
        if (!floor.isWalkable(p)) continue;
        if (manhattan(p, req.player) < req.minPlayerDistance) continue;
        if (accepted.anyWithinManhattan(p, req.minSpacing)) continue;

        out.push_back(p);
        accepted.insert(p, static_cast<int>(out.size()) - 1);
        blocked.insert(packTile(p));
    }
    return out;
}
