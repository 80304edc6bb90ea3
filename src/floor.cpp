#include "floor.hpp"

#include <algorithm>
#include <numeric>
#include <queue>

namespace {

constexpr int DIRS4[4][2] = {
    {1, 0}, {-1, 0}, {0, 1}, {0, -1}
};

inline int idxOf(int w, int x, int y) {
    return y * w + x;
}

Vec2i centroidOf(const std::vector<Vec2i>& tiles) {
    if (tiles.empty()) return {};
    long long sx = 0;
    long long sy = 0;
    for (const Vec2i& p : tiles) {
        sx += p.x;
        sy += p.y;
    }
    const long long n = static_cast<long long>(tiles.size());
    return {static_cast<int>(sx / n), static_cast<int>(sy / n)};
}

// Member tile closest to the centroid. A centroid can sit inside a wall (ring
// shaped caves), so tunnels are anchored on real member tiles.
Vec2i anchorOf(const std::vector<Vec2i>& tiles, Vec2i centroid) {
    Vec2i best = tiles.front();
    int bestD = manhattan(best, centroid);
    for (const Vec2i& p : tiles) {
        const int d = manhattan(p, centroid);
        if (d < bestD) {
            bestD = d;
            best = p;
        }
    }
    return best;
}

int findRoot(std::vector<int>& parent, int i) {
    while (parent[static_cast<size_t>(i)] != i) {
        parent[static_cast<size_t>(i)] = parent[static_cast<size_t>(parent[static_cast<size_t>(i)])];
        i = parent[static_cast<size_t>(i)];
    }
    return i;
}

} // namespace

std::vector<std::vector<Vec2i>> floodOpenRegions(const Floor& f) {
    std::vector<std::vector<Vec2i>> regions;
    if (f.width <= 0 || f.height <= 0) return regions;

    std::vector<uint8_t> seen(static_cast<size_t>(f.width * f.height), 0);
    for (int y = 0; y < f.height; ++y) {
        for (int x = 0; x < f.width; ++x) {
            if (!f.isWalkable(x, y)) continue;
            if (seen[static_cast<size_t>(idxOf(f.width, x, y))]) continue;

            std::vector<Vec2i> region;
            std::queue<Vec2i> q;
            q.push({x, y});
            seen[static_cast<size_t>(idxOf(f.width, x, y))] = 1;
            while (!q.empty()) {
                const Vec2i p = q.front();
                q.pop();
                region.push_back(p);
                for (const auto& dv : DIRS4) {
                    const int nx = p.x + dv[0];
                    const int ny = p.y + dv[1];
                    if (!f.isWalkable(nx, ny)) continue;
                    uint8_t& s = seen[static_cast<size_t>(idxOf(f.width, nx, ny))];
                    if (s) continue;
                    s = 1;
                    q.push({nx, ny});
                }
            }
            regions.push_back(std::move(region));
        }
    }
    return regions;
}

Floor::Floor(int w, int h)
    : width(std::max(0, w)), height(std::max(0, h)) {
    tiles.assign(static_cast<size_t>(width * height), TileType::Wall);
    roomIndex.assign(tiles.size(), -1);
}

Floor Floor::generate(int w, int h, uint64_t seed) {
    Floor f(w, h);
    f.seed = seed;
    if (f.width < 3 || f.height < 3) {
        f.detectRooms();
        return f;
    }

    RNG rng(foldSeed(seed));
    f.fillNoise(rng);
    f.smooth();
    f.connectRegions();
    f.detectRooms();
    return f;
}

Floor Floor::fromRows(const std::vector<std::string>& rows) {
    const int h = static_cast<int>(rows.size());
    const int w = rows.empty() ? 0 : static_cast<int>(rows.front().size());
    Floor f(w, h);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            const char c = (x < static_cast<int>(rows[static_cast<size_t>(y)].size()))
                ? rows[static_cast<size_t>(y)][static_cast<size_t>(x)] : '#';
            f.set(x, y, c == '#' ? TileType::Wall : TileType::Open);
        }
    }
    f.detectRooms();
    return f;
}

void Floor::fillNoise(RNG& rng) {
    for (int y = 1; y < height - 1; ++y) {
        for (int x = 1; x < width - 1; ++x) {
            const bool wall = rng.range(0, 99) < FLOOR_FILL_PERCENT;
            set(x, y, wall ? TileType::Wall : TileType::Open);
        }
    }
}

int Floor::countWallsWithin(int x, int y, int distance) const {
    int count = 0;
    for (int dy = -distance; dy <= distance; ++dy) {
        for (int dx = -distance; dx <= distance; ++dx) {
            if (dx == 0 && dy == 0) continue;
            if (isWall(x + dx, y + dy)) ++count;
        }
    }
    return count;
}

void Floor::smooth() {
    for (int iter = 0; iter < FLOOR_SMOOTH_ITERATIONS; ++iter) {
        std::vector<TileType> next = tiles;
        for (int y = 1; y < height - 1; ++y) {
            for (int x = 1; x < width - 1; ++x) {
                const int w1 = countWallsWithin(x, y, 1);
                bool wall = w1 >= 5;
                if (iter < FLOOR_BIG_AREA_ITERATIONS && !wall) {
                    // Big-area phase: also fill the middle of large open spaces.
                    wall = countWallsWithin(x, y, 2) <= 2;
                }
                next[static_cast<size_t>(idxOf(width, x, y))] = wall ? TileType::Wall : TileType::Open;
            }
        }
        tiles.swap(next);
    }
}

void Floor::carveTunnel(Vec2i from, Vec2i to) {
    // L-shape: walk X first to match the column, then Y.
    int x = from.x;
    int y = from.y;
    set(x, y, TileType::Open);
    while (x != to.x) {
        x += sign(to.x - x);
        set(x, y, TileType::Open);
    }
    while (y != to.y) {
        y += sign(to.y - y);
        set(x, y, TileType::Open);
    }
}

void Floor::connectRegions() {
    for (;;) {
        const std::vector<std::vector<Vec2i>> sections = floodOpenRegions(*this);
        const int n = static_cast<int>(sections.size());
        if (n <= 1) return;

        std::vector<Vec2i> centroids;
        std::vector<Vec2i> anchors;
        centroids.reserve(static_cast<size_t>(n));
        anchors.reserve(static_cast<size_t>(n));
        for (const auto& s : sections) {
            const Vec2i c = centroidOf(s);
            centroids.push_back(c);
            anchors.push_back(anchorOf(s, c));
        }

        std::vector<int> parent(static_cast<size_t>(n));
        std::iota(parent.begin(), parent.end(), 0);

        for (int i = 0; i < n; ++i) {
            int best = -1;
            int bestD = 0;
            for (int j = 0; j < n; ++j) {
                if (j == i) continue;
                if (findRoot(parent, i) == findRoot(parent, j)) continue;
                const int d = manhattan(centroids[static_cast<size_t>(i)], centroids[static_cast<size_t>(j)]);
                if (best < 0 || d < bestD) {
                    best = j;
                    bestD = d;
                }
            }
            if (best < 0) continue;

            parent[static_cast<size_t>(findRoot(parent, i))] = findRoot(parent, best);
            carveTunnel(anchors[static_cast<size_t>(i)], anchors[static_cast<size_t>(best)]);
        }
    }
}

void Floor::detectRooms() {
    rooms.clear();
    roomIndex.assign(tiles.size(), -1);

    std::vector<std::vector<Vec2i>> regions = floodOpenRegions(*this);
    rooms.reserve(regions.size());
    for (size_t i = 0; i < regions.size(); ++i) {
        Room r;
        r.id = static_cast<int>(i);
        r.centroid = centroidOf(regions[i]);
        r.tiles = std::move(regions[i]);
        for (const Vec2i& p : r.tiles) {
            roomIndex[static_cast<size_t>(idxOf(width, p.x, p.y))] = r.id;
        }
        rooms.push_back(std::move(r));
    }
}

int Floor::roomAt(int x, int y) const {
    if (!inBounds(x, y)) return -1;
    return roomIndex[static_cast<size_t>(idxOf(width, x, y))];
}

int Floor::openTileCount() const {
    return static_cast<int>(std::count(tiles.begin(), tiles.end(), TileType::Open));
}

std::optional<Vec2i> Floor::findPlayerSpawn(RNG& rng) const {
    const Room* largest = nullptr;
    for (const Room& r : rooms) {
        if (r.tiles.empty()) continue;
        if (!largest || r.tiles.size() > largest->tiles.size()) largest = &r;
    }
    if (!largest) return std::nullopt;

    const int i = rng.range(0, static_cast<int>(largest->tiles.size()) - 1);
    return largest->tiles[static_cast<size_t>(i)];
}

std::optional<Vec2i> Floor::nearestWalkable(Vec2i from) const {
    if (width <= 0 || height <= 0) return std::nullopt;
    from.x = clampi(from.x, 0, width - 1);
    from.y = clampi(from.y, 0, height - 1);
    if (isWalkable(from)) return from;

    std::vector<uint8_t> seen(tiles.size(), 0);
    std::queue<Vec2i> q;
    q.push(from);
    seen[static_cast<size_t>(idxOf(width, from.x, from.y))] = 1;
    while (!q.empty()) {
        const Vec2i p = q.front();
        q.pop();
        if (isWalkable(p)) return p;
        for (const auto& dv : DIRS4) {
            const int nx = p.x + dv[0];
            const int ny = p.y + dv[1];
            if (!inBounds(nx, ny)) continue;
            uint8_t& s = seen[static_cast<size_t>(idxOf(width, nx, ny))];
            if (s) continue;
            s = 1;
            q.push({nx, ny});
        }
    }
    return std::nullopt;
}
