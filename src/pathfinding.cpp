#include "pathfinding.hpp"

#include "rng.hpp"

#include <algorithm>
#include <limits>
#include <queue>
#include <tuple>

namespace {

inline bool inBounds(int w, int h, int x, int y) {
    return x >= 0 && y >= 0 && x < w && y < h;
}

inline int idxOf(int w, int x, int y) {
    return y * w + x;
}

constexpr int DIRS4[4][2] = {
    {0,-1},{1,0},{0,1},{-1,0}
};

// (f, insertion sequence, idx). The sequence makes equal-f pops FIFO.
using Node = std::tuple<int, uint32_t, int>;

} // namespace

std::vector<Vec2i> astarPath(
    int width,
    int height,
    Vec2i start,
    Vec2i goal,
    const PassableFn& passable,
    int maxExpansions)
{
    if (width <= 0 || height <= 0) return {};
    if (!inBounds(width, height, start.x, start.y)) return {};
    if (!inBounds(width, height, goal.x, goal.y)) return {};
    if (start == goal) return {start};

    const int startI = idxOf(width, start.x, start.y);
    const int goalI = idxOf(width, goal.x, goal.y);

    const int INF = std::numeric_limits<int>::max() / 4;
    std::vector<int> g(static_cast<size_t>(width * height), INF);
    std::vector<int> prev(static_cast<size_t>(width * height), -1);
    std::vector<uint8_t> closed(static_cast<size_t>(width * height), 0);

    std::priority_queue<Node, std::vector<Node>, std::greater<Node>> open;
    uint32_t seq = 0;

    g[static_cast<size_t>(startI)] = 0;
    open.push({manhattan(start, goal), seq++, startI});

    int expansions = 0;
    bool found = false;
    while (!open.empty()) {
        const int i = std::get<2>(open.top());
        open.pop();

        if (closed[static_cast<size_t>(i)]) continue;
        closed[static_cast<size_t>(i)] = 1;

        if (i == goalI) {
            found = true;
            break;
        }
        if (maxExpansions >= 0 && ++expansions > maxExpansions) break;

        const int x = i % width;
        const int y = i / width;
        const int gHere = g[static_cast<size_t>(i)];

        for (const auto& dv : DIRS4) {
            const int nx = x + dv[0];
            const int ny = y + dv[1];
            if (!inBounds(width, height, nx, ny)) continue;
            if (!passable(nx, ny)) continue;

            const int ni = idxOf(width, nx, ny);
            if (closed[static_cast<size_t>(ni)]) continue;

            const int ng = gHere + 1;
            if (ng < g[static_cast<size_t>(ni)]) {
                g[static_cast<size_t>(ni)] = ng;
                prev[static_cast<size_t>(ni)] = i;
                const int f = ng + manhattan({nx, ny}, goal);
                open.push({f, seq++, ni});
            }
        }
    }

    if (!found) return {};

    // Reconstruct
    std::vector<Vec2i> path;
    int cur = goalI;
    while (cur != -1) {
        path.push_back({cur % width, cur / width});
        if (cur == startI) break;
        cur = prev[static_cast<size_t>(cur)];
    }

    if (path.empty() || path.back() != start) return {};
    std::reverse(path.begin(), path.end());
    return path;
}

size_t PathCache::KeyHash::operator()(const Key& k) const noexcept {
    uint32_t h = hashCombine(static_cast<uint32_t>(k.from.x), static_cast<uint32_t>(k.from.y));
    h = hashCombine(h, static_cast<uint32_t>(k.to.x));
    h = hashCombine(h, static_cast<uint32_t>(k.to.y));
    h = hashCombine(h, k.ghost ? 1u : 0u);
    return static_cast<size_t>(h);
}

const std::vector<Vec2i>* PathCache::find(Vec2i from, Vec2i to, bool ghost) {
    auto it = paths_.find(Key{from, to, ghost});
    if (it == paths_.end()) {
        ++misses_;
        return nullptr;
    }
    ++hits_;
    return &it->second;
}

void PathCache::store(Vec2i from, Vec2i to, bool ghost, std::vector<Vec2i> path) {
    if (capacity_ == 0) return;
    if (paths_.size() >= capacity_) paths_.clear();
    paths_[Key{from, to, ghost}] = std::move(path);
}

void PathCache::clear() {
    paths_.clear();
    hits_ = 0;
    misses_ = 0;
}
