#pragma once
#include <cstddef>
#include <cstdint>
#include <limits>

// Seeding helpers. Each generator on a floor (layout, enemies, items, player
// spawn) derives its own stream from the floor seed plus a name tag, so adding
// draws to one stream never shifts another.
//
//   RNG enemyRng(hashCombine(foldSeed(seed), tag32("ENEMIES")));

// FNV-1a over the tag characters, usable in constant expressions.
constexpr uint32_t tagHash(const char* s, std::size_t n) {
    uint32_t h = 2166136261u;
    for (std::size_t i = 0; i < n; ++i) {
        h ^= static_cast<unsigned char>(s[i]);
        h *= 16777619u;
    }
    return h;
}

template <std::size_t N>
constexpr uint32_t tag32(const char (&name)[N]) {
    return tagHash(name, N > 0 ? N - 1 : 0);
}

constexpr uint32_t foldSeed(uint64_t seed) {
    return static_cast<uint32_t>(seed ^ (seed >> 32));
}

// Integer avalanche mix; equal inputs always give equal outputs.
inline uint32_t mix32(uint32_t v) {
    v ^= v >> 16;
    v *= 0x7feb352du;
    v ^= v >> 15;
    v *= 0x846ca68bu;
    v ^= v >> 16;
    return v;
}

inline uint32_t hashCombine(uint32_t a, uint32_t b) {
    return mix32(a ^ (b + 0x9e3779b9u + (a << 6) + (a >> 2)));
}

// xorshift32 stream. Identical on every platform, which the state hashes and
// recorded input scripts depend on. Zero is not a valid state.
struct RNG {
    uint32_t state;

    explicit RNG(uint32_t seed = 0x12345678u) : state(seed ? seed : 0x12345678u) {}

    uint32_t nextU32() {
        state ^= state << 13;
        state ^= state >> 17;
        state ^= state << 5;
        return state;
    }

    // Uniform in [lo, hi]; returns lo for an empty range.
    int range(int lo, int hi) {
        if (hi <= lo) return lo;
        const uint32_t span = static_cast<uint32_t>(hi - lo + 1);
        return lo + static_cast<int>(nextU32() % span);
    }

    // [0, 1)
    float next01() {
        return static_cast<float>(nextU32()) / (static_cast<float>(std::numeric_limits<uint32_t>::max()) + 1.0f);
    }

    bool chance(float p) { return next01() < p; }
};
