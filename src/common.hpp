#pragma once
#include <cstdint>
#include <cstdlib>
#include <string>

struct Vec2i {
    int x = 0;
    int y = 0;
};

inline bool operator==(const Vec2i& a, const Vec2i& b) {
    return a.x == b.x && a.y == b.y;
}

inline bool operator!=(const Vec2i& a, const Vec2i& b) {
    return !(a == b);
}

inline Vec2i operator+(const Vec2i& a, const Vec2i& b) {
    return {a.x + b.x, a.y + b.y};
}

inline Vec2i operator-(const Vec2i& a, const Vec2i& b) {
    return {a.x - b.x, a.y - b.y};
}

inline Vec2i operator*(const Vec2i& a, int k) {
    return {a.x * k, a.y * k};
}

inline bool isZero(const Vec2i& v) {
    return v.x == 0 && v.y == 0;
}

inline int manhattan(const Vec2i& a, const Vec2i& b) {
    return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

// Packs a tile coordinate into a single key (hash maps, caches).
inline uint64_t packTile(const Vec2i& p) {
    return (static_cast<uint64_t>(static_cast<uint32_t>(p.x)) << 32) | static_cast<uint32_t>(p.y);
}

struct Color {
    uint8_t r = 255;
    uint8_t g = 255;
    uint8_t b = 255;
    uint8_t a = 255;
};

inline bool operator==(const Color& a, const Color& b) {
    return a.r == b.r && a.g == b.g && a.b == b.b && a.a == b.a;
}

namespace colors {
constexpr Color White{255, 255, 255, 255};
constexpr Color Gray{128, 128, 128, 255};
constexpr Color DarkGray{64, 64, 64, 255};
constexpr Color Red{205, 0, 0, 255};
constexpr Color LightRed{255, 85, 85, 255};
constexpr Color Yellow{205, 205, 0, 255};
constexpr Color LightYellow{255, 255, 85, 255};
constexpr Color Green{0, 205, 0, 255};
constexpr Color LightGreen{85, 255, 85, 255};
constexpr Color Cyan{0, 205, 205, 255};
constexpr Color LightCyan{85, 255, 255, 255};
constexpr Color Magenta{205, 0, 205, 255};
constexpr Color LightMagenta{255, 85, 255, 255};
constexpr Color Orange{255, 135, 0, 255};
constexpr Color Gold{255, 215, 0, 255};
} // namespace colors

inline int sign(int v) {
    return (v > 0) - (v < 0);
}

inline int clampi(int v, int lo, int hi) {
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}

inline std::string toUpper(std::string s) {
    for (char& c : s) {
        if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
    }
    return s;
}
