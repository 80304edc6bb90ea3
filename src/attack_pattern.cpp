#include "attack_pattern.hpp"

#include <algorithm>
#include <cstdlib>

namespace {

// Clockwise ring of the 8 neighbors, starting north.
constexpr int RING8[8][2] = {
    {0,-1},{1,-1},{1,0},{1,1},{0,1},{-1,1},{-1,0},{-1,-1}
};

Vec2i perpendicular(Vec2i d) {
    return {d.y != 0 ? 1 : 0, d.x != 0 ? 1 : 0};
}

void addUnique(std::vector<Vec2i>& tiles, Vec2i p) {
    if (std::find(tiles.begin(), tiles.end(), p) == tiles.end()) tiles.push_back(p);
}

AnimationFrame frame(Color c, const char* glyph, float duration) {
    AnimationFrame f;
    f.color = c;
    f.glyph = glyph;
    f.duration = duration;
    return f;
}

void basicSlash(std::vector<AnimationFrame>& out, Vec2i o, Vec2i d) {
    const Vec2i center = o + d;
    const Vec2i perp = perpendicular(d);
    std::vector<Vec2i> arc;
    addUnique(arc, center);
    addUnique(arc, center + perp);
    addUnique(arc, center - perp);

    AnimationFrame a = frame(colors::White, "*", 0.04f);
    a.tiles = arc;
    out.push_back(a);
    AnimationFrame b = frame(colors::LightYellow, "X", 0.06f);
    b.tiles = arc;
    out.push_back(b);
}

void diamondRing(std::vector<Vec2i>& tiles, Vec2i c, int k) {
    for (int dy = -k; dy <= k; ++dy) {
        for (int dx = -k; dx <= k; ++dx) {
            if (std::abs(dx) + std::abs(dy) == k) addUnique(tiles, {c.x + dx, c.y + dy});
        }
    }
}

void groundSlam(std::vector<AnimationFrame>& out, Vec2i o, int r) {
    AnimationFrame impact = frame(colors::White, "●", 0.1f);
    impact.tiles.push_back(o);
    out.push_back(impact);
    for (int k = 1; k <= r; ++k) {
        AnimationFrame f = frame(colors::Orange, "#", 0.05f);
        diamondRing(f.tiles, o, k);
        out.push_back(f);
    }
}

int ringIndexOf(Vec2i d) {
    for (int i = 0; i < 8; ++i) {
        if (RING8[i][0] == d.x && RING8[i][1] == d.y) return i;
    }
    return 2;
}

void whirlwind(std::vector<AnimationFrame>& out, Vec2i o, Vec2i d) {
    // Rotate the start so the final pair begins at the facing tile.
    const int start = (ringIndexOf(d) + 2) % 8;
    for (int f = 0; f < 4; ++f) {
        const bool last = (f == 3);
        AnimationFrame fr = last ? frame(colors::White, "*", 0.04f) : frame(colors::Cyan, "~", 0.02f);
        for (int j = 0; j < 2; ++j) {
            const int i = (start + f * 2 + j) % 8;
            addUnique(fr.tiles, {o.x + RING8[i][0], o.y + RING8[i][1]});
        }
        out.push_back(fr);
    }
}

void swordThrust(std::vector<AnimationFrame>& out, Vec2i o, Vec2i d, int r) {
    const Vec2i perp = perpendicular(d);
    for (int k = 1; k <= r; ++k) {
        const bool last = (k == r);
        AnimationFrame f = last ? frame(colors::LightCyan, "*", 0.05f) : frame(colors::Cyan, "≡", 0.05f);
        for (int j = 1; j <= k; ++j) addUnique(f.tiles, o + d * j);
        for (int j = std::max(1, k - 1); j <= k; ++j) {
            addUnique(f.tiles, o + d * j + perp);
            addUnique(f.tiles, o + d * j - perp);
        }
        out.push_back(f);
    }
}

void shot(std::vector<AnimationFrame>& out, Vec2i o, Vec2i d, int r, int trail, Color c, const char* glyph, float dur) {
    for (int k = 1; k <= r; ++k) {
        AnimationFrame f = frame(c, glyph, dur);
        addUnique(f.tiles, o + d * k);
        for (int t = 1; t <= trail; ++t) {
            if (k - t >= 1) addUnique(f.tiles, o + d * (k - t));
        }
        out.push_back(f);
    }
}

void multiShot(std::vector<AnimationFrame>& out, Vec2i o, Vec2i d, int r, int spread) {
    const Vec2i perp = perpendicular(d);
    for (int k = 1; k <= r; ++k) {
        AnimationFrame f = frame(colors::LightGreen, "v", 0.04f);
        const Vec2i tip = o + d * k;
        addUnique(f.tiles, tip);
        if (k >= 2) {
            for (int s = 1; s <= spread; ++s) {
                addUnique(f.tiles, tip + perp * s);
                addUnique(f.tiles, tip - perp * s);
            }
        }
        out.push_back(f);
    }
}

void fireball(std::vector<AnimationFrame>& out, Vec2i o, int r) {
    for (int k = 1; k <= r; ++k) {
        AnimationFrame f = (k % 2 == 1) ? frame(colors::Red, "*", 0.06f) : frame(colors::LightRed, "#", 0.06f);
        for (int dy = -k; dy <= k; ++dy) {
            for (int dx = -k; dx <= k; ++dx) {
                if (dx * dx + dy * dy <= k * k) addUnique(f.tiles, {o.x + dx, o.y + dy});
            }
        }
        out.push_back(f);
    }
}

void chainLightning(std::vector<AnimationFrame>& out, Vec2i o, Vec2i d, int r) {
    const Vec2i perp = perpendicular(d);
    for (int k = 1; k <= r; ++k) {
        AnimationFrame f = frame(colors::LightYellow, "⚡", 0.05f);
        for (int j = 1; j <= k; ++j) {
            const int jitter = (j % 2 == 1) ? 1 : -1;
            addUnique(f.tiles, o + d * j + perp * jitter);
        }
        out.push_back(f);
    }
}

void frostNova(std::vector<AnimationFrame>& out, Vec2i o, int r) {
    for (int k = 1; k <= r; ++k) {
        AnimationFrame f = frame(colors::White, "*", 0.05f);
        diamondRing(f.tiles, o, k);
        out.push_back(f);
    }
}

void meteorShower(std::vector<AnimationFrame>& out, Vec2i o, Vec2i d, int r, int w) {
    for (int k = 1; k <= r; ++k) {
        AnimationFrame f = frame(colors::Yellow, "*", 0.06f);
        const Vec2i c = o + d * k;
        addUnique(f.tiles, c);
        for (int i = 1; i <= w; ++i) {
            addUnique(f.tiles, {c.x + i, c.y});
            addUnique(f.tiles, {c.x - i, c.y});
            addUnique(f.tiles, {c.x, c.y + i});
            addUnique(f.tiles, {c.x, c.y - i});
        }
        out.push_back(f);
    }
}

void crescentSlash(std::vector<AnimationFrame>& out, Vec2i o, Vec2i d) {
    AnimationFrame thin = frame(colors::Magenta, ")", 0.06f);
    AnimationFrame wide = frame(colors::LightMagenta, "D", 0.06f);
    if (d.x != 0) {
        const int dx = d.x;
        thin.tiles = {{o.x + dx, o.y - 1}, {o.x + 2 * dx, o.y}, {o.x + dx, o.y + 1}};
        wide.tiles = thin.tiles;
        addUnique(wide.tiles, {o.x + dx, o.y});
    } else {
        const int dy = d.y;
        thin.tiles = {{o.x - 1, o.y + dy}, {o.x, o.y + 2 * dy}, {o.x + 1, o.y + dy}};
        wide.tiles = thin.tiles;
        addUnique(wide.tiles, {o.x, o.y + dy});
    }
    out.push_back(thin);
    out.push_back(wide);
}

void vortex(std::vector<AnimationFrame>& out, Vec2i o, int r) {
    for (int k = r; k >= 1; --k) {
        AnimationFrame f = frame(colors::Magenta, "%", 0.05f);
        const int inner = (k - 1) * (k - 1);
        for (int dy = -k; dy <= k; ++dy) {
            for (int dx = -k; dx <= k; ++dx) {
                const int d2 = dx * dx + dy * dy;
                if (d2 > inner && d2 <= k * k) addUnique(f.tiles, {o.x + dx, o.y + dy});
            }
        }
        out.push_back(f);
    }
}

} // namespace

const char* patternName(PatternKind k) {
    switch (k) {
        case PatternKind::BasicSlash:     return "BasicSlash";
        case PatternKind::GroundSlam:     return "GroundSlam";
        case PatternKind::Whirlwind:      return "Whirlwind";
        case PatternKind::SwordThrust:    return "SwordThrust";
        case PatternKind::ArrowShot:      return "ArrowShot";
        case PatternKind::MultiShot:      return "MultiShot";
        case PatternKind::Barrage:        return "Barrage";
        case PatternKind::PiercingShot:   return "PiercingShot";
        case PatternKind::Fireball:       return "Fireball";
        case PatternKind::ChainLightning: return "ChainLightning";
        case PatternKind::FrostNova:      return "FrostNova";
        case PatternKind::MeteorShower:   return "MeteorShower";
        case PatternKind::CrescentSlash:  return "CrescentSlash";
        case PatternKind::Vortex:         return "Vortex";
    }
    return "BasicSlash";
}

std::string describePattern(const AttackPattern& p) {
    std::string s = patternName(p.kind);
    switch (p.kind) {
        case PatternKind::BasicSlash:
        case PatternKind::Whirlwind:
        case PatternKind::CrescentSlash:
            return s;
        case PatternKind::MultiShot:
        case PatternKind::MeteorShower:
            return s + "(" + std::to_string(p.reach) + "," + std::to_string(p.spread) + ")";
        default:
            return s + "(" + std::to_string(p.reach) + ")";
    }
}

bool patternKnocksBack(const AttackPattern& p) {
    switch (p.kind) {
        case PatternKind::BasicSlash:
        case PatternKind::GroundSlam:
        case PatternKind::Whirlwind:
        case PatternKind::SwordThrust:
        case PatternKind::CrescentSlash:
            return true;
        default:
            return false;
    }
}

Vec2i normalizeDir(Vec2i dir) {
    Vec2i d{sign(dir.x), sign(dir.y)};
    if (isZero(d)) d = {1, 0};
    return d;
}

Vec2i cardinalToward(Vec2i from, Vec2i to) {
    const int dx = to.x - from.x;
    const int dy = to.y - from.y;
    if (dx == 0 && dy == 0) return {1, 0};
    if (std::abs(dx) >= std::abs(dy)) return {sign(dx), 0};
    return {0, sign(dy)};
}

std::vector<AnimationFrame> animationFrames(const AttackPattern& p, Vec2i origin, Vec2i dir) {
    const Vec2i d = normalizeDir(dir);
    const int r = std::max(1, p.reach);
    const int spread = std::max(0, p.spread);

    std::vector<AnimationFrame> out;
    switch (p.kind) {
        case PatternKind::BasicSlash:
            basicSlash(out, origin, d);
            break;
        case PatternKind::GroundSlam:
            groundSlam(out, origin, r);
            break;
        case PatternKind::Whirlwind:
            whirlwind(out, origin, d);
            break;
        case PatternKind::SwordThrust:
            swordThrust(out, origin, d, r);
            break;
        case PatternKind::ArrowShot:
            shot(out, origin, d, r, 1, colors::Yellow, d.x != 0 ? "-" : "|", 0.03f);
            break;
        case PatternKind::PiercingShot:
            shot(out, origin, d, r, 2, colors::Magenta, "»", 0.02f);
            break;
        case PatternKind::MultiShot:
            multiShot(out, origin, d, r, spread);
            break;
        case PatternKind::Barrage:
            shot(out, origin, d, r, 0, colors::LightYellow, "•", 0.03f);
            break;
        case PatternKind::Fireball:
            fireball(out, origin, r);
            break;
        case PatternKind::ChainLightning:
            chainLightning(out, origin, d, r);
            break;
        case PatternKind::FrostNova:
            frostNova(out, origin, r);
            break;
        case PatternKind::MeteorShower:
            meteorShower(out, origin, d, r, spread);
            break;
        case PatternKind::CrescentSlash:
            crescentSlash(out, origin, d);
            break;
        case PatternKind::Vortex:
            vortex(out, origin, r);
            break;
    }
    return out;
}

std::vector<Vec2i> affectedTiles(const AttackPattern& p, Vec2i origin, Vec2i dir) {
    std::vector<AnimationFrame> frames = animationFrames(p, origin, dir);
    if (frames.empty()) return {};
    return std::move(frames.back().tiles);
}

float totalDuration(const std::vector<AnimationFrame>& frames) {
    float t = 0.0f;
    for (const auto& f : frames) t += f.duration;
    return t;
}
