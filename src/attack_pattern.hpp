#pragma once

#include "common.hpp"

#include <cstdint>
#include <string>
#include <vector>

// Attack pattern engine.
//
// A pattern is a tagged value with its parameters. Given (origin, direction) it
// expands into an ordered list of animation frames. The LAST frame's tile set
// is the damage footprint; everything else is decoration.

enum class PatternKind : uint8_t {
    BasicSlash = 0,
    GroundSlam,
    Whirlwind,
    SwordThrust,
    ArrowShot,
    MultiShot,
    Barrage,
    PiercingShot,
    Fireball,
    ChainLightning,
    FrostNova,
    MeteorShower,
    CrescentSlash,
    Vortex,
};

const char* patternName(PatternKind k);

struct AttackPattern {
    PatternKind kind = PatternKind::BasicSlash;
    int reach = 1;  // radius / range, depending on kind
    int spread = 0; // MultiShot spread, MeteorShower half-width

    static AttackPattern basicSlash() { return {PatternKind::BasicSlash, 1, 0}; }
    static AttackPattern groundSlam(int r) { return {PatternKind::GroundSlam, r, 0}; }
    static AttackPattern whirlwind() { return {PatternKind::Whirlwind, 1, 0}; }
    static AttackPattern swordThrust(int r) { return {PatternKind::SwordThrust, r, 0}; }
    static AttackPattern arrowShot(int r) { return {PatternKind::ArrowShot, r, 0}; }
    static AttackPattern multiShot(int r, int spread) { return {PatternKind::MultiShot, r, spread}; }
    static AttackPattern barrage(int r) { return {PatternKind::Barrage, r, 0}; }
    static AttackPattern piercingShot(int r) { return {PatternKind::PiercingShot, r, 0}; }
    static AttackPattern fireball(int r) { return {PatternKind::Fireball, r, 0}; }
    static AttackPattern chainLightning(int r) { return {PatternKind::ChainLightning, r, 0}; }
    static AttackPattern frostNova(int r) { return {PatternKind::FrostNova, r, 0}; }
    static AttackPattern meteorShower(int r, int w) { return {PatternKind::MeteorShower, r, w}; }
    static AttackPattern crescentSlash() { return {PatternKind::CrescentSlash, 2, 0}; }
    static AttackPattern vortex(int r) { return {PatternKind::Vortex, r, 0}; }
};

inline bool operator==(const AttackPattern& a, const AttackPattern& b) {
    return a.kind == b.kind && a.reach == b.reach && a.spread == b.spread;
}

// "GroundSlam(3)", "MultiShot(5,2)", "Whirlwind".
std::string describePattern(const AttackPattern& p);

// Melee slams push their targets back.
bool patternKnocksBack(const AttackPattern& p);

struct AnimationFrame {
    std::vector<Vec2i> tiles; // deduplicated
    Color color{};
    const char* glyph = "*";  // UTF-8
    float duration = 0.05f;   // seconds
};

// Snaps an arbitrary delta to a unit direction; (0,0) becomes (1,0).
Vec2i normalizeDir(Vec2i dir);

// Unit cardinal direction from `from` toward `to` along the dominant axis.
Vec2i cardinalToward(Vec2i from, Vec2i to);

std::vector<AnimationFrame> animationFrames(const AttackPattern& p, Vec2i origin, Vec2i dir);

// Tile set of the last frame of animationFrames().
std::vector<Vec2i> affectedTiles(const AttackPattern& p, Vec2i origin, Vec2i dir);

float totalDuration(const std::vector<AnimationFrame>& frames);
