#pragma once

#include "attack_pattern.hpp"
#include "combat_rules.hpp"
#include "status_effects.hpp"

#include <cstdint>
#include <optional>
#include <vector>

enum class AnimationOwner : uint8_t {
    Player = 0,
    Enemy,
    Decoration, // never deals damage (burn areas, fades)
};

struct AnimationHitEffect {
    StatusKind kind = StatusKind::Burn;
    float duration = 0.0f;
    float dps = 0.0f;
};

// A live attack animation.
//
// The combat side only reads `footprint()`; frames carry the decoration.
struct Animation {
    std::vector<AnimationFrame> frames;
    float elapsed = 0.0f;

    AnimationOwner owner = AnimationOwner::Player;
    int attackerId = -1; // enemy id for enemy animations
    int damage = 0;
    DamageType type = DamageType::Physical;
    Vec2i origin{};
    Vec2i dir{1, 0};
    float knockback = 0.0f;
    std::optional<AnimationHitEffect> onHit;

    bool applied = false; // footprint damage already dealt

    float total() const { return totalDuration(frames); }
    bool finished() const { return elapsed > total(); }

    size_t frameIndex() const;
    const AnimationFrame* currentFrame() const;
    const std::vector<Vec2i>& footprint() const;

    // Advances time. Returns true when this call moved the animation into its
    // last frame (only ever once).
    bool advance(float dt);
};

// Rescales frame durations so the whole animation lasts `seconds`.
void fitDuration(std::vector<AnimationFrame>& frames, float seconds);
