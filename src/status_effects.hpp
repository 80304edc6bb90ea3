#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

// Timed status effects (buffs/debuffs) shared by the player and enemies.

enum class StatusKind : uint8_t {
    Bleed = 0,
    Poison,
    Burn,
    Stun,
    Cripple,
    Fear,
    PoisonImmunity,
};

constexpr int STATUS_KIND_COUNT = 7;

constexpr float BLEED_MAX_DURATION = 8.0f;

// Human-readable short tag for HUD/status lists.
inline const char* statusTag(StatusKind k) {
    switch (k) {
        case StatusKind::Bleed:          return "BLEED";
        case StatusKind::Poison:         return "POISON";
        case StatusKind::Burn:           return "BURN";
        case StatusKind::Stun:           return "STUN";
        case StatusKind::Cripple:        return "CRIPPLE";
        case StatusKind::Fear:           return "FEAR";
        case StatusKind::PoisonImmunity: return "IMMUNE";
        default:                         return "?";
    }
}

// End-of-effect message (player-facing).
inline const char* statusEndMessage(StatusKind k) {
    switch (k) {
        case StatusKind::Bleed:          return "YOUR WOUNDS CLOSE.";
        case StatusKind::Poison:         return "THE POISON WEARS OFF.";
        case StatusKind::Burn:           return "THE FLAMES SUBSIDE.";
        case StatusKind::Stun:           return "YOU SHAKE OFF THE DAZE.";
        case StatusKind::Cripple:        return "YOUR LEGS FEEL STEADY AGAIN.";
        case StatusKind::Fear:           return "YOU FEEL YOUR COURAGE RETURN.";
        case StatusKind::PoisonImmunity: return "YOUR ANTITOXIN FADES.";
        default:                         return "";
    }
}

// Damage per second per stack when the caller does not specify one.
inline float defaultStatusDps(StatusKind k) {
    switch (k) {
        case StatusKind::Bleed:  return 1.0f;
        case StatusKind::Poison: return 1.0f;
        case StatusKind::Burn:   return 2.0f;
        default:                 return 0.0f;
    }
}

struct StatusEffect {
    StatusKind kind = StatusKind::Bleed;
    float duration = 0.0f; // seconds remaining
    float dps = 0.0f;
    int stacks = 1;        // bleed only
};

StatusEffect makeStatus(StatusKind k, float duration, int stacks = 1);
StatusEffect makeBleed(int stacks, float duration = BLEED_MAX_DURATION);
StatusEffect makeBurn(float duration);

class StatusEffects {
public:
    // Stacking rules:
    //   Bleed adds stacks and refreshes to BLEED_MAX_DURATION.
    //   Poison refreshes duration; blocked while PoisonImmunity is active.
    //   Burn appends a new instance.
    //   Everything else replaces the existing effect.
    // Returns false if the effect was rejected.
    bool apply(const StatusEffect& e);

    // Counts durations down; effects with duration <= 0 are removed and their
    // kinds appended to `expired` (if given).
    void update(float dt, std::vector<StatusKind>* expired = nullptr);

    // Sum of dps * stacks across all active effects.
    float totalDps() const;

    bool has(StatusKind k) const;
    const StatusEffect* get(StatusKind k) const;
    bool remove(StatusKind k);
    void clear() { effects_.clear(); }

    const std::vector<StatusEffect>& effects() const { return effects_; }
    size_t count() const { return effects_.size(); }

private:
    std::vector<StatusEffect> effects_;
};
