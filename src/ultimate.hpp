#pragma once

#include "cooldown.hpp"

#include <cstdint>
#include <optional>
#include <string>

enum class UltimateKind : uint8_t {
    Shockwave = 0,
    Rage,
    Ghost,
};

constexpr float ULTIMATE_MAX_CHARGE = 100.0f;
constexpr float ULTIMATE_CHARGE_PER_HIT_CAP = 15.0f;
constexpr int SHOCKWAVE_DAMAGE = 25;
constexpr int SHOCKWAVE_RADIUS = 3;
constexpr float SHOCKWAVE_ANIM_SEC = 0.5f;

const char* ultimateName(UltimateKind k);
double ultimateCooldownSec(UltimateKind k);

// Seconds the effect stays active (Shockwave: animation length).
double ultimateEffectSec(UltimateKind k);

// Player ultimate: charge meter plus cooldown plus the active window.
class Ultimate {
public:
    explicit Ultimate(UltimateKind k = UltimateKind::Shockwave);

    UltimateKind kind() const { return kind_; }
    void setKind(UltimateKind k);

    float charge() const { return charge_; }
    void setCharge(float c);

    // +min(15, damage * 5%), capped at 100.
    void addCharge(int damage);

    bool canUse(double now) const;

    // Empties the charge, starts the cooldown and the active window.
    // Returns false (no change) if not usable.
    bool use(double now);

    bool active(double now) const;
    double activeRemaining(double now) const;

    const Cooldown& cooldown() const { return cooldown_; }
    Cooldown& cooldown() { return cooldown_; }

private:
    UltimateKind kind_ = UltimateKind::Shockwave;
    float charge_ = 0.0f;
    Cooldown cooldown_;
    std::optional<double> activeSince_;
};
