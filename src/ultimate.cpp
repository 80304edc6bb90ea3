#include "ultimate.hpp"

#include <algorithm>

const char* ultimateName(UltimateKind k) {
    switch (k) {
        case UltimateKind::Shockwave: return "Shockwave";
        case UltimateKind::Rage:      return "Rage";
        case UltimateKind::Ghost:     return "Ghost";
        default:                      return "?";
    }
}

double ultimateCooldownSec(UltimateKind k) {
    switch (k) {
        case UltimateKind::Rage:  return 45.0;
        case UltimateKind::Ghost: return 60.0;
        case UltimateKind::Shockwave:
        default:                  return 20.0;
    }
}

double ultimateEffectSec(UltimateKind k) {
    switch (k) {
        case UltimateKind::Rage:  return 30.0;
        case UltimateKind::Ghost: return 10.0;
        case UltimateKind::Shockwave:
        default:                  return SHOCKWAVE_ANIM_SEC;
    }
}

Ultimate::Ultimate(UltimateKind k) : kind_(k), cooldown_(ultimateCooldownSec(k)) {}

void Ultimate::setKind(UltimateKind k) {
    kind_ = k;
    cooldown_.setDuration(ultimateCooldownSec(k));
    activeSince_.reset();
}

void Ultimate::setCharge(float c) {
    charge_ = std::clamp(c, 0.0f, ULTIMATE_MAX_CHARGE);
}

void Ultimate::addCharge(int damage) {
    if (damage <= 0) return;
    const float gain = std::min(ULTIMATE_CHARGE_PER_HIT_CAP, static_cast<float>(damage) * 0.05f);
    setCharge(charge_ + gain);
}

bool Ultimate::canUse(double now) const {
    return charge_ >= ULTIMATE_MAX_CHARGE && cooldown_.isReady(now);
}

bool Ultimate::use(double now) {
    if (!canUse(now)) return false;
    charge_ = 0.0f;
    cooldown_.trigger(now);
    activeSince_ = now;
    return true;
}

bool Ultimate::active(double now) const {
    return activeRemaining(now) > 0.0;
}

double Ultimate::activeRemaining(double now) const {
    if (!activeSince_) return 0.0;
    return std::max(0.0, ultimateEffectSec(kind_) - (now - *activeSince_));
}
