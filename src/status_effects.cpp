#include "status_effects.hpp"

#include <algorithm>

StatusEffect makeStatus(StatusKind k, float duration, int stacks) {
    StatusEffect e;
    e.kind = k;
    e.duration = duration;
    e.dps = defaultStatusDps(k);
    e.stacks = std::max(1, stacks);
    return e;
}

StatusEffect makeBleed(int stacks, float duration) {
    return makeStatus(StatusKind::Bleed, duration, stacks);
}

StatusEffect makeBurn(float duration) {
    return makeStatus(StatusKind::Burn, duration);
}

bool StatusEffects::apply(const StatusEffect& e) {
    if (e.duration <= 0.0f) return false;

    switch (e.kind) {
        case StatusKind::Bleed: {
            for (auto& cur : effects_) {
                if (cur.kind != StatusKind::Bleed) continue;
                cur.stacks += std::max(1, e.stacks);
                cur.duration = BLEED_MAX_DURATION;
                return true;
            }
            effects_.push_back(e);
            return true;
        }
        case StatusKind::Poison: {
            if (has(StatusKind::PoisonImmunity)) return false;
            for (auto& cur : effects_) {
                if (cur.kind != StatusKind::Poison) continue;
                cur.duration = e.duration;
                return true;
            }
            effects_.push_back(e);
            return true;
        }
        case StatusKind::Burn:
            effects_.push_back(e);
            return true;
        default:
            break;
    }

    for (auto& cur : effects_) {
        if (cur.kind == e.kind) {
            cur = e;
            return true;
        }
    }
    effects_.push_back(e);
    return true;
}

void StatusEffects::update(float dt, std::vector<StatusKind>* expired) {
    for (auto& e : effects_) e.duration -= dt;

    auto it = std::remove_if(effects_.begin(), effects_.end(), [&](const StatusEffect& e) {
        if (e.duration > 0.0f) return false;
        if (expired) expired->push_back(e.kind);
        return true;
    });
    effects_.erase(it, effects_.end());
}

float StatusEffects::totalDps() const {
    float total = 0.0f;
    for (const auto& e : effects_) total += e.dps * static_cast<float>(e.stacks);
    return total;
}

bool StatusEffects::has(StatusKind k) const {
    return get(k) != nullptr;
}

const StatusEffect* StatusEffects::get(StatusKind k) const {
    for (const auto& e : effects_) {
        if (e.kind == k) return &e;
    }
    return nullptr;
}

bool StatusEffects::remove(StatusKind k) {
    const size_t before = effects_.size();
    effects_.erase(std::remove_if(effects_.begin(), effects_.end(),
        [k](const StatusEffect& e) { return e.kind == k; }), effects_.end());
    return effects_.size() != before;
}
