#include "cooldown.hpp"

#include <algorithm>

bool Cooldown::isReady(double now) const {
    if (!start_) return true;
    return elapsed(now) >= duration_;
}

double Cooldown::elapsed(double now) const {
    if (!start_) return duration_;
    return std::max(0.0, now - *start_);
}

double Cooldown::remaining(double now) const {
    if (!start_) return 0.0;
    return std::max(0.0, duration_ - elapsed(now));
}

double Cooldown::progress(double now) const {
    if (!start_ || duration_ <= 0.0) return 1.0;
    return std::clamp(elapsed(now) / duration_, 0.0, 1.0);
}
