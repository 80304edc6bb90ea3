#pragma once

#include <optional>

// Generic ability cooldown measured against the simulation clock (seconds).
//
// A cooldown that was never triggered is ready and reports progress 1.0.
class Cooldown {
public:
    Cooldown() = default;
    explicit Cooldown(double durationSec) : duration_(durationSec > 0.0 ? durationSec : 0.0) {}

    bool isReady(double now) const;
    double elapsed(double now) const;
    double remaining(double now) const;
    double progress(double now) const; // [0,1]

    void trigger(double now) { start_ = now; }
    void reset() { start_.reset(); }

    void setDuration(double d) { duration_ = d > 0.0 ? d : 0.0; }
    double duration() const { return duration_; }

    bool started() const { return start_.has_value(); }

    // Restores a running cooldown (save/load).
    void restore(std::optional<double> start) { start_ = start; }

private:
    double duration_ = 0.0;
    std::optional<double> start_;
};
