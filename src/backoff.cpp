// src/backoff.cpp
// Exponential reconnect backoff with jitter.

#include "logwire/backoff.hpp"
#include "logwire/error.hpp"

#include <algorithm>
#include <cmath>

namespace logwire {

ExponentialBackoff::ExponentialBackoff()
    : ExponentialBackoff(std::chrono::milliseconds(1000), std::chrono::milliseconds(30000)) {}

ExponentialBackoff::ExponentialBackoff(std::chrono::milliseconds initial_delay,
                                       std::chrono::milliseconds max_delay,
                                       double factor, double jitter)
    : initial_delay_(initial_delay), max_delay_(max_delay),
      factor_(factor), jitter_(jitter), rng_(std::random_device{}()) {
    if (initial_delay.count() < 0 || max_delay < initial_delay) {
        throw SyslogError::configuration("backoff delays must satisfy 0 <= initial <= max");
    }
    if (!(factor >= 1.0)) {
        throw SyslogError::configuration("backoff factor must be at least 1");
    }
    if (!(jitter >= 0.0)) {
        throw SyslogError::configuration("backoff jitter must not be negative");
    }
}

std::chrono::milliseconds ExponentialBackoff::next_delay() {
    // Exponential backoff: initial * factor^attempt, capped at max before
    // jitter. attempts_ stops growing once the cap is reached.
    double cap = static_cast<double>(max_delay_.count());
    double base = 0.0;
    if (initial_delay_.count() > 0) {
        base = static_cast<double>(initial_delay_.count()) *
               std::pow(factor_, static_cast<double>(attempts_));
        if (base < cap) {
            attempts_++;
        } else {
            base = cap;
        }
    }

    double slack = 0.0;
    if (jitter_ > 0.0) {
        std::uniform_real_distribution<double> dist(0.0, jitter_);
        slack = base * dist(rng_);
    }

    double delay = std::min(base + slack, cap);
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

void ExponentialBackoff::reset() {
    attempts_ = 0;
}

} // namespace logwire
