// include/logwire/backoff.hpp
// Reconnect backoff strategies.

#pragma once

#include <chrono>
#include <cstdint>
#include <random>

namespace logwire {

// Strategy deciding how long a client waits before the next reconnect
// attempt. Only ever touched under the owning client's lock.
class Backoff {
public:
    virtual ~Backoff() = default;

    // Delay to wait after the attempt that is about to start. Each call
    // advances the schedule.
    virtual std::chrono::milliseconds next_delay() = 0;

    // Called after a successful write: forget previous failures.
    virtual void reset() = 0;
};

// initial * factor^(attempt-1), plus up to `jitter` of that as random slack,
// capped at max_delay. The constructor throws SyslogError (Configuration) if
// initial_delay is negative or above max_delay, factor < 1 or jitter < 0.
class ExponentialBackoff : public Backoff {
public:
    ExponentialBackoff();
    ExponentialBackoff(std::chrono::milliseconds initial_delay,
                       std::chrono::milliseconds max_delay,
                       double factor = 1.5, double jitter = 0.2);

    std::chrono::milliseconds next_delay() override;
    void reset() override;

    uint32_t attempts() const noexcept { return attempts_; }

private:
    std::chrono::milliseconds initial_delay_;
    std::chrono::milliseconds max_delay_;
    double factor_;
    double jitter_;
    uint32_t attempts_ = 0;
    std::mt19937_64 rng_;
};

// Fixed delay regardless of history. A zero delay disables rate limiting.
class ConstantBackoff : public Backoff {
public:
    explicit ConstantBackoff(std::chrono::milliseconds delay = std::chrono::milliseconds(0))
        : delay_(delay) {}

    std::chrono::milliseconds next_delay() override { return delay_; }
    void reset() override {}

private:
    std::chrono::milliseconds delay_;
};

} // namespace logwire
