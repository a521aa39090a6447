#pragma once
#include <cstdint>

// Multiplicative backoff over a fixed base interval. Grows by doubling up to
// a ceiling, drops straight back to 1 on success.
class BackoffController {
public:
    static constexpr int64_t kDefaultBaseIntervalMillis = 30000;
    static constexpr double kDefaultMaxMultiplier = 8.0;

    BackoffController(int64_t base_interval_millis = kDefaultBaseIntervalMillis,
                      double max_multiplier = kDefaultMaxMultiplier);

    // Record a clean round-trip
    void on_success();

    // Record a failed or throttled request
    void on_failure_or_throttle();

    // Caller-requested reset
    void reset();

    int64_t current_interval_millis() const;
    double multiplier() const { return multiplier_; }
    double max_multiplier() const { return max_multiplier_; }
    int64_t base_interval_millis() const { return base_interval_millis_; }

private:
    int64_t base_interval_millis_;
    double max_multiplier_;
    double multiplier_ = 1.0;
};
