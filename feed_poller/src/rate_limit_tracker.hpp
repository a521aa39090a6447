#pragma once
#include "types.hpp"
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>

struct RateLimitState {
    int64_t remaining = 0;
    int64_t reset_at_epoch_millis = 0;
    std::optional<int64_t> retry_after_seconds;
};

// Latest known server-side quota. Not synchronized on its own; the owner
// serializes access (see PollState).
class RateLimitTracker {
public:
    using Clock = std::function<int64_t()>;

    static constexpr int64_t kInitialRemaining = 120;
    static constexpr int64_t kInitialResetWindowMillis = 60000;
    static constexpr int64_t kThrottleRemainingThreshold = 10;
    static constexpr int64_t kMaxProactiveWaitMillis = 5000;
    // Header values are clamped so that scaling to millis cannot overflow
    static constexpr int64_t kMaxRetryAfterSeconds = 86400;
    static constexpr int64_t kMaxResetEpochSeconds = std::numeric_limits<int64_t>::max() / 1000;

    explicit RateLimitTracker(Clock clock = nullptr);

    // Apply the rate-limit headers present on a response; absent or
    // malformed headers leave the matching field unchanged
    void observe(const Headers& headers);

    // Low remaining quota with a reset still in the future
    bool should_throttle() const;

    // Server-declared retry-after wins, then a proactive wait capped at 5s
    int64_t wait_time_millis() const;

    void set_retry_after(int64_t seconds);
    void clear_retry_after();
    bool has_retry_after() const { return state_.retry_after_seconds.has_value(); }

    const RateLimitState& state() const { return state_; }
    int64_t now() const { return clock_(); }

private:
    Clock clock_;
    RateLimitState state_;
};
