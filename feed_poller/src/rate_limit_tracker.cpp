#include "rate_limit_tracker.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace {
    constexpr const char* kRemainingHeader = "x-ratelimit-remaining";
    constexpr const char* kResetHeader = "x-ratelimit-reset";
    constexpr const char* kRetryAfterHeader = "retry-after";

    std::optional<int64_t> non_negative_header(const Headers& headers, const char* name) {
        auto it = headers.find(name);
        if (it == headers.end()) {
            return std::nullopt;
        }

        auto value = util::parse_int64(it->second);
        if (!value || *value < 0) {
            spdlog::debug("Ignoring malformed {} header: '{}'", name, it->second);
            return std::nullopt;
        }
        return value;
    }
}

RateLimitTracker::RateLimitTracker(Clock clock)
    : clock_(clock ? std::move(clock) : Clock(&util::now_epoch_millis)) {
    state_.remaining = kInitialRemaining;
    state_.reset_at_epoch_millis = clock_() + kInitialResetWindowMillis;
}

void RateLimitTracker::observe(const Headers& headers) {
    if (auto remaining = non_negative_header(headers, kRemainingHeader)) {
        state_.remaining = *remaining;
    }

    if (auto reset_seconds = non_negative_header(headers, kResetHeader)) {
        state_.reset_at_epoch_millis = std::min(*reset_seconds, kMaxResetEpochSeconds) * 1000;
    }

    if (auto retry_after = non_negative_header(headers, kRetryAfterHeader)) {
        state_.retry_after_seconds = std::min(*retry_after, kMaxRetryAfterSeconds);
    }

    spdlog::debug("Rate limit state: remaining={} reset_at={} retry_after={}",
                  state_.remaining, state_.reset_at_epoch_millis,
                  state_.retry_after_seconds ? std::to_string(*state_.retry_after_seconds) : "none");
}

bool RateLimitTracker::should_throttle() const {
    return state_.remaining < kThrottleRemainingThreshold &&
           state_.reset_at_epoch_millis > clock_();
}

int64_t RateLimitTracker::wait_time_millis() const {
    if (state_.retry_after_seconds) {
        return *state_.retry_after_seconds * 1000;
    }

    int64_t until_reset = state_.reset_at_epoch_millis - clock_();
    if (state_.remaining < kThrottleRemainingThreshold && until_reset > 0) {
        return std::min(until_reset, kMaxProactiveWaitMillis);
    }

    return 0;
}

void RateLimitTracker::set_retry_after(int64_t seconds) {
    state_.retry_after_seconds = std::clamp<int64_t>(seconds, 0, kMaxRetryAfterSeconds);
}

void RateLimitTracker::clear_retry_after() {
    state_.retry_after_seconds.reset();
}
