#pragma once
#include "backoff_controller.hpp"
#include "rate_limit_tracker.hpp"
#include <atomic>
#include <mutex>

// Rate-limit and backoff state shared by both feeds. The server enforces one
// combined quota, so a single mutex covers both members and every
// response is applied to them as one step.
struct PollState {
    PollState(int64_t base_interval_millis = BackoffController::kDefaultBaseIntervalMillis,
              double max_multiplier = BackoffController::kDefaultMaxMultiplier,
              RateLimitTracker::Clock clock = nullptr)
        : rate_limits(std::move(clock)),
          backoff(base_interval_millis, max_multiplier) {}

    std::mutex mutex;
    RateLimitTracker rate_limits;
    BackoffController backoff;
};

// Cancellation handle for one caller context (e.g. one feed view). A poll
// whose scope is cancelled before its response arrives records nothing.
class PollScope {
public:
    void cancel() { cancelled_ = true; }
    bool is_cancelled() const { return cancelled_; }

private:
    std::atomic<bool> cancelled_{false};
};
