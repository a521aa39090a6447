#include "polling_coordinator.hpp"
#include <spdlog/spdlog.h>

const char* coordinator_state_name(CoordinatorState state) {
    switch (state) {
        case CoordinatorState::Normal:
            return "normal";
        case CoordinatorState::BackedOff:
            return "backed_off";
        case CoordinatorState::RateLimited:
            return "rate_limited";
    }
    return "unknown";
}

PollingCoordinator::PollingCoordinator(HttpTransport& transport,
                                       CredentialProvider& credentials,
                                       int64_t base_interval_millis,
                                       double max_multiplier,
                                       RateLimitTracker::Clock clock)
    : state_(base_interval_millis, max_multiplier, std::move(clock)),
      poller_(transport, credentials, state_) {
}

PollOutcome PollingCoordinator::poll_public_feed(const std::optional<std::string>& cursor,
                                                 int limit,
                                                 const std::shared_ptr<PollScope>& scope) {
    return poller_.poll(FeedKind::Public, cursor, limit, scope);
}

PollOutcome PollingCoordinator::poll_watchlist_feed(const std::optional<std::string>& cursor,
                                                    int limit,
                                                    const std::shared_ptr<PollScope>& scope) {
    return poller_.poll(FeedKind::Watchlist, cursor, limit, scope);
}

int64_t PollingCoordinator::current_interval_millis() {
    std::lock_guard<std::mutex> lock(state_.mutex);
    return state_.backoff.current_interval_millis();
}

bool PollingCoordinator::should_throttle() {
    std::lock_guard<std::mutex> lock(state_.mutex);
    bool throttled = state_.rate_limits.should_throttle();
    if (throttled) {
        const auto& limits = state_.rate_limits.state();
        spdlog::warn("Low rate limit ({} remaining), should wait {} ms",
                     limits.remaining, limits.reset_at_epoch_millis - state_.rate_limits.now());
    }
    return throttled;
}

int64_t PollingCoordinator::recommended_wait_millis() {
    std::lock_guard<std::mutex> lock(state_.mutex);
    int64_t wait = state_.rate_limits.wait_time_millis();
    if (state_.rate_limits.has_retry_after()) {
        state_.rate_limits.clear_retry_after();
    }
    return wait;
}

void PollingCoordinator::reset_backoff() {
    std::lock_guard<std::mutex> lock(state_.mutex);
    state_.backoff.reset();
    spdlog::info("Backoff reset by caller");
}

CoordinatorSnapshot PollingCoordinator::snapshot() {
    std::lock_guard<std::mutex> lock(state_.mutex);

    CoordinatorSnapshot snap;
    snap.rate_limits = state_.rate_limits.state();
    snap.multiplier = state_.backoff.multiplier();
    snap.interval_millis = state_.backoff.current_interval_millis();
    snap.throttled = state_.rate_limits.should_throttle();
    snap.wait_millis = state_.rate_limits.wait_time_millis();

    if (snap.rate_limits.retry_after_seconds) {
        snap.state = CoordinatorState::RateLimited;
    } else if (snap.multiplier > 1.0) {
        snap.state = CoordinatorState::BackedOff;
    } else {
        snap.state = CoordinatorState::Normal;
    }

    return snap;
}
