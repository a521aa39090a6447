#pragma once

#include "feed_poller.hpp"
#include "http_transport.hpp"
#include "poll_state.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>

enum class CoordinatorState {
    Normal,      // multiplier == 1
    BackedOff,   // multiplier > 1
    RateLimited  // server-declared retry-after outstanding
};

const char* coordinator_state_name(CoordinatorState state);

struct CoordinatorSnapshot {
    CoordinatorState state = CoordinatorState::Normal;
    RateLimitState rate_limits;
    double multiplier = 1.0;
    int64_t interval_millis = 0;
    bool throttled = false;
    int64_t wait_millis = 0;
};

// Facade handed to the scheduling layer. Safe to call from several threads;
// it only advises how long to wait and never blocks to enforce it.
class PollingCoordinator {
public:
    PollingCoordinator(HttpTransport& transport,
                       CredentialProvider& credentials,
                       int64_t base_interval_millis = BackoffController::kDefaultBaseIntervalMillis,
                       double max_multiplier = BackoffController::kDefaultMaxMultiplier,
                       RateLimitTracker::Clock clock = nullptr);

    PollingCoordinator(const PollingCoordinator&) = delete;
    PollingCoordinator& operator=(const PollingCoordinator&) = delete;

    PollOutcome poll_public_feed(const std::optional<std::string>& cursor = std::nullopt,
                                 int limit = kDefaultPollLimit,
                                 const std::shared_ptr<PollScope>& scope = nullptr);

    PollOutcome poll_watchlist_feed(const std::optional<std::string>& cursor = std::nullopt,
                                    int limit = kDefaultPollLimit,
                                    const std::shared_ptr<PollScope>& scope = nullptr);

    int64_t current_interval_millis();
    bool should_throttle();

    // Consumes a pending retry-after: it governs exactly one wait
    int64_t recommended_wait_millis();

    void reset_backoff();

    // Read-only view for health reporting; consumes nothing
    CoordinatorSnapshot snapshot();

private:
    PollState state_;
    FeedPoller poller_;
};
