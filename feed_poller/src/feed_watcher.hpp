#pragma once

#include "config.hpp"
#include "polling_coordinator.hpp"
#include "types.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

struct FeedStatus {
    FeedKind feed = FeedKind::Public;
    bool enabled = false;
    bool running = false;
    bool initialized = false;
    std::string cursor;
    int consecutive_failures = 0;
    uint64_t polls = 0;
    uint64_t items_seen = 0;
    std::string last_outcome;
    std::string last_error;
};

using PageHandler = std::function<void(FeedKind, const FeedPage&)>;
using OutcomeHandler = std::function<void(FeedKind, const PollOutcome&)>;

// Drives the coordinator with one timer thread per enabled feed
class FeedWatcher {
public:
    static constexpr std::chrono::milliseconds kStartDelay{2000};
    static constexpr std::chrono::milliseconds kMaxRetryDelay{300000};

    FeedWatcher(const Config& config, PollingCoordinator& coordinator);
    ~FeedWatcher();

    // New items after the reference point; not called for the initial load
    void set_page_handler(PageHandler handler);
    // Every recorded outcome, initial load included
    void set_outcome_handler(OutcomeHandler handler);

    void start();
    void stop();
    bool is_running() const;

    // Forget the cursor and failure count, clear backoff, restart the loop if it had stopped.
    // A poll in flight for the feed is discarded. Handlers must not call start/stop/reset.
    void reset(FeedKind feed);

    std::vector<FeedStatus> status() const;

    // One scheduling step: poll (or defer) and return how long to wait
    // before the next step, or nullopt when this feed's loop should stop
    std::optional<std::chrono::milliseconds> tick(FeedKind feed);

private:
    struct FeedLoop {
        FeedStatus status;
        std::optional<std::string> cursor;
        std::shared_ptr<PollScope> scope = std::make_shared<PollScope>();
        uint64_t generation = 0;
        std::thread thread;
    };

    FeedLoop& loop_for(FeedKind feed);
    const FeedLoop& loop_for(FeedKind feed) const;

    void launch(FeedKind feed);
    void run_loop(FeedKind feed);
    std::optional<std::chrono::milliseconds> handle_outcome(FeedKind feed, const PollOutcome& result,
                                                            bool initial, uint64_t generation);

    const Config& config_;
    PollingCoordinator& coordinator_;
    int poll_limit_;

    PageHandler page_handler_;
    OutcomeHandler outcome_handler_;

    std::atomic<bool> running_{false};
    // Serializes start/stop/reset so thread launch and join never interleave
    std::mutex lifecycle_mutex_;
    mutable std::mutex mutex_;
    std::condition_variable wake_cv_;
    FeedLoop loops_[2];
};
