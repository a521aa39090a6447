#include "feed_watcher.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

FeedWatcher::FeedWatcher(const Config& config, PollingCoordinator& coordinator)
    : config_(config),
      coordinator_(coordinator),
      poll_limit_(std::clamp(config.poll_limit, 1, kMaxPollLimit)) {
    loops_[0].status.feed = FeedKind::Public;
    loops_[0].status.enabled = config.enable_public_feed;
    loops_[1].status.feed = FeedKind::Watchlist;
    loops_[1].status.enabled = config.enable_watchlist_feed;
}

FeedWatcher::~FeedWatcher() {
    stop();
}

void FeedWatcher::set_page_handler(PageHandler handler) {
    page_handler_ = std::move(handler);
}

void FeedWatcher::set_outcome_handler(OutcomeHandler handler) {
    outcome_handler_ = std::move(handler);
}

FeedWatcher::FeedLoop& FeedWatcher::loop_for(FeedKind feed) {
    return loops_[feed == FeedKind::Watchlist ? 1 : 0];
}

const FeedWatcher::FeedLoop& FeedWatcher::loop_for(FeedKind feed) const {
    return loops_[feed == FeedKind::Watchlist ? 1 : 0];
}

void FeedWatcher::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (running_) {
        spdlog::warn("Feed watcher is already running");
        return;
    }
    running_ = true;

    for (auto feed : {FeedKind::Public, FeedKind::Watchlist}) {
        if (loop_for(feed).status.enabled) {
            launch(feed);
        }
    }
}

void FeedWatcher::launch(FeedKind feed) {
    auto& loop = loop_for(feed);
    if (loop.thread.joinable()) {
        loop.thread.join();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        loop.scope = std::make_shared<PollScope>();
        loop.status.running = true;
    }

    loop.thread = std::thread(&FeedWatcher::run_loop, this, feed);
    spdlog::info("Started {} feed polling", feed_name(feed));
}

void FeedWatcher::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    bool was_running = running_.exchange(false);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& loop : loops_) {
            // Results still in flight are no longer wanted
            loop.scope->cancel();
        }
    }
    wake_cv_.notify_all();

    for (auto& loop : loops_) {
        if (loop.thread.joinable()) {
            loop.thread.join();
        }
    }

    if (was_running) {
        spdlog::info("Feed watcher stopped");
    }
}

bool FeedWatcher::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(std::begin(loops_), std::end(loops_),
                       [](const FeedLoop& loop) { return loop.status.running; });
}

void FeedWatcher::reset(FeedKind feed) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    auto& loop = loop_for(feed);
    bool restart = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Anything still in flight belongs to the previous generation
        loop.generation++;
        loop.scope->cancel();
        loop.scope = std::make_shared<PollScope>();

        loop.cursor.reset();
        loop.status.cursor.clear();
        loop.status.initialized = false;
        loop.status.consecutive_failures = 0;
        loop.status.last_error.clear();
        restart = running_ && loop.status.enabled && !loop.status.running;
    }

    coordinator_.reset_backoff();
    spdlog::info("Reset {} feed polling state", feed_name(feed));

    if (restart) {
        launch(feed);
    }
}

std::vector<FeedStatus> FeedWatcher::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {loops_[0].status, loops_[1].status};
}

void FeedWatcher::run_loop(FeedKind feed) {
    while (running_) {
        auto delay = tick(feed);
        if (!delay) {
            break;
        }

        spdlog::debug("Next {} feed poll in {} ms", feed_name(feed), delay->count());
        std::unique_lock<std::mutex> lock(mutex_);
        wake_cv_.wait_for(lock, *delay, [this] { return !running_; });
    }

    std::lock_guard<std::mutex> lock(mutex_);
    loop_for(feed).status.running = false;
    spdlog::info("Stopped {} feed polling", feed_name(feed));
}

std::optional<std::chrono::milliseconds> FeedWatcher::tick(FeedKind feed) {
    auto& loop = loop_for(feed);

    bool initial = false;
    std::optional<std::string> cursor;
    std::shared_ptr<PollScope> scope;
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        initial = !loop.status.initialized;
        cursor = loop.cursor;
        scope = loop.scope;
        generation = loop.generation;
    }

    if (!initial && coordinator_.should_throttle()) {
        auto wait = coordinator_.recommended_wait_millis();
        spdlog::info("Throttling {} feed for {} ms due to rate limits", feed_name(feed), wait);
        return std::chrono::milliseconds(std::max<int64_t>(wait, 1));
    }

    // The initial load only fetches the newest item to set the reference cursor
    int limit = initial ? 1 : poll_limit_;
    PollOutcome result = feed == FeedKind::Watchlist
        ? coordinator_.poll_watchlist_feed(cursor, limit, scope)
        : coordinator_.poll_public_feed(cursor, limit, scope);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (loop.generation != generation) {
            spdlog::debug("Discarding {} feed result from before reset", feed_name(feed));
            return kStartDelay;
        }
    }

    if (scope->is_cancelled()) {
        return std::nullopt;
    }

    if (outcome_handler_) {
        try {
            outcome_handler_(feed, result);
        } catch (const std::exception& e) {
            spdlog::error("Outcome handler failed for {} feed: {}", feed_name(feed), e.what());
        }
    }

    return handle_outcome(feed, result, initial, generation);
}

std::optional<std::chrono::milliseconds> FeedWatcher::handle_outcome(FeedKind feed,
                                                                     const PollOutcome& result,
                                                                     bool initial,
                                                                     uint64_t generation) {
    auto& loop = loop_for(feed);

    if (auto* success = std::get_if<outcome::Success>(&result)) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (loop.generation != generation) {
                return kStartDelay;
            }
            loop.status.polls++;
            loop.status.last_outcome = outcome_name(result);
            loop.status.consecutive_failures = 0;
            loop.status.last_error.clear();
            loop.status.initialized = true;
            if (!success->page.since.empty()) {
                loop.cursor = success->page.since;
                loop.status.cursor = success->page.since;
            }
            if (!initial) {
                loop.status.items_seen += success->page.posts.size();
            }
        }

        if (initial) {
            spdlog::info("Set reference cursor for {} feed: {}", feed_name(feed),
                         success->page.since.empty() ? "<none>" : success->page.since);
            return kStartDelay;
        }

        if (!success->page.posts.empty()) {
            spdlog::info("Found {} new {} posts", success->page.posts.size(), feed_name(feed));
            if (page_handler_) {
                try {
                    page_handler_(feed, success->page);
                } catch (const std::exception& e) {
                    spdlog::error("Page handler failed for {} feed: {}", feed_name(feed), e.what());
                }
            }
        } else {
            spdlog::debug("No new {} posts found", feed_name(feed));
        }

        return std::chrono::milliseconds(coordinator_.current_interval_millis());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (loop.generation != generation) {
        return kStartDelay;
    }
    loop.status.polls++;
    loop.status.last_outcome = outcome_name(result);

    if (std::holds_alternative<outcome::RateLimited>(result)) {
        // The other feed may already have consumed the one-shot retry-after
        auto wait = coordinator_.recommended_wait_millis();
        if (wait <= 0) {
            wait = coordinator_.current_interval_millis();
        }
        return std::chrono::milliseconds(wait);
    }

    if (std::holds_alternative<outcome::AuthRequired>(result)) {
        loop.status.last_error = std::string("Authentication required for ") + feed_name(feed) + " feed";
        spdlog::error("{}, stopping polling", loop.status.last_error);
        return std::nullopt;
    }

    const auto& error = std::get<outcome::TransportError>(result);
    loop.status.consecutive_failures++;
    if (loop.status.consecutive_failures < config_.max_consecutive_failures) {
        int64_t delay = config_.base_interval_ms;
        for (int i = 0; i < loop.status.consecutive_failures && delay < kMaxRetryDelay.count(); ++i) {
            delay *= 2;
        }
        delay = std::min<int64_t>(delay, kMaxRetryDelay.count());
        spdlog::warn("Retrying {} feed in {} ms (attempt {}/{})", feed_name(feed), delay,
                     loop.status.consecutive_failures, config_.max_consecutive_failures);
        return std::chrono::milliseconds(delay);
    }

    loop.status.last_error = error.message;
    spdlog::error("Max retries reached for {} feed, stopping polling", feed_name(feed));
    return std::nullopt;
}
