#include "event_publisher.hpp"
#include "util.hpp"
#include <sw/redis++/redis++.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <thread>
#include <unordered_map>

PollEvent make_poll_event(FeedKind feed, const PollOutcome& outcome) {
    PollEvent event;
    event.feed = feed;
    event.outcome = outcome_name(outcome);
    event.timestamp = util::current_iso8601();

    if (auto* success = std::get_if<outcome::Success>(&outcome)) {
        event.count = success->page.count;
        event.since = success->page.since;
        event.has_more = success->page.has_more;
    } else if (auto* limited = std::get_if<outcome::RateLimited>(&outcome)) {
        event.detail = "retry_after=" + std::to_string(limited->retry_after_seconds);
    } else if (auto* error = std::get_if<outcome::TransportError>(&outcome)) {
        event.detail = error->message;
    }

    return event;
}

nlohmann::json poll_event_to_json(const PollEvent& event) {
    nlohmann::json json_event = {
        {"feed", feed_name(event.feed)},
        {"outcome", event.outcome},
        {"count", event.count},
        {"has_more", event.has_more},
        {"timestamp", event.timestamp}
    };

    // Optional fields
    if (!event.since.empty()) {
        json_event["since"] = event.since;
    }
    if (!event.detail.empty()) {
        json_event["detail"] = event.detail;
    }

    return json_event;
}

class EventPublisher::Impl {
public:
    explicit Impl(const Config& config) : config_(config) {
        try {
            sw::redis::ConnectionOptions connection_opts;
            connection_opts.host = config_.redis_host;
            connection_opts.port = config_.redis_port;
            connection_opts.connect_timeout = std::chrono::milliseconds(500);
            connection_opts.socket_timeout = std::chrono::milliseconds(500);

            if (!config_.redis_password.empty()) {
                connection_opts.password = config_.redis_password;
            }

            sw::redis::ConnectionPoolOptions pool_opts;
            pool_opts.size = 1;

            redis_ = std::make_unique<sw::redis::Redis>(connection_opts, pool_opts);
            spdlog::info("Event publisher targeting Redis at {}:{} (stream {})",
                         config_.redis_host, config_.redis_port, config_.redis_stream);
        } catch (const std::exception& e) {
            spdlog::error("Failed to create Redis client: {}", e.what());
            redis_ = nullptr;
        }
    }

    ~Impl() {
        stop();
    }

    void start() {
        if (running_) {
            return;
        }
        running_ = true;
        worker_ = std::thread(&Impl::worker_loop, this);
    }

    void stop() {
        if (!running_) {
            return;
        }
        running_ = false;
        queue_cv_.notify_all();
        if (worker_.joinable()) {
            worker_.join();
        }

        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!queue_.empty()) {
            spdlog::debug("Dropping {} unpublished poll events on shutdown", queue_.size());
            queue_ = {};
        }
    }

    void publish(const PollEvent& event) {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (queue_.size() >= kMaxQueuedEvents) {
                queue_.pop();
                spdlog::warn("Event queue full, dropped oldest poll event");
            }
            queue_.push(event);
        }
        queue_cv_.notify_one();
    }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        return queue_.size();
    }

    bool check_health() {
        if (!redis_) {
            return false;
        }

        try {
            redis_->ping();
            return true;
        } catch (const std::exception& e) {
            spdlog::warn("Redis health check failed: {}", e.what());
            return false;
        }
    }

private:
    void worker_loop() {
        while (running_) {
            PollEvent event;
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                queue_cv_.wait_for(lock, std::chrono::seconds(1), [this] {
                    return !running_ || !queue_.empty();
                });

                if (!running_ || queue_.empty()) {
                    continue;
                }

                event = queue_.front();
                queue_.pop();
            }

            send(event);
        }
    }

    void send(const PollEvent& event) {
        if (!redis_) {
            spdlog::debug("Redis client not initialized, dropping {} poll event", feed_name(event.feed));
            return;
        }

        try {
            std::unordered_map<std::string, std::string> fields;
            fields["data"] = poll_event_to_json(event).dump();
            redis_->xadd(config_.redis_stream, "*", fields.begin(), fields.end());
        } catch (const std::exception& e) {
            spdlog::warn("Failed to publish poll event to Redis: {}", e.what());
        }
    }

    const Config& config_;
    std::unique_ptr<sw::redis::Redis> redis_;

    std::atomic<bool> running_{false};
    std::thread worker_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::queue<PollEvent> queue_;
};

// --- PIMPL forward declarations ---
EventPublisher::EventPublisher(const Config& config) : pImpl_(std::make_unique<Impl>(config)) {}
EventPublisher::~EventPublisher() = default;
void EventPublisher::start() { pImpl_->start(); }
void EventPublisher::stop() { pImpl_->stop(); }
void EventPublisher::publish(const PollEvent& event) { pImpl_->publish(event); }
size_t EventPublisher::pending() const { return pImpl_->pending(); }
bool EventPublisher::check_health() { return pImpl_->check_health(); }
