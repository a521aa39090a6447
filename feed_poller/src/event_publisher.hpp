#pragma once

#include "config.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <memory>
#include <string>

struct PollEvent {
    FeedKind feed = FeedKind::Public;
    std::string outcome;
    int count = 0;
    std::string since;
    bool has_more = false;
    std::string detail;
    std::string timestamp;
};

PollEvent make_poll_event(FeedKind feed, const PollOutcome& outcome);
nlohmann::json poll_event_to_json(const PollEvent& event);

// Best-effort publication of poll results to a Redis stream. publish() only
// enqueues; a worker thread does the XADD. Failures are logged and dropped.
class EventPublisher {
public:
    static constexpr size_t kMaxQueuedEvents = 1000;

    explicit EventPublisher(const Config& config);
    ~EventPublisher();

    void start();
    void stop();

    void publish(const PollEvent& event);
    size_t pending() const;

    bool check_health();

    EventPublisher(const EventPublisher&) = delete;
    EventPublisher& operator=(const EventPublisher&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
