#pragma once
#include "config.hpp"
#include "feed_watcher.hpp"
#include "polling_coordinator.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

// ok is false once every enabled feed loop has stopped
nlohmann::json build_health_json(const CoordinatorSnapshot& snapshot,
                                 const std::vector<FeedStatus>& feeds);

class HealthServer {
public:
    HealthServer(const Config& config, PollingCoordinator& coordinator, FeedWatcher& watcher);
    ~HealthServer();

    void start();
    void stop();
    bool is_running() const;

private:
    void setup_routes();

    const Config& config_;
    PollingCoordinator& coordinator_;
    FeedWatcher& watcher_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> running_;
};
