#include "health_server.hpp"
#include <spdlog/spdlog.h>

nlohmann::json build_health_json(const CoordinatorSnapshot& snapshot,
                                 const std::vector<FeedStatus>& feeds) {
    bool any_enabled = false;
    bool any_running = false;
    nlohmann::json feeds_json = nlohmann::json::object();

    for (const auto& feed : feeds) {
        any_enabled = any_enabled || feed.enabled;
        any_running = any_running || feed.running;

        nlohmann::json entry = {
            {"enabled", feed.enabled},
            {"running", feed.running},
            {"initialized", feed.initialized},
            {"polls", feed.polls},
            {"items_seen", feed.items_seen},
            {"consecutive_failures", feed.consecutive_failures},
            {"last_outcome", feed.last_outcome}
        };
        entry["cursor"] = feed.cursor.empty() ? nlohmann::json(nullptr) : nlohmann::json(feed.cursor);
        entry["last_error"] = feed.last_error.empty() ? nlohmann::json(nullptr) : nlohmann::json(feed.last_error);

        feeds_json[feed_name(feed.feed)] = entry;
    }

    nlohmann::json health = {
        {"ok", any_enabled && any_running},
        {"state", coordinator_state_name(snapshot.state)},
        {"multiplier", snapshot.multiplier},
        {"interval_ms", snapshot.interval_millis},
        {"remaining", snapshot.rate_limits.remaining},
        {"reset_at_ms", snapshot.rate_limits.reset_at_epoch_millis},
        {"throttled", snapshot.throttled},
        {"wait_ms", snapshot.wait_millis},
        {"feeds", feeds_json}
    };
    health["retry_after_s"] = snapshot.rate_limits.retry_after_seconds
        ? nlohmann::json(*snapshot.rate_limits.retry_after_seconds)
        : nlohmann::json(nullptr);

    return health;
}

HealthServer::HealthServer(const Config& config, PollingCoordinator& coordinator, FeedWatcher& watcher)
    : config_(config), coordinator_(coordinator), watcher_(watcher), running_(false) {
    server_ = std::make_unique<httplib::Server>();
}

HealthServer::~HealthServer() {
    stop();
}

void HealthServer::start() {
    setup_routes();
    running_ = true;

    server_thread_ = std::thread([this]() {
        spdlog::info("Starting health server on {}:{}", config_.health_host, config_.health_port);
        if (!server_->listen(config_.health_host.c_str(), config_.health_port)) {
            spdlog::error("Health server failed to listen on {}:{}", config_.health_host, config_.health_port);
        }
        running_ = false;
    });
}

void HealthServer::stop() {
    server_->stop();
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
    running_ = false;
}

bool HealthServer::is_running() const {
    return running_;
}

void HealthServer::setup_routes() {
    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        auto health = build_health_json(coordinator_.snapshot(), watcher_.status());
        res.status = health["ok"].get<bool>() ? 200 : 503;
        res.set_content(health.dump(), "application/json");
    });

    server_->set_error_handler([](const httplib::Request&, httplib::Response& res) {
        res.status = 404;
        res.set_content("Not Found", "text/plain");
    });
}
