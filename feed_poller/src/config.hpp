#pragma once
#include <string>

class Config {
public:
    // Service info
    std::string service_name = "feed_poller";
    std::string log_level = "info";

    // Feed API
    std::string feed_api_url = "http://localhost:3000/api";
    int http_timeout_ms = 15000;

    // Polling cadence
    int base_interval_ms = 30000;
    int max_backoff_multiplier = 8;
    int poll_limit = 20;
    int max_consecutive_failures = 3;

    // Feed toggles
    bool enable_public_feed = true;
    bool enable_watchlist_feed = true;

    // Redis event sink
    std::string redis_host = "localhost";
    int redis_port = 6379;
    std::string redis_password;
    std::string redis_stream = "feed.poll.events";

    // Health check
    std::string health_host = "0.0.0.0";
    int health_port = 8085;

    static Config from_env();
    void validate() const;
};
