#include "config.hpp"
#include "types.hpp"
#include "util.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

Config Config::from_env() {
    Config config;

    // Service
    config.service_name = util::get_env_var("SERVICE_NAME", config.service_name);
    config.log_level = util::get_env_var("LOG_LEVEL", config.log_level);

    // Feed API
    config.feed_api_url = util::get_env_var("FEED_API_URL", config.feed_api_url);
    config.http_timeout_ms = util::get_env_int("HTTP_TIMEOUT_MS", config.http_timeout_ms);

    // Polling
    config.base_interval_ms = util::get_env_int("BASE_INTERVAL_MS", config.base_interval_ms);
    config.max_backoff_multiplier = util::get_env_int("MAX_BACKOFF_MULTIPLIER", config.max_backoff_multiplier);
    config.poll_limit = util::get_env_int("POLL_LIMIT", config.poll_limit);
    config.max_consecutive_failures = util::get_env_int("MAX_CONSECUTIVE_FAILURES", config.max_consecutive_failures);

    // Feeds
    config.enable_public_feed = util::get_env_bool("ENABLE_PUBLIC_FEED", config.enable_public_feed);
    config.enable_watchlist_feed = util::get_env_bool("ENABLE_WATCHLIST_FEED", config.enable_watchlist_feed);

    // Redis
    config.redis_host = util::get_env_var("REDIS_HOST", config.redis_host);
    config.redis_port = util::get_env_int("REDIS_PORT", config.redis_port);
    config.redis_password = util::get_env_var("REDIS_PASSWORD");
    config.redis_stream = util::get_env_var("REDIS_STREAM", config.redis_stream);

    // Health
    config.health_host = util::get_env_var("HEALTH_HOST", config.health_host);
    config.health_port = util::get_env_int("HEALTH_PORT", config.health_port);

    return config;
}

void Config::validate() const {
    if (feed_api_url.empty()) {
        throw std::runtime_error("FEED_API_URL is required");
    }

    if (base_interval_ms < 1000) {
        throw std::runtime_error("Base polling interval must be at least 1000 ms");
    }

    if (max_backoff_multiplier < 1) {
        throw std::runtime_error("Max backoff multiplier must be at least 1");
    }

    if (poll_limit < 1 || poll_limit > kMaxPollLimit) {
        throw std::runtime_error("Poll limit must be between 1 and 50");
    }

    if (max_consecutive_failures < 1) {
        throw std::runtime_error("Max consecutive failures must be at least 1");
    }

    if (!enable_public_feed && !enable_watchlist_feed) {
        throw std::runtime_error("At least one feed must be enabled");
    }

    spdlog::info("Configuration validated successfully");
}
