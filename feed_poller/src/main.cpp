#include "config.hpp"
#include "cpr_transport.hpp"
#include "event_publisher.hpp"
#include "feed_watcher.hpp"
#include "health_server.hpp"
#include "polling_coordinator.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <signal.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int) {
    shutdown_requested = true;
}

int main() {
    try {
        // 1. Load configuration
        Config config = Config::from_env();

        // 2. Setup logging
        util::setup_logging(config.service_name, config.log_level);
        spdlog::info("Log level set to '{}'", config.log_level);
        spdlog::info("Starting {}...", config.service_name);

        config.validate();

        // 3. Register signal handlers for graceful shutdown
        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        // 4. Wire collaborators
        CprTransport transport(config);
        EnvCredentialProvider credentials;
        if (config.enable_watchlist_feed && !credentials.current_token()) {
            spdlog::warn("No watchlist credential configured (FEED_AUTH_TOKEN_FILE / FEED_AUTH_TOKEN)");
        }

        PollingCoordinator coordinator(transport, credentials,
                                       config.base_interval_ms,
                                       static_cast<double>(config.max_backoff_multiplier));

        EventPublisher publisher(config);
        if (!publisher.check_health()) {
            spdlog::warn("Redis is not reachable, poll events will be dropped until it is");
        }
        publisher.start();

        FeedWatcher watcher(config, coordinator);
        watcher.set_outcome_handler([&publisher](FeedKind feed, const PollOutcome& outcome) {
            publisher.publish(make_poll_event(feed, outcome));
        });
        watcher.set_page_handler([](FeedKind feed, const FeedPage& page) {
            spdlog::info("{} feed delivered {} new posts (has_more={})",
                         feed_name(feed), page.posts.size(), page.has_more);
        });

        HealthServer health(config, coordinator, watcher);
        health.start();

        // 5. Run until signalled
        watcher.start();
        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }

        spdlog::info("Shutdown requested, stopping...");
        watcher.stop();
        health.stop();
        publisher.stop();

    } catch (const std::exception& e) {
        spdlog::critical("A critical error occurred: {}", e.what());
        return 1;
    }

    spdlog::info("Feed poller has shut down gracefully.");
    return 0;
}
