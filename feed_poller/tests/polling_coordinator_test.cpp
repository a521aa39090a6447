#include <catch2/catch.hpp>

#include "mock_transport.hpp"
#include "polling_coordinator.hpp"
#include <algorithm>
#include <thread>
#include <vector>

class CoordinatorTest {
public:
    CoordinatorTest()
        : credentials("token-abc"),
          coordinator(transport, credentials, 30000, 8.0, clock.fn()) {}

    FakeClock clock;
    MockTransport transport;
    StaticCredentials credentials;
    PollingCoordinator coordinator;
};

TEST_CASE_METHOD(CoordinatorTest, "Coordinator starts in the normal state", "[coordinator]") {
    auto snap = coordinator.snapshot();

    REQUIRE(snap.state == CoordinatorState::Normal);
    REQUIRE(snap.multiplier == 1.0);
    REQUIRE(coordinator.current_interval_millis() == 30000);
    REQUIRE_FALSE(coordinator.should_throttle());
    REQUIRE(coordinator.recommended_wait_millis() == 0);
}

TEST_CASE_METHOD(CoordinatorTest, "Coordinator proactive throttle scenario", "[coordinator][rate_limit]") {
    auto response = page_response("sig-1", 0);
    response.headers = {{"x-ratelimit-remaining", "5"},
                        {"x-ratelimit-reset", std::to_string((clock.now() + 10000) / 1000)}};
    transport.enqueue(response);

    coordinator.poll_public_feed();

    REQUIRE(coordinator.should_throttle());
    REQUIRE(coordinator.recommended_wait_millis() == 5000);
    // Proactive waits are not one-shot
    REQUIRE(coordinator.recommended_wait_millis() == 5000);
    REQUIRE(coordinator.current_interval_millis() == 30000);
}

TEST_CASE_METHOD(CoordinatorTest, "Coordinator rate-limited then recovered", "[coordinator][rate_limit]") {
    transport.enqueue(status_response(429, {{"retry-after", "45"}}));

    auto result = coordinator.poll_public_feed(std::string("sig-1"));

    REQUIRE(holds<outcome::RateLimited>(result));
    REQUIRE(std::get<outcome::RateLimited>(result).retry_after_seconds == 45);
    REQUIRE(coordinator.snapshot().state == CoordinatorState::RateLimited);
    REQUIRE(coordinator.current_interval_millis() == 60000);
    REQUIRE(coordinator.snapshot().multiplier == 2.0);

    SECTION("The server-declared delay governs exactly one wait") {
        REQUIRE(coordinator.recommended_wait_millis() == 45000);
        REQUIRE(coordinator.recommended_wait_millis() == 0);
        REQUIRE(coordinator.snapshot().state == CoordinatorState::BackedOff);
    }

    SECTION("A success resets the multiplier and clears the pending retry-after") {
        transport.enqueue(page_response("sig-2", 2));

        auto next = coordinator.poll_public_feed(std::string("sig-1"));

        REQUIRE(holds<outcome::Success>(next));
        auto snap = coordinator.snapshot();
        REQUIRE(snap.state == CoordinatorState::Normal);
        REQUIRE(snap.multiplier == 1.0);
        REQUIRE_FALSE(snap.rate_limits.retry_after_seconds.has_value());
        REQUIRE(coordinator.recommended_wait_millis() == 0);
    }
}

TEST_CASE_METHOD(CoordinatorTest, "Coordinator backs off on consecutive failures", "[coordinator][backoff]") {
    transport.set_fallback(connection_failure());

    for (int n = 1; n <= 5; ++n) {
        auto result = n % 2 == 0 ? coordinator.poll_watchlist_feed() : coordinator.poll_public_feed();
        REQUIRE(holds<outcome::TransportError>(result));
        REQUIRE(coordinator.snapshot().multiplier == std::min(static_cast<double>(1 << n), 8.0));
    }

    REQUIRE(coordinator.snapshot().state == CoordinatorState::BackedOff);
    REQUIRE(coordinator.current_interval_millis() == 240000);

    SECTION("Either feed's success restores the shared cadence") {
        transport.enqueue(page_response("w-1", 1));
        coordinator.poll_watchlist_feed();
        REQUIRE(coordinator.current_interval_millis() == 30000);
    }

    SECTION("Caller reset") {
        coordinator.reset_backoff();
        REQUIRE(coordinator.current_interval_millis() == 30000);
        REQUIRE(coordinator.snapshot().state == CoordinatorState::Normal);
    }
}

TEST_CASE_METHOD(CoordinatorTest, "Coordinator throttle and failure penalties combine", "[coordinator]") {
    transport.enqueue(connection_failure());
    transport.enqueue(status_response(429, {{"retry-after", "10"}}));

    coordinator.poll_public_feed();
    coordinator.poll_public_feed();

    REQUIRE(coordinator.snapshot().multiplier == 4.0);
    REQUIRE(coordinator.recommended_wait_millis() == 10000);
}

TEST_CASE_METHOD(CoordinatorTest, "Coordinator watchlist without credential", "[coordinator][auth]") {
    credentials.set_token(std::nullopt);

    auto result = coordinator.poll_watchlist_feed(std::string("sig-1"), 20);

    REQUIRE(holds<outcome::AuthRequired>(result));
    REQUIRE(transport.call_count() == 0);
    REQUIRE(coordinator.snapshot().state == CoordinatorState::Normal);
}

TEST_CASE_METHOD(CoordinatorTest, "Coordinator ignores results from a cancelled scope", "[coordinator][cancel]") {
    auto scope = std::make_shared<PollScope>();
    transport.enqueue(connection_failure());
    transport.set_on_get([scope]() { scope->cancel(); });

    auto result = coordinator.poll_watchlist_feed(std::nullopt, 20, scope);

    REQUIRE(holds<outcome::TransportError>(result));
    REQUIRE(coordinator.snapshot().state == CoordinatorState::Normal);

    SECTION("Later polls without a scope are recorded normally") {
        transport.set_on_get(nullptr);
        transport.enqueue(connection_failure());
        coordinator.poll_public_feed();
        REQUIRE(coordinator.snapshot().multiplier == 2.0);
    }
}

TEST_CASE_METHOD(CoordinatorTest, "Coordinator is safe under concurrent polling from both feeds", "[coordinator][concurrency]") {
    HttpResponse failure = status_response(500, {{"x-ratelimit-remaining", "60"}});
    transport.set_fallback(failure);

    constexpr int kPollsPerFeed = 200;
    std::vector<std::thread> threads;
    threads.emplace_back([this]() {
        for (int i = 0; i < kPollsPerFeed; ++i) {
            coordinator.poll_public_feed();
            coordinator.should_throttle();
        }
    });
    threads.emplace_back([this]() {
        for (int i = 0; i < kPollsPerFeed; ++i) {
            coordinator.poll_watchlist_feed();
            coordinator.recommended_wait_millis();
        }
    });
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(transport.call_count() == 2 * kPollsPerFeed);
    auto snap = coordinator.snapshot();
    REQUIRE(snap.multiplier == 8.0);
    REQUIRE(snap.rate_limits.remaining == 60);
    REQUIRE(snap.interval_millis == 240000);
}

TEST_CASE("Coordinator state names", "[coordinator]") {
    REQUIRE(std::string(coordinator_state_name(CoordinatorState::Normal)) == "normal");
    REQUIRE(std::string(coordinator_state_name(CoordinatorState::BackedOff)) == "backed_off");
    REQUIRE(std::string(coordinator_state_name(CoordinatorState::RateLimited)) == "rate_limited");
}
