#include <catch2/catch.hpp>

#include "feed_poller.hpp"
#include "mock_transport.hpp"

class FeedPollerTest {
public:
    FeedPollerTest()
        : credentials("token-abc"),
          state(30000, 8.0, clock.fn()),
          poller(transport, credentials, state) {}

    FakeClock clock;
    MockTransport transport;
    StaticCredentials credentials;
    PollState state;
    FeedPoller poller;
};

TEST_CASE_METHOD(FeedPollerTest, "FeedPoller builds requests for each feed", "[poller]") {
    transport.set_fallback(page_response("sig-9", 0));

    SECTION("Public feed without cursor") {
        poller.poll(FeedKind::Public, std::nullopt, 20);

        auto request = transport.last_request();
        REQUIRE(request.path == "/recent/updates");
        REQUIRE(query_value(request, "limit") == std::string("20"));
        REQUIRE_FALSE(query_value(request, "since").has_value());
        REQUIRE(request.headers.count("Authorization") == 0);
    }

    SECTION("Public feed with cursor") {
        poller.poll(FeedKind::Public, std::string("sig-1"), 5);

        auto request = transport.last_request();
        REQUIRE(query_value(request, "limit") == std::string("5"));
        REQUIRE(query_value(request, "since") == std::string("sig-1"));
    }

    SECTION("Watchlist feed carries the bearer token") {
        poller.poll(FeedKind::Watchlist, std::string("sig-2"), 20);

        auto request = transport.last_request();
        REQUIRE(request.path == "/watchlist/updates");
        REQUIRE(request.headers.at("authorization") == "Bearer token-abc");
    }
}

TEST_CASE_METHOD(FeedPollerTest, "FeedPoller normalizes successful pages", "[poller]") {
    SECTION("Bare body") {
        transport.enqueue(page_response("sig-5", 3, true));

        auto result = poller.poll(FeedKind::Public, std::nullopt, 20);

        REQUIRE(holds<outcome::Success>(result));
        const auto& page = std::get<outcome::Success>(result).page;
        REQUIRE(page.posts.size() == 3);
        REQUIRE(page.count == 3);
        REQUIRE(page.since == "sig-5");
        REQUIRE(page.has_more);
        REQUIRE(page.server_time == 1700000000);
    }

    SECTION("Enveloped body") {
        HttpResponse response;
        response.status_code = 200;
        response.body = R"({"success":true,"data":{"posts":[{"id":1}],"count":1,"since":"s1","has_more":false,"server_time":42}})";
        transport.enqueue(response);

        auto result = poller.poll(FeedKind::Public, std::nullopt, 20);

        REQUIRE(holds<outcome::Success>(result));
        const auto& page = std::get<outcome::Success>(result).page;
        REQUIRE(page.posts.size() == 1);
        REQUIRE(page.since == "s1");
        REQUIRE(page.server_time == 42);
    }

    SECTION("Envelope reporting failure") {
        HttpResponse response;
        response.status_code = 200;
        response.body = R"({"success":false,"data":{"posts":[]}})";
        transport.enqueue(response);

        REQUIRE(holds<outcome::TransportError>(poller.poll(FeedKind::Public, std::nullopt, 20)));
    }

    SECTION("Unparsable body") {
        HttpResponse response;
        response.status_code = 200;
        response.body = "<html>gateway</html>";
        transport.enqueue(response);

        auto result = poller.poll(FeedKind::Public, std::nullopt, 20);
        REQUIRE(holds<outcome::TransportError>(result));
        REQUIRE(state.backoff.multiplier() == 2.0);
    }

    SECTION("Out-of-range counts fall back to the number of posts") {
        auto count_of = [this](const std::string& count) {
            HttpResponse response;
            response.status_code = 200;
            response.body = R"({"posts":[{"id":1},{"id":2}],"count":)" + count + "}";
            transport.enqueue(response);
            auto result = poller.poll(FeedKind::Public, std::nullopt, 20);
            return std::get<outcome::Success>(result).page.count;
        };

        REQUIRE(count_of("-4") == 2);
        REQUIRE(count_of("9300000000000000") == 2);
        REQUIRE(count_of("18446744073709551615") == 2);
        REQUIRE(count_of("7") == 7);
    }

    SECTION("Body without posts") {
        HttpResponse response;
        response.status_code = 200;
        response.body = R"({"count":0})";
        transport.enqueue(response);

        REQUIRE(holds<outcome::TransportError>(poller.poll(FeedKind::Public, std::nullopt, 20)));
    }
}

TEST_CASE_METHOD(FeedPollerTest, "FeedPoller fails fast without a watchlist credential", "[poller][auth]") {
    credentials.set_token(std::nullopt);
    state.backoff.on_failure_or_throttle();

    auto result = poller.poll(FeedKind::Watchlist, std::nullopt, 20);

    REQUIRE(holds<outcome::AuthRequired>(result));
    REQUIRE(transport.call_count() == 0);
    REQUIRE(state.backoff.multiplier() == 2.0);
}

TEST_CASE_METHOD(FeedPollerTest, "FeedPoller maps 401", "[poller][auth]") {
    SECTION("Watchlist 401 means re-authentication even with a cached token") {
        transport.enqueue(status_response(401));

        auto result = poller.poll(FeedKind::Watchlist, std::nullopt, 20);

        REQUIRE(holds<outcome::AuthRequired>(result));
        REQUIRE(transport.call_count() == 1);
        REQUIRE(state.backoff.multiplier() == 1.0);
    }

    SECTION("Public 401 is an ordinary failure") {
        transport.enqueue(status_response(401));

        REQUIRE(holds<outcome::TransportError>(poller.poll(FeedKind::Public, std::nullopt, 20)));
        REQUIRE(state.backoff.multiplier() == 2.0);
    }
}

TEST_CASE_METHOD(FeedPollerTest, "FeedPoller handles 429", "[poller][rate_limit]") {
    SECTION("Server-declared retry-after") {
        transport.enqueue(status_response(429, {{"Retry-After", "45"}, {"X-RateLimit-Remaining", "0"}}));

        auto result = poller.poll(FeedKind::Public, std::nullopt, 20);

        REQUIRE(holds<outcome::RateLimited>(result));
        REQUIRE(std::get<outcome::RateLimited>(result).retry_after_seconds == 45);
        REQUIRE(state.rate_limits.state().retry_after_seconds == 45);
        REQUIRE(state.rate_limits.state().remaining == 0);
        REQUIRE(state.backoff.multiplier() == 2.0);
        REQUIRE(transport.call_count() == 1);
    }

    SECTION("Missing retry-after defaults to 60 seconds") {
        transport.enqueue(status_response(429));

        auto result = poller.poll(FeedKind::Watchlist, std::nullopt, 20);

        REQUIRE(std::get<outcome::RateLimited>(result).retry_after_seconds == 60);
        REQUIRE(state.rate_limits.wait_time_millis() == 60000);
    }

    SECTION("Oversized retry-after is capped") {
        transport.enqueue(status_response(429, {{"retry-after", "9300000000000000"}}));

        auto result = poller.poll(FeedKind::Public, std::nullopt, 20);

        REQUIRE(std::get<outcome::RateLimited>(result).retry_after_seconds == RateLimitTracker::kMaxRetryAfterSeconds);
        REQUIRE(state.rate_limits.wait_time_millis() == 86400000);
    }

    SECTION("Unparsable retry-after defaults to 60 seconds") {
        transport.enqueue(status_response(429, {{"retry-after", "soon"}}));

        auto result = poller.poll(FeedKind::Public, std::nullopt, 20);

        REQUIRE(std::get<outcome::RateLimited>(result).retry_after_seconds == 60);
    }
}

TEST_CASE_METHOD(FeedPollerTest, "FeedPoller maps transport failures", "[poller]") {
    SECTION("Server error") {
        transport.enqueue(status_response(503, {{"x-ratelimit-remaining", "77"}}));

        auto result = poller.poll(FeedKind::Public, std::nullopt, 20);

        REQUIRE(holds<outcome::TransportError>(result));
        REQUIRE(state.rate_limits.state().remaining == 77);
        REQUIRE(state.backoff.multiplier() == 2.0);
    }

    SECTION("Connection failure") {
        transport.enqueue(connection_failure());

        auto result = poller.poll(FeedKind::Public, std::nullopt, 20);

        REQUIRE(holds<outcome::TransportError>(result));
        REQUIRE(std::get<outcome::TransportError>(result).message == "Couldn't connect to server");
    }

    SECTION("Transport exception") {
        transport.throw_on_next_call();

        auto result = poller.poll(FeedKind::Watchlist, std::nullopt, 20);

        REQUIRE(holds<outcome::TransportError>(result));
        REQUIRE(std::get<outcome::TransportError>(result).message == "socket closed");
        REQUIRE(state.backoff.multiplier() == 2.0);
    }
}

TEST_CASE_METHOD(FeedPollerTest, "FeedPoller records headers from successful responses", "[poller][rate_limit]") {
    auto response = page_response("sig-3", 1);
    response.headers = {{"x-ratelimit-remaining", "8"},
                        {"x-ratelimit-reset", std::to_string((clock.now() + 20000) / 1000)}};
    transport.enqueue(response);

    poller.poll(FeedKind::Public, std::nullopt, 20);

    REQUIRE(state.rate_limits.state().remaining == 8);
    REQUIRE(state.rate_limits.should_throttle());
}

TEST_CASE_METHOD(FeedPollerTest, "FeedPoller records nothing for a cancelled scope", "[poller][cancel]") {
    auto scope = std::make_shared<PollScope>();
    transport.enqueue(status_response(429, {{"retry-after", "30"}, {"x-ratelimit-remaining", "1"}}));
    transport.set_on_get([scope]() { scope->cancel(); });

    auto result = poller.poll(FeedKind::Public, std::nullopt, 20, scope);

    REQUIRE(holds<outcome::RateLimited>(result));
    REQUIRE(state.backoff.multiplier() == 1.0);
    REQUIRE_FALSE(state.rate_limits.state().retry_after_seconds.has_value());
    REQUIRE(state.rate_limits.state().remaining == 120);
}
