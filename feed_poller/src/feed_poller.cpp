#include "feed_poller.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <limits>

FeedPoller::FeedPoller(HttpTransport& transport, CredentialProvider& credentials, PollState& state)
    : transport_(transport), credentials_(credentials), state_(state) {}

PollOutcome FeedPoller::poll(FeedKind feed,
                             const std::optional<std::string>& cursor,
                             int limit,
                             const std::shared_ptr<PollScope>& scope) {
    HttpRequest request;
    request.path = feed == FeedKind::Watchlist ? kWatchlistPath : kPublicPath;
    request.query.emplace_back("limit", std::to_string(limit));
    if (cursor && !cursor->empty()) {
        request.query.emplace_back("since", *cursor);
    }

    // Fail fast: no token, no request, no quota spent
    if (feed == FeedKind::Watchlist) {
        std::optional<std::string> token;
        try {
            token = credentials_.current_token();
        } catch (const std::exception& e) {
            spdlog::error("Credential lookup failed: {}", e.what());
        }
        if (!token) {
            spdlog::warn("Watchlist poll skipped: no credential available");
            return outcome::AuthRequired{};
        }
        request.headers["Authorization"] = "Bearer " + *token;
    }

    spdlog::debug("Polling {} feed (since={}, limit={})", feed_name(feed), cursor.value_or("<none>"), limit);

    HttpResponse response;
    try {
        response = transport_.get(request);
    } catch (const std::exception& e) {
        response = HttpResponse{};
        response.error = e.what();
    }

    PollOutcome result = classify(feed, response);

    if (scope && scope->is_cancelled()) {
        spdlog::debug("Discarding {} feed result ({}): poll scope cancelled", feed_name(feed), outcome_name(result));
        return result;
    }

    // A failed connection carries no headers; anything the server answered does
    record(feed, result, response.error.empty() ? &response.headers : nullptr);
    return result;
}

PollOutcome FeedPoller::classify(FeedKind feed, const HttpResponse& response) const {
    if (!response.error.empty()) {
        return outcome::TransportError{response.error};
    }

    if (response.status_code == 429) {
        int64_t retry_after = kDefaultRetryAfterSeconds;
        auto it = response.headers.find("retry-after");
        if (it != response.headers.end()) {
            auto parsed = util::parse_int64(it->second);
            if (parsed && *parsed >= 0) {
                retry_after = std::min(*parsed, RateLimitTracker::kMaxRetryAfterSeconds);
            }
        }
        return outcome::RateLimited{retry_after};
    }

    if (response.status_code == 401 && feed == FeedKind::Watchlist) {
        return outcome::AuthRequired{};
    }

    if (response.status_code < 200 || response.status_code >= 300) {
        return outcome::TransportError{"HTTP " + std::to_string(response.status_code) +
                                       " from " + feed_name(feed) + " feed"};
    }

    return parse_page(response.body);
}

PollOutcome FeedPoller::parse_page(const std::string& body) {
    try {
        auto json_res = nlohmann::json::parse(body);
        if (!json_res.is_object()) {
            return outcome::TransportError{"Unexpected feed response format"};
        }

        const nlohmann::json* data = &json_res;
        if (json_res.contains("data") && json_res["data"].is_object()) {
            if (json_res.contains("success") && json_res["success"].is_boolean() &&
                !json_res["success"].get<bool>()) {
                return outcome::TransportError{"Feed response reported success=false"};
            }
            data = &json_res["data"];
        }

        if (!data->contains("posts") || !(*data)["posts"].is_array()) {
            return outcome::TransportError{"Feed response is missing the posts array"};
        }

        FeedPage page;
        for (const auto& post : (*data)["posts"]) {
            page.posts.push_back(post);
        }

        page.count = static_cast<int>(page.posts.size());
        // Out-of-range counts fall back to the number of posts received
        if (data->contains("count") && (*data)["count"].is_number_integer()) {
            auto count = (*data)["count"].get<int64_t>();
            if (count >= 0 && count <= std::numeric_limits<int>::max()) {
                page.count = static_cast<int>(count);
            }
        }
        if (data->contains("since") && (*data)["since"].is_string()) {
            page.since = (*data)["since"].get<std::string>();
        }
        if (data->contains("has_more") && (*data)["has_more"].is_boolean()) {
            page.has_more = (*data)["has_more"].get<bool>();
        }
        if (data->contains("server_time") && (*data)["server_time"].is_number_integer()) {
            page.server_time = (*data)["server_time"].get<int64_t>();
        }

        return outcome::Success{std::move(page)};
    } catch (const nlohmann::json::exception& e) {
        return outcome::TransportError{std::string("Invalid feed response body: ") + e.what()};
    }
}

void FeedPoller::record(FeedKind feed, const PollOutcome& result, const Headers* headers) {
    std::lock_guard<std::mutex> lock(state_.mutex);

    // Quota bookkeeping happens on every answered request, 429s included
    if (headers) {
        state_.rate_limits.observe(*headers);
    }

    if (auto* success = std::get_if<outcome::Success>(&result)) {
        state_.backoff.on_success();
        state_.rate_limits.clear_retry_after();
        spdlog::info("{} feed poll successful: count={}, has_more={}",
                     feed_name(feed), success->page.count, success->page.has_more);
    } else if (auto* limited = std::get_if<outcome::RateLimited>(&result)) {
        state_.rate_limits.set_retry_after(limited->retry_after_seconds);
        state_.backoff.on_failure_or_throttle();
        spdlog::warn("{} feed rate limited, retry after {}s", feed_name(feed), limited->retry_after_seconds);
    } else if (auto* error = std::get_if<outcome::TransportError>(&result)) {
        state_.backoff.on_failure_or_throttle();
        spdlog::error("{} feed poll error: {}", feed_name(feed), error->message);
    } else {
        spdlog::warn("{} feed poll requires authentication", feed_name(feed));
    }
}
