#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

constexpr int kDefaultPollLimit = 20;
constexpr int kMaxPollLimit = 50;

enum class FeedKind {
    Public,
    Watchlist
};

const char* feed_name(FeedKind feed);

struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

// Header lookups ignore case: "Retry-After" and "retry-after" are the same key
using Headers = std::map<std::string, std::string, CaseInsensitiveLess>;
using QueryParams = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
    std::string path;
    QueryParams query;
    Headers headers;
};

struct HttpResponse {
    int status_code = 0;
    Headers headers;
    std::string body;
    std::string error; // non-empty on transport-level failure
};

struct FeedPage {
    std::vector<nlohmann::json> posts;
    int count = 0;
    std::string since;
    bool has_more = false;
    int64_t server_time = 0;
};

namespace outcome {

struct Success {
    FeedPage page;
};

struct RateLimited {
    int64_t retry_after_seconds = 0;
};

struct AuthRequired {};

struct TransportError {
    std::string message;
};

} // namespace outcome

using PollOutcome = std::variant<outcome::Success,
                                 outcome::RateLimited,
                                 outcome::AuthRequired,
                                 outcome::TransportError>;

const char* outcome_name(const PollOutcome& outcome);

template <typename T>
bool holds(const PollOutcome& outcome) {
    return std::holds_alternative<T>(outcome);
}
