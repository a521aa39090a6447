#pragma once

#include "http_transport.hpp"
#include "poll_state.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>

class FeedPoller {
public:
    static constexpr const char* kPublicPath = "/recent/updates";
    static constexpr const char* kWatchlistPath = "/watchlist/updates";
    static constexpr int64_t kDefaultRetryAfterSeconds = 60;

    FeedPoller(HttpTransport& transport, CredentialProvider& credentials, PollState& state);

    // Issue one poll and fold the response into the shared state. Never throws.
    PollOutcome poll(FeedKind feed,
                     const std::optional<std::string>& cursor,
                     int limit,
                     const std::shared_ptr<PollScope>& scope = nullptr);

    // Decode a 2xx body; both the bare page and the {success, data} envelope are accepted
    static PollOutcome parse_page(const std::string& body);

private:
    PollOutcome classify(FeedKind feed, const HttpResponse& response) const;
    void record(FeedKind feed, const PollOutcome& outcome, const Headers* headers);

    HttpTransport& transport_;
    CredentialProvider& credentials_;
    PollState& state_;
};
