#include "types.hpp"
#include <algorithm>
#include <cctype>

const char* feed_name(FeedKind feed) {
    switch (feed) {
        case FeedKind::Public:
            return "public";
        case FeedKind::Watchlist:
            return "watchlist";
    }
    return "unknown";
}

bool CaseInsensitiveLess::operator()(const std::string& a, const std::string& b) const {
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(),
        [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
}

const char* outcome_name(const PollOutcome& outcome) {
    if (holds<outcome::Success>(outcome)) return "success";
    if (holds<outcome::RateLimited>(outcome)) return "rate_limited";
    if (holds<outcome::AuthRequired>(outcome)) return "auth_required";
    return "transport_error";
}
