#include "cpr_transport.hpp"
#include "util.hpp"
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>

class CprTransport::Impl {
public:
    explicit Impl(const Config& config)
        : base_url_(config.feed_api_url),
          timeout_ms_(config.http_timeout_ms) {
        while (!base_url_.empty() && base_url_.back() == '/') {
            base_url_.pop_back();
        }
    }

    HttpResponse get(const HttpRequest& request) {
        HttpResponse result;

        cpr::Parameters parameters;
        for (const auto& [key, value] : request.query) {
            parameters.Add(cpr::Parameter{key, value});
        }

        cpr::Header header{{"User-Agent", "feed_poller/1.0"}, {"Accept", "application/json"}};
        for (const auto& [key, value] : request.headers) {
            header[key] = value;
        }

        auto url = base_url_ + request.path;
        spdlog::debug("GET {}", url);

        auto response = cpr::Get(
            cpr::Url{url},
            parameters,
            header,
            cpr::Timeout{timeout_ms_}
        );

        if (response.error) {
            result.error = response.error.message.empty()
                ? "request failed with cpr error code " + std::to_string(static_cast<int>(response.error.code))
                : response.error.message;
            return result;
        }

        result.status_code = static_cast<int>(response.status_code);
        result.body = std::move(response.text);
        for (const auto& [key, value] : response.header) {
            result.headers[key] = value;
        }

        return result;
    }

private:
    std::string base_url_;
    int timeout_ms_;
};

// --- PIMPL forward declarations ---
CprTransport::CprTransport(const Config& config) : pImpl_(std::make_unique<Impl>(config)) {}
CprTransport::~CprTransport() = default;
HttpResponse CprTransport::get(const HttpRequest& request) { return pImpl_->get(request); }

EnvCredentialProvider::EnvCredentialProvider(std::string file_env, std::string value_env)
    : file_env_(std::move(file_env)), value_env_(std::move(value_env)) {}

std::optional<std::string> EnvCredentialProvider::current_token() {
    return util::read_secret(file_env_, value_env_);
}
