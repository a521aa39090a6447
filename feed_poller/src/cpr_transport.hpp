#pragma once

#include "config.hpp"
#include "http_transport.hpp"
#include <memory>

class CprTransport : public HttpTransport {
public:
    explicit CprTransport(const Config& config);
    ~CprTransport() override;

    HttpResponse get(const HttpRequest& request) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

// Reads the watchlist token on every call so an external refresh of the
// secret file is picked up without a restart
class EnvCredentialProvider : public CredentialProvider {
public:
    EnvCredentialProvider(std::string file_env = "FEED_AUTH_TOKEN_FILE",
                          std::string value_env = "FEED_AUTH_TOKEN");

    std::optional<std::string> current_token() override;

private:
    std::string file_env_;
    std::string value_env_;
};
