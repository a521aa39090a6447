#pragma once
#include "types.hpp"
#include <optional>
#include <string>

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Issue a GET; transport-level failures are reported via HttpResponse::error
    virtual HttpResponse get(const HttpRequest& request) = 0;
};

class CredentialProvider {
public:
    virtual ~CredentialProvider() = default;

    virtual std::optional<std::string> current_token() = 0;
};
