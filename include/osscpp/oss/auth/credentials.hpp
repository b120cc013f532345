#pragma once

#include <optional>
#include <string>

//
#include "osscpp/internal/macro-begin.hpp"

namespace osscpp::oss::auth {

struct Credentials {
    std::string access_key_id;
    std::string access_key_secret;
    // STS token, sent as x-oss-security-token
    std::optional<std::string> security_token;

    // Requests are sent unsigned when this is false.
    [[nodiscard]] bool can_sign() const { return !access_key_id.empty() && !access_key_secret.empty(); }
};

} // namespace osscpp::oss::auth

//
#include "osscpp/internal/macro-end.hpp"
