#pragma once

#include <string>
#include <string_view>

//
#include "osscpp/internal/macro-begin.hpp"

namespace osscpp::oss::auth {

// base64(HMAC-SHA1(access_key_secret, canonical_request))
[[nodiscard]] std::string get_signature(std::string_view access_key_secret, std::string_view canonical_request);

// "OSS <access_key_id>:<signature>"
[[nodiscard]] std::string authorization_header(std::string_view access_key_id, std::string_view signature);

[[nodiscard]] std::string sign_request(std::string_view access_key_id, std::string_view access_key_secret,
                                       std::string_view canonical_request);

} // namespace osscpp::oss::auth

//
#include "osscpp/internal/macro-end.hpp"
