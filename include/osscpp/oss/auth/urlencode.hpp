#pragma once

#include <string>
#include <string_view>

//
#include "osscpp/internal/macro-begin.hpp"

namespace osscpp::oss::auth {

// percent-encode everything outside the RFC 3986 unreserved set
[[nodiscard]] std::string urlencode(std::string_view input);
[[nodiscard]] bool urlencode_required(std::string_view input);
// same, but keeps '/' so object keys stay hierarchical in the request path
[[nodiscard]] std::string urlencode_path(std::string_view input);
[[nodiscard]] bool urlencode_path_required(std::string_view input);

} // namespace osscpp::oss::auth

//
#include "osscpp/internal/macro-end.hpp"
