#pragma once

#include <boost/beast/http/fields.hpp> // IWYU pragma: keep
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

//
#include "osscpp/internal/macro-begin.hpp"

namespace osscpp::oss::auth {

// sub-resource name -> value, a missing or empty value is rendered as the bare name
using SubResources = std::map<std::string, std::optional<std::string>, std::less<>>;

constexpr std::string_view oss_header_prefix = "x-oss-";

// "/" without a bucket, otherwise "/bucket/object" with the object key unescaped.
[[nodiscard]] std::string resource_path(const std::optional<std::string> &bucket,
                                        const std::optional<std::string> &object);

[[nodiscard]] std::string canonical_resource(std::string_view resource_path,
                                             const SubResources &sub_resources);

[[nodiscard]] std::string canonicalize_request(std::string_view method_string,
                                               const boost::beast::http::fields &headers,
                                               std::string_view resource_path, const SubResources &sub_resources);

} // namespace osscpp::oss::auth

//
#include "osscpp/internal/macro-end.hpp"
