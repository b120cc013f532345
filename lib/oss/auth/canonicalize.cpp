#include "osscpp/oss/auth/canonicalize.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/fields.hpp> // IWYU pragma: keep
#include <format>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace osscpp::oss::auth {

std::string resource_path(const std::optional<std::string> &bucket, const std::optional<std::string> &object) {
    if (!bucket.has_value()) {
        return "/";
    }
    return std::format("/{}/{}", bucket.value(), object.value_or(""));
}

std::string canonical_resource(std::string_view resource_path, const SubResources &sub_resources) {
    std::string ret{resource_path.empty() ? "/" : resource_path};

    // std::map iterates in lexicographic key order
    std::string query;
    for (const auto &[key, value] : sub_resources) {
        if (!query.empty()) {
            query.append("&");
        }
        if (value.has_value() && !value->empty()) {
            query.append(std::format("{}={}", key, value.value()));
        } else {
            query.append(key);
        }
    }
    if (!query.empty()) {
        ret.append("?");
        ret.append(query);
    }

    return ret;
}

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
std::string canonicalize_request(std::string_view method_string, const boost::beast::http::fields &headers,
                                 std::string_view resource_path, const SubResources &sub_resources) {
    std::string ret;

    // VERB
    ret.append(method_string);
    ret.append("\n");

    // Content-MD5, Content-Type, Date, in this order and empty when absent
    ret.append(headers[boost::beast::http::field::content_md5]);
    ret.append("\n");
    ret.append(headers[boost::beast::http::field::content_type]);
    ret.append("\n");
    ret.append(headers[boost::beast::http::field::date]);
    ret.append("\n");

    // CanonicalizedOSSHeaders
    // use a map to get them in order
    std::map<std::string, std::string, std::less<>> oss_headers;
    for (const auto &header : headers) {
        std::string lower{header.name_string()};
        boost::algorithm::to_lower(lower);
        if (lower.starts_with(oss_header_prefix)) {
            // repeated headers are folded into one comma separated value
            std::string value = boost::algorithm::trim_copy(std::string{header.value()});
            if (const auto it = oss_headers.find(lower); it != oss_headers.end()) {
                it->second.append(",");
                it->second.append(value);
            } else {
                oss_headers.emplace(std::move(lower), std::move(value));
            }
        }
    }
    for (const auto &[name, value] : oss_headers) {
        ret.append(std::format("{}:{}\n", name, value));
    }

    // CanonicalizedResource
    ret.append(canonical_resource(resource_path, sub_resources));

    return ret;
}

} // namespace osscpp::oss::auth
