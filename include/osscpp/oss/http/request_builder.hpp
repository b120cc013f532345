#pragma once

#include "config.hpp"
#include "osscpp/meta.hpp"
#include "request.hpp"

#include <boost/beast/http/fields.hpp> // IWYU pragma: keep
#include <boost/beast/http/verb.hpp>
#include <boost/url/url.hpp>
#include <chrono>
#include <format>
#include <map>
#include <optional>
#include <string>
#include <string_view>

//
#include "osscpp/internal/macro-begin.hpp"

namespace osscpp::oss::http {

constexpr std::string_view default_content_type = "application/octet-stream";
constexpr std::string_view default_accept_encoding = "gzip, deflate";
constexpr std::string_view sts_header = "x-oss-security-token";

// Everything needed to put one request on the wire.
struct PreparedRequest {
    boost::beast::http::verb verb{};
    boost::urls::url url;
    // canonical resource path, also used in logs and errors
    std::string resource;
    boost::beast::http::fields headers;
    // the string that was (or would have been) signed
    std::string canonical;
    bool is_signed = false;
    bool is_streaming = false;
};

template <typename T>
    requires meta::is_specialization_v<T, std::chrono::time_point>
[[nodiscard]] std::string format_http_date(const T &time) {
    // RFC 1123, always GMT
    return std::format("{:%a, %d %b %Y %H:%M:%S} GMT", std::chrono::floor<std::chrono::seconds>(time));
}

// GET, PUT, POST, DELETE, HEAD and OPTIONS, throws std::invalid_argument for anything else
[[nodiscard]] std::string_view verb_string(boost::beast::http::verb verb);

// base64 of the MD5 digest
[[nodiscard]] std::string content_md5(std::string_view body);

// virtual hosted style unless config.cname is set
[[nodiscard]] boost::urls::url get_request_url(const Config &config, const std::optional<std::string> &bucket,
                                               const std::optional<std::string> &object);

// sub-resources with explicit query options on top, nullopt renders as a bare key
[[nodiscard]] std::map<std::string, std::optional<std::string>, std::less<>>
merge_query(const auth::SubResources &sub_resources, const Query &query);

// Pure, does no I/O. Throws std::invalid_argument for an object without bucket.
[[nodiscard]] PreparedRequest build_request(const Config &config, boost::beast::http::verb verb,
                                            const Resources &resources, const HttpOptions &options,
                                            std::chrono::system_clock::time_point now);

} // namespace osscpp::oss::http

//
#include "osscpp/internal/macro-end.hpp"
