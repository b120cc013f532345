#pragma once

#include "osscpp/oss/auth/canonicalize.hpp"
#include "stream_writer.hpp"

#include <boost/beast/http/fields.hpp> // IWYU pragma: keep
#include <format>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>

//
#include "osscpp/internal/macro-begin.hpp"

namespace osscpp::oss::http {

using Query = std::map<std::string, std::string, std::less<>>;

struct Resources {
    std::optional<std::string> bucket;
    // requires bucket
    std::optional<std::string> object;
    auth::SubResources sub_resources;
};

// Sent with Transfer-Encoding: chunked, never buffered as a whole.
struct StreamBody {
    StreamProducer producer;
};

using Body = std::variant<std::monostate, std::string, StreamBody>;

struct HttpOptions {
    // override the defaults, except User-Agent, Date and Host
    boost::beast::http::fields headers;
    Query query;
    Body body;
};

} // namespace osscpp::oss::http

template <> struct std::formatter<osscpp::oss::http::Resources> {
    [[nodiscard]] constexpr static auto parse(std::format_parse_context &ctx) { return ctx.begin(); }

    static auto format(const osscpp::oss::http::Resources &resources, std::format_context &ctx) {
        std::string sub_resources;
        for (const auto &[key, value] : resources.sub_resources) {
            if (!sub_resources.empty()) {
                sub_resources.append(", ");
            }
            sub_resources.append(value.has_value() ? std::format("{}={}", key, value.value()) : key);
        }
        return std::format_to(ctx.out(), "{{bucket: {}, object: {}, sub_resources: [{}]}}",
                              resources.bucket.value_or("<none>"), resources.object.value_or("<none>"),
                              sub_resources);
    }
};

//
#include "osscpp/internal/macro-end.hpp"
