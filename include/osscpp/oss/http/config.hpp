#pragma once

#include "osscpp/oss/auth/credentials.hpp"

#include <boost/url/url.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

//
#include "osscpp/internal/macro-begin.hpp"

namespace osscpp::oss::http {

constexpr std::string_view version = "0.1.0";

constexpr std::chrono::seconds default_open_timeout{10};
constexpr std::chrono::seconds default_read_timeout{120};

// "osscpp/<version> (<platform>; <compiler>)"
[[nodiscard]] std::string default_user_agent();

// Shared read-only by every request issued through one Http instance.
struct Config {
    // scheme://host[:port] of the service, without bucket
    boost::urls::url endpoint;
    // endpoint is a custom domain bound to a single bucket, no bucket subdomain
    bool cname = false;
    auth::Credentials credentials;
    std::optional<std::chrono::seconds> open_timeout;
    std::optional<std::chrono::seconds> read_timeout;
    std::string user_agent = default_user_agent();

    [[nodiscard]] std::chrono::seconds effective_open_timeout() const {
        return open_timeout.value_or(default_open_timeout);
    }
    [[nodiscard]] std::chrono::seconds effective_read_timeout() const {
        return read_timeout.value_or(default_read_timeout);
    }
};

} // namespace osscpp::oss::http

//
#include "osscpp/internal/macro-end.hpp"
