#pragma once

#include "config.hpp"
#include "osscpp/meta.hpp"
#include "request.hpp"
#include "response.hpp"
#include "server_error.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http/verb.hpp>
#include <expected>
#include <functional>
#include <memory>
#include <string_view>

//
#include "osscpp/internal/macro-begin.hpp"

namespace osscpp::oss::http {

// Receives the decoded body of a successful response piece by piece.
using ChunkHandler = std::function<void(std::string_view)>;

class Http {
public:
    using crt = meta::crt<boost::asio::awaitable<std::expected<Response, Error>>>;

private:
    std::shared_ptr<const Config> config_;
    mutable boost::asio::ssl::context ssl_ctx_{boost::asio::ssl::context::tls_client};

public:
    [[nodiscard]] explicit Http(std::shared_ptr<const Config> config);

    [[nodiscard]] const Config &config() const { return *config_; }

    // One request, one connection, no retries.
    // A status below 300 streams the body to on_chunk (or into Response::body without one), anything else
    // is read in full and returned as ServerError. Network failures come back as the error_code.
    // Throws std::invalid_argument for malformed resources, rethrows exceptions of a StreamBody producer
    // and std::runtime_error for a corrupt Content-Encoding on a successful response.
    [[nodiscard]] crt execute(boost::beast::http::verb verb, Resources resources, HttpOptions opts = {},
                              ChunkHandler on_chunk = {}) const;

    [[nodiscard]] [[clang::coro_wrapper]] crt get(Resources resources, HttpOptions opts = {},
                                                  ChunkHandler on_chunk = {}) const;
    [[nodiscard]] [[clang::coro_wrapper]] crt put(Resources resources, HttpOptions opts = {},
                                                  ChunkHandler on_chunk = {}) const;
    [[nodiscard]] [[clang::coro_wrapper]] crt post(Resources resources, HttpOptions opts = {},
                                                   ChunkHandler on_chunk = {}) const;
    [[nodiscard]] [[clang::coro_wrapper]] crt delete_(Resources resources, HttpOptions opts = {},
                                                      ChunkHandler on_chunk = {}) const;
    [[nodiscard]] [[clang::coro_wrapper]] crt head(Resources resources, HttpOptions opts = {}) const;
    [[nodiscard]] [[clang::coro_wrapper]] crt options(Resources resources, HttpOptions opts = {},
                                                      ChunkHandler on_chunk = {}) const;
};

} // namespace osscpp::oss::http

//
#include "osscpp/internal/macro-end.hpp"
