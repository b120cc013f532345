#pragma once

#include "osscpp/meta.hpp"
#include "osscpp/oss/http/request.hpp"
#include "osscpp/oss/http/request_builder.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/url/url.hpp>
#include <chrono>
#include <cstddef>
#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <variant>

namespace osscpp::oss::http::_internal {

using AnyStream = std::variant<boost::beast::tcp_stream, boost::asio::ssl::stream<boost::beast::tcp_stream>>;

constexpr std::size_t wire_chunk_size = 64 * 1024;

[[nodiscard]] AnyStream get_ssl_stream(bool is_ssl, boost::asio::any_io_executor executor,
                                       boost::asio::ssl::context &ssl_ctx);

// resolve, connect and TLS handshake, all of it bounded by open_timeout
[[nodiscard]] meta::crt<boost::asio::awaitable<std::expected<AnyStream, boost::beast::error_code>>>
prepare_stream(AnyStream stream, boost::urls::url url, std::chrono::seconds open_timeout);

void expires_after(AnyStream &stream, std::chrono::seconds timeout);

// Content-Length for in-memory bodies, chunked transfer encoding for StreamBody.
// Rethrows an exception raised by a StreamBody producer.
[[nodiscard]] meta::crt<boost::asio::awaitable<boost::beast::error_code>>
write_request(AnyStream &stream [[clang::lifetimebound]],
              const PreparedRequest &request [[clang::lifetimebound]], const Body &body [[clang::lifetimebound]],
              std::chrono::seconds timeout);

// Reads the rest of the body in one piece, without a size limit.
[[nodiscard]] meta::crt<boost::asio::awaitable<std::expected<std::string, boost::beast::error_code>>>
read_buffered_body(AnyStream &stream [[clang::lifetimebound]],
                   boost::beast::flat_buffer &buffer [[clang::lifetimebound]],
                   boost::beast::http::response_parser<boost::beast::http::empty_body> &header_parser
                   [[clang::lifetimebound]],
                   std::chrono::seconds timeout);

// Hands the raw body to on_data in pieces of at most wire_chunk_size bytes.
[[nodiscard]] meta::crt<boost::asio::awaitable<boost::beast::error_code>>
read_streamed_body(AnyStream &stream [[clang::lifetimebound]],
                   boost::beast::flat_buffer &buffer [[clang::lifetimebound]],
                   boost::beast::http::response_parser<boost::beast::http::empty_body> &header_parser
                   [[clang::lifetimebound]],
                   std::chrono::seconds timeout,
                   const std::function<void(std::string_view)> &on_data [[clang::lifetimebound]]);

} // namespace osscpp::oss::http::_internal
