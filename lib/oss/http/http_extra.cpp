#include "http_extra.hpp"

#include "osscpp/log.hpp"
#include "osscpp/meta.hpp"
#include "osscpp/oss/http/request.hpp"
#include "osscpp/oss/http/request_builder.hpp"
#include "osscpp/oss/http/stream_writer.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <boost/beast/http/span_body.hpp>
#pragma GCC diagnostic pop

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/ssl/stream_base.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/stream_traits.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/buffer_body.hpp>
#include <boost/beast/http/chunk_encode.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/message.hpp> // IWYU pragma: keep
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/serializer.hpp>
#include <boost/beast/http/string_body.hpp> // IWYU pragma: keep
#include <boost/beast/http/write.hpp>
#include <boost/url/url.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <expected>
#include <functional>
#include <limits>
#include <openssl/err.h>
#include <openssl/tls1.h>
#include <optional>
#include <span>
#include <string>
#include <tuple>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace osscpp::oss::http::_internal {

namespace {

using namespace boost::asio::experimental::awaitable_operators;

constexpr auto token = boost::asio::as_tuple(boost::asio::use_awaitable);

constexpr std::uint64_t unlimited_body = std::numeric_limits<std::uint64_t>::max();

using ReadResult = std::pair<std::exception_ptr, std::optional<std::string>>;

// Never throws: a producer failure has to end the race against the timer, the caller rethrows it.
meta::crt<boost::asio::awaitable<ReadResult>> read_producer(StreamSession &session, std::size_t length) {
    try {
        co_return ReadResult{nullptr, co_await session.read(length)};
    } catch (...) {
        co_return ReadResult{std::current_exception(), std::nullopt};
    }
}

meta::crt<boost::asio::awaitable<boost::beast::error_code>>
write_chunked(AnyStream &stream, const PreparedRequest &prepared, const StreamProducer &producer,
              std::chrono::seconds timeout) {
    boost::beast::http::request<boost::beast::http::empty_body> request{
        prepared.verb, std::string_view{prepared.url.encoded_target()}, 11,
        boost::beast::http::empty_body::value_type{}, prepared.headers};
    request.chunked(true);
    boost::beast::http::request_serializer<boost::beast::http::empty_body> serializer{request};

    // destroyed on every return below, which abandons a producer that is still running
    StreamSession session{co_await boost::asio::this_coro::executor, producer};

    expires_after(stream, timeout);
    {
        const auto [ec, n] = co_await std::visit(
            [&serializer](auto &stream_) {
                return boost::beast::http::async_write_header(stream_, serializer, token);
            },
            stream);
        if (ec.failed()) {
            co_return ec;
        }
    }

    // no socket operation is pending while the producer is awaited, so the stream timer cannot cover it
    boost::asio::steady_timer producer_timer{co_await boost::asio::this_coro::executor};

    std::size_t sent = 0;
    while (true) {
        producer_timer.expires_after(timeout);
        auto read_res = co_await (boost::asio::awaitable<ReadResult>{read_producer(session, wire_chunk_size)} ||
                                  producer_timer.async_wait(token));
        if (read_res.index() == 1) {
            log::debug("stream producer stalled for {}s after {} bytes", timeout.count(), sent);
            co_return boost::beast::error::timeout;
        }
        auto [producer_error, chunk] = std::move(std::get<0>(read_res));
        if (producer_error) {
            std::rethrow_exception(producer_error);
        }
        if (!chunk.has_value()) {
            break;
        }
        expires_after(stream, timeout);
        const auto [ec, n] = co_await std::visit(
            [&chunk](auto &stream_) {
                return boost::asio::async_write(
                    stream_, boost::beast::http::make_chunk(boost::asio::buffer(chunk.value())), token);
            },
            stream);
        if (ec.failed()) {
            co_return ec;
        }
        sent += chunk->size();
    }

    expires_after(stream, timeout);
    const auto [ec, n] = co_await std::visit(
        [](auto &stream_) {
            return boost::asio::async_write(stream_, boost::beast::http::make_chunk_last(), token);
        },
        stream);
    log::debug("sent {} bytes of chunked body", sent);
    co_return ec;
}

} // namespace

AnyStream get_ssl_stream(bool is_ssl, boost::asio::any_io_executor executor,
                         boost::asio::ssl::context &ssl_ctx) {
    if (is_ssl) {
        return boost::asio::ssl::stream<boost::beast::tcp_stream>{executor, ssl_ctx};
    }
    return {boost::beast::tcp_stream{executor}};
}

void expires_after(AnyStream &stream, std::chrono::seconds timeout) {
    std::visit([timeout](auto &stream_) { boost::beast::get_lowest_layer(stream_).expires_after(timeout); },
               stream);
}

meta::crt<boost::asio::awaitable<std::expected<AnyStream, boost::beast::error_code>>>
prepare_stream(AnyStream stream, boost::urls::url url, std::chrono::seconds open_timeout) {
    using rtype = std::expected<AnyStream, boost::beast::error_code>;

    expires_after(stream, open_timeout);

    boost::asio::ip::tcp::resolver resolver{co_await boost::asio::this_coro::executor};
    const std::string port_or_scheme =
        url.has_port() ? url.port() : (url.has_scheme() ? url.scheme() : "https");

    const auto [dns_ec, resolved_ep] = co_await resolver.async_resolve(url.host(), port_or_scheme, token);
    if (dns_ec.failed()) {
        co_return rtype{std::unexpect, dns_ec};
    }

    {
        const auto [con_ec, con_ep] = co_await std::visit(
            [&](auto &stream_) {
                // NOLINTNEXTLINE(clang-analyzer-core.NullDereference)
                return boost::beast::get_lowest_layer(stream_).async_connect(resolved_ep, token);
            },
            stream);
        if (con_ec.failed()) {
            co_return rtype{std::unexpect, con_ec};
        }
    }

    if (stream.index() == 1) {
        auto &ssl_stream = std::get<1>(stream);
        const std::string host = url.host_name();
        if (SSL_set_tlsext_host_name(ssl_stream.native_handle(), host.c_str()) != 1) {
            co_return rtype{std::unexpect, boost::beast::error_code{static_cast<int>(::ERR_get_error()),
                                                                    boost::asio::error::get_ssl_category()}};
        }
        ssl_stream.set_verify_callback(boost::asio::ssl::host_name_verification{host});
        const auto [shake_ec] =
            co_await ssl_stream.async_handshake(boost::asio::ssl::stream_base::client, token);
        if (shake_ec.failed()) {
            co_return rtype{std::unexpect, shake_ec};
        }
    }

    co_return rtype{std::move(stream)};
}

meta::crt<boost::asio::awaitable<boost::beast::error_code>>
write_request(AnyStream &stream, const PreparedRequest &prepared, const Body &body,
              std::chrono::seconds timeout) {
    if (const auto *stream_body = std::get_if<StreamBody>(&body); stream_body != nullptr) {
        co_return co_await write_chunked(stream, prepared, stream_body->producer, timeout);
    }

    std::span<const std::byte> payload;
    if (const auto *str = std::get_if<std::string>(&body); str != nullptr) {
        payload = meta::as_bytes(*str);
    }
    boost::beast::http::request<boost::beast::http::span_body<const std::byte>> request{
        prepared.verb, std::string_view{prepared.url.encoded_target()}, 11, payload, prepared.headers};
    request.prepare_payload();

    expires_after(stream, timeout);
    const auto [ec, n] = co_await std::visit(
        [&request](auto &stream_) { return boost::beast::http::async_write(stream_, request, token); }, stream);
    co_return ec;
}

meta::crt<boost::asio::awaitable<std::expected<std::string, boost::beast::error_code>>>
read_buffered_body(AnyStream &stream, boost::beast::flat_buffer &buffer,
                   boost::beast::http::response_parser<boost::beast::http::empty_body> &header_parser,
                   std::chrono::seconds timeout) {
    using rtype = std::expected<std::string, boost::beast::error_code>;

    boost::beast::http::response_parser<boost::beast::http::string_body> parser{std::move(header_parser)};
    parser.body_limit(unlimited_body);

    while (!parser.is_done()) {
        expires_after(stream, timeout);
        const auto [ec, n] = co_await std::visit(
            [&buffer, &parser](auto &stream_) {
                // NOLINTNEXTLINE(clang-analyzer-core.NullDereference)
                return boost::beast::http::async_read(stream_, buffer, parser, token);
            },
            stream);
        if (ec.failed()) {
            co_return rtype{std::unexpect, ec};
        }
    }

    co_return rtype{std::move(parser.get().body())};
}

meta::crt<boost::asio::awaitable<boost::beast::error_code>>
read_streamed_body(AnyStream &stream, boost::beast::flat_buffer &buffer,
                   boost::beast::http::response_parser<boost::beast::http::empty_body> &header_parser,
                   std::chrono::seconds timeout, const std::function<void(std::string_view)> &on_data) {
    boost::beast::http::response_parser<boost::beast::http::buffer_body> parser{std::move(header_parser)};
    parser.body_limit(unlimited_body);

    std::vector<char> chunk(wire_chunk_size);
    while (!parser.is_done()) {
        parser.get().body().data = chunk.data();
        parser.get().body().size = chunk.size();

        expires_after(stream, timeout);
        const auto [ec, n] = co_await std::visit(
            [&buffer, &parser](auto &stream_) {
                // NOLINTNEXTLINE(clang-analyzer-core.NullDereference)
                return boost::beast::http::async_read(stream_, buffer, parser, token);
            },
            stream);
        // need_buffer only means the chunk is full
        if (ec.failed() && ec != boost::beast::http::error::need_buffer) {
            co_return ec;
        }

        const std::size_t received = chunk.size() - parser.get().body().size;
        if (received > 0) {
            on_data(std::string_view{chunk.data(), received});
        }
    }

    co_return boost::beast::error_code{};
}

} // namespace osscpp::oss::http::_internal
