#include "osscpp/oss/http/http.hpp"

#include "http_extra.hpp"
#include "osscpp/log.hpp"
#include "osscpp/oss/http/content_decoder.hpp"
#include "osscpp/oss/http/request_builder.hpp"
#include "osscpp/oss/http/server_error.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/fields.hpp>  // IWYU pragma: keep
#include <boost/beast/http/message.hpp> // IWYU pragma: keep
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/verb.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace osscpp::oss::http {

namespace {

constexpr auto token = boost::asio::as_tuple(boost::asio::use_awaitable);

} // namespace

Http::Http(std::shared_ptr<const Config> config) : config_{std::move(config)} {
    if (config_ == nullptr) {
        throw std::invalid_argument{"Http needs a Config"};
    }
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(boost::asio::ssl::verify_peer);
}

Http::crt Http::execute(boost::beast::http::verb verb, Resources resources, HttpOptions opts,
                        ChunkHandler on_chunk) const {
    using rtype = Http::crt::value_type;

    const PreparedRequest prepared =
        build_request(*config_, verb, resources, opts, std::chrono::system_clock::now());
    const std::string_view method = verb_string(verb);
    const std::chrono::seconds read_timeout = config_->effective_read_timeout();

    log::debug("Send HTTP request: {} {} {}", method, std::string_view{prepared.url.buffer()}, resources);

    const auto network_error = [&](const boost::beast::error_code &ec) {
        log::error("NetworkError: {} {} failed: {}", method, prepared.resource, ec.message());
        return rtype{std::unexpect, ec};
    };

    const bool is_ssl = prepared.url.scheme() != "http";
    // TODO: gracefully shut down the TLS stream once the response is complete
    auto prep_res = co_await _internal::prepare_stream(
        _internal::get_ssl_stream(is_ssl, co_await boost::asio::this_coro::executor, ssl_ctx_), prepared.url,
        config_->effective_open_timeout());
    if (!prep_res) {
        co_return network_error(prep_res.error());
    }
    auto stream = std::move(prep_res.value());

    if (const auto send_ec = co_await _internal::write_request(stream, prepared, opts.body, read_timeout);
        send_ec.failed()) {
        co_return network_error(send_ec);
    }

    boost::beast::flat_buffer buf;
    boost::beast::http::response_parser<boost::beast::http::empty_body> header_parser;
    header_parser.body_limit(std::numeric_limits<std::uint64_t>::max());
    if (verb == boost::beast::http::verb::head) {
        header_parser.skip(true);
    }

    _internal::expires_after(stream, read_timeout);
    {
        const auto [recv_ec, recv_n] = co_await std::visit(
            [&buf, &header_parser](auto &stream_) {
                // NOLINTNEXTLINE(clang-analyzer-core.NullDereference)
                return boost::beast::http::async_read_header(stream_, buf, header_parser, token);
            },
            stream);
        if (recv_ec.failed()) {
            co_return network_error(recv_ec);
        }
    }

    const unsigned status = header_parser.get().result_int();
    boost::beast::http::fields headers{static_cast<const boost::beast::http::fields &>(header_parser.get())};
    ContentDecoder decoder{headers[boost::beast::http::field::content_encoding]};

    log::debug("Received HTTP response: {} {} {} {}", method, prepared.resource, status,
               find_request_id(headers).value_or("<no request id>"));

    if (status >= 300) {
        auto body = co_await _internal::read_buffered_body(stream, buf, header_parser, read_timeout);
        if (!body) {
            co_return network_error(body.error());
        }

        std::string decoded;
        try {
            decoded = decoder.decode(body.value());
            decoder.finish();
        } catch (const std::runtime_error &e) {
            log::warn("cannot decode error body of {} {}, keeping it as received: {}", method,
                      prepared.resource, e.what());
            decoded = std::move(body.value());
        }

        ServerError error =
            make_server_error(verb, prepared.resource, status, std::move(headers), std::move(decoded));
        log::error("{}", error);
        co_return rtype{std::unexpect, std::move(error)};
    }

    Response response;
    response.status = status;
    response.request_id = find_request_id(headers);
    response.streamed = static_cast<bool>(on_chunk);

    const auto deliver = [&](std::string_view data) {
        if (data.empty()) {
            return;
        }
        if (on_chunk) {
            on_chunk(data);
        } else {
            response.body.append(data);
        }
    };

    const auto read_ec = co_await _internal::read_streamed_body(
        stream, buf, header_parser, read_timeout, [&](std::string_view raw) { deliver(decoder.decode(raw)); });
    if (read_ec.failed()) {
        co_return network_error(read_ec);
    }
    decoder.finish();

    response.headers = std::move(headers);
    co_return response;
}

Http::crt Http::get(Resources resources, HttpOptions opts, ChunkHandler on_chunk) const {
    return execute(boost::beast::http::verb::get, std::move(resources), std::move(opts), std::move(on_chunk));
}

Http::crt Http::put(Resources resources, HttpOptions opts, ChunkHandler on_chunk) const {
    return execute(boost::beast::http::verb::put, std::move(resources), std::move(opts), std::move(on_chunk));
}

Http::crt Http::post(Resources resources, HttpOptions opts, ChunkHandler on_chunk) const {
    return execute(boost::beast::http::verb::post, std::move(resources), std::move(opts), std::move(on_chunk));
}

Http::crt Http::delete_(Resources resources, HttpOptions opts, ChunkHandler on_chunk) const {
    return execute(boost::beast::http::verb::delete_, std::move(resources), std::move(opts),
                   std::move(on_chunk));
}

Http::crt Http::head(Resources resources, HttpOptions opts) const {
    return execute(boost::beast::http::verb::head, std::move(resources), std::move(opts));
}

Http::crt Http::options(Resources resources, HttpOptions opts, ChunkHandler on_chunk) const {
    return execute(boost::beast::http::verb::options, std::move(resources), std::move(opts),
                   std::move(on_chunk));
}

} // namespace osscpp::oss::http
