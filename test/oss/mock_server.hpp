#pragma once

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/message.hpp> // IWYU pragma: keep
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp> // IWYU pragma: keep
#include <boost/beast/http/verb.hpp>
#include <boost/beast/http/write.hpp>
#include <cstdint>
#include <exception>
#include <functional>
#include <initializer_list>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace osscpp::test {

using Request = boost::beast::http::request<boost::beast::http::string_body>;
using Reply = boost::beast::http::response<boost::beast::http::string_body>;

// Runs task on ioc until it completes, rethrowing its exception.
template <typename T> T run_until_complete(boost::asio::io_context &ioc, boost::asio::awaitable<T> task) {
    std::optional<T> result;
    std::exception_ptr error;
    boost::asio::co_spawn(ioc, std::move(task), [&](const std::exception_ptr &e, T value) {
        error = e;
        if (!e) {
            result.emplace(std::move(value));
        }
        ioc.stop();
    });
    ioc.restart();
    ioc.run();
    if (error) {
        std::rethrow_exception(error);
    }
    return std::move(result.value());
}

inline void run_until_complete(boost::asio::io_context &ioc, boost::asio::awaitable<void> task) {
    std::exception_ptr error;
    boost::asio::co_spawn(ioc, std::move(task), [&](const std::exception_ptr &e) {
        error = e;
        ioc.stop();
    });
    ioc.restart();
    ioc.run();
    if (error) {
        std::rethrow_exception(error);
    }
}

inline std::string bytes(std::initializer_list<unsigned> values) {
    std::string ret;
    for (const unsigned value : values) {
        ret.push_back(static_cast<char>(value));
    }
    return ret;
}

// HTTP/1.1 server on 127.0.0.1, one request per connection, connections served one after another.
// Every request is recorded after the handler has seen it.
class MockServer {
public:
    using Handler = std::function<Reply(const Request &)>;

private:
    boost::asio::ip::tcp::acceptor acceptor_;
    Handler handler_;

    boost::asio::awaitable<void> serve() {
        constexpr auto token = boost::asio::as_tuple(boost::asio::use_awaitable);
        while (true) {
            auto [accept_ec, socket] = co_await acceptor_.async_accept(token);
            if (accept_ec.failed()) {
                co_return;
            }
            boost::beast::tcp_stream stream{std::move(socket)};
            boost::beast::flat_buffer buf;
            boost::beast::http::request_parser<boost::beast::http::string_body> parser;
            parser.body_limit(std::numeric_limits<std::uint64_t>::max());

            const auto [read_ec, read_n] = co_await boost::beast::http::async_read(stream, buf, parser, token);
            if (read_ec.failed()) {
                continue;
            }
            Request request = parser.release();
            Reply reply = handler_(request);
            reply.version(11);
            reply.keep_alive(false);
            // HEAD replies keep the Content-Length the handler chose
            if (request.method() != boost::beast::http::verb::head && !reply.chunked()) {
                reply.prepare_payload();
            }
            requests.push_back(std::move(request));

            const auto [write_ec, write_n] = co_await boost::beast::http::async_write(stream, reply, token);
            if (write_ec.failed()) {
                continue;
            }
            boost::beast::error_code shutdown_ec;
            stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, shutdown_ec);
        }
    }

public:
    std::vector<Request> requests;

    MockServer(boost::asio::io_context &ioc, Handler handler)
        : acceptor_{ioc, {boost::asio::ip::address_v4::loopback(), 0}}, handler_{std::move(handler)} {
        boost::asio::co_spawn(ioc, serve(), boost::asio::detached);
    }

    [[nodiscard]] std::uint16_t port() const { return acceptor_.local_endpoint().port(); }
};

} // namespace osscpp::test
