#include "mock_server.hpp"
#include "osscpp/oss/http/stream_writer.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <cstddef>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

using osscpp::oss::http::StreamSession;
using osscpp::oss::http::StreamWriter;

boost::asio::awaitable<void> three_chunks(StreamWriter &writer) {
    co_await writer.write(std::string(4096, 'a'));
    co_await writer.write("b");
    co_await writer.write("");
}

boost::asio::awaitable<std::string> read_with_strides(boost::asio::io_context &ioc,
                                                      std::vector<std::size_t> strides) {
    StreamSession session{ioc.get_executor(), three_chunks};
    std::string ret;
    std::size_t i = 0;
    while (true) {
        auto chunk = co_await session.read(strides[i++ % strides.size()]);
        if (!chunk.has_value()) {
            break;
        }
        ret.append(chunk.value());
    }
    // end of stream stays end of stream
    if (co_await session.read(1) != std::nullopt || !session.finished()) {
        throw std::runtime_error{"end of stream was not sticky"};
    }
    co_return ret;
}

boost::asio::awaitable<std::vector<std::optional<std::string>>> read_exact(boost::asio::io_context &ioc) {
    StreamSession session{ioc.get_executor(), [](StreamWriter &writer) -> boost::asio::awaitable<void> {
                              co_await writer.write("hel");
                              co_await writer.write("lo wo");
                              co_await writer.write("rld");
                          }};
    std::vector<std::optional<std::string>> ret;
    ret.push_back(co_await session.read(0));
    ret.push_back(co_await session.read(4));
    ret.push_back(co_await session.read(4));
    ret.push_back(co_await session.read(4));
    ret.push_back(co_await session.read(4));
    co_return ret;
}

boost::asio::awaitable<std::optional<std::string>> read_empty(boost::asio::io_context &ioc) {
    StreamSession session{ioc.get_executor(), [](StreamWriter &writer) -> boost::asio::awaitable<void> {
                              co_await writer.write("");
                          }};
    co_return co_await session.read(16);
}

boost::asio::awaitable<std::string> read_everything(boost::asio::io_context &ioc) {
    StreamSession session{ioc.get_executor(), [](StreamWriter &writer) -> boost::asio::awaitable<void> {
                              for (int i = 0; i < 10; i++) {
                                  co_await writer.write(std::to_string(i));
                              }
                          }};
    co_return co_await session.read_all();
}

boost::asio::awaitable<std::string> read_failing(boost::asio::io_context &ioc) {
    StreamSession session{ioc.get_executor(), [](StreamWriter &writer) -> boost::asio::awaitable<void> {
                              co_await writer.write("partial");
                              throw std::runtime_error{"producer failed"};
                          }};
    co_return co_await session.read_all();
}

boost::asio::awaitable<std::optional<std::string>> abandon(boost::asio::io_context &ioc, bool &write_failed) {
    std::optional<std::string> first;
    {
        auto producer = [&write_failed](StreamWriter &writer) -> boost::asio::awaitable<void> {
            co_await writer.write("first");
            try {
                co_await writer.write("second");
            } catch (const std::exception &) {
                write_failed = true;
            }
        };
        StreamSession session{ioc.get_executor(), producer};
        first = co_await session.read(5);
    }
    co_return first;
}

} // namespace

// NOLINTNEXTLINE(bugprone-exception-escape)
int main() {
    using osscpp::test::run_until_complete;
    boost::asio::io_context ioc;

    const std::vector<std::vector<std::size_t>> all_strides{{1}, {7, 4096}, {100000}, {4097}, {4095, 1, 3}};
    for (const auto &strides : all_strides) {
        const std::string body = run_until_complete(ioc, read_with_strides(ioc, strides));
        if (body.size() != 4097 || body != std::string(4096, 'a') + "b") {
            std::cerr << "stream round trip failed, got " << body.size() << " bytes\n";
            return 1;
        }
    }

    {
        const auto reads = run_until_complete(ioc, read_exact(ioc));
        const std::vector<std::optional<std::string>> reads_chk{"", "hell", "o wo", "rld", std::nullopt};
        if (reads != reads_chk) {
            std::cerr << "read(length) failed\n";
            return 1;
        }
    }

    if (run_until_complete(ioc, read_empty(ioc)) != std::nullopt) {
        std::cerr << "a zero byte write must end in end of stream\n";
        return 1;
    }

    if (const auto all = run_until_complete(ioc, read_everything(ioc)); all != "0123456789") {
        std::cerr << "read_all failed, got " << all << "\n";
        return 1;
    }

    try {
        const auto unexpected = run_until_complete(ioc, read_failing(ioc));
        std::cerr << "producer exception was swallowed, got " << unexpected << "\n";
        return 1;
    } catch (const std::runtime_error &e) {
        if (std::string_view{e.what()} != "producer failed") {
            std::cerr << "unexpected exception " << e.what() << "\n";
            return 1;
        }
    }

    {
        bool write_failed = false;
        const auto first = run_until_complete(ioc, abandon(ioc, write_failed));
        // let the abandoned producer observe the closed session
        ioc.restart();
        ioc.run();
        if (first != "first" || !write_failed) {
            std::cerr << "abandoning the session did not stop the producer\n";
            return 1;
        }
    }
}
