#include "osscpp/oss/http/stream_writer.hpp"

#include "osscpp/log.hpp"
#include "osscpp/meta.hpp"

#include <algorithm>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp> // IWYU pragma: keep
#include <boost/asio/experimental/channel_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp> // IWYU pragma: keep
#include <boost/system/system_error.hpp>
#include <cstddef>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace osscpp::oss::http {

namespace {

constexpr auto token = boost::asio::as_tuple(boost::asio::use_awaitable);

// the frame keeps state and producer alive for as long as the producer runs
meta::crt<boost::asio::awaitable<void>> run_producer(std::shared_ptr<_internal::StreamState> state,
                                                     StreamProducer producer) {
    StreamWriter writer{std::move(state)};
    co_await producer(writer);
    log::debug("stream producer finished after {} bytes", writer.bytes_written());
}

} // namespace

meta::crt<boost::asio::awaitable<void>> StreamWriter::write(std::string chunk) {
    const std::size_t size = chunk.size();
    const auto [ec] = co_await state_->channel.async_send(boost::system::error_code{}, std::move(chunk), token);
    if (ec.failed()) {
        throw boost::system::system_error{ec, "stream session abandoned"};
    }
    bytes_written_ += size;
}

StreamSession::StreamSession(boost::asio::any_io_executor executor, StreamProducer producer)
    : state_{std::make_shared<_internal::StreamState>(executor)} {
    boost::asio::co_spawn(std::move(executor), run_producer(state_, std::move(producer)),
                          [state = state_](const std::exception_ptr &exception) {
                              state->producer_error = exception;
                              state->channel.close();
                          });
}

StreamSession::~StreamSession() {
    if (state_ == nullptr) {
        return;
    }
    if (!producer_finished_) {
        log::debug("abandoning unfinished stream producer");
    }
    // wakes a producer blocked in write, later writes fail right away
    state_->channel.cancel();
    state_->channel.close();
}

meta::crt<boost::asio::awaitable<bool>> StreamSession::pull() {
    if (producer_finished_) {
        co_return false;
    }
    auto [ec, chunk] = co_await state_->channel.async_receive(token);
    if (ec.failed()) {
        producer_finished_ = true;
        if (state_->producer_error) {
            std::rethrow_exception(std::exchange(state_->producer_error, nullptr));
        }
        if (ec != boost::asio::experimental::error::channel_closed) {
            throw boost::system::system_error{ec, "stream session receive failed"};
        }
        co_return false;
    }
    buffer_.append(chunk);
    co_return true;
}

meta::crt<boost::asio::awaitable<std::optional<std::string>>> StreamSession::read(std::size_t length) {
    std::string ret;
    while (true) {
        const std::size_t take = std::min(length - ret.size(), buffer_.size());
        ret.append(buffer_, 0, take);
        buffer_.erase(0, take);
        if (ret.size() >= length) {
            break;
        }
        if (!co_await pull()) {
            break;
        }
    }

    // end of stream only for a positive length, a zero length read is always ""
    if (ret.empty() && length > 0) {
        co_return std::nullopt;
    }
    co_return ret;
}

meta::crt<boost::asio::awaitable<std::string>> StreamSession::read_all() {
    while (co_await pull()) {
    }
    co_return std::exchange(buffer_, {});
}

} // namespace osscpp::oss::http
