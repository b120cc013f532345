#pragma once

#include "osscpp/meta.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/experimental/channel.hpp>
#include <boost/system/error_code.hpp> // IWYU pragma: keep
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

//
#include "osscpp/internal/macro-begin.hpp"

namespace osscpp::oss::http {

class StreamWriter;

// Produces a request body by awaiting StreamWriter::write for every piece.
using StreamProducer = std::function<boost::asio::awaitable<void>(StreamWriter &)>;

namespace _internal {

struct StreamState {
    // zero capacity: a send completes only once the consumer has received the chunk
    using channel_t = boost::asio::experimental::basic_channel<
        boost::asio::any_io_executor, boost::asio::experimental::channel_traits<std::mutex>,
        void(boost::system::error_code, std::string)>;

    channel_t channel;
    // set by the producer's completion handler before the channel is closed
    std::exception_ptr producer_error;

    [[nodiscard]] explicit StreamState(boost::asio::any_io_executor executor)
        : channel{std::move(executor), 0} {}
};

} // namespace _internal

// Producer side of a StreamSession.
class StreamWriter {
private:
    std::shared_ptr<_internal::StreamState> state_;
    std::size_t bytes_written_ = 0;

public:
    [[nodiscard]] explicit StreamWriter(std::shared_ptr<_internal::StreamState> state)
        : state_{std::move(state)} {}

    // Suspends until the consumer has taken the chunk. Throws boost::system::system_error once the
    // session has been abandoned.
    [[nodiscard]] meta::crt<boost::asio::awaitable<void>> write(std::string chunk);

    [[nodiscard]] std::size_t bytes_written() const { return bytes_written_; }
};

// Consumer side: turns the producer's pushes into reads of arbitrary size.
// One producer, one reader, not shareable.
class StreamSession {
private:
    std::shared_ptr<_internal::StreamState> state_;
    std::string buffer_;
    bool producer_finished_ = false;

    // resumes the producer once, false when it has finished
    [[nodiscard]] meta::crt<boost::asio::awaitable<bool>> pull();

public:
    // The producer is spawned on executor right away and runs up to its first write.
    [[nodiscard]] StreamSession(boost::asio::any_io_executor executor, StreamProducer producer);
    // Abandons the producer if it has not finished.
    ~StreamSession();

    StreamSession(const StreamSession &) = delete;
    StreamSession &operator=(const StreamSession &) = delete;
    StreamSession(StreamSession &&) = default;
    StreamSession &operator=(StreamSession &&) = delete;

    // Exactly length bytes, fewer once the producer has finished, std::nullopt at end of stream
    // (length > 0). Rethrows an exception raised by the producer.
    [[nodiscard]] meta::crt<boost::asio::awaitable<std::optional<std::string>>> read(std::size_t length);

    // Everything until the producer has finished, empty at end of stream.
    [[nodiscard]] meta::crt<boost::asio::awaitable<std::string>> read_all();

    [[nodiscard]] bool finished() const { return producer_finished_ && buffer_.empty(); }
};

} // namespace osscpp::oss::http

//
#include "osscpp/internal/macro-end.hpp"
