#pragma once

#include <boost/beast/zlib/inflate_stream.hpp>
#include <boost/crc.hpp>
#include <boost/describe/enum.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

//
#include "osscpp/internal/macro-begin.hpp"

namespace osscpp::oss::http {

// Incremental Content-Encoding decoder, fed with the body as it arrives off the wire.
// Throws std::runtime_error on corrupt input.
class ContentDecoder {
public:
    enum class Encoding : std::uint8_t { IDENTITY, GZIP, DEFLATE };
    BOOST_DESCRIBE_NESTED_ENUM(Encoding, IDENTITY, GZIP, DEFLATE);

private:
    enum class Stage : std::uint8_t { HEADER, BODY, TRAILER, DONE };

    Encoding encoding_;
    Stage stage_ = Stage::HEADER;
    boost::beast::zlib::inflate_stream inflater_;
    // header or trailer bytes that did not arrive in one piece
    std::string pending_;
    std::size_t trailer_size_ = 0;
    bool received_input_ = false;
    boost::crc_32_type crc_;
    std::uint32_t adler_a_ = 1;
    std::uint32_t adler_b_ = 0;
    std::uint64_t decoded_size_ = 0;

    void update_adler32(std::string_view data);
    [[nodiscard]] std::string inflate(std::string_view input);

public:
    // unknown encodings are passed through untouched
    [[nodiscard]] explicit ContentDecoder(std::string_view content_encoding);

    [[nodiscard]] Encoding encoding() const { return encoding_; }

    [[nodiscard]] std::string decode(std::string_view chunk);

    // checks that the stream was complete, call once after the last chunk
    void finish();
};

} // namespace osscpp::oss::http

//
#include "osscpp/internal/macro-end.hpp"
