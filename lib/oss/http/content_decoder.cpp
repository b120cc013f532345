#include "osscpp/oss/http/content_decoder.hpp"

#include "osscpp/log.hpp"

#include <array>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/zlib/error.hpp>
#include <boost/beast/zlib/inflate_stream.hpp>
#include <boost/beast/zlib/zlib.hpp>
#include <boost/describe/enum_to_string.hpp>
#include <cstddef>
#include <cstdint>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace osscpp::oss::http {

namespace {

constexpr std::size_t inflate_buffer_size = 16 * 1024;
constexpr std::size_t gzip_trailer_size = 8;
constexpr std::size_t zlib_trailer_size = 4;

[[nodiscard]] ContentDecoder::Encoding parse_encoding(std::string_view content_encoding) {
    std::string encoding{content_encoding};
    boost::algorithm::trim(encoding);
    boost::algorithm::to_lower(encoding);

    if (encoding.empty() || encoding == "identity") {
        return ContentDecoder::Encoding::IDENTITY;
    }
    if (encoding == "gzip" || encoding == "x-gzip") {
        return ContentDecoder::Encoding::GZIP;
    }
    if (encoding == "deflate") {
        return ContentDecoder::Encoding::DEFLATE;
    }
    log::warn("unsupported Content-Encoding {}, passing the body through", encoding);
    return ContentDecoder::Encoding::IDENTITY;
}

[[nodiscard]] std::uint8_t byte_at(std::string_view data, std::size_t pos) {
    return static_cast<std::uint8_t>(data[pos]);
}

[[nodiscard]] std::uint32_t read_be32(std::string_view data, std::size_t pos) {
    std::uint32_t ret = 0;
    for (std::size_t i = 0; i < 4; i++) {
        ret = (ret << 8U) | byte_at(data, pos + i);
    }
    return ret;
}

[[nodiscard]] std::uint32_t read_le32(std::string_view data, std::size_t pos) {
    std::uint32_t ret = 0;
    for (std::size_t i = 0; i < 4; i++) {
        ret |= static_cast<std::uint32_t>(byte_at(data, pos + i)) << (8U * i);
    }
    return ret;
}

// RFC 1952 member header, nullopt until all of it is available
[[nodiscard]] std::optional<std::size_t> gzip_header_size(std::string_view data) {
    constexpr std::uint8_t FHCRC = 0x02;
    constexpr std::uint8_t FEXTRA = 0x04;
    constexpr std::uint8_t FNAME = 0x08;
    constexpr std::uint8_t FCOMMENT = 0x10;

    if (data.size() < 10) {
        return std::nullopt;
    }
    if (byte_at(data, 0) != 0x1f || byte_at(data, 1) != 0x8b) {
        throw std::runtime_error{"invalid gzip magic"};
    }
    if (byte_at(data, 2) != 8) {
        throw std::runtime_error{std::format("unsupported gzip compression method {}", byte_at(data, 2))};
    }
    const std::uint8_t flags = byte_at(data, 3);
    std::size_t pos = 10;

    if ((flags & FEXTRA) != 0) {
        if (data.size() < pos + 2) {
            return std::nullopt;
        }
        const std::size_t xlen = byte_at(data, pos) | (static_cast<std::size_t>(byte_at(data, pos + 1)) << 8U);
        pos += 2 + xlen;
    }
    for (const std::uint8_t flag : {FNAME, FCOMMENT}) {
        if ((flags & flag) == 0) {
            continue;
        }
        if (pos >= data.size()) {
            return std::nullopt;
        }
        const auto end = data.find('\0', pos);
        if (end == std::string_view::npos) {
            return std::nullopt;
        }
        pos = end + 1;
    }
    if ((flags & FHCRC) != 0) {
        pos += 2;
    }
    if (data.size() < pos) {
        return std::nullopt;
    }
    return pos;
}

// RFC 1950, some servers send raw deflate data for "deflate" instead
[[nodiscard]] bool has_zlib_header(std::string_view data) {
    const std::uint8_t cmf = byte_at(data, 0);
    const std::uint8_t flg = byte_at(data, 1);
    constexpr std::uint8_t FDICT = 0x20;
    return (cmf & 0x0fU) == 8 && (cmf >> 4U) <= 7 && (flg & FDICT) == 0 &&
           ((static_cast<unsigned>(cmf) << 8U) | flg) % 31 == 0;
}

} // namespace

ContentDecoder::ContentDecoder(std::string_view content_encoding)
    : encoding_{parse_encoding(content_encoding)} {}

void ContentDecoder::update_adler32(std::string_view data) {
    constexpr std::uint32_t adler_mod = 65521;
    for (const char c : data) {
        adler_a_ = (adler_a_ + static_cast<std::uint8_t>(c)) % adler_mod;
        adler_b_ = (adler_b_ + adler_a_) % adler_mod;
    }
}

std::string ContentDecoder::inflate(std::string_view input) {
    std::string out;
    std::array<char, inflate_buffer_size> buf{};

    boost::beast::zlib::z_params zs;
    zs.next_in = input.data();
    zs.avail_in = input.size();

    while (true) {
        zs.next_out = buf.data();
        zs.avail_out = buf.size();
        boost::beast::error_code ec;
        inflater_.write(zs, boost::beast::zlib::Flush::none, ec);

        const std::size_t produced = buf.size() - zs.avail_out;
        out.append(buf.data(), produced);
        crc_.process_bytes(buf.data(), produced);
        update_adler32(std::string_view{buf.data(), produced});
        decoded_size_ += produced;

        if (ec == boost::beast::zlib::error::end_of_stream) {
            stage_ = trailer_size_ > 0 ? Stage::TRAILER : Stage::DONE;
            pending_.append(static_cast<const char *>(zs.next_in), zs.avail_in);
            break;
        }
        if (ec.failed() && ec != boost::beast::zlib::error::need_buffers) {
            throw std::runtime_error{std::format("inflate failed: {}", ec.message())};
        }
        if (zs.avail_out == 0) {
            continue;
        }
        if (zs.avail_in == 0) {
            break;
        }
        if (ec == boost::beast::zlib::error::need_buffers) {
            throw std::runtime_error{"inflate made no progress"};
        }
    }

    return out;
}

std::string ContentDecoder::decode(std::string_view chunk) {
    if (encoding_ == Encoding::IDENTITY) {
        return std::string{chunk};
    }
    if (!chunk.empty()) {
        received_input_ = true;
    }

    switch (stage_) {
    case Stage::HEADER: {
        pending_.append(chunk);
        std::size_t header_size = 0;
        if (encoding_ == Encoding::GZIP) {
            const auto size = gzip_header_size(pending_);
            if (!size.has_value()) {
                return {};
            }
            header_size = size.value();
            trailer_size_ = gzip_trailer_size;
        } else {
            if (pending_.size() < 2) {
                return {};
            }
            if (has_zlib_header(pending_)) {
                header_size = 2;
                trailer_size_ = zlib_trailer_size;
            }
        }
        stage_ = Stage::BODY;
        const std::string body = pending_.substr(header_size);
        pending_.clear();
        return inflate(body);
    }
    case Stage::BODY:
        return inflate(chunk);
    case Stage::TRAILER:
    case Stage::DONE:
        pending_.append(chunk);
        return {};
    }
    return {};
}

void ContentDecoder::finish() {
    if (encoding_ == Encoding::IDENTITY || !received_input_ || stage_ == Stage::DONE) {
        return;
    }
    const std::string_view name = boost::describe::enum_to_string(encoding_, "unknown");
    if (stage_ != Stage::TRAILER || pending_.size() < trailer_size_) {
        throw std::runtime_error{std::format("truncated {} stream", name)};
    }
    if (encoding_ == Encoding::DEFLATE) {
        if (read_be32(pending_, 0) != ((adler_b_ << 16U) | adler_a_)) {
            throw std::runtime_error{"zlib Adler-32 mismatch"};
        }
    } else if (encoding_ == Encoding::GZIP) {
        if (read_le32(pending_, 0) != crc_.checksum()) {
            throw std::runtime_error{"gzip CRC32 mismatch"};
        }
        if (read_le32(pending_, 4) != static_cast<std::uint32_t>(decoded_size_)) {
            throw std::runtime_error{"gzip ISIZE mismatch"};
        }
    }
    stage_ = Stage::DONE;
}

} // namespace osscpp::oss::http
