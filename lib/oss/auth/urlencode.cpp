#include "osscpp/oss/auth/urlencode.hpp"

#include <boost/url/encode.hpp> // IWYU pragma: keep
#include <boost/url/grammar/charset.hpp>
#include <boost/url/grammar/lut_chars.hpp>
#include <string>
#include <string_view>

namespace osscpp::oss::auth {

namespace {

constexpr boost::urls::grammar::lut_chars charset = "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
                                                    "abcdefghijklmnopqrstuvwxyz"
                                                    "1234567890"
                                                    "-._~";

constexpr boost::urls::grammar::lut_chars path_charset = charset + "/";

} // namespace

std::string urlencode(std::string_view input) { return boost::urls::encode(input, charset); }
bool urlencode_required(std::string_view input) {
    return boost::urls::grammar::find_if_not(input.begin(), input.end(), charset) != input.end();
}

std::string urlencode_path(std::string_view input) { return boost::urls::encode(input, path_charset); }
bool urlencode_path_required(std::string_view input) {
    return boost::urls::grammar::find_if_not(input.begin(), input.end(), path_charset) != input.end();
}

} // namespace osscpp::oss::auth
