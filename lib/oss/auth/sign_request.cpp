#include "osscpp/oss/auth/sign_request.hpp"

#include "osscpp/meta.hpp"

#include <botan/base64.h>
#include <botan/mac.h>
#include <cassert>
#include <cstdint>
#include <format>
#include <span>
#include <string>
#include <string_view>

// see https://help.aliyun.com/document_detail/31951.html
// for the signing scheme

namespace osscpp::oss::auth {

std::string get_signature(std::string_view access_key_secret, std::string_view canonical_request) {
    auto hmac = Botan::MessageAuthenticationCode::create_or_throw("HMAC(SHA-1)");
    assert(hmac != nullptr);

    hmac->set_key(std::span<const std::uint8_t>{
        meta::safe_reinterpret_cast<const std::uint8_t *>(access_key_secret.data()), access_key_secret.size()});
    hmac->update(canonical_request);

    return Botan::base64_encode(hmac->final());
}

std::string authorization_header(std::string_view access_key_id, std::string_view signature) {
    return std::format("OSS {}:{}", access_key_id, signature);
}

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
std::string sign_request(std::string_view access_key_id, std::string_view access_key_secret,
                         std::string_view canonical_request) {
    return authorization_header(access_key_id, get_signature(access_key_secret, canonical_request));
}

} // namespace osscpp::oss::auth
