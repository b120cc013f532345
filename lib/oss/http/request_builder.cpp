#include "osscpp/oss/http/request_builder.hpp"

#include "osscpp/log.hpp"
#include "osscpp/oss/auth/canonicalize.hpp"
#include "osscpp/oss/auth/sign_request.hpp"
#include "osscpp/oss/auth/urlencode.hpp"

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/fields.hpp> // IWYU pragma: keep
#include <boost/beast/http/verb.hpp>
#include <boost/url/url.hpp>
#include <botan/base64.h>
#include <botan/hash.h>
#include <cassert>
#include <chrono>
#include <format>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace osscpp::oss::http {

std::string_view verb_string(boost::beast::http::verb verb) {
    switch (verb) {
    case boost::beast::http::verb::get:
    case boost::beast::http::verb::put:
    case boost::beast::http::verb::post:
    case boost::beast::http::verb::delete_:
    case boost::beast::http::verb::head:
    case boost::beast::http::verb::options:
        return boost::beast::http::to_string(verb);
    default:
        throw std::invalid_argument{
            std::format("unsupported HTTP verb {}", std::string_view{boost::beast::http::to_string(verb)})};
    }
}

std::string content_md5(std::string_view body) {
    auto hash = Botan::HashFunction::create_or_throw("MD5");
    assert(hash != nullptr);
    hash->update(body);
    return Botan::base64_encode(hash->final());
}

boost::urls::url get_request_url(const Config &config, const std::optional<std::string> &bucket,
                                 const std::optional<std::string> &object) {
    boost::urls::url url;
    url.set_scheme(config.endpoint.has_scheme() ? std::string_view{config.endpoint.scheme()}
                                                : std::string_view{"https"});

    const std::string_view host{config.endpoint.encoded_host()};
    if (bucket.has_value() && !config.cname) {
        url.set_encoded_host(std::format("{}.{}", bucket.value(), host));
    } else {
        url.set_encoded_host(host);
    }
    if (config.endpoint.has_port()) {
        url.set_port(config.endpoint.port());
    }

    if (object.has_value()) {
        url.set_encoded_path(std::format("/{}", auth::urlencode_path_required(object.value())
                                                    ? auth::urlencode_path(object.value())
                                                    : object.value()));
    } else {
        url.set_encoded_path("/");
    }

    return url;
}

std::map<std::string, std::optional<std::string>, std::less<>>
merge_query(const auth::SubResources &sub_resources, const Query &query) {
    std::map<std::string, std::optional<std::string>, std::less<>> ret;
    for (const auto &[key, value] : sub_resources) {
        if (value.has_value() && !value->empty()) {
            ret.insert_or_assign(key, value);
        } else {
            ret.insert_or_assign(key, std::nullopt);
        }
    }
    for (const auto &[key, value] : query) {
        ret.insert_or_assign(key, value);
    }
    return ret;
}

PreparedRequest build_request(const Config &config, boost::beast::http::verb verb, const Resources &resources,
                              const HttpOptions &options, std::chrono::system_clock::time_point now) {
    if (!resources.bucket.has_value() && resources.object.has_value()) {
        throw std::invalid_argument{std::format("object {} given without a bucket", resources.object.value())};
    }

    PreparedRequest ret;
    ret.verb = verb;
    const std::string_view method = verb_string(verb);

    ret.url = get_request_url(config, resources.bucket, resources.object);
    std::string query;
    for (const auto &[key, value] : merge_query(resources.sub_resources, options.query)) {
        if (!query.empty()) {
            query.append("&");
        }
        query.append(auth::urlencode(key));
        if (value.has_value()) {
            query.append("=");
            query.append(auth::urlencode(value.value()));
        }
    }
    if (!query.empty()) {
        ret.url.set_encoded_query(query);
    }

    ret.headers = options.headers;
    ret.headers.set(boost::beast::http::field::user_agent, config.user_agent);
    ret.headers.set(boost::beast::http::field::date, format_http_date(now));
    if (ret.headers[boost::beast::http::field::content_type].empty()) {
        ret.headers.set(boost::beast::http::field::content_type, default_content_type);
    }
    if (ret.headers[boost::beast::http::field::accept_encoding].empty()) {
        ret.headers.set(boost::beast::http::field::accept_encoding, default_accept_encoding);
    }
    if (config.credentials.security_token.has_value()) {
        ret.headers.set(sts_header, config.credentials.security_token.value());
    }

    // Content-MD5 and chunked transfer encoding are mutually exclusive
    std::visit(
        [&ret]<typename T>(const T &body) {
            if constexpr (std::is_same_v<T, std::string>) {
                ret.headers.set(boost::beast::http::field::content_md5, content_md5(body));
                ret.headers.erase(boost::beast::http::field::transfer_encoding);
            } else if constexpr (std::is_same_v<T, StreamBody>) {
                ret.is_streaming = true;
                ret.headers.set(boost::beast::http::field::transfer_encoding, "chunked");
                ret.headers.erase(boost::beast::http::field::content_md5);
                ret.headers.erase(boost::beast::http::field::content_length);
            }
        },
        options.body);

    ret.headers.set(boost::beast::http::field::host, ret.url.encoded_host_and_port());

    ret.resource = auth::resource_path(resources.bucket, resources.object);
    ret.canonical = auth::canonicalize_request(method, ret.headers, ret.resource, resources.sub_resources);

    if (config.credentials.can_sign()) {
        ret.headers.set(boost::beast::http::field::authorization,
                        auth::sign_request(config.credentials.access_key_id,
                                           config.credentials.access_key_secret, ret.canonical));
        ret.is_signed = true;
    } else {
        log::debug("SigningSkipped: no credentials, sending {} {} unauthenticated", method, ret.resource);
    }

    return ret;
}

} // namespace osscpp::oss::http
