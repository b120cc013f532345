#pragma once

#include <boost/beast/core/error.hpp>
#include <boost/beast/http/fields.hpp> // IWYU pragma: keep
#include <boost/beast/http/verb.hpp>
#include <format>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

//
#include "osscpp/internal/macro-begin.hpp"

namespace osscpp::oss::http {

constexpr std::string_view request_id_header = "x-oss-request-id";

// Fields of a structured (XML or JSON) error body.
struct ErrorBody {
    std::optional<std::string> code;
    std::optional<std::string> message;
    std::optional<std::string> request_id;
    std::optional<std::string> host_id;
    // every top level field, including the ones above
    std::map<std::string, std::string, std::less<>> fields;
};

// <Error><Code>..</Code>..</Error> or {"Code": .., ..}, nullopt for anything else.
[[nodiscard]] std::optional<ErrorBody> parse_error_body(std::string_view body);

// x-oss-request-id, or any other header following the *-request-id convention
[[nodiscard]] std::optional<std::string> find_request_id(const boost::beast::http::fields &headers);

// A response with status >= 300. Immutable.
class ServerError {
private:
    boost::beast::http::verb verb_;
    std::string resource_;
    unsigned status_;
    boost::beast::http::fields headers_;
    std::string body_;
    std::optional<ErrorBody> parsed_;
    std::optional<std::string> request_id_;

public:
    [[nodiscard]] ServerError(boost::beast::http::verb verb, std::string resource, unsigned status,
                              boost::beast::http::fields headers, std::string body);

    [[nodiscard]] boost::beast::http::verb verb() const { return verb_; }
    [[nodiscard]] const std::string &resource() const { return resource_; }
    [[nodiscard]] unsigned status() const { return status_; }
    [[nodiscard]] const boost::beast::http::fields &headers() const { return headers_; }
    // decoded, unparsed body
    [[nodiscard]] const std::string &body() const { return body_; }
    [[nodiscard]] const std::optional<ErrorBody> &parsed() const { return parsed_; }
    [[nodiscard]] const std::optional<std::string> &request_id() const { return request_id_; }

    [[nodiscard]] std::optional<std::string> code() const {
        return parsed_.has_value() ? parsed_->code : std::nullopt;
    }
    [[nodiscard]] std::optional<std::string> message() const {
        return parsed_.has_value() ? parsed_->message : std::nullopt;
    }
};

// Never fails on the body, unparseable bodies are kept as raw text.
[[nodiscard]] ServerError make_server_error(boost::beast::http::verb verb, std::string resource, unsigned status,
                                            boost::beast::http::fields headers, std::string body);

// NetworkError (as reported by Asio/Beast) or ServerError
using Error = std::variant<boost::beast::error_code, ServerError>;

[[nodiscard]] std::string to_string(const Error &error);

} // namespace osscpp::oss::http

template <> struct std::formatter<osscpp::oss::http::ServerError> {
    [[nodiscard]] constexpr static auto parse(std::format_parse_context &ctx) { return ctx.begin(); }

    static auto format(const osscpp::oss::http::ServerError &error, std::format_context &ctx) {
        auto out = std::format_to(ctx.out(), "ServerError: {} {} returned {} {}",
                                  std::string_view{boost::beast::http::to_string(error.verb())}, error.resource(),
                                  error.status(), error.code().value_or("<no code>"));
        if (const auto message = error.message(); message.has_value()) {
            out = std::format_to(out, ": {}", message.value());
        } else if (!error.body().empty() && !error.parsed().has_value()) {
            out = std::format_to(out, ": {}", error.body());
        }
        return std::format_to(out, " (RequestId: {})", error.request_id().value_or("<none>"));
    }
};

//
#include "osscpp/internal/macro-end.hpp"
