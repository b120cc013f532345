#include "osscpp/oss/http/server_error.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/beast/http/fields.hpp> // IWYU pragma: keep
#include <boost/beast/http/verb.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value.hpp>
#include <boost/system/error_code.hpp> // IWYU pragma: keep
#include <format>
#include <optional>
#include <pugixml.hpp>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace osscpp::oss::http {

namespace {

[[nodiscard]] std::optional<std::string> field_value(const ErrorBody &body, std::string_view name) {
    if (const auto iter = body.fields.find(name); iter != body.fields.end() && !iter->second.empty()) {
        return iter->second;
    }
    return std::nullopt;
}

[[nodiscard]] ErrorBody with_known_fields(ErrorBody body) {
    body.code = field_value(body, "Code");
    body.message = field_value(body, "Message");
    body.request_id = field_value(body, "RequestId");
    body.host_id = field_value(body, "HostId");
    return body;
}

[[nodiscard]] std::optional<ErrorBody> parse_xml_error(std::string_view body) {
    pugi::xml_document document;
    if (const pugi::xml_parse_status status =
            document.load_buffer(body.data(), body.size(), pugi::parse_default, pugi::encoding_utf8).status;
        status != pugi::xml_parse_status::status_ok) {
        return std::nullopt;
    }
    // a proxy page or any other document is not an OSS error
    const pugi::xml_node node = document.child("Error");
    if (!node) {
        return std::nullopt;
    }

    ErrorBody ret;
    for (const auto &child : node.children()) {
        if (child.type() == pugi::node_element) {
            ret.fields.insert_or_assign(child.name(), child.child_value());
        }
    }
    return with_known_fields(std::move(ret));
}

[[nodiscard]] std::optional<ErrorBody> parse_json_error(std::string_view body) {
    boost::system::error_code ec;
    const boost::json::value value = boost::json::parse(body, ec);
    if (ec.failed()) {
        return std::nullopt;
    }
    const auto *object = value.if_object();
    if (object == nullptr) {
        return std::nullopt;
    }
    if (const auto *code = object->if_contains("Code"); code == nullptr || !code->is_string()) {
        return std::nullopt;
    }

    ErrorBody ret;
    for (const auto &member : *object) {
        std::string key{member.key()};
        if (const auto *str = member.value().if_string(); str != nullptr) {
            ret.fields.insert_or_assign(std::move(key), std::string{str->data(), str->size()});
        } else {
            ret.fields.insert_or_assign(std::move(key), boost::json::serialize(member.value()));
        }
    }
    return with_known_fields(std::move(ret));
}

} // namespace

std::optional<ErrorBody> parse_error_body(std::string_view body) {
    const auto begin = body.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return std::nullopt;
    }
    body.remove_prefix(begin);

    if (body.front() == '<') {
        return parse_xml_error(body);
    }
    if (body.front() == '{') {
        return parse_json_error(body);
    }
    return std::nullopt;
}

std::optional<std::string> find_request_id(const boost::beast::http::fields &headers) {
    if (const auto value = headers[request_id_header]; !value.empty()) {
        return std::string{value};
    }
    for (const auto &header : headers) {
        std::string lower{header.name_string()};
        boost::algorithm::to_lower(lower);
        if (lower.ends_with("-request-id") && !header.value().empty()) {
            return std::string{header.value()};
        }
    }
    return std::nullopt;
}

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
ServerError::ServerError(boost::beast::http::verb verb, std::string resource, unsigned status,
                         boost::beast::http::fields headers, std::string body)
    : verb_{verb}, resource_{std::move(resource)}, status_{status}, headers_{std::move(headers)},
      body_{std::move(body)}, parsed_{parse_error_body(body_)}, request_id_{find_request_id(headers_)} {
    // the header wins, the body is the fallback for servers that only echo it there
    if (!request_id_.has_value() && parsed_.has_value()) {
        request_id_ = parsed_->request_id;
    }
}

ServerError make_server_error(boost::beast::http::verb verb, std::string resource, unsigned status,
                              boost::beast::http::fields headers, std::string body) {
    return ServerError{verb, std::move(resource), status, std::move(headers), std::move(body)};
}

std::string to_string(const Error &error) {
    return std::visit(
        []<typename T>(const T &err) -> std::string {
            if constexpr (std::is_same_v<T, ServerError>) {
                return std::format("{}", err);
            } else {
                return std::format("NetworkError: {}", err.message());
            }
        },
        error);
}

} // namespace osscpp::oss::http
