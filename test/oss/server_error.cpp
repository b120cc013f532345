#include "osscpp/oss/http/server_error.hpp"

#include <boost/beast/core/error.hpp>
#include <boost/beast/http/fields.hpp> // IWYU pragma: keep
#include <boost/beast/http/verb.hpp>
#include <boost/system/errc.hpp>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace {

using osscpp::oss::http::make_server_error;
using osscpp::oss::http::ServerError;

ServerError get_error(std::string body, boost::beast::http::fields headers = {}) {
    return make_server_error(boost::beast::http::verb::get, "/b/k", 404, std::move(headers), std::move(body));
}

} // namespace

// NOLINTNEXTLINE(bugprone-exception-escape)
int main() {
    {
        constexpr std::string_view xml = R"---(<?xml version="1.0" encoding="UTF-8"?>
<Error>
  <Code>NoSuchKey</Code>
  <Message>The specified key does not exist.</Message>
  <RequestId>5C3D9175B6FC201293AD4890</RequestId>
  <HostId>b.oss-cn-hangzhou.aliyuncs.com</HostId>
  <Key>k</Key>
</Error>)---";
        const ServerError error = get_error(std::string{xml});
        if (!error.parsed().has_value() || error.code() != "NoSuchKey" ||
            error.message() != "The specified key does not exist." ||
            error.request_id() != "5C3D9175B6FC201293AD4890" ||
            error.parsed()->host_id != "b.oss-cn-hangzhou.aliyuncs.com" ||
            error.parsed()->fields.at("Key") != "k" ||
            error.body() != xml) {
            std::cerr << "XML error body not parsed: " << std::format("{}", error) << "\n";
            return 1;
        }
        const std::string formatted = std::format("{}", error);
        constexpr std::string_view formatted_chk =
            "ServerError: GET /b/k returned 404 NoSuchKey: The specified key does not exist. "
            "(RequestId: 5C3D9175B6FC201293AD4890)";
        if (formatted != formatted_chk) {
            std::cerr << "wrong format, got " << formatted << "\n";
            return 1;
        }
    }

    {
        const ServerError error = get_error(R"({"Code":"NoSuchKey","RequestId":"abc123","Retry":false})");
        if (error.status() != 404 || error.code() != "NoSuchKey" || error.request_id() != "abc123" ||
            error.message().has_value() || error.parsed()->fields.at("Retry") != "false") {
            std::cerr << "JSON error body not parsed: " << std::format("{}", error) << "\n";
            return 1;
        }
    }

    // the header wins over the body
    {
        boost::beast::http::fields headers;
        headers.set("X-Oss-Request-Id", "from-header");
        const ServerError error = get_error(R"({"RequestId":"from-body"})", std::move(headers));
        if (error.request_id() != "from-header") {
            std::cerr << "request id not taken from the header\n";
            return 1;
        }
    }
    {
        boost::beast::http::fields headers;
        headers.set("x-acs-request-id", "acs");
        if (get_error("", std::move(headers)).request_id() != "acs") {
            std::cerr << "*-request-id header ignored\n";
            return 1;
        }
    }

    // anything else is kept as raw text
    for (const std::string_view body :
         {"", "   ", "<Error><Code>broken", "{\"Code\":", "[1, 2]", "Not Found",
          "<html><body>bad gateway</body></html>", "{\"foo\":1}", "{\"Code\":42}",
          "<Result><Code>X</Code></Result>"}) {
        const ServerError error = get_error(std::string{body});
        if (error.body() != body || error.request_id().has_value() || error.code().has_value() ||
            error.parsed().has_value()) {
            std::cerr << "unexpected parse of \"" << body << "\"\n";
            return 1;
        }
    }

    // a gateway page keeps its text in the message
    {
        constexpr std::string_view page = "<html><body>502 Bad Gateway</body></html>";
        const ServerError error =
            make_server_error(boost::beast::http::verb::get, "/b/k", 502, {}, std::string{page});
        const std::string formatted = std::format("{}", error);
        if (formatted !=
            std::format("ServerError: GET /b/k returned 502 <no code>: {} (RequestId: <none>)", page)) {
            std::cerr << "gateway page text lost: " << formatted << "\n";
            return 1;
        }
    }

    {
        const osscpp::oss::http::Error network = boost::beast::error_code{
            boost::system::errc::make_error_code(boost::system::errc::connection_refused)};
        if (!osscpp::oss::http::to_string(network).starts_with("NetworkError: ")) {
            std::cerr << "wrong NetworkError text " << osscpp::oss::http::to_string(network) << "\n";
            return 1;
        }
        const osscpp::oss::http::Error server = get_error("oops");
        if (osscpp::oss::http::to_string(server) !=
            "ServerError: GET /b/k returned 404 <no code>: oops (RequestId: <none>)") {
            std::cerr << "wrong ServerError text " << osscpp::oss::http::to_string(server) << "\n";
            return 1;
        }
    }
}
