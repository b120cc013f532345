#include "osscpp/oss/auth/sign_request.hpp"
#include "osscpp/oss/http/config.hpp"
#include "osscpp/oss/http/request.hpp"
#include "osscpp/oss/http/request_builder.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/fields.hpp> // IWYU pragma: keep
#include <boost/beast/http/verb.hpp>
#include <boost/url/url.hpp>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace {

using boost::beast::http::field;
using boost::beast::http::verb;
namespace http = osscpp::oss::http;

template <typename Name> std::string_view value(const boost::beast::http::fields &headers, Name name) {
    return std::string_view{headers[name]};
}

http::Config make_config(std::string_view endpoint) {
    http::Config config;
    config.endpoint = boost::urls::url{endpoint};
    config.credentials = {.access_key_id = "id", .access_key_secret = "secret"};
    return config;
}

} // namespace

// NOLINTNEXTLINE(bugprone-exception-escape)
int main() {
    using namespace std::chrono_literals;
    const std::chrono::system_clock::time_point now =
        std::chrono::sys_days{std::chrono::year{2005} / 11 / 17} + 18h + 49min + 58s;
    constexpr std::string_view date = "Thu, 17 Nov 2005 18:49:58 GMT";

    if (http::format_http_date(now) != date) {
        std::cerr << "format_http_date failed, got " << http::format_http_date(now) << "\n";
        return 1;
    }

    const http::Config config = make_config("https://oss-cn-hangzhou.aliyuncs.com");

    // in-memory body
    {
        const auto prepared = http::build_request(config, verb::put, {.bucket = "b", .object = "dir/a b.txt"},
                                                  {.body = std::string{"hello"}}, now);
        if (std::string_view{prepared.url.buffer()} != "https://b.oss-cn-hangzhou.aliyuncs.com/dir/a%20b.txt") {
            std::cerr << "wrong url " << std::string_view{prepared.url.buffer()} << "\n";
            return 1;
        }
        if (prepared.resource != "/b/dir/a b.txt") {
            std::cerr << "wrong resource " << prepared.resource << "\n";
            return 1;
        }
        const auto &headers = prepared.headers;
        if (value(headers, field::content_md5) != "XUFAKrxLKna5cZ2REBfFkg==" ||
            value(headers, field::content_type) != http::default_content_type ||
            value(headers, field::accept_encoding) != http::default_accept_encoding ||
            value(headers, field::date) != date ||
            value(headers, field::host) != "b.oss-cn-hangzhou.aliyuncs.com" ||
            !value(headers, field::user_agent).starts_with("osscpp/0.1.0 (") ||
            headers.count(field::transfer_encoding) != 0) {
            std::cerr << "wrong default headers\n";
            return 1;
        }

        constexpr auto canonical_chk = R"---(PUT
XUFAKrxLKna5cZ2REBfFkg==
application/octet-stream
Thu, 17 Nov 2005 18:49:58 GMT
/b/dir/a b.txt)---";
        if (prepared.canonical != canonical_chk) {
            std::cerr << "wrong canonical request\n" << prepared.canonical << "\n";
            return 1;
        }
        if (!prepared.is_signed || prepared.is_streaming ||
            value(headers, field::authorization) !=
                osscpp::oss::auth::sign_request("id", "secret", canonical_chk)) {
            std::cerr << "wrong signature " << value(headers, field::authorization) << "\n";
            return 1;
        }

        const auto again = http::build_request(config, verb::put, {.bucket = "b", .object = "dir/a b.txt"},
                                               {.body = std::string{"hello"}}, now);
        if (again.canonical != prepared.canonical ||
            value(again.headers, field::authorization) != value(headers, field::authorization)) {
            std::cerr << "build_request is not deterministic\n";
            return 1;
        }
    }

    // streamed body
    {
        http::HttpOptions options;
        options.headers.set(field::content_length, "5");
        options.headers.set(field::content_md5, "XUFAKrxLKna5cZ2REBfFkg==");
        options.headers.set(field::content_type, "text/plain");
        options.body = http::StreamBody{[](http::StreamWriter &writer) -> boost::asio::awaitable<void> {
            co_await writer.write("hello");
        }};
        const auto prepared =
            http::build_request(config, verb::put, {.bucket = "b", .object = "k"}, options, now);
        if (!prepared.is_streaming || value(prepared.headers, field::transfer_encoding) != "chunked" ||
            prepared.headers.count(field::content_length) != 0 ||
            prepared.headers.count(field::content_md5) != 0) {
            std::cerr << "wrong streaming headers\n";
            return 1;
        }
        if (value(prepared.headers, field::content_type) != "text/plain" ||
            prepared.canonical != "PUT\n\ntext/plain\nThu, 17 Nov 2005 18:49:58 GMT\n/b/k") {
            std::cerr << "wrong canonical request\n" << prepared.canonical << "\n";
            return 1;
        }
    }

    // sub-resources and query
    {
        http::HttpOptions options;
        options.query = {{"max-keys", "10"}, {"uploadId", "override"}};
        const http::Resources resources{.bucket = "b",
                                        .object = std::nullopt,
                                        .sub_resources = {{"acl", std::nullopt}, {"uploadId", "x y"}}};
        const auto prepared = http::build_request(config, verb::get, resources, options, now);
        if (std::string_view{prepared.url.encoded_query()} != "acl&max-keys=10&uploadId=override") {
            std::cerr << "wrong query " << std::string_view{prepared.url.encoded_query()} << "\n";
            return 1;
        }
        if (std::string_view{prepared.url.encoded_path()} != "/" || prepared.resource != "/b/" ||
            !prepared.canonical.ends_with("\n/b/?acl&uploadId=x y")) {
            std::cerr << "wrong canonical resource\n" << prepared.canonical << "\n";
            return 1;
        }
        if (prepared.headers.count(field::content_md5) != 0) {
            std::cerr << "Content-MD5 without body\n";
            return 1;
        }
    }

    // no bucket at all
    {
        const auto prepared = http::build_request(config, verb::get, {}, {}, now);
        if (std::string_view{prepared.url.buffer()} != "https://oss-cn-hangzhou.aliyuncs.com/" ||
            prepared.resource != "/") {
            std::cerr << "wrong service url " << std::string_view{prepared.url.buffer()} << "\n";
            return 1;
        }
    }

    // custom domain with port
    {
        http::Config cname_config = make_config("http://static.example.com:8080");
        cname_config.cname = true;
        const auto prepared =
            http::build_request(cname_config, verb::delete_, {.bucket = "b", .object = "k"}, {}, now);
        if (std::string_view{prepared.url.buffer()} != "http://static.example.com:8080/k" ||
            value(prepared.headers, field::host) != "static.example.com:8080" || prepared.resource != "/b/k" ||
            !prepared.canonical.starts_with("DELETE\n")) {
            std::cerr << "wrong cname url " << std::string_view{prepared.url.buffer()} << "\n";
            return 1;
        }
    }

    // STS token
    {
        http::Config sts_config = make_config("https://oss-cn-hangzhou.aliyuncs.com");
        sts_config.credentials.security_token = "token";
        const auto prepared =
            http::build_request(sts_config, verb::head, {.bucket = "b", .object = "k"}, {}, now);
        if (value(prepared.headers, http::sts_header) != "token" ||
            prepared.canonical.find("\nx-oss-security-token:token\n/b/k") == std::string::npos) {
            std::cerr << "security token not signed\n" << prepared.canonical << "\n";
            return 1;
        }
    }

    // anonymous
    {
        http::Config anonymous = make_config("https://oss-cn-hangzhou.aliyuncs.com");
        anonymous.credentials = {};
        const auto prepared =
            http::build_request(anonymous, verb::get, {.bucket = "b", .object = "k"}, {}, now);
        if (prepared.is_signed || prepared.headers.count(field::authorization) != 0 ||
            prepared.canonical.empty()) {
            std::cerr << "anonymous request was signed\n";
            return 1;
        }
    }

    try {
        (void)http::build_request(config, verb::get, {.bucket = std::nullopt, .object = "k"}, {}, now);
        std::cerr << "object without bucket accepted\n";
        return 1;
    } catch (const std::invalid_argument &) {
    }

    try {
        (void)http::build_request(config, verb::patch, {.bucket = "b"}, {}, now);
        std::cerr << "PATCH accepted\n";
        return 1;
    } catch (const std::invalid_argument &) {
    }
}
