#include "osscpp/log.hpp"
#include "osscpp/oss/http/config.hpp"
#include "osscpp/oss/http/http.hpp"
#include "osscpp/oss/http/request.hpp"
#include "osscpp/oss/http/server_error.hpp"
#include "osscpp/oss/http/stream_writer.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/describe/enum_from_string.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/positional_options.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <boost/program_options/variables_map.hpp>
#include <boost/url/url.hpp>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <ostream>
#include <print>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace {

constexpr std::size_t upload_chunk_size = 64 * 1024;

[[nodiscard]] std::string file_to_string(const std::filesystem::path &path) {
    const std::ifstream stream{path};
    std::stringstream buffer;
    buffer << stream.rdbuf();
    return buffer.str();
}

struct Options {
    std::string command;
    std::string endpoint;
    std::string bucket;
    std::string key;
    std::string access_key;
    std::string secret_key;
    std::optional<std::string> security_token;
    std::string file;
    bool cname{};
    bool buffered_upload{};
    std::optional<std::chrono::seconds> open_timeout;
    std::optional<std::chrono::seconds> read_timeout;
};

[[nodiscard]] Options parse_opts(int argc, char **argv) {

    Options ret;
    std::string log_level;
    std::string access_key_file;
    std::string secret_key_file;
    std::string security_token_file;
    long open_timeout{};
    long read_timeout{};

    boost::program_options::options_description descr{"Options"};
    // clang-format off
    descr.add_options()
        ("help,h", "print this help")
        ("command", boost::program_options::value<std::string>(&ret.command)->required(), "get, put, head or delete")
        ("endpoint,e", boost::program_options::value<std::string>(&ret.endpoint)->required(), "endpoint URL, including protocol and (if required) port")
        ("bucket,b", boost::program_options::value<std::string>(&ret.bucket)->required(), "OSS bucket name")
        ("key,k", boost::program_options::value<std::string>(&ret.key)->required(), "object key")
        ("access-key-file", boost::program_options::value<std::string>(&access_key_file), "path to access key id file, requests are anonymous without it")
        ("secret-access-key-file", boost::program_options::value<std::string>(&secret_key_file), "path to access key secret file")
        ("security-token-file", boost::program_options::value<std::string>(&security_token_file), "path to STS security token file")
        ("file,f", boost::program_options::value<std::string>(&ret.file), "file to upload (put) or to write the object to (get), stdout if omitted")
        ("cname", boost::program_options::bool_switch(&ret.cname), "endpoint is a custom domain bound to the bucket")
        ("buffered", boost::program_options::bool_switch(&ret.buffered_upload), "upload the file in one piece instead of streaming it")
        ("open-timeout", boost::program_options::value<long>(&open_timeout)->default_value(0), "connect timeout in seconds, 0 for the default")
        ("read-timeout", boost::program_options::value<long>(&read_timeout)->default_value(0), "read/write timeout in seconds, 0 for the default")
        ("log-level", boost::program_options::value<std::string>(&log_level)->default_value("warn"), "debug, info, warn or error")
    ;
    // clang-format on
    boost::program_options::positional_options_description positional;
    positional.add("command", 1);

    boost::program_options::variables_map varmap;
    boost::program_options::store(
        boost::program_options::command_line_parser(argc, argv).options(descr).positional(positional).run(),
        varmap);
    if (varmap.contains("help")) {
        std::println("transfer a single object from or to an OSS bucket\n");
        std::cout << descr << '\n';
        exit(0);
    }
    boost::program_options::notify(varmap);

    osscpp::log::Level level{};
    if (!boost::describe::enum_from_string(log_level.c_str(), level)) {
        std::println(std::cerr, "Invalid log level '{}'.", log_level);
        exit(1);
    }
    osscpp::log::set_level(level);

    if (ret.command != "get" && ret.command != "put" && ret.command != "head" && ret.command != "delete") {
        std::println(std::cerr, "Invalid command '{}'. Must be 'get', 'put', 'head' or 'delete'.", ret.command);
        exit(1);
    }
    if (ret.command == "put" && ret.file.empty()) {
        std::println(std::cerr, "put needs --file");
        exit(1);
    }

    if (!access_key_file.empty()) {
        ret.access_key = file_to_string(access_key_file);
        ret.secret_key = file_to_string(secret_key_file);
        boost::algorithm::trim(ret.access_key);
        boost::algorithm::trim(ret.secret_key);
    }
    if (!security_token_file.empty()) {
        ret.security_token = boost::algorithm::trim_copy(file_to_string(security_token_file));
    }
    if (open_timeout > 0) {
        ret.open_timeout = std::chrono::seconds{open_timeout};
    }
    if (read_timeout > 0) {
        ret.read_timeout = std::chrono::seconds{read_timeout};
    }

    return ret;
}

[[nodiscard]] osscpp::oss::http::StreamProducer read_file(std::filesystem::path path) {
    return [path = std::move(path)](osscpp::oss::http::StreamWriter &writer) -> boost::asio::awaitable<void> {
        std::ifstream stream{path, std::ios::binary};
        if (!stream) {
            throw std::runtime_error{std::format("failed to open {}", path.string())};
        }
        std::string buffer(upload_chunk_size, '\0');
        while (stream.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || stream.gcount() > 0) {
            co_await writer.write(buffer.substr(0, static_cast<std::size_t>(stream.gcount())));
        }
    };
}

boost::asio::awaitable<int> run(const Options &options, const osscpp::oss::http::Http &client) {
    namespace http = osscpp::oss::http;

    const http::Resources resources{.bucket = options.bucket, .object = options.key};
    std::expected<http::Response, http::Error> result;

    if (options.command == "get") {
        std::ofstream file;
        if (!options.file.empty()) {
            file.open(options.file, std::ios::binary | std::ios::trunc);
            if (!file) {
                std::println(std::cerr, "failed to open output file {}", options.file);
                co_return 1;
            }
        }
        std::ostream &out = options.file.empty() ? std::cout : file;
        result = co_await client.get(resources, {}, [&out](std::string_view chunk) {
            out.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        });
    } else if (options.command == "put") {
        http::HttpOptions opts;
        if (options.buffered_upload) {
            opts.body = file_to_string(options.file);
        } else {
            opts.body = http::StreamBody{read_file(options.file)};
        }
        result = co_await client.put(resources, std::move(opts));
    } else if (options.command == "head") {
        result = co_await client.head(resources);
        if (result.has_value()) {
            for (const auto &header : result->headers) {
                std::println("{}: {}", std::string_view{header.name_string()}, std::string_view{header.value()});
            }
        }
    } else {
        result = co_await client.delete_(resources);
    }

    if (!result.has_value()) {
        std::println(std::cerr, "{}", http::to_string(result.error()));
        co_return 1;
    }
    osscpp::log::info("{} {} done, HTTP {}, request id {}", options.command, options.key, result->status,
                      result->request_id.value_or("<none>"));
    co_return 0;
}

} // namespace

// NOLINTNEXTLINE(bugprone-exception-escape)
int main(int argc, char **argv) {
    const Options options = parse_opts(argc, argv);

    auto config = std::make_shared<osscpp::oss::http::Config>();
    config->endpoint = boost::urls::url{options.endpoint};
    config->cname = options.cname;
    config->credentials = {.access_key_id = options.access_key,
                           .access_key_secret = options.secret_key,
                           .security_token = options.security_token};
    config->open_timeout = options.open_timeout;
    config->read_timeout = options.read_timeout;

    boost::asio::io_context ioc;
    const osscpp::oss::http::Http client{config};

    int exit_code = 1;
    boost::asio::co_spawn(ioc, run(options, client), [&exit_code](const std::exception_ptr &e, int code) {
        if (e) {
            std::rethrow_exception(e);
        }
        exit_code = code;
    });
    ioc.run();

    return exit_code;
}
