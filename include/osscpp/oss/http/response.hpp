#pragma once

#include <boost/beast/http/fields.hpp> // IWYU pragma: keep
#include <optional>
#include <string>

//
#include "osscpp/internal/macro-begin.hpp"

namespace osscpp::oss::http {

struct Response {
    unsigned status = 0;
    boost::beast::http::fields headers;
    std::optional<std::string> request_id;
    // decoded, stays empty when the body went to the chunk handler
    std::string body;
    bool streamed = false;
};

} // namespace osscpp::oss::http

//
#include "osscpp/internal/macro-end.hpp"
