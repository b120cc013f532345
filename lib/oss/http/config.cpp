#include "osscpp/oss/http/config.hpp"

#include <boost/config.hpp>
#include <format>
#include <string>

namespace osscpp::oss::http {

std::string default_user_agent() {
    return std::format("osscpp/{} ({}; {})", version, BOOST_PLATFORM, BOOST_COMPILER);
}

} // namespace osscpp::oss::http
