#include "osscpp/log.hpp"

#include <atomic>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/describe/enum_to_string.hpp>
#include <iostream>
#include <print>
#include <string>
#include <string_view>
#include <utility>

namespace osscpp::log {

namespace {

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
std::atomic<Level> current_level = Level::warn;

} // namespace

void set_level(Level level) noexcept { current_level = level; }

Level level() noexcept { return current_level; }

bool enabled(Level level) noexcept {
    return std::to_underlying(level) >= std::to_underlying(current_level.load());
}

namespace _internal {

void write(Level level, std::string_view message) {
    const std::string name =
        boost::algorithm::to_upper_copy(std::string{boost::describe::enum_to_string(level, "unknown")});
    std::println(std::cerr, "{} {}", name, message);
}

} // namespace _internal

} // namespace osscpp::log
