#pragma once

#include <boost/describe/enum.hpp>
#include <cstdint>
#include <format>
#include <string_view>
#include <utility>

//
#include "osscpp/internal/macro-begin.hpp"

namespace osscpp::log {

// lower case, DEBUG and ERROR are commonly defined as macros
enum class Level : std::uint8_t { debug, info, warn, error };
BOOST_DESCRIBE_ENUM(Level, debug, info, warn, error);

// Process wide, warn by default.
void set_level(Level level) noexcept;
[[nodiscard]] Level level() noexcept;
[[nodiscard]] bool enabled(Level level) noexcept;

namespace _internal {

void write(Level level, std::string_view message);

} // namespace _internal

template <typename... Args> void debug(std::format_string<Args...> fmt, Args &&...args) {
    if (enabled(Level::debug)) {
        _internal::write(Level::debug, std::format(fmt, std::forward<Args>(args)...));
    }
}

template <typename... Args> void info(std::format_string<Args...> fmt, Args &&...args) {
    if (enabled(Level::info)) {
        _internal::write(Level::info, std::format(fmt, std::forward<Args>(args)...));
    }
}

template <typename... Args> void warn(std::format_string<Args...> fmt, Args &&...args) {
    if (enabled(Level::warn)) {
        _internal::write(Level::warn, std::format(fmt, std::forward<Args>(args)...));
    }
}

template <typename... Args> void error(std::format_string<Args...> fmt, Args &&...args) {
    if (enabled(Level::error)) {
        _internal::write(Level::error, std::format(fmt, std::forward<Args>(args)...));
    }
}

} // namespace osscpp::log

//
#include "osscpp/internal/macro-end.hpp"
