/**
 * MixGraph - Logging
 *
 * Levelled stderr logger on top of fmt.
 */

#ifndef MIXGRAPH_LOG_H
#define MIXGRAPH_LOG_H

#include <fmt/format.h>
#include <string_view>
#include <utility>

namespace mixgraph {
namespace log {

enum class Level {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

void set_level(Level level);
Level level();

namespace detail {
    void write(Level level, std::string_view message);
}

template <typename... Args>
void debug(fmt::format_string<Args...> format_str, Args&&... args) {
    if (level() > Level::Debug) return;
    detail::write(Level::Debug, fmt::format(format_str, std::forward<Args>(args)...));
}

template <typename... Args>
void info(fmt::format_string<Args...> format_str, Args&&... args) {
    if (level() > Level::Info) return;
    detail::write(Level::Info, fmt::format(format_str, std::forward<Args>(args)...));
}

template <typename... Args>
void warn(fmt::format_string<Args...> format_str, Args&&... args) {
    if (level() > Level::Warn) return;
    detail::write(Level::Warn, fmt::format(format_str, std::forward<Args>(args)...));
}

template <typename... Args>
void error(fmt::format_string<Args...> format_str, Args&&... args) {
    if (level() > Level::Error) return;
    detail::write(Level::Error, fmt::format(format_str, std::forward<Args>(args)...));
}

} // namespace log
} // namespace mixgraph

#endif // MIXGRAPH_LOG_H
