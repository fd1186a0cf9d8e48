/**
 * MixGraph - Logging Implementation
 */

#include "log.h"
#include <fmt/color.h>
#include <atomic>
#include <mutex>
#include <cstdio>

namespace mixgraph {
namespace log {

namespace {
    std::atomic<Level> g_level{Level::Info};
    std::mutex g_write_mutex;

    const char* level_name(Level level) {
        switch (level) {
            case Level::Debug: return "debug";
            case Level::Info:  return "info ";
            case Level::Warn:  return "warn ";
            case Level::Error: return "error";
            default:           return "";
        }
    }

    fmt::text_style level_style(Level level) {
        switch (level) {
            case Level::Warn:  return fmt::fg(fmt::terminal_color::yellow);
            case Level::Error: return fmt::fg(fmt::terminal_color::red);
            case Level::Debug: return fmt::fg(fmt::terminal_color::bright_black);
            default:           return fmt::text_style{};
        }
    }
}

void set_level(Level level) {
    g_level.store(level);
}

Level level() {
    return g_level.load();
}

namespace detail {

void write(Level level, std::string_view message) {
    // Workers log concurrently; keep lines whole
    std::lock_guard<std::mutex> lock(g_write_mutex);
    fmt::print(stderr, "[mixgraph] ");
    fmt::print(stderr, level_style(level), "{}", level_name(level));
    fmt::print(stderr, " | {}\n", message);
}

} // namespace detail

} // namespace log
} // namespace mixgraph
