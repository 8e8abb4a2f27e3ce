/// @file log.hpp
/// @brief Process-wide leveled logging.
///
/// Lines are formatted as `[YYYY-mm-dd HH:MM:SS][LEVEL] message`, handed
/// to the sink (stderr unless replaced) and kept in a bounded ring of
/// recent lines. All functions are thread-safe.

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace slides_cpp::log {

/// Severity of a log line. `off` as a threshold silences everything.
enum class Level : std::uint8_t {
    debug,
    info,
    warn,
    error,
    off,
};

/// Convert a Level to its upper-case name ("DEBUG", "INFO", ...).
constexpr auto to_string_view(Level level) noexcept -> std::string_view {
    switch (level) {
        case Level::debug: return "DEBUG";
        case Level::info:  return "INFO";
        case Level::warn:  return "WARN";
        case Level::error: return "ERROR";
        case Level::off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name, case-insensitively ("debug", "WARN", ...).
auto parse_level(std::string_view name) -> std::optional<Level>;

/// Receives each formatted line that passes the threshold. Called without
/// the log lock held, so a sink may itself log or call recent().
using Sink = std::function<void(Level, std::string_view line)>;

/// Lines below the threshold are dropped. Default: info.
void set_level(Level level);
auto level() -> Level;

/// Replace the sink. An empty sink restores the stderr sink.
void set_sink(Sink sink);

void debug(std::string_view msg);
void info(std::string_view msg);
void warn(std::string_view msg);
void error(std::string_view msg);

/// The most recent lines, oldest first.
auto recent(std::size_t max_entries = 200) -> std::vector<std::string>;

/// Drop every line kept for recent().
void clear_recent();

}  // namespace slides_cpp::log
