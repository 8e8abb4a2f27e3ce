#include <slides-cpp/log.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <deque>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <utility>

namespace slides_cpp::log {

namespace {

constexpr std::size_t ring_max = 200;

std::mutex g_mutex;
Level g_level = Level::info;
Sink g_sink;
std::deque<std::string> g_ring;

auto timestamp_now() -> std::string {
    const auto tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    auto tm = std::tm{};
    ::localtime_r(&tt, &tm);
    auto oss = std::ostringstream{};
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

void log_line(Level lvl, std::string_view msg) {
    auto line = std::string{};
    auto sink = Sink{};
    {
        auto lock = std::lock_guard{g_mutex};
        if (lvl < g_level) return;
        line = "[" + timestamp_now() + "][" + std::string{to_string_view(lvl)} + "] "
             + std::string{msg};
        g_ring.push_back(line);
        if (g_ring.size() > ring_max) g_ring.pop_front();
        sink = g_sink;
    }

    // The sink runs unlocked so it may log or read recent() itself.
    if (sink) {
        sink(lvl, line);
    } else {
        std::cerr << line << '\n';
    }
}

}  // anonymous namespace

auto parse_level(std::string_view name) -> std::optional<Level> {
    auto lower = std::string{};
    lower.reserve(name.size());
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lower == "debug") return Level::debug;
    if (lower == "info") return Level::info;
    if (lower == "warn" || lower == "warning") return Level::warn;
    if (lower == "error") return Level::error;
    if (lower == "off") return Level::off;
    return std::nullopt;
}

void set_level(Level lvl) {
    auto lock = std::lock_guard{g_mutex};
    g_level = lvl;
}

auto level() -> Level {
    auto lock = std::lock_guard{g_mutex};
    return g_level;
}

void set_sink(Sink sink) {
    auto lock = std::lock_guard{g_mutex};
    g_sink = std::move(sink);
}

void debug(std::string_view msg) { log_line(Level::debug, msg); }
void info(std::string_view msg) { log_line(Level::info, msg); }
void warn(std::string_view msg) { log_line(Level::warn, msg); }
void error(std::string_view msg) { log_line(Level::error, msg); }

auto recent(std::size_t max_entries) -> std::vector<std::string> {
    auto lock = std::lock_guard{g_mutex};
    const auto count = std::min(max_entries, g_ring.size());
    return {g_ring.end() - static_cast<std::ptrdiff_t>(count), g_ring.end()};
}

void clear_recent() {
    auto lock = std::lock_guard{g_mutex};
    g_ring.clear();
}

}  // namespace slides_cpp::log
