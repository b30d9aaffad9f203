#pragma once

#include <algorithm>
#include <atomic>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <cstdio>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace sqlmcp::utils {

// ============================================================================
// Numeric Parsing (std::from_chars)
// ============================================================================

// Parse integer, returns std::nullopt on failure (for cases where 0 is ambiguous).
// Trailing garbage ("12abc") is a failure.
template<typename T>
    requires std::is_integral_v<T>
[[nodiscard]] inline std::optional<T> try_parse_int(std::string_view sv) {
    T result{};
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), result);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
    return result;
}

// ============================================================================
// String Utilities
// ============================================================================

inline constexpr bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

inline std::string to_lower(std::string_view str) {
    std::string result(str);
    for (char& c : result) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return result;
}

[[nodiscard]] inline std::string_view trim_left(std::string_view sv) {
    size_t i = 0;
    while (i < sv.size() && is_space(sv[i])) ++i;
    return sv.substr(i);
}

[[nodiscard]] inline std::string_view trim_right(std::string_view sv) {
    size_t n = sv.size();
    while (n > 0 && is_space(sv[n - 1])) --n;
    return sv.substr(0, n);
}

[[nodiscard]] inline std::string trim(std::string_view sv) {
    return std::string(trim_right(trim_left(sv)));
}

// Case-insensitive ASCII comparison
[[nodiscard]] inline bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        char x = a[i];
        char y = b[i];
        if (x >= 'A' && x <= 'Z') x = static_cast<char>(x - 'A' + 'a');
        if (y >= 'A' && y <= 'Z') y = static_cast<char>(y - 'A' + 'a');
        if (x != y) return false;
    }
    return true;
}

[[nodiscard]] inline bool istarts_with(std::string_view s, std::string_view prefix) noexcept {
    return s.size() >= prefix.size() && iequals(s.substr(0, prefix.size()), prefix);
}

/**
 * @brief Parse a boolean flag the way the environment and config files spell it.
 * Accepts 1/true/yes/y/on (case-insensitive). Everything else is false.
 */
[[nodiscard]] inline bool parse_bool(std::string_view sv) {
    const std::string v = to_lower(trim(sv));
    return v == "1" || v == "true" || v == "yes" || v == "y" || v == "on";
}

/**
 * @brief Shorten a query for log output, collapsing newlines.
 */
[[nodiscard]] inline std::string preview(std::string_view sql, size_t max_len = 80) {
    std::string out;
    out.reserve(std::min(sql.size(), max_len) + 3);
    for (size_t i = 0; i < sql.size() && out.size() < max_len; ++i) {
        out += (sql[i] == '\n' || sql[i] == '\r' || sql[i] == '\t') ? ' ' : sql[i];
    }
    if (sql.size() > max_len) out += "...";
    return out;
}

// ============================================================================
// Performance Timer
// ============================================================================

class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    template<typename Duration = std::chrono::microseconds>
    Duration elapsed() const {
        const auto end = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<Duration>(end - start_);
    }

    std::chrono::milliseconds elapsed_ms() const {
        return elapsed<std::chrono::milliseconds>();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// ============================================================================
// Logging (thread-safe, stderr, level-tagged)
//
// stdout carries the JSON-RPC stream, so every log line goes to stderr.
// ============================================================================

namespace log {

enum class Level { INFO = 0, WARN = 1, ERROR = 2 };

namespace detail {
    inline std::mutex& log_mutex() {
        static std::mutex m;
        return m;
    }

    inline std::atomic<int>& min_level() {
        static std::atomic<int> level{static_cast<int>(Level::INFO)};
        return level;
    }

    inline void write(Level level, const std::string& msg) {
        if (static_cast<int>(level) < min_level().load(std::memory_order_relaxed)) {
            return;
        }

        const char* tag = "";
        switch (level) {
            case Level::INFO:  tag = "INFO "; break;
            case Level::WARN:  tag = "WARN "; break;
            case Level::ERROR: tag = "ERROR"; break;
        }

        const auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf;
        ::localtime_r(&time, &tm_buf);

        char time_buf[16];
        std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

        const auto formatted = std::format("{}.{:03d} [{}] {}\n",
            time_buf, static_cast<int>(ms.count()), tag, msg);

        std::lock_guard<std::mutex> lock(log_mutex());
        std::cerr << formatted;
    }
} // namespace detail

inline void set_level(Level level) {
    detail::min_level().store(static_cast<int>(level), std::memory_order_relaxed);
}

[[nodiscard]] inline bool is_level_name(std::string_view name) {
    const std::string n = to_lower(name);
    return n == "info" || n == "warn" || n == "warning" || n == "error";
}

// "info" | "warn" | "error"; unknown names leave the level unchanged
inline bool set_level(std::string_view name) {
    const std::string n = to_lower(name);
    if (n == "info")  { set_level(Level::INFO);  return true; }
    if (n == "warn" || n == "warning") { set_level(Level::WARN); return true; }
    if (n == "error") { set_level(Level::ERROR); return true; }
    return false;
}

inline void info(const std::string& msg) {
    detail::write(Level::INFO, msg);
}

inline void warn(const std::string& msg) {
    detail::write(Level::WARN, msg);
}

inline void error(const std::string& msg) {
    detail::write(Level::ERROR, msg);
}

} // namespace log

} // namespace sqlmcp::utils
