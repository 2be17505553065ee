#pragma once

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>

namespace sqlmigrator::utils {

// ============================================================================
// Formatting
// ============================================================================

/**
 * @brief UTC ISO-8601 with milliseconds: 2026-10-18T09:15:02.117Z
 */
inline std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    const auto since_epoch = tp.time_since_epoch();
    const auto secs = std::chrono::floor<std::chrono::seconds>(since_epoch);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch - secs);
    const std::time_t t = std::chrono::system_clock::to_time_t(
        std::chrono::system_clock::time_point(secs));

    std::tm utc{};
    ::gmtime_r(&t, &utc);
    return std::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
        utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
        utc.tm_hour, utc.tm_min, utc.tm_sec, static_cast<int>(millis.count()));
}

inline constexpr const char* booltostr(bool x) { return x ? "true" : "false"; }

// Inclusive bounds check that is safe across signed / unsigned types
template<auto Lo, auto Hi, typename T>
constexpr bool in_range(T value) {
    return std::cmp_greater_equal(value, Lo) && std::cmp_less_equal(value, Hi);
}

// ============================================================================
// Strings
// ============================================================================

inline std::string to_lower(std::string_view str) {
    std::string out;
    out.reserve(str.size());
    for (const char c : str) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

inline bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size()
        && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x))
                   == std::tolower(static_cast<unsigned char>(y));
           });
}

inline std::string trim(std::string_view str) {
    constexpr std::string_view kBlank = " \t\n\r";
    const auto first = str.find_first_not_of(kBlank);
    if (first == std::string_view::npos) return {};
    return std::string(str.substr(first, str.find_last_not_of(kBlank) - first + 1));
}

/**
 * @brief JSON string body: quotes, backslashes and control characters escaped
 */
[[nodiscard]] inline std::string escape_json(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 16);
    for (const char c : s) {
        if (c == '"' || c == '\\') {
            out += '\\';
            out += c;
        } else if (c == '\n') {
            out += "\\n";
        } else if (c == '\r') {
            out += "\\r";
        } else if (c == '\t') {
            out += "\\t";
        } else if (static_cast<unsigned char>(c) < 0x20) {
            out += std::format("\\u{:04x}", static_cast<unsigned>(c));
        } else {
            out += c;
        }
    }
    return out;
}

// ============================================================================
// Regex
// ============================================================================

/**
 * @brief Escape every ECMAScript metacharacter so the text matches literally.
 */
[[nodiscard]] inline std::string regex_escape(std::string_view literal) {
    static constexpr std::string_view kSpecial = R"(\^$.|?*+()[]{})";
    std::string result;
    result.reserve(literal.size() * 2);
    for (const char c : literal) {
        if (kSpecial.find(c) != std::string_view::npos) {
            result += '\\';
        }
        result += c;
    }
    return result;
}

/**
 * @brief Replace every match of re in input with fn(match).
 *
 * fn may return std::nullopt to keep the matched text unchanged.
 * Match positions are relative to the start of input.
 */
template<typename Fn>
[[nodiscard]] std::string regex_replace_each(const std::string& input,
                                             const std::regex& re, Fn&& fn) {
    std::string result;
    result.reserve(input.size());

    auto last = input.cbegin();
    const auto end_it = std::sregex_iterator();
    for (auto it = std::sregex_iterator(input.cbegin(), input.cend(), re); it != end_it; ++it) {
        const std::smatch& match = *it;
        result.append(last, match[0].first);
        std::optional<std::string> replacement = fn(match);
        if (replacement) {
            result += *replacement;
        } else {
            result.append(match[0].first, match[0].second);
        }
        last = match[0].second;
    }
    result.append(last, input.cend());
    return result;
}

// ============================================================================
// Stopwatch
// ============================================================================

class Timer {
public:
    [[nodiscard]] std::chrono::milliseconds elapsed_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started_);
    }

private:
    std::chrono::steady_clock::time_point started_ = std::chrono::steady_clock::now();
};

// ============================================================================
// Logging: stderr, one line per call, serialized across worker threads
// ============================================================================

namespace log {

enum class Level { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

namespace detail {

inline std::atomic<Level>& threshold() {
    static std::atomic<Level> level{Level::INFO};
    return level;
}

inline void emit(Level level, std::string_view msg) {
    if (level < threshold().load(std::memory_order_relaxed)) return;

    static constexpr std::array<std::string_view, 4> kTags{"DEBUG", "INFO ", "WARN ", "ERROR"};
    static std::mutex sink_mutex;

    const auto now = std::chrono::system_clock::now();
    const auto day_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch() % std::chrono::days(1));
    const std::chrono::hh_mm_ss clock{day_ms};

    const std::string line = std::format("{:02}:{:02}:{:02}.{:03} [{}] {}\n",
        clock.hours().count(), clock.minutes().count(), clock.seconds().count(),
        clock.subseconds().count(), kTags[static_cast<size_t>(level)], msg);

    const std::lock_guard<std::mutex> lock(sink_mutex);
    std::cerr << line;
}

} // namespace detail

/**
 * @brief "debug" / "info" / "warn" / "error", any case; "warning" is accepted
 */
[[nodiscard]] inline std::optional<Level> parse_level(std::string_view name) {
    const std::string lower = to_lower(name);
    if (lower == "debug") return Level::DEBUG;
    if (lower == "info") return Level::INFO;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    return std::nullopt;
}

inline void set_level(Level level) { detail::threshold().store(level, std::memory_order_relaxed); }

[[nodiscard]] inline bool enabled(Level level) {
    return level >= detail::threshold().load(std::memory_order_relaxed);
}

inline void debug(std::string_view msg) { detail::emit(Level::DEBUG, msg); }
inline void info(std::string_view msg) { detail::emit(Level::INFO, msg); }
inline void warn(std::string_view msg) { detail::emit(Level::WARN, msg); }
inline void error(std::string_view msg) { detail::emit(Level::ERROR, msg); }

} // namespace log

} // namespace sqlmigrator::utils
