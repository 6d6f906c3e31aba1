#pragma once

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <format>
#include <functional>
#include <iostream>
#include <mutex>
#include <random>
#include <string>
#include <string_view>
#include <thread>

#include <unistd.h>

namespace sqlaudit::utils {

// ============================================================================
// UUID Generation
// ============================================================================

inline std::string generate_uuid() {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dis;

    uint64_t high = dis(gen);
    uint64_t low = dis(gen);

    // Version 4, RFC 4122 variant
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    return std::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
        static_cast<uint32_t>(high >> 32),
        static_cast<uint16_t>((high >> 16) & 0xFFFF),
        static_cast<uint16_t>(high & 0xFFFF),
        static_cast<uint16_t>(low >> 48),
        low & 0xFFFFFFFFFFFF);
}

// ============================================================================
// Time Utilities
// ============================================================================

/// ISO-8601 UTC with milliseconds, e.g. 2024-05-01T12:00:00.123Z
inline std::string format_timestamp(const std::chrono::system_clock::time_point& tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm_buf;
    ::gmtime_r(&time, &tm_buf);

    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);

    return std::format("{}.{:03d}Z", time_buf, static_cast<int>(ms.count()));
}

inline std::chrono::system_clock::time_point now() {
    return std::chrono::system_clock::now();
}

// ============================================================================
// Host / Process / Thread identity
// ============================================================================

inline std::string host_name() {
    char buf[256] = {};
    if (::gethostname(buf, sizeof(buf) - 1) != 0) {
        return "unknown";
    }
    return std::string(buf);
}

inline int64_t process_id() {
    return static_cast<int64_t>(::getpid());
}

inline std::string thread_id() {
    return std::format("{}", std::hash<std::thread::id>{}(std::this_thread::get_id()));
}

// ============================================================================
// String Utilities
// ============================================================================

inline std::string to_lower(std::string_view str) {
    std::string result(str);
    for (char& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

inline std::string trim(std::string_view str) {
    const auto start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string_view::npos) {
        return "";
    }
    const auto end = str.find_last_not_of(" \t\n\r\f\v");
    return std::string(str.substr(start, end - start + 1));
}

inline bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

inline bool iends_with(std::string_view str, std::string_view suffix) {
    return str.size() >= suffix.size() &&
           iequals(str.substr(str.size() - suffix.size()), suffix);
}

/**
 * @brief Quote a SQL identifier ("name", embedded quotes doubled)
 */
[[nodiscard]] inline std::string quote_identifier(std::string_view ident) {
    std::string result;
    result.reserve(ident.size() + 2);
    result += '"';
    for (const char c : ident) {
        if (c == '"') result += '"';
        result += c;
    }
    result += '"';
    return result;
}

// ============================================================================
// JSON String Utilities
// ============================================================================

/**
 * @brief Escape a string for safe embedding in a JSON string value.
 * Handles: " \ and all control characters
 */
[[nodiscard]] inline std::string escape_json(std::string_view s) {
    std::string result;
    result.reserve(s.size() + s.size() / 8);
    for (const char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    result += std::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    result += c;
                }
        }
    }
    return result;
}

// ============================================================================
// Logging (thread-safe, stderr, level-tagged)
// ============================================================================

namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

namespace detail {
    inline std::mutex& log_mutex() {
        static std::mutex m;
        return m;
    }

    inline std::atomic<Level>& min_level() {
        static std::atomic<Level> level{Level::INFO};
        return level;
    }

    inline void write(Level level, const std::string& msg) {
        if (level < min_level().load(std::memory_order_relaxed)) {
            return;
        }

        const char* tag = "";
        switch (level) {
            case Level::DEBUG: tag = "DEBUG"; break;
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
    detail::min_level().store(level, std::memory_order_relaxed);
}


/// "debug" / "info" / "warn" / "error" (case-insensitive); unknown -> INFO
inline Level parse_level(std::string_view name) {
    if (iequals(name, "debug")) return Level::DEBUG;
    if (iequals(name, "warn") || iequals(name, "warning")) return Level::WARN;
    if (iequals(name, "error")) return Level::ERROR;
    return Level::INFO;
}

inline void debug(const std::string& msg) {
    detail::write(Level::DEBUG, msg);
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

} // namespace sqlaudit::utils
