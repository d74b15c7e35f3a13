#pragma once

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace promptsan::utils {

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

/**
 * @brief Count non-overlapping occurrences of needle in haystack.
 */
[[nodiscard]] inline size_t count_occurrences(std::string_view haystack, std::string_view needle) {
    if (needle.empty()) return 0;
    size_t count = 0;
    size_t pos = 0;
    while ((pos = haystack.find(needle, pos)) != std::string_view::npos) {
        ++count;
        pos += needle.size();
    }
    return count;
}

/**
 * @brief Split text into lines on '\n', dropping one trailing '\r' per line.
 *
 * A final empty line after a trailing newline is not returned.
 */
[[nodiscard]] inline std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        const size_t next = (end == std::string_view::npos) ? text.size() : end + 1;
        if (end == std::string_view::npos) end = text.size();
        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        start = next;
    }
    return lines;
}

// ============================================================================
// UTF-8
// ============================================================================

namespace detail {

inline bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Length of the well-formed sequence starting at i, or 0 if malformed
inline size_t utf8_sequence_length(std::string_view s, size_t i) {
    const auto* bytes = reinterpret_cast<const unsigned char*>(s.data());
    const unsigned char c0 = bytes[i];
    if (c0 <= 0x7F) return 1;

    size_t len = 0;
    if (c0 >= 0xC2 && c0 <= 0xDF) {
        len = 2;
    } else if (c0 >= 0xE0 && c0 <= 0xEF) {
        len = 3;
    } else if (c0 >= 0xF0 && c0 <= 0xF4) {
        len = 4;
    } else {
        return 0;
    }
    if (i + len > s.size()) return 0;

    for (size_t k = 1; k < len; ++k) {
        if (!is_continuation(bytes[i + k])) return 0;
    }

    const unsigned char c1 = bytes[i + 1];
    if (c0 == 0xE0 && c1 < 0xA0) return 0;  // overlong
    if (c0 == 0xED && c1 >= 0xA0) return 0; // surrogate
    if (c0 == 0xF0 && c1 < 0x90) return 0;  // overlong
    if (c0 == 0xF4 && c1 >= 0x90) return 0; // > U+10FFFF
    return len;
}

inline uint32_t decode_utf8(std::string_view s, size_t i, size_t len) {
    const auto* bytes = reinterpret_cast<const unsigned char*>(s.data());
    switch (len) {
        case 1: return bytes[i];
        case 2: return ((bytes[i] & 0x1Fu) << 6) | (bytes[i + 1] & 0x3Fu);
        case 3: return ((bytes[i] & 0x0Fu) << 12) | ((bytes[i + 1] & 0x3Fu) << 6) |
                       (bytes[i + 2] & 0x3Fu);
        case 4: return ((bytes[i] & 0x07u) << 18) | ((bytes[i + 1] & 0x3Fu) << 12) |
                       ((bytes[i + 2] & 0x3Fu) << 6) | (bytes[i + 3] & 0x3Fu);
        default: return 0xFFFD;
    }
}

// Unicode White_Space property
inline constexpr bool is_unicode_space(uint32_t cp) {
    return (cp >= 0x09 && cp <= 0x0D) || cp == 0x20 || cp == 0x85 || cp == 0xA0 ||
           cp == 0x1680 || (cp >= 0x2000 && cp <= 0x200A) || cp == 0x2028 ||
           cp == 0x2029 || cp == 0x202F || cp == 0x205F || cp == 0x3000;
}

} // namespace detail

[[nodiscard]] inline bool is_valid_utf8(std::string_view s) {
    size_t i = 0;
    while (i < s.size()) {
        const size_t len = detail::utf8_sequence_length(s, i);
        if (len == 0) return false;
        i += len;
    }
    return true;
}

/**
 * @brief Strip leading and trailing Unicode whitespace.
 *
 * Malformed UTF-8 at either edge is treated as non-whitespace.
 */
[[nodiscard]] inline std::string_view trim_view(std::string_view str) {
    size_t start = 0;
    while (start < str.size()) {
        const size_t len = detail::utf8_sequence_length(str, start);
        if (len == 0 || !detail::is_unicode_space(detail::decode_utf8(str, start, len))) break;
        start += len;
    }

    size_t end = str.size();
    while (end > start) {
        // Walk back to the lead byte of the last sequence
        size_t lead = end - 1;
        while (lead > start && end - lead < 4 &&
               detail::is_continuation(static_cast<unsigned char>(str[lead]))) {
            --lead;
        }
        const size_t len = detail::utf8_sequence_length(str, lead);
        if (len != end - lead ||
            !detail::is_unicode_space(detail::decode_utf8(str, lead, len))) {
            break;
        }
        end = lead;
    }
    return str.substr(start, end - start);
}

[[nodiscard]] inline std::string trim(std::string_view str) {
    return std::string(trim_view(str));
}

// ============================================================================
// Performance Timer
// ============================================================================

class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    void reset() {
        start_ = std::chrono::steady_clock::now();
    }

    template<typename Duration = std::chrono::microseconds>
    Duration elapsed() const {
        const auto end = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<Duration>(end - start_);
    }

    std::chrono::microseconds elapsed_us() const {
        return elapsed<std::chrono::microseconds>();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// ============================================================================
// Logging (thread-safe, stderr, level-tagged)
// ============================================================================

namespace log {

enum class Level { INFO, WARN, ERROR };

[[nodiscard]] inline std::optional<Level> parse_level(std::string_view name) {
    const std::string lower = to_lower(name);
    if (lower == "info") return Level::INFO;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    return std::nullopt;
}

namespace detail {
    inline std::mutex& log_mutex() {
        static std::mutex m;
        return m;
    }

    inline std::atomic<Level>& min_level() {
        static std::atomic<Level> level{Level::WARN};
        return level;
    }

    inline void write(Level level, const std::string& msg) {
        if (level < min_level().load(std::memory_order_relaxed)) return;

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
    detail::min_level().store(level, std::memory_order_relaxed);
}

[[nodiscard]] inline Level level() {
    return detail::min_level().load(std::memory_order_relaxed);
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

} // namespace promptsan::utils
