// include/debug_utils.h
#pragma once

#include <string>
#include <sstream>
#include <iomanip>
#include <cctype> // For std::isprint
#include <iostream>
#include <atomic>

namespace schemata {

enum class LogLevel : int { TRACE = 0, INFO = 1, WARN = 2, ERROR = 3, FATAL = 4, OFF = 5 };

// Process-wide threshold. Lines below it are dropped before formatting.
inline std::atomic<int> g_log_level{static_cast<int>(LogLevel::INFO)};

inline void setLogLevel(LogLevel level) {
    g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

inline LogLevel getLogLevel() {
    return static_cast<LogLevel>(g_log_level.load(std::memory_order_relaxed));
}

inline bool logEnabled(LogLevel level) {
    return static_cast<int>(level) >= g_log_level.load(std::memory_order_relaxed);
}

} // namespace schemata

// Subject names come straight from callers; escape anything unprintable.
inline std::string format_subject_for_print(const std::string& subject) {
    std::ostringstream oss;
    for (unsigned char c : subject) {
        if (std::isprint(c)) {
            oss << c;
        } else {
            oss << "\\x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

// Lowercase hex of a byte string (digests, CRC buffers).
inline std::string hex_dump_string(const std::string& str) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned char c : str) {
        oss << std::setw(2) << static_cast<int>(c);
    }
    return oss.str();
}

// Shortened fingerprint for log lines.
inline std::string short_fingerprint(const std::string& fingerprint) {
    return fingerprint.size() > 12 ? fingerprint.substr(0, 12) : fingerprint;
}


// --- Logging Macros ---

template<typename... Args>
void print_log_line(std::ostream& os, Args&&... args) {
    std::ostringstream line;
    (line << ... << std::forward<Args>(args));
    line << '\n';
    os << line.str() << std::flush;
}

// #define SCHEMATA_DEBUG_LOG

#ifdef SCHEMATA_DEBUG_LOG
    #define LOG_DEBUG(level, ...) \
        do { \
            std::cout << "[" << #level << "] "; \
            print_log_line(std::cout, __VA_ARGS__); \
        } while(0)
#else
    #define LOG_DEBUG(level, ...) // No-op when not debugging
#endif

#define SCHEMATA_LOG_AT(lvl, stream, tag, ...) \
    do { \
        if (::schemata::logEnabled(::schemata::LogLevel::lvl)) { \
            print_log_line(stream, tag, __VA_ARGS__); \
        } \
    } while(0)

#define LOG_TRACE(...) SCHEMATA_LOG_AT(TRACE, std::cout, "[TRACE] ", __VA_ARGS__)
#define LOG_INFO(...)  SCHEMATA_LOG_AT(INFO,  std::cout, "[INFO] ",  __VA_ARGS__)
#define LOG_WARN(...)  SCHEMATA_LOG_AT(WARN,  std::cerr, "[WARN] ",  __VA_ARGS__)
#define LOG_ERROR(...) SCHEMATA_LOG_AT(ERROR, std::cerr, "[ERROR] ", __VA_ARGS__)
#define LOG_FATAL(...) SCHEMATA_LOG_AT(FATAL, std::cerr, "[FATAL] ", __VA_ARGS__)
