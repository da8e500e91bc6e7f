#ifndef PROCTOR_UTILS_LOG_H
#define PROCTOR_UTILS_LOG_H

#include <iostream>
#include <iomanip>
#include <chrono>
#include <sstream>
#include <ctime>
#include <string>
#include <algorithm>
#include <cctype>

namespace proctor {
namespace utils {

enum class LogLevel {
    VERBOSE,
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    FATAL
};

// Compile-time default, e.g. -DPROCTOR_LOG_LEVEL_DEFAULT=::proctor::utils::LogLevel::INFO
#ifndef PROCTOR_LOG_LEVEL_DEFAULT
    #define PROCTOR_LOG_LEVEL_DEFAULT ::proctor::utils::LogLevel::INFO
#endif

// Logs below this level are suppressed
inline LogLevel& maxLogLevel() {
    static LogLevel level = PROCTOR_LOG_LEVEL_DEFAULT;
    return level;
}

inline void setLogLevel(LogLevel level) {
    maxLogLevel() = level;
}

inline LogLevel getLogLevel() {
    return maxLogLevel();
}

inline const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::VERBOSE: return "VERBOSE";
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::FATAL:   return "FATAL";
        default:                return "UNKNOWN";
    }
}

/**
 * @brief Parse a level name from configuration ("info", "WARN", ...)
 * @param name Level name, case-insensitive
 * @param fallback Returned when the name is not recognised
 */
inline LogLevel parseLogLevel(const std::string& name, LogLevel fallback = LogLevel::INFO) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "VERBOSE" || upper == "TRACE") return LogLevel::VERBOSE;
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::WARNING;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "FATAL") return LogLevel::FATAL;
    return fallback;
}

inline std::string getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&now_time_t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << now_ms.count();
    return oss.str();
}

inline const char* extractFilename(const char* path) {
    const char* filename = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') {
            filename = p + 1;
        }
    }
    return filename;
}

inline void log(LogLevel level, const char* file, int line, const std::string& message) {
    if (level < maxLogLevel()) {
        return;
    }

    std::ostringstream oss;
    oss << "[" << getCurrentTimestamp() << "] "
        << "[" << logLevelToString(level) << "] "
        << "[" << extractFilename(file) << ":" << line << "] "
        << message;

    if (level == LogLevel::ERROR || level == LogLevel::FATAL) {
        std::cerr << oss.str() << std::endl;
    } else {
        std::cout << oss.str() << std::endl;
    }
}

} // namespace utils
} // namespace proctor

// Log macros
#define LOGV(msg) ::proctor::utils::log(::proctor::utils::LogLevel::VERBOSE, __FILE__, __LINE__, msg)
#define LOGD(msg) ::proctor::utils::log(::proctor::utils::LogLevel::DEBUG, __FILE__, __LINE__, msg)
#define LOGI(msg) ::proctor::utils::log(::proctor::utils::LogLevel::INFO, __FILE__, __LINE__, msg)
#define LOGW(msg) ::proctor::utils::log(::proctor::utils::LogLevel::WARNING, __FILE__, __LINE__, msg)
#define LOGE(msg) ::proctor::utils::log(::proctor::utils::LogLevel::ERROR, __FILE__, __LINE__, msg)
#define LOGF(msg) ::proctor::utils::log(::proctor::utils::LogLevel::FATAL, __FILE__, __LINE__, msg)

// Stream-style variants: LOGI_FMT("ran " << n << " cases")
#define LOGV_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGV(_oss.str()); }
#define LOGD_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGD(_oss.str()); }
#define LOGI_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGI(_oss.str()); }
#define LOGW_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGW(_oss.str()); }
#define LOGE_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGE(_oss.str()); }
#define LOGF_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGF(_oss.str()); }

#endif // PROCTOR_UTILS_LOG_H
