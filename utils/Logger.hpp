#pragma once
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace ts {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

inline std::optional<LogLevel> parseLogLevel(const std::string &val) {
    if (val == "DEBUG" || val == "debug")
        return LogLevel::Debug;
    if (val == "INFO" || val == "info")
        return LogLevel::Info;
    if (val == "WARN" || val == "warn")
        return LogLevel::Warn;
    if (val == "ERROR" || val == "error")
        return LogLevel::Error;
    return std::nullopt;
}

inline LogLevel &globalLogLevel() {
    static LogLevel level = [] {
        const char *env = std::getenv("TS_LOG_LEVEL");
        if (!env)
            return LogLevel::Info;
        return parseLogLevel(env).value_or(LogLevel::Info);
    }();
    return level;
}

inline void setLogLevel(LogLevel level) { globalLogLevel() = level; }

inline bool logEnabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(globalLogLevel());
}

inline const char *levelTag(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

inline std::string currentTime() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) % 1000;
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm, "%F %T") << '.' << std::setw(3) << std::setfill('0')
       << ms.count();
    return ss.str();
}

// The session worker thread and the main thread both log.
inline std::mutex &logMutex() {
    static std::mutex m;
    return m;
}

inline void log(LogLevel level, const std::string &msg,
                const char *file = nullptr, int line = 0) {
    if (!logEnabled(level))
        return;
    std::ostringstream out;
    out << '[' << levelTag(level) << "] " << currentTime();
    if (file)
        out << ' ' << file << ':' << line;
    out << ' ' << msg << '\n';

    std::lock_guard<std::mutex> lock(logMutex());
    std::ostream &stream = (level == LogLevel::Error ? std::cerr : std::cout);
    stream << out.str() << std::flush;
}

} // namespace ts

#define TS_LOG(level, msg) ::ts::log(level, msg, __FILE__, __LINE__)
