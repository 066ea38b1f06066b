#pragma once
#include <chrono>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace ct {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

inline LogLevel parseLogLevel(const std::string &val, LogLevel fallback) {
    if (val == "DEBUG")
        return LogLevel::Debug;
    if (val == "INFO")
        return LogLevel::Info;
    if (val == "WARN")
        return LogLevel::Warn;
    if (val == "ERROR")
        return LogLevel::Error;
    return fallback;
}

inline LogLevel &globalLogLevel() {
    static LogLevel level = [] {
        const char *env = std::getenv("CT_LOG_LEVEL");
        if (!env)
            return LogLevel::Info;
        return parseLogLevel(env, LogLevel::Info);
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
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm, "%F %T");
    return ss.str();
}

// __FILE__ without its directories.
inline const char *sourceName(const char *file) {
    const char *slash = std::strrchr(file, '/');
    return slash ? slash + 1 : file;
}

// Lines about one console session carry its id so a session can be followed
// through open, input and close.
inline void log(LogLevel level, const std::string &msg, const char *file = nullptr,
                int line = 0, std::uint64_t session = 0) {
    if (!logEnabled(level))
        return;
    std::ostream &out = (level == LogLevel::Error ? std::cerr : std::cout);
    out << '[' << levelTag(level) << "] " << currentTime();
    if (file)
        out << ' ' << sourceName(file) << ':' << line;
    if (session != 0)
        out << " [session " << session << ']';
    out << " " << msg << std::endl;
}

} // namespace ct

#define CT_LOG(level, msg) ::ct::log(level, msg, __FILE__, __LINE__)
#define CT_SESSION_LOG(level, session, msg) ::ct::log(level, msg, __FILE__, __LINE__, session)
