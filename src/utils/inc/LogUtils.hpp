#pragma once
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ostr.h>
#include <string>
#include <utility>

namespace LogUtils {

enum class Level {
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

// Console sink on stderr (stdout carries job output) plus a rotating file.
// Calling init again replaces the previous logger.
void init(Level level = Level::Info,
          const std::string& log_file = "log/reef.log",
          size_t max_file_size = 1024 * 1024 * 5,
          size_t max_files = 3);

void shutdown();
void set_level(Level level);
bool enabled(Level level);

// Parse "debug", "info", "warn", "error", "fatal" (case-insensitive)
Level parse_level(const std::string& name);

// Before init(), messages go to stderr with a level tag
void write(Level level, const std::string& msg);

inline void debug(const std::string& msg) { write(Level::Debug, msg); }
inline void info(const std::string& msg) { write(Level::Info, msg); }
inline void warn(const std::string& msg) { write(Level::Warn, msg); }
inline void error(const std::string& msg) { write(Level::Error, msg); }
inline void fatal(const std::string& msg) { write(Level::Fatal, msg); }

// Variadic template version (fmt-style), formatted only when the level is enabled
template <typename... Args>
inline void debug(fmt::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Debug)) write(Level::Debug, fmt::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
inline void info(fmt::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Info)) write(Level::Info, fmt::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
inline void warn(fmt::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Warn)) write(Level::Warn, fmt::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
inline void error(fmt::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Error)) write(Level::Error, fmt::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
inline void fatal(fmt::format_string<Args...> fmt, Args&&... args) {
    write(Level::Fatal, fmt::format(fmt, std::forward<Args>(args)...));
}

class LoggerGuard {
public:
    LoggerGuard(Level level = Level::Info,
                const std::string& log_file = "log/reef.log",
                size_t max_file_size = 1024 * 1024 * 5,
                size_t max_files = 3) {
        LogUtils::init(level, log_file, max_file_size, max_files);
    }

    ~LoggerGuard() {
        LogUtils::shutdown();
    }

    LoggerGuard(const LoggerGuard&) = delete;
    LoggerGuard& operator=(const LoggerGuard&) = delete;

    void set_level(Level level) {
        LogUtils::set_level(level);
    }
};

}
