#include "LogUtils.hpp"
#include "StringUtils.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <atomic>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace LogUtils {

namespace {

std::mutex logger_mutex;
std::shared_ptr<spdlog::logger> logger;
std::atomic<Level> current_level{Level::Info};

spdlog::level::level_enum to_spdlog_level(Level level) {
    switch (level) {
        case Level::Debug: return spdlog::level::debug;
        case Level::Info:  return spdlog::level::info;
        case Level::Warn:  return spdlog::level::warn;
        case Level::Error: return spdlog::level::err;
        case Level::Fatal: return spdlog::level::critical;
        default:           return spdlog::level::info;
    }
}

const char* tag(Level level) {
    switch (level) {
        case Level::Debug: return "[DEBUG] ";
        case Level::Info:  return "[INFO] ";
        case Level::Warn:  return "[WARN] ";
        case Level::Error: return "[ERROR] ";
        default:           return "[FATAL] ";
    }
}

std::shared_ptr<spdlog::logger> current_logger() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    return logger;
}

class LevelFullNameFormatter : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
        static const char* level_names[] = {
            "TRACE", "DEBUG", "INFO ", "WARN ", "ERROR", "FATAL", "OFF  "
        };
        auto lvl = static_cast<size_t>(msg.level);
        const char* name = lvl < sizeof(level_names) / sizeof(level_names[0]) ? level_names[lvl] : "INFO ";
        dest.append(name, name + std::strlen(name));
    }

    std::unique_ptr<spdlog::custom_flag_formatter> clone() const override {
        return std::make_unique<LevelFullNameFormatter>();
    }
};

}

void init(Level level, const std::string& log_file, size_t max_file_size, size_t max_files) {
    shutdown();

    std::filesystem::path parent_dir = std::filesystem::path(log_file).parent_path();
    if (!parent_dir.empty() && !std::filesystem::exists(parent_dir)) {
        std::filesystem::create_directories(parent_dir);
    }

    spdlog::init_thread_pool(8192, 1);

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_file, max_file_size, max_files);

    std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
    auto async_logger = std::make_shared<spdlog::async_logger>(
        "reef", sinks.begin(), sinks.end(),
        spdlog::thread_pool(), spdlog::async_overflow_policy::block);

    auto formatter = std::make_unique<spdlog::pattern_formatter>(
        "%Y-%m-%d %H:%M:%S.%f %t %X %v"
    );
    formatter->add_flag<LevelFullNameFormatter>('X');

    async_logger->set_formatter(std::move(formatter));
    async_logger->set_level(to_spdlog_level(level));
    async_logger->flush_on(spdlog::level::info);
    spdlog::flush_every(std::chrono::seconds(1));
    spdlog::register_logger(async_logger);

    current_level = level;
    std::lock_guard<std::mutex> lock(logger_mutex);
    logger = std::move(async_logger);
}

void shutdown() {
    std::shared_ptr<spdlog::logger> old;
    {
        std::lock_guard<std::mutex> lock(logger_mutex);
        old.swap(logger);
    }
    if (old) {
        old->flush();
        old.reset();
        spdlog::shutdown();
    }
}

void set_level(Level level) {
    current_level = level;
    if (auto log = current_logger()) log->set_level(to_spdlog_level(level));
}

bool enabled(Level level) {
    return level >= current_level.load();
}

Level parse_level(const std::string& name) {
    const std::string lower = StringUtils::to_lower(name);
    if (lower == "debug") return Level::Debug;
    if (lower == "info") return Level::Info;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error") return Level::Error;
    if (lower == "fatal" || lower == "critical") return Level::Fatal;
    throw std::invalid_argument("Unknown log level: " + name);
}

void write(Level level, const std::string& msg) {
    if (auto log = current_logger()) {
        log->log(to_spdlog_level(level), msg);
    } else if (enabled(level)) {
        std::cerr << tag(level) << msg << std::endl;
    }
}

}
