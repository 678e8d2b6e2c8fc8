#include "LogUtils.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

static const fs::path kLogDir = fs::temp_directory_path() / "reef_testlog";

bool log_file_contains(const fs::path& log_file, const std::string& keyword) {
    std::ifstream fin(log_file);
    if (!fin.is_open()) return false;
    std::string line;
    while (std::getline(fin, line)) {
        if (line.find(keyword) != std::string::npos) return true;
    }
    return false;
}

void test_file_sink_and_levels() {
    fs::remove_all(kLogDir);
    fs::path log_file = kLogDir / "nested" / "reef.log";

    LogUtils::init(LogUtils::Level::Info, log_file.string(), 1024 * 1024, 1);
    LogUtils::debug("Debug {} should not appear", "job-1");
    LogUtils::info("Job {} started on {}", "job-1", "db1");
    LogUtils::warn("Rejected job on {}", "db1");
    LogUtils::error(std::string("plain error message"));
    LogUtils::fatal("Schema declaration error: {}", "duplicate option key 'a'");
    LogUtils::shutdown();

    assert(fs::exists(log_file));
    assert(!log_file_contains(log_file, "should not appear"));
    assert(log_file_contains(log_file, "INFO  Job job-1 started on db1"));
    assert(log_file_contains(log_file, "WARN  Rejected job on db1"));
    assert(log_file_contains(log_file, "ERROR plain error message"));
    assert(log_file_contains(log_file, "FATAL Schema declaration error"));
    fs::remove_all(kLogDir);
    std::cout << "test_file_sink_and_levels passed" << std::endl;
}

void test_set_level_and_reinit() {
    fs::remove_all(kLogDir);
    fs::path first = kLogDir / "first.log";
    fs::path second = kLogDir / "second.log";

    LogUtils::init(LogUtils::Level::Warn, first.string(), 1024 * 1024, 1);
    assert(!LogUtils::enabled(LogUtils::Level::Info));
    LogUtils::info("hidden at warn");
    LogUtils::set_level(LogUtils::Level::Debug);
    assert(LogUtils::enabled(LogUtils::Level::Debug));
    LogUtils::debug("visible after set_level");

    // A second init replaces the logger
    LogUtils::init(LogUtils::Level::Info, second.string(), 1024 * 1024, 1);
    LogUtils::info("goes to the second file");
    LogUtils::shutdown();

    assert(!log_file_contains(first, "hidden at warn"));
    assert(log_file_contains(first, "visible after set_level"));
    assert(!log_file_contains(first, "second file"));
    assert(log_file_contains(second, "goes to the second file"));
    fs::remove_all(kLogDir);
    std::cout << "test_set_level_and_reinit passed" << std::endl;
}

void test_logger_guard() {
    fs::remove_all(kLogDir);
    fs::path log_file = kLogDir / "guard.log";
    {
        LogUtils::LoggerGuard guard(LogUtils::Level::Warn, log_file.string(), 1024 * 1024, 1);
        LogUtils::info("Should not appear");
        guard.set_level(LogUtils::Level::Info);
        LogUtils::info("Guard info message");
    }
    assert(log_file_contains(log_file, "Guard info message"));
    assert(!log_file_contains(log_file, "Should not appear"));

    // After the guard, logging falls back to stderr without failing
    LogUtils::info("fallback message {}", 1);
    fs::remove_all(kLogDir);
    std::cout << "test_logger_guard passed" << std::endl;
}

void test_parse_level() {
    assert(LogUtils::parse_level("debug") == LogUtils::Level::Debug);
    assert(LogUtils::parse_level("INFO") == LogUtils::Level::Info);
    assert(LogUtils::parse_level("Warning") == LogUtils::Level::Warn);
    assert(LogUtils::parse_level("error") == LogUtils::Level::Error);
    assert(LogUtils::parse_level("critical") == LogUtils::Level::Fatal);

    bool threw = false;
    try {
        LogUtils::parse_level("chatty");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "test_parse_level passed" << std::endl;
}

int main() {
    test_file_sink_and_levels();
    test_set_level_and_reinit();
    test_logger_guard();
    test_parse_level();

    std::cout << "All LogUtils tests passed!" << std::endl;
    return 0;
}
