#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

struct TaskResult {
    std::string host;
    std::string task;
    std::string status;     // ok, changed, failed, fatal, skipping, unreachable
};

// Turns playbook runner output into per-host task results.
// Feed it lines in order; safe to read from another thread.
class PlaybookOutputParser {
public:
    void consume(const std::string& line);

    std::vector<TaskResult> results() const;

    // Result count per status
    std::map<std::string, size_t> summary() const;

    std::string current_task() const;

private:
    mutable std::mutex mutex_;
    std::string current_task_ = "Starting";
    std::vector<TaskResult> results_;
};
