#pragma once

#include "JobRunner.hpp"
#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>
#include <vector>

// Appends one JSON object per finished job to a JSON-lines file
class JobHistory : public JobListener {
public:
    explicit JobHistory(std::filesystem::path path, size_t tail_lines = 20);

    void on_job_finished(const Job& job) override;

    // Entries in file order; unreadable lines are skipped
    std::vector<nlohmann::json> load() const;

    static nlohmann::json to_json(const Job& job, size_t tail_lines);

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    size_t tail_lines_;
    mutable std::mutex mutex_;
};
