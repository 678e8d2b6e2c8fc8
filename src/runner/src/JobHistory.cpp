#include "JobHistory.hpp"
#include "LogUtils.hpp"
#include <fstream>
#include <stdexcept>

namespace {

nlohmann::json epoch_ms(const std::optional<Job::Clock::time_point>& time) {
    if (!time) return nullptr;
    return std::chrono::duration_cast<std::chrono::milliseconds>(time->time_since_epoch()).count();
}

}

JobHistory::JobHistory(std::filesystem::path path, size_t tail_lines)
    : path_(std::move(path)), tail_lines_(tail_lines) {
}

nlohmann::json JobHistory::to_json(const Job& job, size_t tail_lines) {
    nlohmann::json entry;
    entry["id"] = job.id();
    entry["target"] = job.target();
    entry["command"] = job.command().display();
    entry["state"] = to_string(job.state());

    auto exit_code = job.exit_code();
    if (exit_code) {
        entry["exit_code"] = *exit_code;
    } else {
        entry["exit_code"] = nullptr;
    }

    const std::string error = job.error();
    if (!error.empty()) {
        entry["error"] = error;
    }
    entry["started_at"] = epoch_ms(job.started_at());
    entry["finished_at"] = epoch_ms(job.finished_at());

    const auto lines = job.lines();
    entry["line_count"] = lines.size();
    nlohmann::json tail = nlohmann::json::array();
    const size_t first = lines.size() > tail_lines ? lines.size() - tail_lines : 0;
    for (size_t i = first; i < lines.size(); ++i) {
        tail.push_back(lines[i].text);
    }
    entry["tail"] = tail;
    return entry;
}

void JobHistory::on_job_finished(const Job& job) {
    const nlohmann::json entry = to_json(job, tail_lines_);

    std::lock_guard<std::mutex> lock(mutex_);
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path());
    }
    std::ofstream out(path_, std::ios::app);
    if (!out) {
        throw std::runtime_error("Cannot open job history file: " + path_.string());
    }
    out << entry.dump() << '\n';
    if (!out) {
        throw std::runtime_error("Cannot write job history file: " + path_.string());
    }
    LogUtils::debug("Recorded job {} in {}", job.id(), path_.string());
}

std::vector<nlohmann::json> JobHistory::load() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<nlohmann::json> entries;
    std::ifstream in(path_);
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty()) continue;
        try {
            entries.push_back(nlohmann::json::parse(line));
        } catch (const nlohmann::json::parse_error& e) {
            LogUtils::warn("Skipping line {} of {}: {}", line_no, path_.string(), e.what());
        }
    }
    return entries;
}
