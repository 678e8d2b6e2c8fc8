#include "PlaybookOutputParser.hpp"
#include "StringUtils.hpp"

namespace {

const char* const kStatuses[] = {"ok", "changed", "failed", "fatal", "skipping", "unreachable"};

// "TASK [name] ****" or "RUNNING HANDLER [name] ****"
bool parse_task_header(const std::string& text, std::string& task) {
    for (const char* prefix : {"TASK [", "RUNNING HANDLER ["}) {
        if (StringUtils::starts_with(text, prefix)) {
            const size_t start = std::char_traits<char>::length(prefix);
            const size_t end = text.find(']', start);
            if (end == std::string::npos) return false;
            task = text.substr(start, end - start);
            return true;
        }
    }
    return false;
}

}

void PlaybookOutputParser::consume(const std::string& line) {
    const std::string text = StringUtils::trimmed(line);

    std::lock_guard<std::mutex> lock(mutex_);
    std::string task;
    if (parse_task_header(text, task)) {
        current_task_ = task;
        return;
    }

    for (const char* status : kStatuses) {
        const std::string prefix = std::string(status) + ": [";
        if (!StringUtils::starts_with(text, prefix)) continue;

        const size_t end = text.find(']', prefix.size());
        if (end == std::string::npos) return;

        TaskResult result;
        result.host = text.substr(prefix.size(), end - prefix.size());
        const size_t delegated = result.host.find(" -> ");
        if (delegated != std::string::npos) {
            result.host.erase(delegated);
        }
        result.host = StringUtils::trimmed(result.host);
        result.task = current_task_;
        result.status = status;
        if (result.status == "fatal" && text.find("UNREACHABLE!", end) != std::string::npos) {
            result.status = "unreachable";
        }
        results_.push_back(std::move(result));
        return;
    }
}

std::string PlaybookOutputParser::current_task() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_task_;
}

std::vector<TaskResult> PlaybookOutputParser::results() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_;
}

std::map<std::string, size_t> PlaybookOutputParser::summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, size_t> counts;
    for (const auto& result : results_) {
        ++counts[result.status];
    }
    return counts;
}
