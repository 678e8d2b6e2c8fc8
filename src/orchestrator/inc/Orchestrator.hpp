#pragma once

#include "CommandSpec.hpp"
#include "ConfigStore.hpp"
#include "EngineSettings.hpp"
#include "InventoryStore.hpp"
#include "JobHistory.hpp"
#include "JobRunner.hpp"
#include "PlaybookOutputParser.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct DeployRequest {
    std::string target;             // inventory host, group or "all"
    ConfigStore::Patch patch;       // variables to apply before running
    CommandSpec command;
};

enum class ResultCode {
    Accepted,
    Succeeded,
    Failed,
    Cancelled,
    TargetBusy,
    ConfigRejected
};

const char* to_string(ResultCode code);

struct DeployResult {
    ResultCode code = ResultCode::Accepted;
    std::string reason;                 // ConfigRejected, TargetBusy, Failed
    JobHandle job;                      // set once a job was submitted
    std::optional<int> exit_code;       // Succeeded, Failed
    std::vector<std::string> tail;      // last output lines for Failed
};

// Entry point for the UI/CLI layer: persist configuration, then run the job.
// Never retries.
class Orchestrator {
public:
    static constexpr const char* kProvisionTarget = "terraform";

    // Loads the schema from settings.schema_file.
    // Throws SchemaDeclarationError if it is malformed.
    explicit Orchestrator(const EngineSettings& settings);

    Orchestrator(const EngineSettings& settings, std::shared_ptr<const SchemaRegistry> schema);

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Accepted, ConfigRejected (no job submitted) or TargetBusy
    DeployResult deploy(const DeployRequest& request);

    // Block on an Accepted result and report how the job ended; other results pass through
    DeployResult await(const DeployResult& result) const;

    // Playbook run limited to `target` ("all" runs everywhere)
    DeployResult deploy_playbook(const std::string& target, const ConfigStore::Patch& patch = {});
    DeployResult provision(const ConfigStore::Patch& patch = {});

    CommandSpec playbook_command(const std::string& target) const;
    CommandSpec provision_command() const;

    // Parsed task results of a playbook job so far; empty for other jobs
    std::vector<TaskResult> task_results(const std::string& job_id) const;

    // False if no such job
    bool cancel(const std::string& job_id);
    void cancel_all();

    ConfigStore& config() { return config_; }
    InventoryStore& inventory() { return inventory_; }
    JobRunner& runner() { return runner_; }
    const JobHistory& history() const { return *history_; }
    const EngineSettings& settings() const { return settings_; }

private:
    EngineSettings settings_;
    ConfigStore config_;
    InventoryStore inventory_;
    std::shared_ptr<JobHistory> history_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<PlaybookOutputParser>> parsers_;

    // Last, so running jobs are cancelled and joined before the rest goes away
    JobRunner runner_;
};
