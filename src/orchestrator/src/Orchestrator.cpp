#include "Orchestrator.hpp"
#include "LogUtils.hpp"
#include "ReefError.hpp"
#include "StringUtils.hpp"

namespace {

std::shared_ptr<const SchemaRegistry> load_schema(const EngineSettings& settings) {
    return std::make_shared<const SchemaRegistry>(SchemaRegistry::from_file(settings.schema_file.string()));
}

std::string patch_keys(const ConfigStore::Patch& patch) {
    std::vector<std::string> keys;
    for (const auto& entry : patch) {
        keys.push_back(entry.first);
    }
    return StringUtils::join(keys, ", ");
}

}

const char* to_string(ResultCode code) {
    switch (code) {
        case ResultCode::Accepted:       return "Accepted";
        case ResultCode::Succeeded:      return "Succeeded";
        case ResultCode::Failed:         return "Failed";
        case ResultCode::Cancelled:      return "Cancelled";
        case ResultCode::TargetBusy:     return "TargetBusy";
        case ResultCode::ConfigRejected: return "ConfigRejected";
    }
    return "Unknown";
}

Orchestrator::Orchestrator(const EngineSettings& settings)
    : Orchestrator(settings, load_schema(settings)) {
}

Orchestrator::Orchestrator(const EngineSettings& settings, std::shared_ptr<const SchemaRegistry> schema)
    : settings_(settings),
      config_(settings.config_file, std::move(schema)),
      inventory_(settings.inventory_file),
      history_(std::make_shared<JobHistory>(settings.history_file, settings.tail_lines)),
      runner_(settings.cancel_grace) {
    runner_.add_listener(history_);
    LogUtils::info("Engine ready: config {}, inventory {}, {} declared options",
                   config_.path().string(), inventory_.path().string(), config_.schema().options().size());
}

DeployResult Orchestrator::deploy(const DeployRequest& request) {
    DeployResult result;

    if (!request.patch.empty()) {
        LogUtils::info("Applying configuration for {}: {}", request.target, patch_keys(request.patch));
    }
    try {
        config_.commit(request.patch);
    } catch (const ReefError& e) {
        LogUtils::error("Configuration rejected for {}: {}", request.target, e.what());
        result.code = ResultCode::ConfigRejected;
        result.reason = e.what();
        return result;
    }

    try {
        result.job = runner_.submit(request.target, request.command);
    } catch (const ReefError& e) {
        if (e.code() != ErrorCode::TargetBusy) {
            throw;
        }
        result.code = ResultCode::TargetBusy;
        result.reason = e.what();
        return result;
    }

    result.code = ResultCode::Accepted;
    return result;
}

DeployResult Orchestrator::await(const DeployResult& result) const {
    if (result.code != ResultCode::Accepted || !result.job) {
        return result;
    }

    const JobHandle& job = result.job;
    job->wait();

    DeployResult out;
    out.job = job;
    out.exit_code = job->exit_code();
    switch (job->state()) {
        case JobState::Succeeded:
            out.code = ResultCode::Succeeded;
            break;
        case JobState::Cancelled:
            out.code = ResultCode::Cancelled;
            out.reason = "cancelled";
            break;
        default:
            out.code = ResultCode::Failed;
            out.reason = !job->error().empty()
                ? job->error()
                : fmt::format("exit code {}", out.exit_code ? *out.exit_code : -1);
            for (auto& line : job->tail(settings_.tail_lines)) {
                out.tail.push_back(std::move(line.text));
            }
            break;
    }
    return out;
}

CommandSpec Orchestrator::playbook_command(const std::string& target) const {
    CommandSpec command;
    command.program = "ansible-playbook";
    command.args = {settings_.playbook.string(), "-i", settings_.inventory_file.string()};
    if (!target.empty() && target != "all") {
        command.args.push_back("-l");
        command.args.push_back(target);
    }
    command.working_dir = settings_.base_dir.string();
    command.env["ANSIBLE_CONFIG"] = settings_.ansible_config.string();
    command.env["ANSIBLE_ROLES_PATH"] = settings_.roles_path.string();
    return command;
}

CommandSpec Orchestrator::provision_command() const {
    CommandSpec command;
    command.program = "terraform";
    command.args = {"apply", "-auto-approve"};
    command.working_dir = settings_.terraform_dir.string();
    return command;
}

DeployResult Orchestrator::deploy_playbook(const std::string& target, const ConfigStore::Patch& patch) {
    DeployResult result = deploy(DeployRequest{target, patch, playbook_command(target)});
    if (result.code != ResultCode::Accepted) {
        return result;
    }

    auto parser = std::make_shared<PlaybookOutputParser>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        parsers_[result.job->id()] = parser;
    }
    // Replay covers whatever the job printed before this point
    runner_.subscribe(result.job, [parser](const JobEvent& event) {
        if (event.kind == JobEvent::Kind::Line) {
            parser->consume(event.line.text);
        }
    });
    return result;
}

DeployResult Orchestrator::provision(const ConfigStore::Patch& patch) {
    return deploy(DeployRequest{kProvisionTarget, patch, provision_command()});
}

std::vector<TaskResult> Orchestrator::task_results(const std::string& job_id) const {
    std::shared_ptr<PlaybookOutputParser> parser;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = parsers_.find(job_id);
        if (it == parsers_.end()) {
            return {};
        }
        parser = it->second;
    }
    return parser->results();
}

bool Orchestrator::cancel(const std::string& job_id) {
    JobHandle job = runner_.find(job_id);
    if (!job) {
        LogUtils::warn("Cannot cancel {}: no such job", job_id);
        return false;
    }
    runner_.cancel(job);
    return true;
}

void Orchestrator::cancel_all() {
    runner_.cancel_all();
}
