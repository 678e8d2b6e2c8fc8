#include "CommandLine.hpp"
#include "EngineSettings.hpp"
#include "LogUtils.hpp"
#include "Orchestrator.hpp"
#include "ReefError.hpp"
#include "SignalManager.hpp"
#include <csignal>
#include <iostream>
#include <memory>
#include <mutex>

namespace {

constexpr int kExitFailed = 1;
constexpr int kExitRejected = 2;
constexpr int kExitCancelled = 130;

// Stream the job's output, wait for it and report
int follow(Orchestrator& engine, const DeployResult& accepted) {
    if (accepted.code != ResultCode::Accepted) {
        LogUtils::error("{}: {}", to_string(accepted.code), accepted.reason);
        return kExitRejected;
    }

    engine.runner().subscribe(accepted.job, [](const JobEvent& event) {
        if (event.kind == JobEvent::Kind::Line) {
            std::cout << event.line.text << '\n';
        }
    });
    DeployResult done = engine.await(accepted);
    std::cout.flush();

    const auto tasks = engine.task_results(done.job->id());
    for (const auto& task : tasks) {
        if (task.status == "failed" || task.status == "fatal" || task.status == "unreachable") {
            LogUtils::warn("{} on {}: {}", task.task, task.host, task.status);
        }
    }

    switch (done.code) {
        case ResultCode::Succeeded:
            LogUtils::info("Job {} on {} succeeded", done.job->id(), done.job->target());
            return 0;
        case ResultCode::Cancelled:
            LogUtils::warn("Job {} on {} was cancelled", done.job->id(), done.job->target());
            return kExitCancelled;
        default:
            LogUtils::error("Job {} on {} failed: {}", done.job->id(), done.job->target(), done.reason);
            return kExitFailed;
    }
}

int dispatch(Orchestrator& engine, const CommandLine& cli) {
    const std::string& command = cli.command();
    if (command == "deploy") {
        if (cli.operands().empty()) {
            throw std::runtime_error("deploy needs a target");
        }
        return follow(engine, engine.deploy_playbook(cli.operands()[0], cli.assignments(1)));
    }
    if (command == "provision") {
        return follow(engine, engine.provision(cli.assignments(0)));
    }
    if (command == "show") {
        for (const auto& [key, value] : engine.config().snapshot()) {
            std::cout << key << " = " << value << '\n';
        }
        return 0;
    }
    if (command == "history") {
        for (const auto& entry : engine.history().load()) {
            std::cout << entry.dump() << '\n';
        }
        return 0;
    }
    throw std::runtime_error("Unknown command: " + command);
}

}

int main(int argc, char* argv[]) {
    CommandLine cli;
    try {
        cli = CommandLine::parse(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\nUse --help or -? to show usage information" << std::endl;
        return kExitRejected;
    }
    if (cli.has("--help") || cli.command().empty()) {
        CommandLine::show_help(std::cout);
        return cli.has("--help") ? 0 : kExitRejected;
    }

    EngineSettings settings;
    try {
        settings = EngineSettings::load(cli.value("--config-file"));
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitRejected;
    }

    // Before the logger starts its thread, so no thread takes these signals directly
    std::mutex engine_mutex;
    Orchestrator* engine = nullptr;
    auto on_interrupt = [&](int signum) {
        std::lock_guard<std::mutex> lock(engine_mutex);
        LogUtils::info("Interrupt signal ({}) received. Cancelling running jobs...", signum);
        if (engine) {
            engine->cancel_all();
        }
    };
    SignalManager::register_signal(SIGINT, on_interrupt);
    SignalManager::register_signal(SIGTERM, on_interrupt);
    SignalManager::setup();

    try {
        LogUtils::init(cli.has("--verbose") ? LogUtils::Level::Debug : settings.log_level, settings.log_file.string());
    } catch (const std::exception& e) {
        std::cerr << "Cannot open log file " << settings.log_file << ": " << e.what() << std::endl;
        SignalManager::shutdown();
        return kExitFailed;
    }

    int result = 0;
    try {
        Orchestrator orchestrator(settings);
        {
            std::lock_guard<std::mutex> lock(engine_mutex);
            engine = &orchestrator;
        }
        try {
            result = dispatch(orchestrator, cli);
        } catch (const std::exception& e) {
            LogUtils::error("Error: {}", e.what());
            result = kExitRejected;
        }
        std::lock_guard<std::mutex> lock(engine_mutex);
        engine = nullptr;
    } catch (const SchemaDeclarationError& e) {
        LogUtils::fatal("{}", e.what());
        result = kExitFailed;
    } catch (const std::exception& e) {
        LogUtils::error("Cannot start engine: {}", e.what());
        result = kExitFailed;
    }

    SignalManager::shutdown();
    LogUtils::shutdown();
    return result;
}
