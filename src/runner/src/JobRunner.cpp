#include "JobRunner.hpp"
#include "LogUtils.hpp"
#include "ReefError.hpp"
#include "Subprocess.hpp"
#include <csignal>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <sys/wait.h>

namespace {

constexpr int kPollIntervalMs = 50;

int exit_code_of(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return 255;
}

}

JobRunner::JobRunner(std::chrono::milliseconds cancel_grace)
    : cancel_grace_(cancel_grace), locks_(std::make_shared<JobLockTable>()) {
}

JobRunner::~JobRunner() {
    cancel_all();

    std::map<std::string, std::thread> supervisors;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        supervisors.swap(supervisors_);
    }
    for (auto& [id, thread] : supervisors) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

JobHandle JobRunner::submit(const std::string& target, const CommandSpec& command) {
    join_settled();

    std::optional<JobLock> lock = locks_->try_acquire(target);
    if (!lock) {
        LogUtils::warn("Rejected job on {}: another job is running", target);
        throw ReefError(ErrorCode::TargetBusy, "target '" + target + "' already has a running job", target);
    }

    JobHandle job;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        job = std::make_shared<Job>(fmt::format("job-{}", ++next_id_), target, command);
        jobs_.emplace(job->id(), job);
    }

    std::unique_ptr<Subprocess> process;
    try {
        process = Subprocess::spawn(command);
    } catch (const ReefError& e) {
        job->complete(JobState::Failed, std::nullopt, e.what());
        lock->release();
        job->publish_finished();
        LogUtils::error("Job {} on {} failed to launch: {}", job->id(), target, e.what());
        notify_finished(*job);
        return job;
    }

    job->mark_running(process->pid());
    LogUtils::info("Job {} started on {} (pid {}): {}", job->id(), target, process->pid(), command.display());
    notify_started(*job);

    try {
        std::thread supervisor(&JobRunner::supervise, this, job, std::move(process), std::move(*lock));
        std::lock_guard<std::mutex> guard(mutex_);
        supervisors_.emplace(job->id(), std::move(supervisor));
    } catch (const std::system_error& e) {
        // The moved-in process and lock were destroyed with the thread arguments
        job->finish(JobState::Failed, std::nullopt, std::string("cannot start supervisor: ") + e.what());
        LogUtils::error("Job {} on {} aborted: {}", job->id(), target, e.what());
        notify_finished(*job);
    }
    return job;
}

void JobRunner::supervise(JobHandle job, std::unique_ptr<Subprocess> process, JobLock lock) {
    using Clock = std::chrono::steady_clock;

    const Subprocess::LineSink sink = [&job](OutputStream stream, std::string text) {
        job->append(stream, std::move(text));
    };

    std::optional<int> exit_code;
    std::string failure;
    try {
        std::optional<Clock::time_point> kill_at;
        bool killed = false;
        int status = 0;
        while (!process->try_reap(status)) {
            if (!kill_at && job->cancel_requested()) {
                LogUtils::info("Cancelling job {} on {}: SIGTERM to process group {}",
                               job->id(), job->target(), process->pid());
                process->signal_group(SIGTERM);
                kill_at = Clock::now() + cancel_grace_;
            }
            if (kill_at && !killed && Clock::now() >= *kill_at) {
                LogUtils::warn("Job {} still running {} ms after SIGTERM, sending SIGKILL",
                               job->id(), cancel_grace_.count());
                process->signal_group(SIGKILL);
                killed = true;
            }
            process->pump(kPollIntervalMs, sink);
        }
        process->drain(sink);
        exit_code = exit_code_of(status);
    } catch (const std::exception& e) {
        failure = std::string("supervisor error: ") + e.what();
        LogUtils::error("Job {} on {}: {}", job->id(), job->target(), failure);
    }
    process.reset();

    JobState state;
    if (job->cancel_requested()) {
        state = JobState::Cancelled;
    } else if (exit_code && *exit_code == 0) {
        state = JobState::Succeeded;
    } else {
        state = JobState::Failed;
    }

    // Terminal before the target is free, Finished after
    job->complete(state, exit_code, failure);
    lock.release();
    job->publish_finished();

    if (state == JobState::Succeeded) {
        LogUtils::info("Job {} on {} succeeded", job->id(), job->target());
    } else {
        LogUtils::warn("Job {} on {} finished {} (exit code {})",
                       job->id(), job->target(), to_string(state), exit_code ? *exit_code : -1);
    }
    notify_finished(*job);
}

void JobRunner::cancel(const JobHandle& job) {
    if (job && job->request_cancel()) {
        LogUtils::info("Cancel requested for job {} on {}", job->id(), job->target());
    }
}

void JobRunner::cancel_all() {
    for (const auto& job : jobs()) {
        cancel(job);
    }
}

std::uint64_t JobRunner::subscribe(const JobHandle& job, Job::Callback callback) {
    if (!job) {
        throw std::invalid_argument("subscribe: null job handle");
    }
    return job->subscribe(std::move(callback));
}

void JobRunner::unsubscribe(const JobHandle& job, std::uint64_t subscription) {
    if (job) {
        job->unsubscribe(subscription);
    }
}

JobHandle JobRunner::find(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(job_id);
    return it == jobs_.end() ? nullptr : it->second;
}

std::vector<JobHandle> JobRunner::jobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<JobHandle> out;
    out.reserve(jobs_.size());
    for (const auto& entry : jobs_) {
        out.push_back(entry.second);
    }
    return out;
}

bool JobRunner::is_busy(const std::string& target) const {
    return locks_->is_held(target);
}

void JobRunner::add_listener(std::shared_ptr<JobListener> listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

void JobRunner::notify_started(const Job& job) {
    std::vector<std::shared_ptr<JobListener>> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners = listeners_;
    }
    for (const auto& listener : listeners) {
        try {
            listener->on_job_started(job);
        } catch (const std::exception& e) {
            LogUtils::error("Job listener failed on start of {}: {}", job.id(), e.what());
        }
    }
}

void JobRunner::notify_finished(const Job& job) {
    std::vector<std::shared_ptr<JobListener>> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners = listeners_;
    }
    for (const auto& listener : listeners) {
        try {
            listener->on_job_finished(job);
        } catch (const std::exception& e) {
            LogUtils::error("Job listener failed on finish of {}: {}", job.id(), e.what());
        }
    }
}

// Join supervisors of finished jobs so threads do not pile up
void JobRunner::join_settled() {
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = supervisors_.begin(); it != supervisors_.end();) {
            auto job = jobs_.find(it->first);
            const bool settled = job != jobs_.end() && job->second->wait_for(std::chrono::milliseconds(0));
            if (settled && it->second.get_id() != std::this_thread::get_id()) {
                finished.push_back(std::move(it->second));
                it = supervisors_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& thread : finished) {
        thread.join();
    }
}
