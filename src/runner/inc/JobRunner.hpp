#pragma once

#include "CommandSpec.hpp"
#include "Job.hpp"
#include "JobLock.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

class Subprocess;

// Observer of job lifecycle, called on the job's supervisor thread
class JobListener {
public:
    virtual ~JobListener() = default;

    virtual void on_job_started(const Job& job) { (void)job; }
    virtual void on_job_finished(const Job& job) = 0;
};

// Runs external commands as subprocesses, at most one per target
class JobRunner {
public:
    static constexpr std::chrono::milliseconds kDefaultCancelGrace{10000};

    explicit JobRunner(std::chrono::milliseconds cancel_grace = kDefaultCancelGrace);

    // Cancels running jobs and joins every supervisor thread
    ~JobRunner();

    JobRunner(const JobRunner&) = delete;
    JobRunner& operator=(const JobRunner&) = delete;

    // Throws ReefError(TargetBusy) while another job holds `target`; never queues.
    // A launch error returns a job that is already Failed with its lock released.
    JobHandle submit(const std::string& target, const CommandSpec& command);

    // SIGTERM to the process group, SIGKILL after the grace period.
    // Idempotent, callable from any thread, no-op on terminal jobs.
    void cancel(const JobHandle& job);
    void cancel_all();

    // Replay of captured lines, then live lines, then Finished
    std::uint64_t subscribe(const JobHandle& job, Job::Callback callback);

    // Once it returns the callback is never invoked again. Called from another
    // thread it waits for the delivery in progress to finish.
    void unsubscribe(const JobHandle& job, std::uint64_t subscription);

    JobHandle find(const std::string& job_id) const;
    std::vector<JobHandle> jobs() const;
    bool is_busy(const std::string& target) const;

    void add_listener(std::shared_ptr<JobListener> listener);

    std::chrono::milliseconds cancel_grace() const { return cancel_grace_; }

private:
    void supervise(JobHandle job, std::unique_ptr<Subprocess> process, JobLock lock);
    void notify_started(const Job& job);
    void notify_finished(const Job& job);
    void join_settled();

    const std::chrono::milliseconds cancel_grace_;
    std::shared_ptr<JobLockTable> locks_;

    mutable std::mutex mutex_;
    std::map<std::string, JobHandle> jobs_;
    std::map<std::string, std::thread> supervisors_;
    std::vector<std::shared_ptr<JobListener>> listeners_;
    std::uint64_t next_id_ = 0;
};
