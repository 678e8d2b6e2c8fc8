#pragma once

#include "CommandSpec.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

enum class JobState {
    Pending,
    Running,
    Succeeded,
    Failed,
    Cancelled
};

const char* to_string(JobState state);
bool is_terminal(JobState state);

enum class OutputStream {
    Stdout,
    Stderr
};

const char* to_string(OutputStream stream);

struct JobLine {
    std::uint64_t seq = 0;      // 1, 2, 3... per job
    OutputStream stream = OutputStream::Stdout;
    std::string text;           // without the line terminator
};

struct JobEvent {
    enum class Kind {
        Line,
        Finished
    };

    Kind kind = Kind::Line;
    JobLine line;                       // Kind::Line
    JobState state = JobState::Pending; // Kind::Finished
    std::optional<int> exit_code;       // Kind::Finished
};

// One external command run against one target. Created by JobRunner.
class Job {
public:
    using Callback = std::function<void(const JobEvent&)>;
    using Clock = std::chrono::system_clock;

    Job(std::string id, std::string target, CommandSpec command);

    Job(const Job&) = delete;
    Job& operator=(const Job&) = delete;

    const std::string& id() const { return id_; }
    const std::string& target() const { return target_; }
    const CommandSpec& command() const { return command_; }

    JobState state() const;
    bool is_terminal() const;

    // Process id (and process group id) while running, -1 before launch
    int pid() const;

    // Set once terminal, except for launch failures
    std::optional<int> exit_code() const;

    // Launch error, empty otherwise
    std::string error() const;

    std::optional<Clock::time_point> started_at() const;
    std::optional<Clock::time_point> finished_at() const;

    std::vector<JobLine> lines() const;
    std::vector<JobLine> tail(size_t n) const;

    bool cancel_requested() const;

    // Block until terminal and every subscriber has seen Finished
    void wait() const;
    bool wait_for(std::chrono::milliseconds timeout) const;

private:
    friend class JobRunner;

    void mark_running(int pid);
    void append(OutputStream stream, std::string text);
    // complete() makes the job terminal, publish_finished() then delivers
    // Finished and settles it. finish() does both.
    void complete(JobState state, std::optional<int> exit_code, std::string error = {});
    void publish_finished();
    void finish(JobState state, std::optional<int> exit_code, std::string error = {});

    // Replays captured lines (and Finished if already delivered) before returning
    std::uint64_t subscribe(Callback callback);

    // Waits for an event delivery in progress, unless called from a callback.
    // No callback of the subscription runs after it returns.
    void unsubscribe(std::uint64_t subscription);

    // False if already requested or terminal
    bool request_cancel();

    using Subscriber = std::pair<std::uint64_t, Callback>;
    void deliver(const std::vector<Subscriber>& targets, const JobEvent& event);

    const std::string id_;
    const std::string target_;
    const CommandSpec command_;

    mutable std::mutex mutex_;
    mutable std::condition_variable settled_cv_;
    JobState state_ = JobState::Pending;
    bool settled_ = false;
    bool finished_published_ = false;
    bool cancel_requested_ = false;
    int pid_ = -1;
    std::optional<int> exit_code_;
    std::string error_;
    std::optional<Clock::time_point> started_at_;
    std::optional<Clock::time_point> finished_at_;
    std::vector<JobLine> lines_;

    // Held while delivering, so replay and live events never interleave
    std::mutex delivery_mutex_;
    std::atomic<std::thread::id> delivering_thread_{};
    std::map<std::uint64_t, Callback> subscribers_;
    std::uint64_t next_subscription_ = 0;
};

using JobHandle = std::shared_ptr<Job>;
