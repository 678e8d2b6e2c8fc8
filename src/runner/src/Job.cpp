#include "Job.hpp"
#include "LogUtils.hpp"

const char* to_string(JobState state) {
    switch (state) {
        case JobState::Pending:   return "Pending";
        case JobState::Running:   return "Running";
        case JobState::Succeeded: return "Succeeded";
        case JobState::Failed:    return "Failed";
        case JobState::Cancelled: return "Cancelled";
        default:                  return "Unknown";
    }
}

bool is_terminal(JobState state) {
    return state == JobState::Succeeded || state == JobState::Failed || state == JobState::Cancelled;
}

const char* to_string(OutputStream stream) {
    return stream == OutputStream::Stdout ? "stdout" : "stderr";
}

Job::Job(std::string id, std::string target, CommandSpec command)
    : id_(std::move(id)), target_(std::move(target)), command_(std::move(command)) {
}

JobState Job::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool Job::is_terminal() const {
    return ::is_terminal(state());
}

int Job::pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pid_;
}

std::optional<int> Job::exit_code() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exit_code_;
}

std::string Job::error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

std::optional<Job::Clock::time_point> Job::started_at() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_at_;
}

std::optional<Job::Clock::time_point> Job::finished_at() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_at_;
}

std::vector<JobLine> Job::lines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
}

std::vector<JobLine> Job::tail(size_t n) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t first = lines_.size() > n ? lines_.size() - n : 0;
    return std::vector<JobLine>(lines_.begin() + first, lines_.end());
}

bool Job::cancel_requested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancel_requested_;
}

void Job::wait() const {
    std::unique_lock<std::mutex> lock(mutex_);
    settled_cv_.wait(lock, [this] { return settled_; });
}

bool Job::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return settled_cv_.wait_for(lock, timeout, [this] { return settled_; });
}

void Job::mark_running(int pid) {
    std::lock_guard<std::mutex> lock(mutex_);
    pid_ = pid;
    state_ = JobState::Running;
    started_at_ = Clock::now();
}

namespace {

// Marks the calling thread as the one delivering events of a job
class DeliveryScope {
public:
    explicit DeliveryScope(std::atomic<std::thread::id>& owner) : owner_(owner) {
        owner_.store(std::this_thread::get_id());
    }
    ~DeliveryScope() { owner_.store(std::thread::id()); }

private:
    std::atomic<std::thread::id>& owner_;
};

}

void Job::append(OutputStream stream, std::string text) {
    std::lock_guard<std::mutex> delivery(delivery_mutex_);
    DeliveryScope scope(delivering_thread_);

    JobEvent event;
    std::vector<Subscriber> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        JobLine line;
        line.seq = lines_.size() + 1;
        line.stream = stream;
        line.text = std::move(text);
        lines_.push_back(line);

        event.kind = JobEvent::Kind::Line;
        event.line = std::move(line);
        targets.assign(subscribers_.begin(), subscribers_.end());
    }
    deliver(targets, event);
}

void Job::complete(JobState state, std::optional<int> exit_code, std::string error) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = state;
    exit_code_ = exit_code;
    error_ = std::move(error);
    finished_at_ = Clock::now();
}

void Job::publish_finished() {
    {
        std::lock_guard<std::mutex> delivery(delivery_mutex_);
        DeliveryScope scope(delivering_thread_);

        JobEvent event;
        std::vector<Subscriber> targets;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            event.kind = JobEvent::Kind::Finished;
            event.state = state_;
            event.exit_code = exit_code_;
            finished_published_ = true;
            targets.assign(subscribers_.begin(), subscribers_.end());
        }
        deliver(targets, event);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        settled_ = true;
    }
    settled_cv_.notify_all();
}

void Job::finish(JobState state, std::optional<int> exit_code, std::string error) {
    complete(state, exit_code, std::move(error));
    publish_finished();
}

std::uint64_t Job::subscribe(Callback callback) {
    std::lock_guard<std::mutex> delivery(delivery_mutex_);
    DeliveryScope scope(delivering_thread_);

    std::vector<JobLine> replay;
    std::optional<JobEvent> finished;
    std::uint64_t subscription;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscription = ++next_subscription_;
        subscribers_.emplace(subscription, callback);
        replay = lines_;
        // Until publish_finished() runs, Finished arrives live instead
        if (finished_published_) {
            JobEvent event;
            event.kind = JobEvent::Kind::Finished;
            event.state = state_;
            event.exit_code = exit_code_;
            finished = event;
        }
    }

    const std::vector<Subscriber> only = {{subscription, callback}};
    for (auto& line : replay) {
        JobEvent event;
        event.kind = JobEvent::Kind::Line;
        event.line = std::move(line);
        deliver(only, event);
    }
    if (finished) {
        deliver(only, *finished);
    }
    return subscription;
}

void Job::unsubscribe(std::uint64_t subscription) {
    // From inside a callback the delivery in progress is our own
    if (delivering_thread_.load() == std::this_thread::get_id()) {
        std::lock_guard<std::mutex> lock(mutex_);
        subscribers_.erase(subscription);
        return;
    }

    std::lock_guard<std::mutex> delivery(delivery_mutex_);
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.erase(subscription);
}

bool Job::request_cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancel_requested_ || ::is_terminal(state_)) {
        return false;
    }
    cancel_requested_ = true;
    return true;
}

void Job::deliver(const std::vector<Subscriber>& targets, const JobEvent& event) {
    for (const auto& [subscription, callback] : targets) {
        {
            // An earlier callback may have unsubscribed this one
            std::lock_guard<std::mutex> lock(mutex_);
            if (!subscribers_.count(subscription)) continue;
        }
        try {
            callback(event);
        } catch (const std::exception& e) {
            LogUtils::error("Subscriber of job {} threw: {}", id_, e.what());
        }
    }
}
