#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

class JobLockTable;

// Exclusive claim on one target. Released on destruction or release(), exactly once.
class JobLock {
public:
    JobLock() = default;
    ~JobLock();

    JobLock(JobLock&& other) noexcept;
    JobLock& operator=(JobLock&& other) noexcept;

    JobLock(const JobLock&) = delete;
    JobLock& operator=(const JobLock&) = delete;

    void release();
    bool owns() const { return table_ != nullptr; }
    const std::string& target() const { return target_; }

private:
    friend class JobLockTable;
    JobLock(std::shared_ptr<JobLockTable> table, std::string target);

    std::shared_ptr<JobLockTable> table_;
    std::string target_;
};

// Targets with a running job. Must be owned by a shared_ptr.
class JobLockTable : public std::enable_shared_from_this<JobLockTable> {
public:
    // nullopt if another job holds `target`
    std::optional<JobLock> try_acquire(const std::string& target);
    bool is_held(const std::string& target) const;
    size_t held_count() const;

private:
    friend class JobLock;
    void release(const std::string& target);

    mutable std::mutex mutex_;
    std::set<std::string> held_;
};
