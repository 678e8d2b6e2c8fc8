#include "JobLock.hpp"
#include "LogUtils.hpp"

JobLock::JobLock(std::shared_ptr<JobLockTable> table, std::string target)
    : table_(std::move(table)), target_(std::move(target)) {
}

JobLock::~JobLock() {
    release();
}

JobLock::JobLock(JobLock&& other) noexcept
    : table_(std::move(other.table_)), target_(std::move(other.target_)) {
    other.table_.reset();
}

JobLock& JobLock::operator=(JobLock&& other) noexcept {
    if (this != &other) {
        release();
        table_ = std::move(other.table_);
        target_ = std::move(other.target_);
        other.table_.reset();
    }
    return *this;
}

void JobLock::release() {
    if (table_) {
        table_->release(target_);
        table_.reset();
    }
}

std::optional<JobLock> JobLockTable::try_acquire(const std::string& target) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!held_.insert(target).second) {
        return std::nullopt;
    }
    LogUtils::debug("Acquired job lock on {}", target);
    return JobLock(shared_from_this(), target);
}

bool JobLockTable::is_held(const std::string& target) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_.count(target) > 0;
}

size_t JobLockTable::held_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_.size();
}

void JobLockTable::release(const std::string& target) {
    std::lock_guard<std::mutex> lock(mutex_);
    held_.erase(target);
    LogUtils::debug("Released job lock on {}", target);
}
