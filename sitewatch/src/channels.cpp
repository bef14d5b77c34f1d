#include "channels.hpp"
#include <utility>

void JobQueue::push(Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
}

void JobQueue::push_all(std::vector<Job> jobs) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& job : jobs) {
            jobs_.push_back(std::move(job));
        }
    }
    cv_.notify_all();
}

std::optional<Job> JobQueue::pop(const CancellationToken& cancel) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        if (cancel.is_cancelled()) {
            return std::nullopt;
        }
        if (!jobs_.empty()) {
            Job job = std::move(jobs_.front());
            jobs_.pop_front();
            return job;
        }
        if (closed_) {
            return std::nullopt;
        }
        cv_.wait_for(lock, CancellationToken::kPollInterval);
    }
}

std::vector<Job> JobQueue::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Job> remaining;
    remaining.reserve(jobs_.size());
    while (!jobs_.empty()) {
        remaining.push_back(std::move(jobs_.front()));
        jobs_.pop_front();
    }
    return remaining;
}

void JobQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

size_t JobQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

void ResultChannel::publish(ProbeResult result) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        results_.push(std::move(result));
    }
    cv_.notify_one();
}

void ResultChannel::fail(std::exception_ptr error) {
    if (!error) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!error_) error_ = std::move(error);
    }
    cv_.notify_all();
}

std::optional<ProbeResult> ResultChannel::receive_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return error_ || !results_.empty(); });

    if (error_) {
        std::rethrow_exception(error_);
    }
    if (results_.empty()) {
        return std::nullopt;
    }

    ProbeResult result = std::move(results_.front());
    results_.pop();
    return result;
}
