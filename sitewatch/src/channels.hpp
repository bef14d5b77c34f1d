#pragma once

#include "cancellation.hpp"
#include "types.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <optional>
#include <queue>
#include <vector>

// Shared FIFO of pending jobs. One producer (the scheduler), many consumers
// (the workers). Each job is handed out exactly once, by pop() or drain().
class JobQueue {
public:
    void push(Job job);
    void push_all(std::vector<Job> jobs);

    // Blocks until a job is available. Returns nullopt once the queue is
    // closed and empty, or as soon as cancellation is observed.
    std::optional<Job> pop(const CancellationToken& cancel);

    // Removes and returns every job still waiting.
    std::vector<Job> drain();

    void close();
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Job> jobs_;
    bool closed_ = false;
};

// Results flowing from the workers back to the single coordinator.
class ResultChannel {
public:
    void publish(ProbeResult result);

    // A worker hit an unexpected fault. The next receive rethrows it.
    void fail(std::exception_ptr error);

    // Waits up to `timeout` for a result; rethrows a published failure.
    std::optional<ProbeResult> receive_for(std::chrono::milliseconds timeout);

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<ProbeResult> results_;
    std::exception_ptr error_;
};
