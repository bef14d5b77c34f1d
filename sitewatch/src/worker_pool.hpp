#pragma once

#include "cancellation.hpp"
#include "channels.hpp"
#include "retrying_probe.hpp"
#include <atomic>
#include <thread>
#include <vector>

// Fixed set of threads sharing one JobQueue. Every job a worker takes off
// the queue produces exactly one result on the ResultChannel. In-flight
// probes always run to completion; cancellation is observed at dequeue.
class WorkerPool {
public:
    WorkerPool(int worker_count,
               const RetryingProbe& probe,
               JobQueue& jobs,
               ResultChannel& results,
               const CancellationToken& cancel);
    ~WorkerPool();

    void start();

    // Closes the job queue and joins every worker. Idempotent.
    void stop();

    bool is_running() const;
    int worker_count() const { return worker_count_; }

    // Non-copyable
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

private:
    void worker_loop(int index);

    const int worker_count_;
    const RetryingProbe& probe_;
    JobQueue& jobs_;
    ResultChannel& results_;
    const CancellationToken& cancel_;

    std::vector<std::thread> workers_;
    std::atomic<bool> running_{false};
};
