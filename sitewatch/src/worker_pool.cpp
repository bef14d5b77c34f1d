#include "worker_pool.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>

WorkerPool::WorkerPool(int worker_count,
                       const RetryingProbe& probe,
                       JobQueue& jobs,
                       ResultChannel& results,
                       const CancellationToken& cancel)
    : worker_count_(std::max(worker_count, 1)),
      probe_(probe),
      jobs_(jobs),
      results_(results),
      cancel_(cancel) {}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::start() {
    if (running_.exchange(true)) {
        spdlog::warn("Worker pool already running");
        return;
    }

    workers_.reserve(worker_count_);
    for (int i = 0; i < worker_count_; ++i) {
        workers_.emplace_back(&WorkerPool::worker_loop, this, i);
    }
    spdlog::debug("Started {} workers", worker_count_);
}

void WorkerPool::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    jobs_.close();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    spdlog::debug("Worker pool stopped");
}

bool WorkerPool::is_running() const {
    return running_;
}

void WorkerPool::worker_loop(int index) {
    while (auto job = jobs_.pop(cancel_)) {
        try {
            ProbeResult result = probe_.probe(job->target);
            result.round_id = job->round_id;
            results_.publish(std::move(result));
        } catch (const std::exception& e) {
            spdlog::critical("Worker {} failed probing {}: {}", index, job->target.url, e.what());
            results_.fail(std::current_exception());
            return;
        } catch (...) {
            spdlog::critical("Worker {} failed probing {}: unknown error", index, job->target.url);
            results_.fail(std::current_exception());
            return;
        }
    }
    spdlog::debug("Worker {} exiting", index);
}
