#include "round_scheduler.hpp"
#include "worker_pool.hpp"
#include <spdlog/spdlog.h>
#include <utility>

const char* scheduler_state_str(SchedulerState state) {
    switch (state) {
        case SchedulerState::Idle: return "idle";
        case SchedulerState::RunningRound: return "running_round";
        case SchedulerState::Draining: return "draining";
        case SchedulerState::AwaitingNextPeriod: return "awaiting_next_period";
        case SchedulerState::Terminated: return "terminated";
    }
    return "unknown";
}

SchedulerOptions SchedulerOptions::from_config(const Config& config) {
    SchedulerOptions options;
    options.worker_count = config.worker_threads;
    options.period = config.period();
    return options;
}

RoundScheduler::RoundScheduler(SchedulerOptions options,
                               const RetryingProbe& probe,
                               StatsAggregator& stats,
                               const CancellationToken& cancel)
    : options_(std::move(options)),
      probe_(probe),
      stats_(stats),
      cancel_(cancel) {}

void RoundScheduler::set_result_sink(ResultSink sink) {
    sink_ = std::move(sink);
}

void RoundScheduler::set_round_callback(RoundCallback callback) {
    round_callback_ = std::move(callback);
}

uint64_t RoundScheduler::run(const std::vector<ProbeTarget>& targets) {
    transition(SchedulerState::Idle);

    if (targets.empty()) {
        spdlog::warn("No targets to probe");
        transition(SchedulerState::Terminated);
        return 0;
    }

    JobQueue jobs;
    ResultChannel results;
    WorkerPool pool(options_.worker_count, probe_, jobs, results, cancel_);
    uint64_t completed = 0;

    try {
        while (!cancel_.is_cancelled()) {
            auto round_start = std::chrono::steady_clock::now();
            uint64_t round_id = next_round_id_++;

            transition(SchedulerState::RunningRound);
            if (!pool.is_running()) {
                pool.start();
            }
            run_round(round_id, targets, jobs, results);

            transition(SchedulerState::Draining);
            ++completed;
            if (round_callback_) {
                round_callback_(round_id, stats_.snapshot());
            }

            if (!options_.period) {
                break;
            }

            transition(SchedulerState::AwaitingNextPeriod);
            auto next_start = round_start + *options_.period;
            if (std::chrono::steady_clock::now() >= next_start) {
                spdlog::warn("Round {} overran the period, starting next round immediately", round_id);
                continue;
            }
            if (cancel_.wait_until(next_start)) {
                break;
            }
        }
    } catch (...) {
        // Leave nothing for the remaining workers, then join them.
        jobs.drain();
        pool.stop();
        transition(SchedulerState::Terminated);
        throw;
    }

    pool.stop();
    transition(SchedulerState::Terminated);
    spdlog::info("Scheduler terminated after {} round(s)", completed);
    return completed;
}

void RoundScheduler::run_round(uint64_t round_id,
                               const std::vector<ProbeTarget>& targets,
                               JobQueue& jobs,
                               ResultChannel& results) {
    auto started = std::chrono::steady_clock::now();

    std::vector<Job> batch;
    batch.reserve(targets.size());
    for (const auto& target : targets) {
        batch.push_back(Job{target, round_id});
    }
    const size_t expected = batch.size();
    jobs.push_all(std::move(batch));
    spdlog::debug("Round {} dispatched {} jobs, {} queued", round_id, expected, jobs.size());

    size_t received = 0;
    bool drained = false;
    while (received < expected) {
        if (!drained && cancel_.is_cancelled()) {
            drained = true;
            auto leftover = jobs.drain();
            if (!leftover.empty()) {
                spdlog::info("Shutdown requested, cancelling {} queued probe(s) of round {}",
                             leftover.size(), round_id);
            }
            for (const auto& job : leftover) {
                ProbeResult result;
                result.target = job.target;
                result.outcome = ProbeOutcome::cancelled();
                result.attempts = 1;
                result.response_time_ms = 0;
                result.timestamp = std::chrono::system_clock::now();
                result.round_id = job.round_id;
                deliver(result);
                ++received;
            }
            continue;
        }

        auto result = results.receive_for(CancellationToken::kPollInterval);
        if (!result) {
            continue;
        }
        deliver(*result);
        ++received;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    spdlog::info("Round {} completed: {} result(s) in {} ms, {} URL(s) tracked",
                 round_id, received, elapsed, stats_.url_count());
}

void RoundScheduler::deliver(const ProbeResult& result) {
    stats_.update(result);
    if (sink_) {
        sink_(result);
    }
}

void RoundScheduler::transition(SchedulerState next) {
    SchedulerState previous = state_.exchange(next);
    if (previous != next) {
        spdlog::debug("Scheduler {} -> {}", scheduler_state_str(previous), scheduler_state_str(next));
    }
}
