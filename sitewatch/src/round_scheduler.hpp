#pragma once

#include "cancellation.hpp"
#include "channels.hpp"
#include "config.hpp"
#include "retrying_probe.hpp"
#include "stats_aggregator.hpp"
#include "types.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

class WorkerPool;

enum class SchedulerState {
    Idle,
    RunningRound,
    Draining,
    AwaitingNextPeriod,
    Terminated
};

const char* scheduler_state_str(SchedulerState state);

struct SchedulerOptions {
    int worker_count = 50;
    std::optional<std::chrono::milliseconds> period; // unset => single round

    static SchedulerOptions from_config(const Config& config);
};

using ResultSink = std::function<void(const ProbeResult&)>;
using RoundCallback = std::function<void(uint64_t /*round_id*/, const std::vector<StatsRecord>&)>;

// Drives rounds over the whole target set. All results of round N reach
// the aggregator and the sink before any job of round N+1 is queued.
class RoundScheduler {
public:
    RoundScheduler(SchedulerOptions options,
                   const RetryingProbe& probe,
                   StatsAggregator& stats,
                   const CancellationToken& cancel);

    void set_result_sink(ResultSink sink);
    void set_round_callback(RoundCallback callback);

    // Blocks until Terminated. Returns the number of completed rounds.
    // A worker fault is rethrown after the pool has been joined.
    uint64_t run(const std::vector<ProbeTarget>& targets);

    SchedulerState state() const { return state_; }

private:
    void run_round(uint64_t round_id,
                   const std::vector<ProbeTarget>& targets,
                   JobQueue& jobs,
                   ResultChannel& results);
    void deliver(const ProbeResult& result);
    void transition(SchedulerState next);

    SchedulerOptions options_;
    const RetryingProbe& probe_;
    StatsAggregator& stats_;
    const CancellationToken& cancel_;

    ResultSink sink_;
    RoundCallback round_callback_;

    std::atomic<SchedulerState> state_{SchedulerState::Idle};
    uint64_t next_round_id_ = 1;
};
