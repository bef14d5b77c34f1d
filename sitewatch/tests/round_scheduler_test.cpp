// ============================================================================
// ROUND SCHEDULER TEST SUITE
// ============================================================================
// - Single-shot and periodic rounds
// - Exactly one result per (target, round), rounds never overlap
// - Cooperative shutdown with in-flight and queued probes
// - Worker faults surface from run()
// ============================================================================

#include <gtest/gtest.h>
#include "fake_probe_client.hpp"
#include "output.hpp"
#include "round_scheduler.hpp"
#include <map>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;

class RoundSchedulerTest : public ::testing::Test {
protected:
    ScriptedProbeClient client;
    StatsAggregator stats;
    CancellationToken cancel;
    std::vector<ProbeResult> results;

    RetryPolicy policy() const {
        RetryPolicy p;
        p.max_retries = 0;
        p.timeout_per_attempt = 1000ms;
        return p;
    }

    SchedulerOptions options(int workers, std::optional<std::chrono::milliseconds> period = std::nullopt) const {
        SchedulerOptions o;
        o.worker_count = workers;
        o.period = period;
        return o;
    }
};

// ============================================================================
// SINGLE ROUND
// ============================================================================

TEST_F(RoundSchedulerTest, SingleRoundProbesEveryTargetOnce) {
    client.set_delay(1ms);
    RetryingProbe probe(client, policy());
    RoundScheduler scheduler(options(8), probe, stats, cancel);
    scheduler.set_result_sink([this](const ProbeResult& r) { results.push_back(r); });

    auto targets = make_targets(50);
    uint64_t rounds = scheduler.run(targets);

    EXPECT_EQ(rounds, 1u);
    EXPECT_EQ(scheduler.state(), SchedulerState::Terminated);
    ASSERT_EQ(results.size(), 50u);
    EXPECT_LE(client.max_in_flight(), 8);

    std::map<std::string, int> seen;
    for (const auto& r : results) {
        seen[r.target.url]++;
        EXPECT_EQ(r.round_id, 1u);
    }
    for (const auto& target : targets) {
        EXPECT_EQ(seen[target.url], 1) << target.url;
    }

    auto snapshot = stats.snapshot();
    ASSERT_EQ(snapshot.size(), 50u);
    for (const auto& record : snapshot) {
        EXPECT_EQ(record.checks, 1u);
        EXPECT_EQ(record.successes, 1u);
    }
}

TEST_F(RoundSchedulerTest, EmptyTargetListFinishesImmediately) {
    RetryingProbe probe(client, policy());
    RoundScheduler scheduler(options(4), probe, stats, cancel);

    EXPECT_EQ(scheduler.run({}), 0u);
    EXPECT_EQ(scheduler.state(), SchedulerState::Terminated);
    EXPECT_EQ(client.total_calls(), 0);
}

TEST_F(RoundSchedulerTest, RoundCallbackSeesCompleteSnapshot) {
    RetryingProbe probe(client, policy());
    RoundScheduler scheduler(options(3), probe, stats, cancel);

    std::vector<uint64_t> round_ids;
    size_t snapshot_size = 0;
    scheduler.set_round_callback([&](uint64_t round_id, const std::vector<StatsRecord>& snapshot) {
        round_ids.push_back(round_id);
        snapshot_size = snapshot.size();
    });

    scheduler.run(make_targets(7));

    ASSERT_EQ(round_ids.size(), 1u);
    EXPECT_EQ(round_ids[0], 1u);
    EXPECT_EQ(snapshot_size, 7u);
}

TEST_F(RoundSchedulerTest, CancelledBeforeStartRunsNoRound) {
    RetryingProbe probe(client, policy());
    RoundScheduler scheduler(options(4), probe, stats, cancel);

    cancel.cancel();
    EXPECT_EQ(scheduler.run(make_targets(5)), 0u);
    EXPECT_EQ(client.total_calls(), 0);
    EXPECT_EQ(scheduler.state(), SchedulerState::Terminated);
}

// ============================================================================
// PERIODIC ROUNDS
// ============================================================================

TEST_F(RoundSchedulerTest, PeriodicRoundsNeverOverlap) {
    RetryingProbe probe(client, policy());
    RoundScheduler scheduler(options(4, 20ms), probe, stats, cancel);
    auto targets = make_targets(10);

    std::vector<int> calls_at_round_end;
    scheduler.set_result_sink([this](const ProbeResult& r) { results.push_back(r); });
    scheduler.set_round_callback([&](uint64_t round_id, const std::vector<StatsRecord>& snapshot) {
        calls_at_round_end.push_back(client.total_calls());
        for (const auto& record : snapshot) {
            EXPECT_EQ(record.checks, round_id);
        }
        if (round_id == 3) {
            cancel.cancel();
        }
    });

    uint64_t rounds = scheduler.run(targets);

    EXPECT_EQ(rounds, 3u);
    ASSERT_EQ(calls_at_round_end.size(), 3u);
    EXPECT_EQ(calls_at_round_end[0], 10);
    EXPECT_EQ(calls_at_round_end[1], 20);
    EXPECT_EQ(calls_at_round_end[2], 30);

    ASSERT_EQ(results.size(), 30u);
    for (size_t i = 0; i < results.size(); ++i) {
        EXPECT_EQ(results[i].round_id, i / 10 + 1);
    }
}

TEST_F(RoundSchedulerTest, NextRoundWaitsForThePeriod) {
    RetryingProbe probe(client, policy());
    RoundScheduler scheduler(options(2, 100ms), probe, stats, cancel);

    std::vector<std::chrono::steady_clock::time_point> round_ends;
    scheduler.set_round_callback([&](uint64_t round_id, const std::vector<StatsRecord>&) {
        round_ends.push_back(std::chrono::steady_clock::now());
        if (round_id == 2) {
            cancel.cancel();
        }
    });

    scheduler.run(make_targets(2));

    ASSERT_EQ(round_ends.size(), 2u);
    EXPECT_GE(round_ends[1] - round_ends[0], 50ms);
}

TEST_F(RoundSchedulerTest, OverrunningRoundStartsNextImmediately) {
    client.set_delay(30ms);
    RetryingProbe probe(client, policy());
    RoundScheduler scheduler(options(1, 10ms), probe, stats, cancel);

    std::vector<std::chrono::steady_clock::time_point> round_ends;
    scheduler.set_round_callback([&](uint64_t round_id, const std::vector<StatsRecord>&) {
        round_ends.push_back(std::chrono::steady_clock::now());
        if (round_id == 2) {
            cancel.cancel();
        }
    });

    EXPECT_EQ(scheduler.run(make_targets(2)), 2u);
    ASSERT_EQ(round_ends.size(), 2u);
    EXPECT_LT(round_ends[1] - round_ends[0], 1s);
}

TEST_F(RoundSchedulerTest, CancelDuringWaitEndsPromptly) {
    RetryingProbe probe(client, policy());
    RoundScheduler scheduler(options(2, 10s), probe, stats, cancel);

    std::thread canceller([this] {
        std::this_thread::sleep_for(100ms);
        cancel.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    uint64_t rounds = scheduler.run(make_targets(3));
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    EXPECT_EQ(rounds, 1u);
    EXPECT_LT(elapsed, 2s);
}

// ============================================================================
// SHUTDOWN AND FAULTS
// ============================================================================

TEST_F(RoundSchedulerTest, ShutdownReportsQueuedProbesAsCancelled) {
    GatedProbeClient gated;
    RetryingProbe probe(gated, policy());
    RoundScheduler scheduler(options(10), probe, stats, cancel);
    scheduler.set_result_sink([this](const ProbeResult& r) { results.push_back(r); });

    std::thread controller([&] {
        auto deadline = std::chrono::steady_clock::now() + 5s;
        while (gated.in_flight() < 10 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(1ms);
        }
        cancel.cancel();
        // Give the coordinator time to drain the queue before releasing workers.
        std::this_thread::sleep_for(150ms);
        gated.open();
    });

    uint64_t rounds = scheduler.run(make_targets(20));
    controller.join();

    EXPECT_EQ(rounds, 1u);
    EXPECT_EQ(gated.total_calls(), 10);
    ASSERT_EQ(results.size(), 20u);

    int cancelled = 0;
    int succeeded = 0;
    std::map<std::string, int> seen;
    for (const auto& r : results) {
        seen[r.target.url]++;
        if (r.outcome.kind == OutcomeKind::TransportError && r.outcome.message == "cancelled") {
            ++cancelled;
            EXPECT_EQ(r.attempts, 1);
        } else if (r.outcome.kind == OutcomeKind::Success) {
            ++succeeded;
        }
    }
    EXPECT_EQ(cancelled, 10);
    EXPECT_EQ(succeeded, 10);
    EXPECT_EQ(seen.size(), 20u);
    EXPECT_EQ(scheduler.state(), SchedulerState::Terminated);
}

TEST_F(RoundSchedulerTest, NonUtf8HeaderValueDoesNotStopTheRound) {
    auto targets = make_targets(3);
    targets[0].required_headers.push_back({"Server", "nginx"});
    client.set_script(targets[0].url, {http_response(200, {{"Server", "caf\xe9"}})});

    RetryingProbe probe(client, policy());
    RoundScheduler scheduler(options(2), probe, stats, cancel);

    std::vector<std::string> lines;
    scheduler.set_result_sink([&lines](const ProbeResult& r) {
        lines.push_back(format_result_line(r));
    });

    uint64_t rounds = 0;
    ASSERT_NO_THROW(rounds = scheduler.run(targets));
    EXPECT_EQ(rounds, 1u);
    ASSERT_EQ(lines.size(), 3u);

    int mismatches = 0;
    for (const auto& line : lines) {
        auto j = nlohmann::json::parse(line);
        if (j["url"] == targets[0].url) {
            EXPECT_EQ(j["outcome"], "validation_failure");
            ++mismatches;
        } else {
            EXPECT_EQ(j["outcome"], "success");
        }
    }
    EXPECT_EQ(mismatches, 1);
}

TEST_F(RoundSchedulerTest, WorkerFaultIsRethrownFromRun) {
    auto targets = make_targets(5);
    client.throw_on(targets[2].url);
    RetryingProbe probe(client, policy());
    RoundScheduler scheduler(options(2), probe, stats, cancel);

    EXPECT_THROW(scheduler.run(targets), std::logic_error);
    EXPECT_EQ(scheduler.state(), SchedulerState::Terminated);
}

TEST(SchedulerOptionsTest, TakenFromConfig) {
    Config config;
    config.worker_threads = 12;
    auto single = SchedulerOptions::from_config(config);
    EXPECT_EQ(single.worker_count, 12);
    EXPECT_FALSE(single.period.has_value());

    config.period_seconds = 30;
    auto periodic = SchedulerOptions::from_config(config);
    ASSERT_TRUE(periodic.period.has_value());
    EXPECT_EQ(*periodic.period, 30s);
}
