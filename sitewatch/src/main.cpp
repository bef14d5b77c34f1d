#include "cli.hpp"
#include "config.hpp"
#include "cpr_probe_client.hpp"
#include "output.hpp"
#include "retrying_probe.hpp"
#include "round_scheduler.hpp"
#include "stats_aggregator.hpp"
#include "status_server.hpp"
#include "targets.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <csignal>
#include <iostream>
#include <memory>

// Raised from the signal handler; cancel() is a lock-free store.
CancellationToken shutdown_token;

void signal_handler(int) {
    shutdown_token.cancel();
}

int main(int argc, char** argv) {
    try {
        // 1. Load configuration
        Config config = Config::from_env();
        if (!parse_args(argc, argv, config)) {
            return 0;
        }

        // 2. Setup logging
        util::setup_logging(config.log_level);

        config.validate();
        auto targets = load_targets(config);
        spdlog::info("Starting {}: {} target(s), {} worker(s), timeout {}s, retries {}{}",
                     config.service_name, targets.size(), config.worker_threads,
                     config.timeout_seconds, config.max_retries,
                     config.period_seconds ? ", period " + std::to_string(*config.period_seconds) + "s" : "");

        // 3. Register signal handlers for graceful shutdown
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        // 4. Wire the engine
        CprProbeClient client(config);
        RetryingProbe probe(client, RetryPolicy::from_config(config), &shutdown_token);
        StatsAggregator stats;
        RoundScheduler scheduler(SchedulerOptions::from_config(config), probe, stats, shutdown_token);
        ResultWriter writer(std::cout);

        std::unique_ptr<StatusServer> status_server;
        if (config.status_port > 0) {
            status_server = std::make_unique<StatusServer>(config);
            status_server->start();
        }

        scheduler.set_result_sink([&writer](const ProbeResult& result) {
            writer.write_result(result);
        });
        scheduler.set_round_callback([&](uint64_t round_id, const std::vector<StatsRecord>& snapshot) {
            writer.write_summary(snapshot);
            if (status_server) {
                status_server->publish(round_id, snapshot);
            }
        });

        // 5. Run until single round is done, or until interrupted
        scheduler.run(targets);

        if (shutdown_token.is_cancelled()) {
            spdlog::info("Shutdown requested, stopped cleanly");
        }
        if (status_server) {
            status_server->stop();
        }

    } catch (const std::exception& e) {
        spdlog::critical("A critical error occurred: {}", e.what());
        return 1;
    }

    spdlog::info("Shutdown complete.");
    return 0;
}
