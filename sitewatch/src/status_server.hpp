#pragma once
#include "config.hpp"
#include "stats_aggregator.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Serves GET /health and GET /stats. The scheduler publishes a copy of the
// latest snapshot after each round; the aggregator itself is never shared.
class StatusServer {
public:
    StatusServer(const std::string& host, int port, const std::string& service_name);
    explicit StatusServer(const Config& config);
    ~StatusServer();

    // Binds synchronously (port 0 picks a free port) and serves on a
    // background thread. Throws std::runtime_error if the bind fails.
    void start();
    void stop();
    bool is_running() const;
    int port() const;

    void publish(uint64_t round_id, const std::vector<StatsRecord>& snapshot);

    // Non-copyable
    StatusServer(const StatusServer&) = delete;
    StatusServer& operator=(const StatusServer&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
