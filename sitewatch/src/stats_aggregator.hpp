#pragma once

#include "types.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

struct StatsRecord {
    std::string url;
    uint64_t checks = 0;
    uint64_t successes = 0;
    int64_t total_response_time_ms = 0;

    // Both are 0 while checks == 0.
    double uptime_percent() const;
    double avg_response_time_ms() const;

    nlohmann::json to_json() const;
};

// Cumulative per-URL counters across every round of the process. Only the
// coordinating thread touches it, so it carries no locks.
class StatsAggregator {
public:
    void update(const ProbeResult& result);

    // Records in the order URLs were first seen.
    std::vector<StatsRecord> snapshot() const;

    size_t url_count() const { return records_.size(); }

private:
    std::vector<StatsRecord> records_;
    std::unordered_map<std::string, size_t> index_;
};
