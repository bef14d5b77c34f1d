#include "stats_aggregator.hpp"

double StatsRecord::uptime_percent() const {
    if (checks == 0) return 0.0;
    return static_cast<double>(successes) * 100.0 / static_cast<double>(checks);
}

double StatsRecord::avg_response_time_ms() const {
    if (checks == 0) return 0.0;
    return static_cast<double>(total_response_time_ms) / static_cast<double>(checks);
}

nlohmann::json StatsRecord::to_json() const {
    return {
        {"url", url},
        {"checks", checks},
        {"successes", successes},
        {"uptime_percent", uptime_percent()},
        {"avg_response_time_ms", avg_response_time_ms()}
    };
}

void StatsAggregator::update(const ProbeResult& result) {
    auto it = index_.find(result.target.url);
    if (it == index_.end()) {
        it = index_.emplace(result.target.url, records_.size()).first;
        StatsRecord record;
        record.url = result.target.url;
        records_.push_back(std::move(record));
    }

    auto& record = records_[it->second];
    record.checks++;
    if (result.outcome.is_success()) {
        record.successes++;
    }
    record.total_response_time_ms += result.response_time_ms;
}

std::vector<StatsRecord> StatsAggregator::snapshot() const {
    return records_;
}
