#pragma once

#include "stats_aggregator.hpp"
#include "types.hpp"
#include <ostream>
#include <string>
#include <vector>

// Single-line JSON without trailing newline
std::string format_result_line(const ProbeResult& result);

// Complete summary block with trailing newline
std::string format_summary(const std::vector<StatsRecord>& records);

// Line-oriented writer used from the coordinating thread only.
class ResultWriter {
public:
    explicit ResultWriter(std::ostream& out);

    void write_result(const ProbeResult& result);
    void write_summary(const std::vector<StatsRecord>& records);

private:
    std::ostream& out_;
};
