#include "output.hpp"
#include <fmt/format.h>

std::string format_result_line(const ProbeResult& result) {
    // Header values echoed into error messages may carry non-UTF-8 bytes.
    return result.to_json().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string format_summary(const std::vector<StatsRecord>& records) {
    std::string text = "--- stats summary ---\n";
    for (const auto& record : records) {
        text += fmt::format("{} -> checks: {}, uptime: {:.1f}%, avg_rt_ms: {:.1f}\n",
                            record.url,
                            record.checks,
                            record.uptime_percent(),
                            record.avg_response_time_ms());
    }
    text += "---------------------\n";
    return text;
}

ResultWriter::ResultWriter(std::ostream& out) : out_(out) {}

void ResultWriter::write_result(const ProbeResult& result) {
    out_ << format_result_line(result) << '\n';
    out_.flush();
}

void ResultWriter::write_summary(const std::vector<StatsRecord>& records) {
    out_ << format_summary(records);
    out_.flush();
}
