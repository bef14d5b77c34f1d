#pragma once
#include <string>
#include <vector>
#include <optional>
#include <chrono>

enum class HeaderValueMatch {
    Exact,
    Contains
};

class Config {
public:
    // Service info
    std::string service_name = "sitewatch";
    std::string log_level = "info";

    // Engine
    int worker_threads = 50;
    int timeout_seconds = 5;
    int max_retries = 1;
    std::optional<int> period_seconds; // unset => single round
    int retry_delay_ms = 0;

    // Targets
    std::vector<std::string> urls;
    std::string url_file;
    std::vector<std::string> required_headers; // "Name: Value"
    std::optional<std::string> required_body_substring;
    HeaderValueMatch header_value_match = HeaderValueMatch::Exact;

    // HTTP client
    std::string user_agent = "sitewatch/1.0";
    int max_redirects = 2;

    // Status endpoint (0 disables it)
    std::string status_host = "127.0.0.1";
    int status_port = 0;

    std::chrono::milliseconds timeout() const;
    std::optional<std::chrono::milliseconds> period() const;

    static Config from_env();
    void validate() const;
};

HeaderValueMatch parse_header_value_match(const std::string& value);
