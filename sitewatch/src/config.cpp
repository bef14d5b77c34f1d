#include "config.hpp"
#include "util.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

std::chrono::milliseconds Config::timeout() const {
    return std::chrono::seconds(timeout_seconds);
}

std::optional<std::chrono::milliseconds> Config::period() const {
    if (!period_seconds) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(std::chrono::seconds(*period_seconds));
}

Config Config::from_env() {
    Config config;

    // Service
    config.service_name = util::get_env_var("SERVICE_NAME", config.service_name);
    config.log_level = util::get_env_var("LOG_LEVEL", config.log_level);

    // Engine
    config.worker_threads = util::get_env_int("SITEWATCH_THREADS", config.worker_threads);
    config.timeout_seconds = util::get_env_int("SITEWATCH_TIMEOUT_SECONDS", config.timeout_seconds);
    config.max_retries = util::get_env_int("SITEWATCH_RETRIES", config.max_retries);
    config.retry_delay_ms = util::get_env_int("SITEWATCH_RETRY_DELAY_MS", config.retry_delay_ms);

    std::string period = util::get_env_var("SITEWATCH_PERIOD_SECONDS");
    if (!period.empty()) {
        config.period_seconds = util::parse_int(period, "SITEWATCH_PERIOD_SECONDS");
    }

    // Targets
    config.urls = util::split_string(util::get_env_var("SITEWATCH_URLS"), ',');
    config.url_file = util::get_env_var("SITEWATCH_URL_FILE");

    std::string contains = util::get_env_var("SITEWATCH_CONTAINS");
    if (!contains.empty()) {
        config.required_body_substring = contains;
    }

    std::string header_match = util::get_env_var("SITEWATCH_HEADER_MATCH");
    if (!header_match.empty()) {
        config.header_value_match = parse_header_value_match(header_match);
    }

    // HTTP client
    config.user_agent = util::get_env_var("SITEWATCH_USER_AGENT", config.user_agent);
    config.max_redirects = util::get_env_int("SITEWATCH_MAX_REDIRECTS", config.max_redirects);

    // Status endpoint
    config.status_host = util::get_env_var("STATUS_HOST", config.status_host);
    config.status_port = util::get_env_int("STATUS_PORT", config.status_port);

    return config;
}

void Config::validate() const {
    if (worker_threads < 1 || worker_threads > 1000) {
        throw std::runtime_error("Worker threads must be between 1 and 1000");
    }

    if (timeout_seconds < 1) {
        throw std::runtime_error("Timeout must be at least 1 second");
    }

    if (max_retries < 0 || max_retries > 10) {
        throw std::runtime_error("Max retries must be between 0 and 10");
    }

    if (period_seconds && *period_seconds < 1) {
        throw std::runtime_error("Period must be at least 1 second");
    }

    if (retry_delay_ms < 0) {
        throw std::runtime_error("Retry delay must not be negative");
    }

    if (max_redirects < 0) {
        throw std::runtime_error("Max redirects must not be negative");
    }

    if (status_port < 0 || status_port > 65535) {
        throw std::runtime_error("Status port must be between 0 and 65535");
    }

    if (urls.empty() && url_file.empty()) {
        throw std::runtime_error("No URLs provided. Provide positional URLs or -f <file>.");
    }

    spdlog::debug("Configuration validated successfully");
}

HeaderValueMatch parse_header_value_match(const std::string& value) {
    if (value == "exact") {
        return HeaderValueMatch::Exact;
    }
    if (value == "contains") {
        return HeaderValueMatch::Contains;
    }
    throw std::runtime_error("Unknown header match mode '" + value + "' (expected exact|contains)");
}
