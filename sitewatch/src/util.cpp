#include "util.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <charconv>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace util {

void setup_logging(const std::string& level) {
    // stdout is reserved for result lines
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("sitewatch", console_sink);
    spdlog::set_default_logger(logger);

    if (level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (level == "info") {
        spdlog::set_level(spdlog::level::info);
    } else if (level == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::info);
        spdlog::warn("Unknown log level '{}', using 'info'", level);
    }

    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [tid %t] %v");
}

std::string get_env_var(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_value;
}

int get_env_int(const std::string& name, int default_value) {
    const char* value = std::getenv(name.c_str());
    if (!value || *value == '\0') {
        return default_value;
    }
    return parse_int(value, name);
}

std::vector<std::string> split_string(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;

    while (std::getline(ss, token, delimiter)) {
        token = trim(token);
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }

    return tokens;
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";

    auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.length() >= prefix.length() &&
           str.compare(0, prefix.length(), prefix) == 0;
}

int parse_int(const std::string& str, const std::string& what) {
    int value = 0;
    const char* first = str.data();
    const char* last = str.data() + str.size();
    auto result = std::from_chars(first, last, value);
    if (result.ec != std::errc() || result.ptr != last) {
        throw std::runtime_error("Invalid integer for " + what + ": '" + str + "'");
    }
    return value;
}

std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    auto tt = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm{};
    gmtime_r(&tt, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return ss.str();
}

std::string current_iso8601() {
    return format_iso8601(std::chrono::system_clock::now());
}

bool is_valid_url(const std::string& url) {
    std::string rest;
    if (starts_with(url, "http://")) {
        rest = url.substr(7);
    } else if (starts_with(url, "https://")) {
        rest = url.substr(8);
    } else {
        return false;
    }

    if (rest.empty() || rest.front() == '/') {
        return false;
    }
    return rest.find_first_of(" \t\r\n") == std::string::npos;
}

} // namespace util
