#pragma once
#include <string>
#include <vector>
#include <chrono>

namespace util {

// Logging
void setup_logging(const std::string& level);

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");
int get_env_int(const std::string& name, int default_value);

// String utilities
std::vector<std::string> split_string(const std::string& str, char delimiter);
std::string trim(const std::string& str);
bool starts_with(const std::string& str, const std::string& prefix);
int parse_int(const std::string& str, const std::string& what);

// Time utilities
std::string format_iso8601(const std::chrono::system_clock::time_point& tp);
std::string current_iso8601();

// Validation utilities
bool is_valid_url(const std::string& url);

} // namespace util
