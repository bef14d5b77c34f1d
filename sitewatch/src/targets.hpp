#pragma once

#include "config.hpp"
#include "types.hpp"
#include <istream>
#include <string>
#include <vector>

// "Name: Value" -> {Name, Value}, both trimmed. Throws std::runtime_error
// when there is no ':' or the name is empty.
RequiredHeader parse_header(const std::string& spec);

// One URL per line; blank lines and lines starting with '#' are skipped.
std::vector<std::string> read_urls(std::istream& in);
std::vector<std::string> read_urls_from_file(const std::string& path);

// Builds the immutable target list: URLs from the file first, then the
// ones given directly, each carrying the configured validations.
// Throws std::runtime_error on a malformed URL or header.
std::vector<ProbeTarget> load_targets(const Config& config);
