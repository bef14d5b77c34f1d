#pragma once
#include "config.hpp"

void print_usage(const char* prog);

// Applies command-line flags on top of `config` (normally Config::from_env()).
// Returns false when help was requested. Throws std::runtime_error on
// unknown flags or missing/invalid values.
bool parse_args(int argc, char** argv, Config& config);
