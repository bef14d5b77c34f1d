#include "cli.hpp"
#include "util.hpp"
#include <fmt/core.h>
#include <stdexcept>
#include <string>
#include <vector>

void print_usage(const char* prog) {
    fmt::print("Concurrent website status checker\n");
    fmt::print("Usage: {} [options] [URL...]\n", prog);
    fmt::print("Options:\n");
    fmt::print("  -n, --threads NUM        Number of worker threads (default: 50)\n");
    fmt::print("  -t, --timeout SECS       Per-attempt request timeout (default: 5)\n");
    fmt::print("  -r, --retries NUM        Max retries per website (default: 1)\n");
    fmt::print("  -p, --period SECS        Repeat every SECS (default: run once)\n");
    fmt::print("  -f, --file PATH          File with one URL per line\n");
    fmt::print("  -H, --header 'N: V'      Require response header to match value (repeatable).\n");
    fmt::print("                           Names are case-sensitive; HTTP/2 servers send them\n");
    fmt::print("                           in lowercase, e.g. -H 'server: nginx'\n");
    fmt::print("      --contains TEXT      Require response body to contain TEXT\n");
    fmt::print("      --header-match MODE  exact|contains for header values (default: exact)\n");
    fmt::print("      --retry-delay MS     Linear pause before each retry (default: 0)\n");
    fmt::print("      --status-port PORT   Serve /health and /stats on PORT (default: off)\n");
    fmt::print("      --log-level LEVEL    debug|info|warn|error (default: info)\n");
    fmt::print("  -h, --help               Show this help\n");
    fmt::print("\nExamples:\n");
    fmt::print("  {} https://example.com https://isocpp.org\n", prog);
    fmt::print("  {} -f urls.txt -n 80 -t 3 -r 2\n", prog);
    fmt::print("  {} -p 60 -H 'Server: nginx' --contains 'Welcome' https://example.com\n", prog);
}

bool parse_args(int argc, char** argv, Config& config) {
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw std::runtime_error("Missing value for " + flag);
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return false;
        } else if (arg == "-n" || arg == "--threads") {
            config.worker_threads = util::parse_int(value(arg), arg);
        } else if (arg == "-t" || arg == "--timeout") {
            config.timeout_seconds = util::parse_int(value(arg), arg);
        } else if (arg == "-r" || arg == "--retries") {
            config.max_retries = util::parse_int(value(arg), arg);
        } else if (arg == "-p" || arg == "--period") {
            config.period_seconds = util::parse_int(value(arg), arg);
        } else if (arg == "-f" || arg == "--file") {
            config.url_file = value(arg);
        } else if (arg == "-H" || arg == "--header") {
            config.required_headers.push_back(value(arg));
        } else if (arg == "--contains") {
            config.required_body_substring = value(arg);
        } else if (arg == "--header-match") {
            config.header_value_match = parse_header_value_match(value(arg));
        } else if (arg == "--retry-delay") {
            config.retry_delay_ms = util::parse_int(value(arg), arg);
        } else if (arg == "--status-port") {
            config.status_port = util::parse_int(value(arg), arg);
        } else if (arg == "--log-level") {
            config.log_level = value(arg);
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw std::runtime_error("Unknown option: " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    // Positional URLs replace any list taken from the environment.
    if (!positional.empty()) {
        config.urls = positional;
    }
    return true;
}
