#include "targets.hpp"
#include "util.hpp"
#include <fstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

RequiredHeader parse_header(const std::string& spec) {
    auto colon = spec.find(':');
    if (colon == std::string::npos) {
        throw std::runtime_error("Invalid header '" + spec + "', expected 'Name: Value'");
    }

    RequiredHeader header;
    header.name = util::trim(spec.substr(0, colon));
    header.value = util::trim(spec.substr(colon + 1));
    if (header.name.empty()) {
        throw std::runtime_error("Invalid header '" + spec + "', name is empty");
    }
    return header;
}

std::vector<std::string> read_urls(std::istream& in) {
    std::vector<std::string> urls;
    std::string line;
    while (std::getline(in, line)) {
        line = util::trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        urls.push_back(line);
    }
    return urls;
}

std::vector<std::string> read_urls_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open URL file: " + path);
    }
    return read_urls(file);
}

std::vector<ProbeTarget> load_targets(const Config& config) {
    std::vector<std::string> urls;
    if (!config.url_file.empty()) {
        urls = read_urls_from_file(config.url_file);
        spdlog::info("Loaded {} URL(s) from {}", urls.size(), config.url_file);
    }
    urls.insert(urls.end(), config.urls.begin(), config.urls.end());

    std::vector<RequiredHeader> headers;
    for (const auto& spec : config.required_headers) {
        headers.push_back(parse_header(spec));
    }

    std::vector<ProbeTarget> targets;
    targets.reserve(urls.size());
    for (const auto& url : urls) {
        if (!util::is_valid_url(url)) {
            throw std::runtime_error("Invalid URL '" + url + "', expected http:// or https://");
        }

        ProbeTarget target;
        target.url = url;
        target.required_headers = headers;
        target.required_body_substring = config.required_body_substring;
        targets.push_back(std::move(target));
    }

    if (targets.empty()) {
        throw std::runtime_error("No URLs provided. Provide positional URLs or -f <file>.");
    }
    return targets;
}
