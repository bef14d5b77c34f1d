#include "cpr_probe_client.hpp"
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>
#include <cmath>

class CprProbeClient::Impl {
public:
    explicit Impl(const Config& config)
        : user_agent_(config.user_agent),
          max_redirects_(config.max_redirects) {}

    RawResponse fetch(const ProbeTarget& target, std::chrono::milliseconds timeout) {
        RawResponse raw;

        auto response = cpr::Get(
            cpr::Url{target.url},
            cpr::Timeout{timeout},
            cpr::ConnectTimeout{timeout},
            // 0 means report the 3xx itself instead of following it
            cpr::Redirect{static_cast<long>(max_redirects_), max_redirects_ > 0, false,
                          cpr::PostRedirectFlags::POST_ALL},
            cpr::Header{{"User-Agent", user_agent_}}
        );

        raw.elapsed = std::chrono::milliseconds(
            static_cast<int64_t>(std::llround(response.elapsed * 1000.0)));

        if (response.error) {
            if (response.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
                raw.kind = RawResponse::Kind::Timeout;
                raw.error_message = "request timed out";
            } else {
                raw.kind = RawResponse::Kind::TransportError;
                raw.error_message = "request error: " + response.error.message;
            }
            spdlog::debug("GET {} failed: {}", target.url, response.error.message);
            return raw;
        }

        raw.kind = RawResponse::Kind::Response;
        raw.status_code = static_cast<int>(response.status_code);
        for (const auto& header : response.header) {
            raw.headers.emplace(header.first, header.second);
        }
        raw.body = std::move(response.text);

        spdlog::debug("GET {} -> {} in {} ms", target.url, raw.status_code, raw.elapsed.count());
        return raw;
    }

private:
    std::string user_agent_;
    int max_redirects_;
};

CprProbeClient::CprProbeClient(const Config& config)
    : pImpl_(std::make_unique<Impl>(config)) {}

CprProbeClient::~CprProbeClient() = default;

RawResponse CprProbeClient::fetch(const ProbeTarget& target, std::chrono::milliseconds timeout) {
    return pImpl_->fetch(target, timeout);
}
