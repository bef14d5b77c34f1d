#include "retrying_probe.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <thread>

RetryPolicy RetryPolicy::from_config(const Config& config) {
    RetryPolicy policy;
    policy.timeout_per_attempt = config.timeout();
    policy.max_retries = config.max_retries;
    policy.retry_delay = std::chrono::milliseconds(config.retry_delay_ms);
    policy.header_value_match = config.header_value_match;
    return policy;
}

RetryingProbe::RetryingProbe(ProbeClient& client, RetryPolicy policy, const CancellationToken* cancel)
    : client_(client), policy_(policy), cancel_(cancel) {}

ProbeResult RetryingProbe::probe(const ProbeTarget& target) const {
    return probe(target, policy_.timeout_per_attempt, policy_.max_retries);
}

ProbeResult RetryingProbe::probe(const ProbeTarget& target,
                                 std::chrono::milliseconds timeout_per_attempt,
                                 int max_retries) const {
    const int max_attempts = std::max(max_retries, 0) + 1;

    ProbeResult result;
    result.target = target;

    for (int attempt = 1; ; ++attempt) {
        RawResponse raw = client_.fetch(target, timeout_per_attempt);

        result.outcome = classify(target, raw, timeout_per_attempt);
        result.attempts = attempt;
        result.response_time_ms = std::max<int64_t>(raw.elapsed.count(), 0);

        if (!result.outcome.is_retryable() || attempt >= max_attempts) {
            break;
        }

        spdlog::debug("{} attempt {}/{} failed ({}), retrying",
                      target.url, attempt, max_attempts, result.outcome.message);

        if (cancel_ && cancel_->is_cancelled()) {
            break;
        }
        if (policy_.retry_delay.count() > 0) {
            auto delay = policy_.retry_delay * attempt;
            if (!cancel_) {
                std::this_thread::sleep_for(delay);
            } else if (cancel_->wait_for(delay)) {
                break;
            }
        }
    }

    result.timestamp = std::chrono::system_clock::now();
    return result;
}

ProbeOutcome RetryingProbe::classify(const ProbeTarget& target,
                                     const RawResponse& raw,
                                     std::chrono::milliseconds timeout) const {
    switch (raw.kind) {
        case RawResponse::Kind::Timeout:
            return ProbeOutcome::timeout();
        case RawResponse::Kind::TransportError:
            return ProbeOutcome::transport_error(
                raw.error_message.empty() ? "request error" : raw.error_message);
        case RawResponse::Kind::Response:
            break;
    }

    // A response that arrived after the deadline still counts as a timeout.
    if (raw.elapsed > timeout) {
        return ProbeOutcome::timeout();
    }

    for (const auto& required : target.required_headers) {
        if (!header_matches(raw, required)) {
            auto it = raw.headers.find(required.name);
            if (it == raw.headers.end()) {
                return ProbeOutcome::validation_failure(
                    ValidationReason::HeaderMismatch,
                    "missing required header: " + required.name);
            }
            return ProbeOutcome::validation_failure(
                ValidationReason::HeaderMismatch,
                "header mismatch: " + required.name + " expected '" + required.value +
                "' got '" + it->second + "'");
        }
    }

    if (target.required_body_substring &&
        raw.body.find(*target.required_body_substring) == std::string::npos) {
        return ProbeOutcome::validation_failure(
            ValidationReason::BodyMismatch,
            "body validation failed: missing substring '" + *target.required_body_substring + "'");
    }

    return ProbeOutcome::success(raw.status_code);
}

bool RetryingProbe::header_matches(const RawResponse& raw, const RequiredHeader& required) const {
    // Header names are compared case-sensitively.
    auto it = raw.headers.find(required.name);
    if (it == raw.headers.end()) {
        return false;
    }

    if (policy_.header_value_match == HeaderValueMatch::Contains) {
        return it->second.find(required.value) != std::string::npos;
    }
    return it->second == required.value;
}
