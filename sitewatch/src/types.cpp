#include "types.hpp"
#include "util.hpp"
#include <utility>

ProbeOutcome ProbeOutcome::success(int status_code) {
    ProbeOutcome outcome;
    outcome.kind = OutcomeKind::Success;
    outcome.status_code = status_code;
    return outcome;
}

ProbeOutcome ProbeOutcome::validation_failure(ValidationReason reason, std::string message) {
    ProbeOutcome outcome;
    outcome.kind = OutcomeKind::ValidationFailure;
    outcome.reason = reason;
    outcome.message = std::move(message);
    return outcome;
}

ProbeOutcome ProbeOutcome::transport_error(std::string message) {
    ProbeOutcome outcome;
    outcome.kind = OutcomeKind::TransportError;
    outcome.message = std::move(message);
    return outcome;
}

ProbeOutcome ProbeOutcome::timeout() {
    ProbeOutcome outcome;
    outcome.kind = OutcomeKind::Timeout;
    outcome.message = "request timed out";
    return outcome;
}

// Jobs drained after shutdown was requested are reported as transport errors.
ProbeOutcome ProbeOutcome::cancelled() {
    return transport_error("cancelled");
}

const char* outcome_kind_str(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::Success: return "success";
        case OutcomeKind::ValidationFailure: return "validation_failure";
        case OutcomeKind::TransportError: return "transport_error";
        case OutcomeKind::Timeout: return "timeout";
    }
    return "unknown";
}

const char* validation_reason_str(ValidationReason reason) {
    switch (reason) {
        case ValidationReason::None: return "none";
        case ValidationReason::HeaderMismatch: return "header_mismatch";
        case ValidationReason::BodyMismatch: return "body_mismatch";
    }
    return "unknown";
}

nlohmann::json ProbeResult::to_json() const {
    nlohmann::json j = {
        {"url", target.url},
        {"round", round_id},
        {"outcome", outcome_kind_str(outcome.kind)},
        {"status", nullptr},
        {"error", nullptr},
        {"attempts", attempts},
        {"response_time_ms", response_time_ms},
        {"timestamp", util::format_iso8601(timestamp)}
    };

    if (outcome.is_success()) {
        j["status"] = outcome.status_code;
    } else {
        j["error"] = outcome.message;
    }

    if (outcome.kind == OutcomeKind::ValidationFailure) {
        j["validation"] = validation_reason_str(outcome.reason);
    }

    return j;
}
