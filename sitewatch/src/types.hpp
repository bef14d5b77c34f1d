#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

struct RequiredHeader {
    std::string name;
    std::string value;
};

// Loaded once at startup, never mutated afterwards.
struct ProbeTarget {
    std::string url;
    std::vector<RequiredHeader> required_headers;
    std::optional<std::string> required_body_substring;
};

enum class OutcomeKind {
    Success,
    ValidationFailure,
    TransportError,
    Timeout
};

enum class ValidationReason {
    None,
    HeaderMismatch,
    BodyMismatch
};

struct ProbeOutcome {
    OutcomeKind kind = OutcomeKind::TransportError;
    int status_code = 0;                              // Success only
    ValidationReason reason = ValidationReason::None; // ValidationFailure only
    std::string message;                              // empty for Success

    static ProbeOutcome success(int status_code);
    static ProbeOutcome validation_failure(ValidationReason reason, std::string message);
    static ProbeOutcome transport_error(std::string message);
    static ProbeOutcome timeout();
    static ProbeOutcome cancelled();

    bool is_success() const { return kind == OutcomeKind::Success; }
    bool is_retryable() const {
        return kind == OutcomeKind::TransportError || kind == OutcomeKind::Timeout;
    }
};

struct ProbeResult {
    ProbeTarget target;
    ProbeOutcome outcome;
    int attempts = 1;
    int64_t response_time_ms = 0;
    std::chrono::system_clock::time_point timestamp;
    uint64_t round_id = 0;

    nlohmann::json to_json() const;
};

struct Job {
    ProbeTarget target;
    uint64_t round_id = 0;
};

const char* outcome_kind_str(OutcomeKind kind);
const char* validation_reason_str(ValidationReason reason);
