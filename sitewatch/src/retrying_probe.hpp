#pragma once

#include "cancellation.hpp"
#include "config.hpp"
#include "probe_client.hpp"
#include "types.hpp"
#include <chrono>

struct RetryPolicy {
    std::chrono::milliseconds timeout_per_attempt{5000};
    int max_retries = 1;
    // Pause before retry n is retry_delay * n; zero retries immediately.
    std::chrono::milliseconds retry_delay{0};
    HeaderValueMatch header_value_match = HeaderValueMatch::Exact;

    static RetryPolicy from_config(const Config& config);
};

// Runs one job to a terminal outcome: Success and ValidationFailure end
// immediately, Timeout and TransportError are retried up to max_retries.
class RetryingProbe {
public:
    RetryingProbe(ProbeClient& client, RetryPolicy policy, const CancellationToken* cancel = nullptr);

    ProbeResult probe(const ProbeTarget& target) const;
    ProbeResult probe(const ProbeTarget& target,
                      std::chrono::milliseconds timeout_per_attempt,
                      int max_retries) const;

    const RetryPolicy& policy() const { return policy_; }

private:
    ProbeOutcome classify(const ProbeTarget& target,
                          const RawResponse& raw,
                          std::chrono::milliseconds timeout) const;
    bool header_matches(const RawResponse& raw, const RequiredHeader& required) const;

    ProbeClient& client_;
    RetryPolicy policy_;
    const CancellationToken* cancel_;
};
