#pragma once

#include "config.hpp"
#include "probe_client.hpp"
#include <memory>

class CprProbeClient : public ProbeClient {
public:
    explicit CprProbeClient(const Config& config);
    ~CprProbeClient() override;

    RawResponse fetch(const ProbeTarget& target, std::chrono::milliseconds timeout) override;

    // Non-copyable
    CprProbeClient(const CprProbeClient&) = delete;
    CprProbeClient& operator=(const CprProbeClient&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
