#pragma once
#include "types.hpp"
#include <chrono>
#include <map>
#include <string>

// What a single HTTP attempt produced, before any validation.
struct RawResponse {
    enum class Kind {
        Response,
        Timeout,
        TransportError
    };

    Kind kind = Kind::TransportError;
    int status_code = 0;
    std::map<std::string, std::string> headers; // names as sent by the server
    std::string body;
    std::string error_message;
    std::chrono::milliseconds elapsed{0};
};

// Performs one timed HTTP request. Implementations must be safe to call
// concurrently from every worker thread.
class ProbeClient {
public:
    virtual ~ProbeClient() = default;

    virtual RawResponse fetch(const ProbeTarget& target, std::chrono::milliseconds timeout) = 0;
};
