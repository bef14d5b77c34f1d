#include "cancellation.hpp"
#include <algorithm>
#include <thread>

bool CancellationToken::wait_until(std::chrono::steady_clock::time_point deadline) const {
    while (!is_cancelled()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining + std::chrono::milliseconds(1), kPollInterval));
    }
    return true;
}

bool CancellationToken::wait_for(std::chrono::milliseconds duration) const {
    return wait_until(std::chrono::steady_clock::now() + duration);
}
