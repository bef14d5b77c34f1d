#pragma once
#include <atomic>
#include <chrono>

// Broadcast shutdown signal shared by the coordinator and every worker.
// cancel() only touches a lock-free atomic, so it may be raised from a
// signal handler. Waiters poll in short slices.
class CancellationToken {
public:
    static constexpr std::chrono::milliseconds kPollInterval{50};

    void cancel() { cancelled_.store(true, std::memory_order_release); }
    bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

    // Sleeps until deadline or cancellation. Returns true if cancelled.
    bool wait_until(std::chrono::steady_clock::time_point deadline) const;
    bool wait_for(std::chrono::milliseconds duration) const;

private:
    std::atomic<bool> cancelled_{false};
};
