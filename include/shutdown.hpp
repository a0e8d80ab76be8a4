#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

// Process-wide stop request shared by the poll loop and the reconciler.
class ShutdownSignal {
public:
    void request_stop();
    // Re-arms the signal for an owner that restarts its worker.
    void reset() { stopped_.store(false, std::memory_order_release); }
    bool stop_requested() const { return stopped_.load(std::memory_order_acquire); }

    // Both return true if stop was requested before the deadline.
    bool wait_until(std::chrono::steady_clock::time_point deadline);
    bool wait_for(std::chrono::milliseconds timeout);

private:
    std::atomic<bool> stopped_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};
