#include "shutdown.hpp"

void ShutdownSignal::request_stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
}

bool ShutdownSignal::wait_until(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_until(lock, deadline, [this] { return stopped_.load(std::memory_order_acquire); });
}

bool ShutdownSignal::wait_for(std::chrono::milliseconds timeout) {
    return wait_until(std::chrono::steady_clock::now() + timeout);
}
