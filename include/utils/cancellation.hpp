#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace arbscan {

/**
 * Stop flag shared between a long-running loop and its owner.
 *
 * The loop sleeps through wait_for() so that request_stop() wakes it
 * immediately instead of after the full interval.
 */
class CancellationToken {
public:
    void request_stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_.store(true);
        }
        cv_.notify_all();
    }

    bool stop_requested() const { return stopped_.load(); }

    // Sleeps up to `timeout`. Returns true if stop was requested.
    template <typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return stopped_.load(); });
    }

    void reset() { stopped_.store(false); }

private:
    std::atomic<bool> stopped_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace arbscan
