#pragma once

#include <string>
#include <chrono>
#include <mutex>
#include <thread>
#include "common/types.hpp"

namespace arbscan {
namespace time_utils {

/**
 * Convert timestamp to ISO 8601 string.
 */
std::string to_iso8601(WallClock t);
std::string to_iso8601(int64_t epoch_ms);

/**
 * Parse ISO 8601 string to timestamp.
 */
WallClock from_iso8601(const std::string& s);

std::string now_iso8601();

int64_t epoch_ms();
int64_t epoch_us();

int64_t to_epoch_ms(WallClock t);
WallClock from_epoch_ms(int64_t ms);

/**
 * Rate limiter for API calls.
 * Allows max_requests per sliding window; a window of 200ms with
 * max_requests=1 enforces a minimum spacing between requests.
 */
class RateLimiter {
public:
    RateLimiter(int max_requests, std::chrono::milliseconds window);

    // Returns true if request is allowed, false if rate limited
    bool try_acquire();

    // Wait until request is allowed
    void acquire();

    int remaining() const;
    void reset();

private:
    int max_requests_;
    std::chrono::milliseconds window_;
    std::chrono::steady_clock::time_point window_start_;
    int requests_in_window_{0};
    mutable std::mutex mutex_;
};

} // namespace time_utils
} // namespace arbscan
