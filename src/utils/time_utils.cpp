#include "utils/time_utils.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace arbscan {
namespace time_utils {

std::string to_iso8601(WallClock t) {
    auto time_t = std::chrono::system_clock::to_time_t(t);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        t.time_since_epoch()) % 1000;
    if (ms.count() < 0) {
        ms += std::chrono::milliseconds(1000);
        time_t -= 1;
    }

    std::tm tm{};
    gmtime_r(&time_t, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';

    return ss.str();
}

std::string to_iso8601(int64_t epoch_ms) {
    return to_iso8601(from_epoch_ms(epoch_ms));
}

WallClock from_iso8601(const std::string& s) {
    std::tm tm = {};
    std::istringstream ss(s);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        throw std::invalid_argument("Invalid ISO 8601 timestamp: " + s);
    }

    auto time_t = timegm(&tm);
    auto tp = std::chrono::system_clock::from_time_t(time_t);

    // Fractional seconds, millisecond resolution
    size_t dot_pos = s.find('.');
    if (dot_pos != std::string::npos && dot_pos + 1 < s.length()) {
        std::string ms_str;
        for (size_t i = dot_pos + 1; i < s.size() && ms_str.size() < 3 && std::isdigit(static_cast<unsigned char>(s[i])); ++i) {
            ms_str += s[i];
        }
        if (!ms_str.empty()) {
            while (ms_str.size() < 3) ms_str += '0';
            tp += std::chrono::milliseconds(std::stoi(ms_str));
        }
    }

    return tp;
}

std::string now_iso8601() {
    return to_iso8601(wall_now());
}

int64_t epoch_ms() {
    return to_epoch_ms(std::chrono::system_clock::now());
}

int64_t epoch_us() {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

int64_t to_epoch_ms(WallClock t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        t.time_since_epoch()
    ).count();
}

WallClock from_epoch_ms(int64_t ms) {
    return WallClock(std::chrono::milliseconds(ms));
}

// RateLimiter implementation

RateLimiter::RateLimiter(int max_requests, std::chrono::milliseconds window)
    : max_requests_(max_requests)
    , window_(window)
    , window_start_(std::chrono::steady_clock::now())
{
}

bool RateLimiter::try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto now_tp = std::chrono::steady_clock::now();

    // Reset window if expired
    if (now_tp - window_start_ >= window_) {
        window_start_ = now_tp;
        requests_in_window_ = 0;
    }

    if (requests_in_window_ >= max_requests_) {
        return false;
    }

    requests_in_window_++;
    return true;
}

void RateLimiter::acquire() {
    while (!try_acquire()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

int RateLimiter::remaining() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::chrono::steady_clock::now() - window_start_ >= window_) {
        return max_requests_;
    }
    return std::max(0, max_requests_ - requests_in_window_);
}

void RateLimiter::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    window_start_ = std::chrono::steady_clock::now();
    requests_in_window_ = 0;
}

} // namespace time_utils
} // namespace arbscan
