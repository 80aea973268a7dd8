#include "network/RateLimiter.h"
#include "common/Logger.h"
#include <algorithm>

namespace emis {
namespace network {

RateLimiter::RateLimiter(int max_per_second)
    : max_per_second_(std::max(1, max_per_second))
    , window_start_(std::chrono::steady_clock::now())
{
}

bool RateLimiter::tryAcquire() {
    std::unique_lock<std::mutex> lock(mutex_);

    if (is_blocked_) {
        if (std::chrono::steady_clock::now() < block_end_time_) {
            return false;
        }
        is_blocked_ = false;
        cv_.notify_all();
    }

    resetWindowIfNeeded();

    if (current_count_ < max_per_second_) {
        current_count_++;
        total_requests_++;
        return true;
    }
    return false;
}

void RateLimiter::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        if (is_blocked_) {
            auto status = cv_.wait_until(lock, block_end_time_);
            if (status == std::cv_status::timeout) {
                is_blocked_ = false;
            } else {
                continue;
            }
        }

        resetWindowIfNeeded();

        if (current_count_ < max_per_second_) {
            current_count_++;
            total_requests_++;
            return;
        }

        // Sleep until the next window opens; a reset elsewhere wakes us early.
        auto wake_time = window_start_ + std::chrono::seconds(1) + std::chrono::milliseconds(1);

        forced_waits_++;
        auto wait_start = std::chrono::steady_clock::now();
        cv_.wait_until(lock, wake_time);
        total_wait_time_ += std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - wait_start
        );
    }
}

void RateLimiter::handleRateLimitError(std::chrono::milliseconds pause) {
    std::lock_guard<std::mutex> lock(mutex_);
    LOG_WARN("429 Too Many Requests: pausing requests for {} ms", pause.count());
    forced_waits_++;
    is_blocked_ = true;
    block_end_time_ = std::chrono::steady_clock::now() + pause;
}

RateLimiter::Stats RateLimiter::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    Stats stats;
    stats.total_requests = total_requests_;
    stats.forced_waits = forced_waits_;
    stats.total_wait_time = total_wait_time_;
    return stats;
}

void RateLimiter::resetWindowIfNeeded() {
    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - window_start_);

    if (elapsed.count() >= 1000) {
        current_count_ = 0;
        window_start_ = now;
        cv_.notify_all();
    }
}

} // namespace network
} // namespace emis
