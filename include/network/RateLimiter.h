#pragma once

#include <chrono>
#include <mutex>
#include <condition_variable>

namespace emis {
namespace network {

// Fixed one-second window limiter shared by all requests of one client.
class RateLimiter {
public:
    explicit RateLimiter(int max_per_second);

    // Non-blocking: true if a slot was taken
    bool tryAcquire();

    // Blocks until a slot is free (or a server-imposed pause has elapsed)
    void acquire();

    // 429 from the server: pause every caller for the given duration
    void handleRateLimitError(std::chrono::milliseconds pause);

    struct Stats {
        int total_requests;
        int forced_waits;
        std::chrono::milliseconds total_wait_time;
    };
    Stats getStats() const;

private:
    int max_per_second_;
    int current_count_ = 0;
    std::chrono::steady_clock::time_point window_start_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    int total_requests_ = 0;
    int forced_waits_ = 0;
    std::chrono::milliseconds total_wait_time_{0};

    bool is_blocked_ = false;
    std::chrono::steady_clock::time_point block_end_time_;

    void resetWindowIfNeeded();
};

} // namespace network
} // namespace emis
