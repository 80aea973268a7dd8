#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include "data/PriceStore.h"
#include "data/PriceSource.h"

namespace emis {
namespace data {

struct RetryPolicy {
    int max_attempts = 4;
    std::chrono::milliseconds initial_backoff{500};
    double backoff_factor = 2.0;
};

// Fetch-on-miss front of a price store. DataUnavailable is never cached.
class PriceCache {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    PriceCache(std::shared_ptr<IPriceStore> store,
               std::shared_ptr<IPriceSource> source,
               RetryPolicy retry = RetryPolicy{});

    // Tests swap in a sleeper that records delays instead of waiting
    void setSleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

    // Throws DataUnavailable (no data) or FetchError (retries exhausted)
    PriceSeries get(const std::string& cache_namespace,
                    const std::string& ticker,
                    const DateRange& range);

    struct Stats {
        int hits = 0;
        int misses = 0;
        int fetch_attempts = 0;
        int unavailable = 0;
    };
    Stats getStats() const;

private:
    PriceSeries fetchWithRetry(const std::string& ticker, const DateRange& range);

    std::shared_ptr<IPriceStore> store_;
    std::shared_ptr<IPriceSource> source_;
    RetryPolicy retry_;
    Sleeper sleeper_;

    mutable std::mutex stats_mutex_;
    Stats stats_;
};

} // namespace data
} // namespace emis
