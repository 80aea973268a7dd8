#include "data/PriceCache.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <algorithm>
#include <thread>

namespace emis {
namespace data {

PriceCache::PriceCache(std::shared_ptr<IPriceStore> store,
                       std::shared_ptr<IPriceSource> source,
                       RetryPolicy retry)
    : store_(std::move(store))
    , source_(std::move(source))
    , retry_(retry)
    , sleeper_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); })
{
    if (!store_ || !source_) {
        throw std::invalid_argument("PriceCache needs a store and a source");
    }
    retry_.max_attempts = std::max(1, retry_.max_attempts);
}

PriceSeries PriceCache::get(const std::string& cache_namespace,
                            const std::string& ticker,
                            const DateRange& range) {
    auto key = PriceCacheKey::make(cache_namespace, range);

    if (auto cached = store_->find(key, ticker)) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.hits++;
        return cached->clip(range);
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.misses++;
    }

    PriceSeries series;
    try {
        series = fetchWithRetry(ticker, range);
    } catch (const DataUnavailable&) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.unavailable++;
        throw;
    }

    series = series.clip(range);
    if (series.empty()) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.unavailable++;
        throw DataUnavailable(ticker, "no quotes in " + range.toString());
    }
    series.ticker = ticker;
    store_->store(key, series);
    return series;
}

PriceSeries PriceCache::fetchWithRetry(const std::string& ticker, const DateRange& range) {
    auto backoff = retry_.initial_backoff;

    for (int attempt = 1; ; ++attempt) {
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.fetch_attempts++;
        }

        try {
            return source_->fetch(ticker, range);
        } catch (const FetchError& e) {
            if (attempt >= retry_.max_attempts) {
                LOG_ERROR("Fetch of {} failed after {} attempts: {}", ticker, attempt, e.what());
                throw;
            }
            LOG_WARN("Fetch of {} failed (attempt {}/{}): {}; retrying in {} ms",
                     ticker, attempt, retry_.max_attempts, e.what(), backoff.count());
        }

        sleeper_(backoff);
        backoff = std::chrono::milliseconds(
            static_cast<long long>(static_cast<double>(backoff.count()) * retry_.backoff_factor));
    }
}

PriceCache::Stats PriceCache::getStats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

} // namespace data
} // namespace emis
