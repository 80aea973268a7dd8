#include "data/PriceStore.h"
#include "data/DataHistory.h"
#include "common/Fingerprint.h"
#include "common/Logger.h"

namespace emis {
namespace data {

PriceCacheKey PriceCacheKey::make(const std::string& cache_namespace, const DateRange& range) {
    PriceCacheKey key;
    key.cache_namespace = cache_namespace;
    key.range = range;
    key.version = Fingerprint::shortId({
        {"start", range.start.toString()},
        {"end", range.end.toString()}
    });
    return key;
}

std::optional<PriceSeries> MemoryPriceStore::find(const PriceCacheKey& key, const std::string& ticker) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key.stem());
    if (it == entries_.end()) {
        return std::nullopt;
    }
    auto series_it = it->second.find(ticker);
    if (series_it == it->second.end()) {
        return std::nullopt;
    }
    return series_it->second;
}

void MemoryPriceStore::store(const PriceCacheKey& key, const PriceSeries& series) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key.stem()][series.ticker] = series;
}

size_t MemoryPriceStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto& [stem, by_ticker] : entries_) {
        total += by_ticker.size();
    }
    return total;
}

CsvPriceStore::CsvPriceStore(std::filesystem::path cache_dir)
    : cache_dir_(std::move(cache_dir)) {}

std::filesystem::path CsvPriceStore::pathFor(const PriceCacheKey& key) const {
    return cache_dir_ / (key.stem() + "_prices.csv");
}

std::map<std::string, PriceSeries>& CsvPriceStore::loadLocked(const PriceCacheKey& key) {
    auto it = loaded_.find(key.stem());
    if (it != loaded_.end()) {
        return it->second;
    }

    auto& slot = loaded_[key.stem()];
    auto path = pathFor(key);
    if (std::filesystem::exists(path)) {
        slot = DataHistory::loadPrices(path);
    }
    return slot;
}

std::optional<PriceSeries> CsvPriceStore::find(const PriceCacheKey& key, const std::string& ticker) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& by_ticker = loadLocked(key);
    auto it = by_ticker.find(ticker);
    if (it == by_ticker.end()) {
        return std::nullopt;
    }
    return it->second;
}

void CsvPriceStore::store(const PriceCacheKey& key, const PriceSeries& series) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& by_ticker = loadLocked(key);
    by_ticker[series.ticker] = series;
    DataHistory::savePrices(pathFor(key), by_ticker);
    LOG_DEBUG("Cached {} ({} rows) in {}", series.ticker, series.size(), pathFor(key).string());
}

} // namespace data
} // namespace emis
