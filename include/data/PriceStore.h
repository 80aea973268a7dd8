#pragma once

#include <string>
#include <map>
#include <mutex>
#include <optional>
#include <filesystem>
#include "common/Types.h"

namespace emis {
namespace data {

// Identifies one cached universe: a market namespace fetched over one date range.
struct PriceCacheKey {
    std::string cache_namespace;
    DateRange range;
    std::string version;    // short fingerprint of the range

    static PriceCacheKey make(const std::string& cache_namespace, const DateRange& range);

    // "<namespace>_<version>"
    std::string stem() const { return cache_namespace + "_" + version; }
};

class IPriceStore {
public:
    virtual ~IPriceStore() = default;

    virtual std::optional<PriceSeries> find(const PriceCacheKey& key, const std::string& ticker) = 0;
    virtual void store(const PriceCacheKey& key, const PriceSeries& series) = 0;
};

class MemoryPriceStore : public IPriceStore {
public:
    std::optional<PriceSeries> find(const PriceCacheKey& key, const std::string& ticker) override;
    void store(const PriceCacheKey& key, const PriceSeries& series) override;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::map<std::string, PriceSeries>> entries_;
};

// One "<cache_dir>/<namespace>_<version>_prices.csv" per key, loaded lazily.
class CsvPriceStore : public IPriceStore {
public:
    explicit CsvPriceStore(std::filesystem::path cache_dir);

    std::optional<PriceSeries> find(const PriceCacheKey& key, const std::string& ticker) override;
    void store(const PriceCacheKey& key, const PriceSeries& series) override;

    std::filesystem::path pathFor(const PriceCacheKey& key) const;

private:
    std::map<std::string, PriceSeries>& loadLocked(const PriceCacheKey& key);

    std::filesystem::path cache_dir_;
    std::mutex mutex_;
    std::map<std::string, std::map<std::string, PriceSeries>> loaded_;
};

} // namespace data
} // namespace emis
