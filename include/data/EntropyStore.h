#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "common/Types.h"

namespace emis {
namespace data {

// Persists a computed entropy series next to the price cache.
// "<stem>_entropy.csv" holds date,entropy; "<stem>_entropy.meta.json" holds the
// fingerprint of every input that shaped it. A stale fingerprint is a miss.
class EntropyStore {
public:
    explicit EntropyStore(std::filesystem::path cache_dir);

    std::optional<EntropySeries> load(const std::string& stem, const std::string& fingerprint) const;

    // meta is written as-is plus "fingerprint" and "points"
    void save(const std::string& stem, const std::string& fingerprint,
              const EntropySeries& series, nlohmann::json meta = nlohmann::json::object()) const;

    std::filesystem::path seriesPath(const std::string& stem) const;
    std::filesystem::path metaPath(const std::string& stem) const;

private:
    std::filesystem::path cache_dir_;
};

} // namespace data
} // namespace emis
