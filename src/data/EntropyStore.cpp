#include "data/EntropyStore.h"
#include "data/DataHistory.h"
#include "common/Logger.h"
#include <fstream>

namespace emis {
namespace data {

EntropyStore::EntropyStore(std::filesystem::path cache_dir)
    : cache_dir_(std::move(cache_dir)) {}

std::filesystem::path EntropyStore::seriesPath(const std::string& stem) const {
    return cache_dir_ / (stem + "_entropy.csv");
}

std::filesystem::path EntropyStore::metaPath(const std::string& stem) const {
    return cache_dir_ / (stem + "_entropy.meta.json");
}

std::optional<EntropySeries> EntropyStore::load(const std::string& stem,
                                                const std::string& fingerprint) const {
    const auto meta_path = metaPath(stem);
    const auto series_path = seriesPath(stem);
    if (!std::filesystem::exists(meta_path) || !std::filesystem::exists(series_path)) {
        return std::nullopt;
    }

    std::ifstream in(meta_path, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }

    nlohmann::json meta;
    try {
        in >> meta;
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("Ignoring unreadable entropy metadata {}: {}", meta_path.string(), e.what());
        return std::nullopt;
    }

    if (meta.value("fingerprint", std::string()) != fingerprint) {
        LOG_INFO("Entropy cache {} is stale, recomputing", stem);
        return std::nullopt;
    }

    auto series = DataHistory::loadEntropy(series_path);
    if (series.size() != meta.value("points", size_t{0})) {
        LOG_WARN("Entropy cache {} is truncated ({} of {} points)",
                 stem, series.size(), meta.value("points", size_t{0}));
        return std::nullopt;
    }
    return series;
}

void EntropyStore::save(const std::string& stem, const std::string& fingerprint,
                        const EntropySeries& series, nlohmann::json meta) const {
    DataHistory::saveEntropy(seriesPath(stem), series);

    meta["fingerprint"] = fingerprint;
    meta["points"] = series.size();
    // Metadata goes last so a torn write reads back as a miss.
    DataHistory::writeAtomic(metaPath(stem), meta.dump(2));
}

} // namespace data
} // namespace emis
