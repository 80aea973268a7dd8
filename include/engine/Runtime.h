#pragma once

#include <memory>
#include "common/Config.h"
#include "data/EntropyStore.h"
#include "data/PriceCache.h"

namespace emis {
namespace engine {

// Production wiring shared by the CLI and the tools:
// libcurl client -> Yahoo chart source -> CSV-backed price cache.
struct Runtime {
    std::shared_ptr<data::PriceCache> cache;
    std::shared_ptr<data::EntropyStore> entropy_store;

    static Runtime fromConfig(const Config& config);
};

} // namespace engine
} // namespace emis
