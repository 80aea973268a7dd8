#include "engine/Runtime.h"
#include "common/Logger.h"
#include "common/PathUtils.h"
#include "data/PriceSource.h"
#include "network/CurlHttpClient.h"

namespace emis {
namespace engine {

Runtime Runtime::fromConfig(const Config& config) {
    const auto fetch = config.getFetchConfig();
    const auto cache_dir = utils::PathUtils::resolveRelativePath(config.getCacheDir());

    auto http_client = std::make_shared<network::CurlHttpClient>(
        fetch.base_url, fetch.max_requests_per_second, fetch.timeout_seconds);
    auto source = std::make_shared<data::YahooChartSource>(http_client);
    auto store = std::make_shared<data::CsvPriceStore>(cache_dir);

    data::RetryPolicy retry;
    retry.max_attempts = fetch.max_attempts;
    retry.initial_backoff = std::chrono::milliseconds(fetch.initial_backoff_ms);

    Runtime runtime;
    runtime.cache = std::make_shared<data::PriceCache>(store, source, retry);
    runtime.entropy_store = std::make_shared<data::EntropyStore>(cache_dir);

    LOG_INFO("Price source {} ({} req/s, {} attempts), cache {}",
             fetch.base_url, fetch.max_requests_per_second, fetch.max_attempts, cache_dir.string());
    return runtime;
}

} // namespace engine
} // namespace emis
