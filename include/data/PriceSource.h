#pragma once

#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "common/Types.h"
#include "network/IHttpClient.h"

namespace emis {
namespace data {

class IPriceSource {
public:
    virtual ~IPriceSource() = default;

    // Daily adjusted closes inside range, ascending.
    // Throws DataUnavailable when the source knows nothing for the ticker
    // and FetchError for anything worth retrying.
    virtual PriceSeries fetch(const std::string& ticker, const DateRange& range) = 0;
};

// Yahoo Finance v8 chart endpoint
class YahooChartSource : public IPriceSource {
public:
    explicit YahooChartSource(std::shared_ptr<network::IHttpClient> client);

    PriceSeries fetch(const std::string& ticker, const DateRange& range) override;

    // Exposed for tests: turns one chart payload into a series
    static PriceSeries parseChart(const std::string& ticker, const nlohmann::json& payload);

    static std::string encodeTicker(const std::string& ticker);

private:
    std::shared_ptr<network::IHttpClient> client_;
};

} // namespace data
} // namespace emis
