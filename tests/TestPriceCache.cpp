#include "data/PriceCache.h"
#include "data/PriceStore.h"
#include "data/PriceSource.h"
#include "data/EntropyStore.h"
#include "data/DataHistory.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <map>
#include <vector>

using namespace emis;
using namespace emis::data;

namespace {

PriceSeries makeSeries(const std::string& ticker, Date start, int days) {
    PriceSeries s;
    s.ticker = ticker;
    for (int i = 0; i < days; ++i) {
        s.points.push_back({start.addDays(i), 100.0 + i});
    }
    return s;
}

// Scripted source: throws FetchError for the first `failures` calls per ticker
class FakeSource : public IPriceSource {
public:
    std::map<std::string, int> calls;
    int failures = 0;
    std::vector<std::string> unknown;

    PriceSeries fetch(const std::string& ticker, const DateRange& range) override {
        const int n = ++calls[ticker];
        for (const auto& u : unknown) {
            if (u == ticker) throw DataUnavailable(ticker, "delisted");
        }
        if (n <= failures) {
            throw FetchError(ticker + ": HTTP 503");
        }
        return makeSeries(ticker, range.start, range.end.days - range.start.days + 1);
    }
};

class CannedHttpClient : public network::IHttpClient {
public:
    network::HttpResponse response;
    std::string last_endpoint;
    std::map<std::string, std::string> last_params;

    network::HttpResponse get(const std::string& endpoint,
                              const std::map<std::string, std::string>& params) override {
        last_endpoint = endpoint;
        last_params = params;
        return response;
    }
};

std::filesystem::path freshDir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

void testCacheHitAvoidsRefetch() {
    auto store = std::make_shared<MemoryPriceStore>();
    auto source = std::make_shared<FakeSource>();
    PriceCache cache(store, source);

    const DateRange range(Date::fromYmd(2020, 1, 1), Date::fromYmd(2020, 1, 31));
    auto first = cache.get("us", "AAPL", range);
    auto second = cache.get("us", "AAPL", range);

    assert(first.size() == 31);
    assert(second.size() == first.size());
    assert(second.points.back().adjusted_close == first.points.back().adjusted_close);
    assert(source->calls["AAPL"] == 1);

    const auto stats = cache.getStats();
    assert(stats.hits == 1);
    assert(stats.misses == 1);

    // Same ticker in another namespace is a separate entry
    cache.get("japan", "AAPL", range);
    assert(source->calls["AAPL"] == 2);
    assert(store->size() == 2);
}

void testUnavailableIsNotCached() {
    auto store = std::make_shared<MemoryPriceStore>();
    auto source = std::make_shared<FakeSource>();
    source->unknown.push_back("DEAD");
    PriceCache cache(store, source);

    const DateRange range(Date::fromYmd(2020, 1, 1), Date::fromYmd(2020, 1, 10));
    for (int i = 0; i < 2; ++i) {
        bool threw = false;
        try {
            cache.get("us", "DEAD", range);
        } catch (const DataUnavailable& e) {
            threw = (e.ticker() == "DEAD");
        }
        assert(threw);
    }
    assert(source->calls["DEAD"] == 2);
    assert(store->size() == 0);
    assert(cache.getStats().unavailable == 2);
}

void testRetryBackoff() {
    auto store = std::make_shared<MemoryPriceStore>();
    auto source = std::make_shared<FakeSource>();
    source->failures = 3;

    RetryPolicy retry;
    retry.max_attempts = 4;
    retry.initial_backoff = std::chrono::milliseconds(500);
    PriceCache cache(store, source, retry);

    std::vector<long long> delays;
    cache.setSleeper([&](std::chrono::milliseconds d) { delays.push_back(d.count()); });

    const DateRange range(Date::fromYmd(2021, 3, 1), Date::fromYmd(2021, 3, 5));
    auto series = cache.get("us", "MSFT", range);
    assert(series.size() == 5);
    assert(source->calls["MSFT"] == 4);
    assert((delays == std::vector<long long>{500, 1000, 2000}));

    // Exhausted retries surface as FetchError and nothing is stored
    source->failures = 100;
    delays.clear();
    bool threw = false;
    try {
        cache.get("us", "IBM", range);
    } catch (const FetchError&) {
        threw = true;
    }
    assert(threw);
    assert(source->calls["IBM"] == 4);
    assert(delays.size() == 3);
    assert(!store->find(PriceCacheKey::make("us", range), "IBM").has_value());
}

void testCsvStorePersists() {
    const auto dir = freshDir("emis_test_price_store");
    const DateRange range(Date::fromYmd(2019, 12, 30), Date::fromYmd(2020, 1, 3));
    const auto key = PriceCacheKey::make("germany", range);

    {
        CsvPriceStore store(dir);
        auto s = makeSeries("SAP.DE", range.start, 5);
        s.points[2].adjusted_close = 123.456789012345;
        store.store(key, s);
        store.store(key, makeSeries("^GDAXI", range.start, 5));
        assert(std::filesystem::exists(store.pathFor(key)));
    }

    // A fresh store instance reads what the previous one wrote
    CsvPriceStore reopened(dir);
    auto found = reopened.find(key, "SAP.DE");
    assert(found.has_value());
    assert(found->size() == 5);
    assert(found->points[2].date == Date::fromYmd(2020, 1, 1));
    assert(std::abs(found->points[2].adjusted_close - 123.456789012345) < 1e-12);
    assert(reopened.find(key, "^GDAXI").has_value());
    assert(!reopened.find(key, "BMW.DE").has_value());

    // A different range is a different cache file
    const auto other = PriceCacheKey::make("germany", DateRange(range.start, range.end.addDays(1)));
    assert(other.stem() != key.stem());
    assert(!reopened.find(other, "SAP.DE").has_value());

    std::filesystem::remove_all(dir);
}

void testYahooChartSource() {
    const Date d1 = Date::fromYmd(2020, 1, 2);
    const Date d2 = Date::fromYmd(2020, 1, 3);
    const Date d3 = Date::fromYmd(2020, 1, 6);
    const long long open_utc = 14 * 3600 + 30 * 60;

    nlohmann::json payload = {
        {"chart", {
            {"result", nlohmann::json::array({{
                {"meta", {{"gmtoffset", -18000}}},
                {"timestamp", {d1.toUnixSeconds() + open_utc, d2.toUnixSeconds() + open_utc,
                               d3.toUnixSeconds() + open_utc}},
                {"indicators", {
                    {"quote", nlohmann::json::array({{{"close", {300.0, 297.0, 299.0}}}})},
                    {"adjclose", nlohmann::json::array({{{"adjclose", {295.5, nullptr, 294.0}}}})}
                }}
            }})},
            {"error", nullptr}
        }}
    };

    auto parsed = YahooChartSource::parseChart("^GSPC", payload);
    assert(parsed.size() == 2);                       // null adjclose dropped
    assert(parsed.points[0].date == d1);
    assert(parsed.points[0].adjusted_close == 295.5); // adjusted, not raw close
    assert(parsed.points[1].date == d3);

    assert(YahooChartSource::encodeTicker("^GSPC") == "%5EGSPC");
    assert(YahooChartSource::encodeTicker("7203.T") == "7203.T");

    auto client = std::make_shared<CannedHttpClient>();
    YahooChartSource source(client);
    const DateRange range(d1, d2);

    client->response.status_code = 200;
    client->response.body = payload.dump();
    auto fetched = source.fetch("^GSPC", range);
    assert(fetched.size() == 1);                      // clipped to range
    assert(client->last_endpoint == "/v8/finance/chart/%5EGSPC");
    assert(client->last_params["interval"] == "1d");
    assert(client->last_params["period2"] == std::to_string(d2.addDays(1).toUnixSeconds()));

    client->response.status_code = 404;
    client->response.body = R"({"chart":{"result":null,"error":{"code":"Not Found","description":"No data found, symbol may be delisted"}}})";
    bool unavailable = false;
    try {
        source.fetch("GONE", range);
    } catch (const DataUnavailable&) {
        unavailable = true;
    }
    assert(unavailable);

    client->response.status_code = 503;
    client->response.body = "Service Unavailable";
    bool fetch_error = false;
    try {
        source.fetch("^GSPC", range);
    } catch (const FetchError&) {
        fetch_error = true;
    }
    assert(fetch_error);

    client->response.status_code = 200;
    client->response.body = "<html>";
    fetch_error = false;
    try {
        source.fetch("^GSPC", range);
    } catch (const FetchError&) {
        fetch_error = true;
    }
    assert(fetch_error);
}

void testEntropyStore() {
    const auto dir = freshDir("emis_test_entropy_store");
    EntropyStore store(dir);

    EntropySeries series;
    series.push_back({Date::fromYmd(2020, 3, 2), 0.25, EntropyStatus::VALID});
    series.push_back({Date::fromYmd(2020, 3, 3), std::nan(""), EntropyStatus::DEGENERATE});
    series.push_back({Date::fromYmd(2020, 3, 4), 0.5, EntropyStatus::VALID});

    assert(!store.load("us_abc", "fp1").has_value());
    store.save("us_abc", "fp1", series, {{"window", 60}});

    auto loaded = store.load("us_abc", "fp1");
    assert(loaded.has_value());
    assert(loaded->size() == 3);
    assert((*loaded)[0].valid() && (*loaded)[0].value == 0.25);
    assert(!(*loaded)[1].valid());
    assert((*loaded)[2].date == Date::fromYmd(2020, 3, 4));

    // Inputs changed: stale entry is ignored
    assert(!store.load("us_abc", "fp2").has_value());

    // Truncated series file is a miss too
    DataHistory::writeAtomic(store.seriesPath("us_abc"), "date,entropy\n2020-03-02,0.25\n");
    assert(!store.load("us_abc", "fp1").has_value());

    std::filesystem::remove_all(dir);
}

} // namespace

int main() {
    testCacheHitAvoidsRefetch();
    testUnavailableIsNotCached();
    testRetryBackoff();
    testCsvStorePersists();
    testYahooChartSource();
    testEntropyStore();

    std::cout << "[TEST] PriceCache PASSED\n";
    return 0;
}
