#include "data/PriceSource.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cmath>

namespace emis {
namespace data {

namespace {
std::string describeError(const nlohmann::json& error) {
    if (error.is_object()) {
        return error.value("description", std::string("chart error"));
    }
    return error.dump();
}
}

YahooChartSource::YahooChartSource(std::shared_ptr<network::IHttpClient> client)
    : client_(std::move(client)) {}

std::string YahooChartSource::encodeTicker(const std::string& ticker) {
    std::string out;
    for (unsigned char c : ticker) {
        if (std::isalnum(c) || c == '.' || c == '-' || c == '_') {
            out += static_cast<char>(c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

PriceSeries YahooChartSource::fetch(const std::string& ticker, const DateRange& range) {
    std::map<std::string, std::string> params;
    params["period1"] = std::to_string(range.start.toUnixSeconds());
    // period2 is exclusive
    params["period2"] = std::to_string(range.end.addDays(1).toUnixSeconds());
    params["interval"] = "1d";
    params["includeAdjustedClose"] = "true";
    params["events"] = "div,split";

    network::HttpResponse response;
    try {
        response = client_->get("/v8/finance/chart/" + encodeTicker(ticker), params);
    } catch (const std::runtime_error& e) {
        throw FetchError(ticker + ": " + e.what());
    }

    if (response.isNotFound()) {
        throw DataUnavailable(ticker, "HTTP 404");
    }
    if (response.isTransient()) {
        throw FetchError(ticker + ": HTTP " + std::to_string(response.status_code));
    }

    nlohmann::json payload;
    try {
        payload = response.json();
    } catch (const nlohmann::json::exception& e) {
        throw FetchError(ticker + ": malformed response (" + e.what() + ")");
    }

    if (!response.isSuccess()) {
        const auto chart = payload.is_object() ? payload.value("chart", nlohmann::json::object())
                                               : nlohmann::json::object();
        if (chart.is_object() && chart.contains("error") && !chart["error"].is_null()) {
            throw DataUnavailable(ticker, describeError(chart["error"]));
        }
        throw FetchError(ticker + ": HTTP " + std::to_string(response.status_code));
    }

    auto series = parseChart(ticker, payload).clip(range);
    if (series.empty()) {
        throw DataUnavailable(ticker, "no quotes in " + range.toString());
    }
    LOG_DEBUG("Fetched {} quotes for {}", series.size(), ticker);
    return series;
}

PriceSeries YahooChartSource::parseChart(const std::string& ticker, const nlohmann::json& payload) {
    if (!payload.contains("chart") || !payload["chart"].is_object()) {
        throw FetchError(ticker + ": response has no chart object");
    }
    const auto& chart = payload["chart"];
    if (chart.contains("error") && !chart["error"].is_null()) {
        throw DataUnavailable(ticker, describeError(chart["error"]));
    }
    if (!chart.contains("result") || !chart["result"].is_array() || chart["result"].empty()) {
        throw DataUnavailable(ticker, "empty chart result");
    }

    const auto& result = chart["result"][0];
    if (!result.contains("timestamp") || !result["timestamp"].is_array()) {
        throw DataUnavailable(ticker, "no timestamps");
    }
    const auto& timestamps = result["timestamp"];

    // Timestamps are exchange-local session opens expressed in UTC.
    long long gmt_offset = 0;
    if (result.contains("meta") && result["meta"].is_object()) {
        gmt_offset = result["meta"].value("gmtoffset", 0LL);
    }

    const nlohmann::json* closes = nullptr;
    const auto indicators = result.value("indicators", nlohmann::json::object());
    if (indicators.contains("adjclose") && indicators["adjclose"].is_array() &&
        !indicators["adjclose"].empty() && indicators["adjclose"][0].contains("adjclose")) {
        closes = &indicators["adjclose"][0]["adjclose"];
    } else if (indicators.contains("quote") && indicators["quote"].is_array() &&
               !indicators["quote"].empty() && indicators["quote"][0].contains("close")) {
        closes = &indicators["quote"][0]["close"];
    }
    if (closes == nullptr || !closes->is_array()) {
        throw DataUnavailable(ticker, "no close prices");
    }

    PriceSeries series;
    series.ticker = ticker;
    const size_t n = std::min(timestamps.size(), closes->size());
    for (size_t i = 0; i < n; ++i) {
        const auto& ts = timestamps[i];
        const auto& px = (*closes)[i];
        if (!ts.is_number() || !px.is_number()) continue;

        double price = px.get<double>();
        if (!std::isfinite(price) || price <= 0.0) continue;

        PricePoint point;
        point.date = Date::fromUnixSeconds(ts.get<long long>() + gmt_offset);
        point.adjusted_close = price;
        series.points.push_back(point);
    }

    std::stable_sort(series.points.begin(), series.points.end(),
                     [](const PricePoint& a, const PricePoint& b) { return a.date < b.date; });

    // An intraday snapshot can repeat the last session; keep the later quote.
    std::vector<PricePoint> unique_points;
    for (const auto& p : series.points) {
        if (!unique_points.empty() && unique_points.back().date == p.date) {
            unique_points.back() = p;
        } else {
            unique_points.push_back(p);
        }
    }
    series.points = std::move(unique_points);
    return series;
}

} // namespace data
} // namespace emis
