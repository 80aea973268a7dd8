#include "common/Types.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace emis {

namespace {
// Howard Hinnant's civil calendar conversions.
int daysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int>(doe) - 719468;
}

void civilFromDays(int z, int& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = static_cast<int>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y += (m <= 2);
}

bool isDigits(const std::string& s, size_t pos, size_t len) {
    if (pos + len > s.size()) return false;
    for (size_t i = pos; i < pos + len; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}
}

Date Date::fromYmd(int year, int month, int day) {
    return Date(daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)));
}

bool Date::tryParse(const std::string& text, Date& out) {
    if (!isDigits(text, 0, 4) || text.size() < 10 || text[4] != '-' || text[7] != '-' ||
        !isDigits(text, 5, 2) || !isDigits(text, 8, 2)) {
        return false;
    }
    const int y = std::stoi(text.substr(0, 4));
    const int m = std::stoi(text.substr(5, 2));
    const int d = std::stoi(text.substr(8, 2));
    if (m < 1 || m > 12 || d < 1 || d > 31) {
        return false;
    }
    out = fromYmd(y, m, d);
    // Reject 2021-02-30 style dates that roll into the next month.
    return out.month() == m && out.day() == d;
}

Date Date::parse(const std::string& text) {
    Date out;
    if (!tryParse(text, out)) {
        throw std::invalid_argument("Invalid date: '" + text + "'");
    }
    return out;
}

Date Date::fromUnixSeconds(long long seconds) {
    long long days = seconds / 86400LL;
    if (seconds % 86400LL < 0) {
        --days;
    }
    return Date(static_cast<int>(days));
}

std::string Date::toString() const {
    int y = 0;
    unsigned m = 0, d = 0;
    civilFromDays(days, y, m, d);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", y, m, d);
    return buf;
}

int Date::year() const {
    int y = 0;
    unsigned m = 0, d = 0;
    civilFromDays(days, y, m, d);
    return y;
}

int Date::month() const {
    int y = 0;
    unsigned m = 0, d = 0;
    civilFromDays(days, y, m, d);
    return static_cast<int>(m);
}

int Date::day() const {
    int y = 0;
    unsigned m = 0, d = 0;
    civilFromDays(days, y, m, d);
    return static_cast<int>(d);
}

int Date::weekday() const {
    // 1970-01-01 was a Thursday (3 when Monday = 0).
    const int w = (days + 3) % 7;
    return w < 0 ? w + 7 : w;
}

int Date::isoWeekKey() const {
    const Date thursday = addDays(3 - weekday());
    const int iso_year = thursday.year();
    const int day_of_year = thursday.days - fromYmd(iso_year, 1, 1).days;
    const int week = day_of_year / 7 + 1;
    return iso_year * 100 + week;
}

PriceSeries PriceSeries::clip(const DateRange& range) const {
    PriceSeries out;
    out.ticker = ticker;
    for (const auto& p : points) {
        if (range.contains(p.date)) {
            out.points.push_back(p);
        }
    }
    return out;
}

std::string toString(TradeMode mode) {
    switch (mode) {
        case TradeMode::OVERLAPPING: return "overlapping";
        case TradeMode::NON_OVERLAPPING: return "non_overlapping";
        case TradeMode::WEEKLY: return "weekly";
    }
    return "overlapping";
}

TradeMode tradeModeFromString(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "overlapping") return TradeMode::OVERLAPPING;
    if (v == "non_overlapping" || v == "non-overlapping") return TradeMode::NON_OVERLAPPING;
    if (v == "weekly") return TradeMode::WEEKLY;
    throw std::invalid_argument("Unknown trade mode: " + value);
}

} // namespace emis
