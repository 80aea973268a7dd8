#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <limits>

namespace emis {

// Calendar day stored as days since 1970-01-01 (proleptic Gregorian).
struct Date {
    int days = 0;

    Date() = default;
    explicit Date(int days_since_epoch) : days(days_since_epoch) {}

    static Date fromYmd(int year, int month, int day);
    // Accepts "YYYY-MM-DD"; trailing time/zone text is ignored.
    static Date parse(const std::string& text);
    static bool tryParse(const std::string& text, Date& out);
    static Date fromUnixSeconds(long long seconds);

    std::string toString() const;
    long long toUnixSeconds() const { return static_cast<long long>(days) * 86400LL; }

    int year() const;
    int month() const;
    int day() const;
    // 0 = Monday ... 6 = Sunday
    int weekday() const;
    // ISO-8601 (year, week) packed as year * 100 + week.
    int isoWeekKey() const;

    Date addDays(int n) const { return Date(days + n); }

    bool operator==(const Date& o) const { return days == o.days; }
    bool operator!=(const Date& o) const { return days != o.days; }
    bool operator<(const Date& o) const { return days < o.days; }
    bool operator<=(const Date& o) const { return days <= o.days; }
    bool operator>(const Date& o) const { return days > o.days; }
    bool operator>=(const Date& o) const { return days >= o.days; }
};

// Inclusive [start, end].
struct DateRange {
    Date start;
    Date end;

    DateRange() = default;
    DateRange(Date s, Date e) : start(s), end(e) {}

    bool contains(const Date& d) const { return d >= start && d <= end; }
    bool overlaps(const DateRange& o) const { return start <= o.end && o.start <= end; }
    bool valid() const { return start <= end; }
    std::string toString() const { return start.toString() + ".." + end.toString(); }
};

struct PricePoint {
    Date date;
    double adjusted_close = 0.0;
};

struct PriceSeries {
    std::string ticker;
    std::vector<PricePoint> points;   // strictly ascending dates

    bool empty() const { return points.empty(); }
    size_t size() const { return points.size(); }
    const Date& firstDate() const { return points.front().date; }
    const Date& lastDate() const { return points.back().date; }

    PriceSeries clip(const DateRange& range) const;
};

// Date-indexed log returns, one column per instrument.
struct ReturnMatrix {
    std::vector<Date> dates;
    std::vector<std::string> tickers;
    std::vector<std::vector<double>> rows;   // rows[t][i]

    size_t rowCount() const { return rows.size(); }
    size_t columnCount() const { return tickers.size(); }
};

enum class EntropyStatus { VALID, DEGENERATE };

struct EntropyPoint {
    Date date;
    double value = std::numeric_limits<double>::quiet_NaN();
    EntropyStatus status = EntropyStatus::DEGENERATE;

    bool valid() const { return status == EntropyStatus::VALID; }
};

using EntropySeries = std::vector<EntropyPoint>;

enum class SignalDirection { ENTER, NEUTRAL };

struct Signal {
    Date date;
    SignalDirection direction = SignalDirection::NEUTRAL;
    double indicator = std::numeric_limits<double>::quiet_NaN();

    bool operator==(const Signal& o) const {
        return date == o.date && direction == o.direction;
    }
};

struct Trade {
    Date entry_date;
    Date exit_date;
    double entry_price = 0.0;
    double exit_price = 0.0;
    double realized_return = 0.0;   // exit / entry - 1
    double log_return = 0.0;
    double indicator = 0.0;

    bool win() const { return realized_return > 0.0; }
};

enum class TradeMode { OVERLAPPING, NON_OVERLAPPING, WEEKLY };

std::string toString(TradeMode mode);
TradeMode tradeModeFromString(const std::string& value);

struct BacktestResult {
    std::string strategy;
    TradeMode mode = TradeMode::OVERLAPPING;
    int sample_size = 0;
    int wins = 0;
    double win_rate = 0.0;
    double p_value = 1.0;          // binomial, H1: win probability > 0.5
    double mean_return = 0.0;
    double std_return = 0.0;
    double min_return = 0.0;
    double max_return = 0.0;
    double t_stat = 0.0;
    double p_return = 1.0;         // one-sided t-test, H1: mean > 0
    double ci_low = 0.0;
    double ci_high = 0.0;
    std::vector<Trade> trades;
};

} // namespace emis
