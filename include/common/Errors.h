#pragma once

#include <stdexcept>
#include <string>

namespace emis {

// The source has no data for an instrument over the requested range.
// Callers drop the instrument and keep going.
class DataUnavailable : public std::runtime_error {
public:
    DataUnavailable(const std::string& ticker, const std::string& detail)
        : std::runtime_error("No data for " + ticker + ": " + detail)
        , ticker_(ticker) {}

    const std::string& ticker() const { return ticker_; }

private:
    std::string ticker_;
};

// Too few common trading dates (or instruments) for the configured window.
// Aborts the affected market only.
class InsufficientHistory : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Training and testing periods overlap; raised before any threshold exists.
class LookaheadViolation : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A network fetch still failing after every retry.
class FetchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace emis
