#pragma once

#include <string>
#include <vector>
#include <map>
#include <filesystem>
#include "common/Types.h"

namespace emis {
namespace data {

class DataHistory {
public:
    // Splits one CSV line; cells are trimmed, unquoted and BOM-stripped
    static std::vector<std::string> splitRow(const std::string& line);

    // Long format: date,ticker,adjusted_close
    // Malformed rows are logged and skipped; an unreadable file throws.
    static std::map<std::string, PriceSeries> loadPrices(const std::filesystem::path& file_path);
    static void savePrices(const std::filesystem::path& file_path,
                           const std::map<std::string, PriceSeries>& series);

    // date,entropy with an empty entropy cell for degenerate dates
    static EntropySeries loadEntropy(const std::filesystem::path& file_path);
    static void saveEntropy(const std::filesystem::path& file_path, const EntropySeries& series);

    // Write to "<path>.tmp" then rename over the target
    static void writeAtomic(const std::filesystem::path& file_path, const std::string& content);
};

} // namespace data
} // namespace emis
