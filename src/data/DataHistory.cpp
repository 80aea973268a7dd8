#include "data/DataHistory.h"
#include "common/Logger.h"
#include <fstream>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <system_error>

namespace emis {
namespace data {

namespace {

std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // Strip UTF-8 BOM if present at first cell.
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

bool isDataRow(const std::vector<std::string>& row) {
    // Header or malformed row.
    return !row.empty() && !row[0].empty() &&
           std::isdigit(static_cast<unsigned char>(row[0][0]));
}

std::ifstream openOrThrow(const std::filesystem::path& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open CSV file: " + file_path.string());
    }
    return file;
}

} // namespace

std::vector<std::string> DataHistory::splitRow(const std::string& line) {
    std::vector<std::string> row;
    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, ',')) {
        row.push_back(normalizeCell(cell));
    }
    // getline drops a trailing empty cell ("2020-01-02,")
    if (!line.empty() && line.back() == ',') {
        row.emplace_back();
    }
    return row;
}

std::map<std::string, PriceSeries> DataHistory::loadPrices(const std::filesystem::path& file_path) {
    std::map<std::string, PriceSeries> result;
    auto file = openOrThrow(file_path);

    std::string line;
    size_t skipped = 0;
    while (std::getline(file, line)) {
        auto row = splitRow(line);
        if (row.size() < 3 || !isDataRow(row)) continue;

        try {
            PricePoint point;
            point.date = Date::parse(row[0]);
            point.adjusted_close = std::stod(row[2]);
            if (!std::isfinite(point.adjusted_close) || point.adjusted_close <= 0.0) {
                throw std::invalid_argument("non-positive price");
            }
            auto& series = result[row[1]];
            series.ticker = row[1];
            series.points.push_back(point);
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
            skipped++;
        }
    }

    for (auto& [ticker, series] : result) {
        std::sort(series.points.begin(), series.points.end(),
                  [](const PricePoint& a, const PricePoint& b) { return a.date < b.date; });
        auto last = std::unique(series.points.begin(), series.points.end(),
                                [](const PricePoint& a, const PricePoint& b) { return a.date == b.date; });
        series.points.erase(last, series.points.end());
    }

    LOG_INFO("Loaded {} price series from {} ({} rows skipped)",
             result.size(), file_path.string(), skipped);
    return result;
}

void DataHistory::savePrices(const std::filesystem::path& file_path,
                             const std::map<std::string, PriceSeries>& series) {
    std::ostringstream out;
    out << "date,ticker,adjusted_close\n";
    out << std::setprecision(17);
    for (const auto& [ticker, s] : series) {
        for (const auto& p : s.points) {
            out << p.date.toString() << ',' << ticker << ',' << p.adjusted_close << '\n';
        }
    }
    writeAtomic(file_path, out.str());
}

EntropySeries DataHistory::loadEntropy(const std::filesystem::path& file_path) {
    EntropySeries result;
    auto file = openOrThrow(file_path);

    std::string line;
    while (std::getline(file, line)) {
        auto row = splitRow(line);
        if (row.size() < 2 || !isDataRow(row)) continue;

        try {
            EntropyPoint point;
            point.date = Date::parse(row[0]);
            if (row[1].empty()) {
                point.status = EntropyStatus::DEGENERATE;
            } else {
                point.value = std::stod(row[1]);
                point.status = EntropyStatus::VALID;
            }
            result.push_back(point);
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }
    return result;
}

void DataHistory::saveEntropy(const std::filesystem::path& file_path, const EntropySeries& series) {
    std::ostringstream out;
    out << "date,entropy\n";
    out << std::setprecision(17);
    for (const auto& p : series) {
        out << p.date.toString() << ',';
        if (p.valid()) {
            out << p.value;
        }
        out << '\n';
    }
    writeAtomic(file_path, out.str());
}

void DataHistory::writeAtomic(const std::filesystem::path& file_path, const std::string& content) {
    if (file_path.has_parent_path()) {
        std::filesystem::create_directories(file_path.parent_path());
    }

    auto tmp_path = file_path;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("Failed to write " + tmp_path.string());
        }
        out << content;
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, file_path, ec);
    if (!ec) {
        return;
    }

    // Some filesystems refuse to rename over an existing file.
    ec.clear();
    std::filesystem::copy_file(tmp_path, file_path,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        throw std::runtime_error("Failed to replace " + file_path.string() + ": " + ec.message());
    }
    std::filesystem::remove(tmp_path, ec);
}

} // namespace data
} // namespace emis
