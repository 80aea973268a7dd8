#include "engine/ReportWriter.h"
#include "data/DataHistory.h"
#include "common/Logger.h"
#include <cctype>
#include <iomanip>
#include <sstream>

namespace emis {
namespace engine {

namespace {

std::string fileSafe(const std::string& name) {
    std::string out;
    for (unsigned char c : name) {
        out.push_back(std::isalnum(c) || c == '-' || c == '_' ? static_cast<char>(c) : '_');
    }
    return out;
}

void writeResultColumns(std::ostream& out, const BacktestResult& r) {
    out << r.strategy << ',' << toString(r.mode) << ','
        << std::setprecision(6) << std::fixed
        << r.win_rate << ',' << r.sample_size << ','
        << std::setprecision(8) << r.p_value << ','
        << std::setprecision(6) << r.mean_return << ','
        << std::setprecision(4) << r.t_stat << ','
        << std::setprecision(8) << r.p_return;
}

nlohmann::json resultJson(const BacktestResult& r) {
    return {
        {"strategy", r.strategy},
        {"mode", toString(r.mode)},
        {"sample_size", r.sample_size},
        {"wins", r.wins},
        {"win_rate", r.win_rate},
        {"p_value", r.p_value},
        {"mean_return", r.mean_return},
        {"std_return", r.std_return},
        {"min_return", r.min_return},
        {"max_return", r.max_return},
        {"t_stat", r.t_stat},
        {"p_return", r.p_return},
        {"ci_low", r.ci_low},
        {"ci_high", r.ci_high}
    };
}

}

ReportWriter::ReportWriter(std::filesystem::path output_dir)
    : output_dir_(std::move(output_dir)) {}

std::string ReportWriter::marketCsv(const AggregateReport& report, const std::string& market) {
    std::ostringstream out;
    out << "strategy,mode,win_rate,sample_size,p_value,mean_return,t_stat,p_return\n";
    for (const auto& row : report.rows()) {
        if (row.market != market) continue;
        writeResultColumns(out, row.result);
        out << '\n';
    }
    return out.str();
}

std::string ReportWriter::comparisonCsv(const AggregateReport& report) {
    std::ostringstream out;
    out << "market,strategy,mode,win_rate,sample_size,p_value,mean_return,t_stat,p_return\n";
    for (const auto& row : report.rows()) {
        out << row.market << ',';
        writeResultColumns(out, row.result);
        out << '\n';
    }
    return out.str();
}

std::vector<std::filesystem::path> ReportWriter::write(const AggregateReport& report) const {
    std::vector<std::filesystem::path> written;
    for (const auto& market : report.marketNames()) {
        auto path = output_dir_ / ("results_" + fileSafe(market) + ".csv");
        data::DataHistory::writeAtomic(path, marketCsv(report, market));
        written.push_back(path);
    }

    auto comparison = output_dir_ / "comparison.csv";
    data::DataHistory::writeAtomic(comparison, comparisonCsv(report));
    written.push_back(comparison);

    LOG_INFO("Wrote {} result file(s) to {}", written.size(), output_dir_.string());
    return written;
}

nlohmann::json ReportWriter::toJson(const AggregateReport& report) {
    nlohmann::json j;
    j["markets"] = nlohmann::json::array();
    for (const auto& m : report.reports) {
        nlohmann::json jm;
        jm["market"] = m.market;
        jm["indicator"] = m.indicator;
        jm["benchmark"] = m.benchmark;
        jm["ok"] = m.ok();
        if (!m.ok()) {
            jm["error"] = m.error;
        }
        jm["instruments"] = m.instruments;
        jm["excluded"] = m.excluded;
        jm["return_rows"] = m.return_rows;
        jm["threshold"] = m.threshold;
        jm["training_points"] = m.training_points;
        jm["enter_signals"] = m.enter_signals;
        jm["entropy"] = {
            {"count", m.entropy.count},
            {"valid", m.entropy.valid},
            {"degenerate", m.entropy.degenerate},
            {"min", m.entropy.min},
            {"max", m.entropy.max},
            {"mean", m.entropy.mean}
        };
        jm["results"] = nlohmann::json::array();
        for (const auto& r : m.results) {
            jm["results"].push_back(resultJson(r));
        }
        j["markets"].push_back(jm);
    }

    j["comparison"] = nlohmann::json::array();
    for (const auto& row : report.rows()) {
        auto jr = resultJson(row.result);
        jr["market"] = row.market;
        j["comparison"].push_back(jr);
    }
    return j;
}

std::string ReportWriter::formatTable(const AggregateReport& report) {
    std::ostringstream out;
    out << std::left << std::setw(10) << "market"
        << std::setw(8) << "signal"
        << std::setw(17) << "mode"
        << std::right << std::setw(8) << "trades"
        << std::setw(10) << "win%"
        << std::setw(12) << "p_value"
        << std::setw(10) << "mean%"
        << std::setw(9) << "t" << '\n';
    out << std::string(84, '-') << '\n';

    for (const auto& row : report.rows()) {
        const auto& r = row.result;
        out << std::left << std::setw(10) << row.market
            << std::setw(8) << r.strategy
            << std::setw(17) << toString(r.mode)
            << std::right << std::setw(8) << r.sample_size
            << std::fixed << std::setprecision(1) << std::setw(10) << r.win_rate * 100.0
            << std::setprecision(5) << std::setw(12) << r.p_value
            << std::setprecision(2) << std::setw(10) << r.mean_return * 100.0
            << std::setw(9) << r.t_stat << '\n';
    }

    for (const auto& m : report.reports) {
        if (!m.ok()) {
            out << "! " << m.market << " (" << m.indicator << "): " << m.error << '\n';
        }
    }
    return out.str();
}

} // namespace engine
} // namespace emis
