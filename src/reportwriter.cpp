#include "reportwriter.hpp"

#include <filesystem>
#include <fstream>
#include <functional>
#include <stdexcept>

namespace execmetrics {

namespace fs = std::filesystem;

namespace {

constexpr int kPrecision = 10;

void writeFile(const std::string& path, const std::function<void(std::ostream&)>& write)
{
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open output file: " + path);
    }
    write(file);
    file.flush();
    if (!file) {
        throw std::runtime_error("Failed to write output file: " + path);
    }
}

} // namespace

ReportPaths reportPathsFor(const std::string& outputPath)
{
    fs::path summary(outputPath);
    std::string extension = summary.has_extension() ? summary.extension().string() : std::string(".csv");
    fs::path base = summary.parent_path() / summary.stem();

    return {summary.string(), base.string() + "_details" + extension, base.string() + "_skipped" + extension};
}

void writeSummary(std::ostream& out, const std::vector<AggregateRow>& rows)
{
    out.precision(kPrecision);
    out << "dimension,key,execution_count,total_quantity,total_notional,weighted_slippage,weighted_slippage_bps\n";
    for (const auto& row : rows) {
        out << toString(row.dimension) << ',' << row.key << ',' << row.executionCount << ',' << row.totalQuantity
            << ',' << row.totalNotional << ',' << row.weightedSlippage << ',' << row.weightedSlippageBps << '\n';
    }
}

void writeDetails(std::ostream& out, const std::vector<MetricRecord>& records)
{
    out.precision(kPrecision);
    out << "execution_id,instrument_id,currency,venue,side,quantity,price,benchmark_price,slippage,slippage_bps,"
           "slippage_ticks,notional,spread_capture\n";
    for (const auto& record : records) {
        out << record.executionId << ',' << record.instrumentId << ',' << record.currency << ',' << record.venue << ','
            << toString(record.side) << ',' << record.quantity << ',' << record.price << ',' << record.benchmarkPrice
            << ',' << record.slippage << ',' << record.slippageBps << ',' << record.slippageTicks << ','
            << record.notional << ',';
        if (record.spreadCapture) {
            out << *record.spreadCapture;
        }
        out << '\n';
    }
}

void writeSkipped(std::ostream& out, const std::vector<SkippedExecution>& skipped)
{
    out << "execution_id,reason\n";
    for (const auto& entry : skipped) {
        // Reasons may quote user input; keep the table two columns wide
        std::string reason = entry.reason;
        for (auto& c : reason) {
            if (c == ',' || c == '\n') {
                c = ';';
            }
        }
        out << entry.executionId << ',' << reason << '\n';
    }
}

ReportPaths writeReport(const Report& report, const std::string& outputPath)
{
    ReportPaths paths = reportPathsFor(outputPath);

    fs::path directory = fs::path(outputPath).parent_path();
    if (!directory.empty()) {
        std::error_code error;
        fs::create_directories(directory, error);
        if (error) {
            throw std::runtime_error("Failed to create output directory " + directory.string() + ": " +
                                     error.message());
        }
    }

    writeFile(paths.summary, [&](std::ostream& out) { writeSummary(out, report.aggregates); });
    writeFile(paths.details, [&](std::ostream& out) { writeDetails(out, report.details); });
    writeFile(paths.skipped, [&](std::ostream& out) { writeSkipped(out, report.skipped); });
    return paths;
}

} // namespace execmetrics
