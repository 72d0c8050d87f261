#pragma once

#include "metricsengine.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace execmetrics {

struct ReportPaths {
    std::string summary; // The configured output path
    std::string details; // <stem>_details<ext>
    std::string skipped; // <stem>_skipped<ext>
};

[[nodiscard]] ReportPaths reportPathsFor(const std::string& outputPath);

void writeSummary(std::ostream& out, const std::vector<AggregateRow>& rows);
void writeDetails(std::ostream& out, const std::vector<MetricRecord>& records);
void writeSkipped(std::ostream& out, const std::vector<SkippedExecution>& skipped);

// Write all three tables, creating parent directories; throws std::runtime_error on I/O failure
ReportPaths writeReport(const Report& report, const std::string& outputPath);

} // namespace execmetrics
