#pragma once

#include "config.hpp"
#include "metricsengine.hpp"

namespace execmetrics {

// Load inputs, compute metrics and write the report.
// DataIntegrityError and I/O errors propagate; no report is written in that case.
Report runPipeline(const AppConfig& config);

} // namespace execmetrics
