#pragma once

#include "execution.hpp"
#include "marketseriesindex.hpp"

#include <optional>
#include <utility>
#include <vector>

namespace execmetrics {

// Descriptive statistics of the inputs, reported before computing metrics
struct DatasetProfile {
    size_t executionCount = 0;
    size_t uniqueVenues = 0;
    size_t uniqueDates = 0; // Distinct UTC trade dates
    std::optional<std::pair<Timestamp, Timestamp>> executionTimeRange;
    std::optional<std::pair<Timestamp, Timestamp>> marketTimeRange;
};

[[nodiscard]] DatasetProfile profileDatasets(const std::vector<Execution>& executions, const MarketSeriesIndex& index);

// One INFO line per statistic
void logProfile(const DatasetProfile& profile);

} // namespace execmetrics
