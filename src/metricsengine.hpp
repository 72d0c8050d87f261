#pragma once

#include "aggregator.hpp"
#include "execution.hpp"
#include "instrumentcatalog.hpp"
#include "marketseriesindex.hpp"
#include "metriccalculator.hpp"

#include <optional>
#include <string>
#include <vector>

namespace execmetrics {

inline constexpr char kUnknownInstrumentReason[] = "unknown instrument";
inline constexpr char kDuplicateExecutionReason[] = "duplicate execution id";

struct EngineConfig {
    Duration tolerance = kNanosPerSecond; // Max distance to a benchmark observation
    SlippageConvention convention = SlippageConvention::PositiveIsFavorable;
    std::string tradingPhase; // Only executions in this phase (empty = all)
    size_t workerThreads = 1;
};

// Result of resolving a single execution: a record or a skip reason
struct ExecutionOutcome {
    std::optional<MetricRecord> record;
    SkippedExecution skipped;

    [[nodiscard]] bool resolved() const { return record.has_value(); }
};

struct Report {
    // Overall row first; a report that has not been run holds an empty overall row
    std::vector<AggregateRow> aggregates{{GroupDimension::Overall, kOverallKey, 0, 0.0, 0.0, 0.0, 0.0}};
    std::vector<MetricRecord> details;
    std::vector<SkippedExecution> skipped;

    // Executions rejected before the engine saw them (e.g. unparseable rows)
    void addSkipped(const std::vector<SkippedExecution>& rejected);

    [[nodiscard]] const AggregateRow& overall() const { return aggregates.front(); }
};

class MetricsEngine {
public:
    MetricsEngine(const InstrumentCatalog& catalog, const MarketSeriesIndex& index, EngineConfig config = {});

    // Pure per-execution resolution; never throws for bad executions
    [[nodiscard]] ExecutionOutcome resolve(const Execution& execution) const;

    // Resolve all executions and aggregate the resolved ones
    [[nodiscard]] Report run(const std::vector<Execution>& executions) const;

    // Threads used for a batch: configured count, capped by hardware concurrency and batch size
    [[nodiscard]] size_t workerCount(size_t batchSize) const;

    [[nodiscard]] const EngineConfig& config() const { return m_config; }

private:
    [[nodiscard]] std::vector<ExecutionOutcome> resolveAll(const std::vector<Execution>& executions) const;

    static ExecutionOutcome skip(const Execution& execution, std::string reason);

    const InstrumentCatalog& m_catalog;
    const MarketSeriesIndex& m_index;
    EngineConfig m_config;
    MetricCalculator m_calculator;
};

} // namespace execmetrics
