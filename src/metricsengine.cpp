#include "metricsengine.hpp"
#include "errors.hpp"
#include "logger.hpp"

#include <algorithm>
#include <future>
#include <stdexcept>
#include <thread>
#include <unordered_set>

namespace execmetrics {

void Report::addSkipped(const std::vector<SkippedExecution>& rejected)
{
    skipped.insert(skipped.end(), rejected.begin(), rejected.end());
}

MetricsEngine::MetricsEngine(const InstrumentCatalog& catalog, const MarketSeriesIndex& index, EngineConfig config)
    : m_catalog(catalog), m_index(index), m_config(std::move(config)), m_calculator(m_config.convention)
{
    if (m_config.tolerance < 0) {
        throw std::invalid_argument("benchmark tolerance must be non-negative");
    }
    if (m_config.workerThreads == 0) {
        throw std::invalid_argument("worker thread count must be positive");
    }
}

ExecutionOutcome MetricsEngine::skip(const Execution& execution, std::string reason)
{
    ExecutionOutcome outcome;
    outcome.skipped = {execution.id, std::move(reason)};
    return outcome;
}

ExecutionOutcome MetricsEngine::resolve(const Execution& execution) const
{
    if (!m_config.tradingPhase.empty() && execution.phase != m_config.tradingPhase) {
        return skip(execution, "trading phase excluded: " + (execution.phase.empty() ? "<none>" : execution.phase));
    }

    const Instrument* instrument = m_catalog.find(execution.instrumentId);
    if (instrument == nullptr) {
        return skip(execution, kUnknownInstrumentReason);
    }

    BenchmarkResult benchmark = m_index.resolveBenchmark(execution.instrumentId, execution.timestamp,
                                                         m_config.tolerance);
    if (!benchmark.resolved()) {
        return skip(execution, benchmark.reason);
    }

    try {
        ExecutionOutcome outcome;
        outcome.record = m_calculator.compute(execution, *instrument, *benchmark.benchmark);
        return outcome;
    } catch (const ValidationError& e) {
        return skip(execution, e.what());
    } catch (const UnresolvedError& e) {
        return skip(execution, e.what());
    }
}

size_t MetricsEngine::workerCount(size_t batchSize) const
{
    size_t workers = m_config.workerThreads;
    size_t hardware = std::thread::hardware_concurrency();
    if (hardware > 0) {
        workers = std::min(workers, hardware);
    }
    return std::min(workers, std::max<size_t>(batchSize, 1));
}

std::vector<ExecutionOutcome> MetricsEngine::resolveAll(const std::vector<Execution>& executions) const
{
    std::vector<ExecutionOutcome> outcomes(executions.size());
    size_t workers = workerCount(executions.size());

    auto resolveRange = [this, &executions, &outcomes](size_t begin, size_t end) {
        for (size_t i = begin; i < end; ++i) {
            outcomes[i] = resolve(executions[i]);
        }
    };

    if (workers <= 1) {
        resolveRange(0, executions.size());
        return outcomes;
    }

    // Contiguous chunks, each writing its own slots of `outcomes`
    size_t chunk = (executions.size() + workers - 1) / workers;
    std::vector<std::future<void>> futures;
    futures.reserve(workers);
    for (size_t begin = 0; begin < executions.size(); begin += chunk) {
        size_t end = std::min(begin + chunk, executions.size());
        futures.push_back(std::async(std::launch::async, resolveRange, begin, end));
    }
    for (auto& future : futures) {
        future.get();
    }
    return outcomes;
}

Report MetricsEngine::run(const std::vector<Execution>& executions) const
{
    auto& logger = Logger::instance();

    // First occurrence of an id wins; later ones are skipped before resolution
    std::vector<Execution> unique;
    std::vector<SkippedExecution> duplicates;
    unique.reserve(executions.size());
    std::unordered_set<std::string> seen;
    for (const auto& execution : executions) {
        if (!seen.insert(execution.id).second) {
            duplicates.push_back({execution.id, kDuplicateExecutionReason});
            continue;
        }
        unique.push_back(execution);
    }

    std::vector<ExecutionOutcome> outcomes = resolveAll(unique);

    Report report;
    Aggregator aggregator;
    for (auto& outcome : outcomes) {
        if (outcome.resolved()) {
            aggregator.add(*outcome.record);
            report.details.push_back(std::move(*outcome.record));
        } else {
            logger.debug("Skipped execution ", outcome.skipped.executionId, ": ", outcome.skipped.reason);
            report.skipped.push_back(std::move(outcome.skipped));
        }
    }
    report.addSkipped(duplicates);
    report.aggregates = aggregator.rows();

    logger.info("Resolved ", report.details.size(), " of ", executions.size(), " executions");
    if (!report.skipped.empty()) {
        logger.warning("Skipped ", report.skipped.size(), " executions");
    }
    return report;
}

} // namespace execmetrics
