#include "marketseriesindex.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace execmetrics {

namespace {

bool finiteOrAbsent(const std::optional<Price>& price) { return !price || std::isfinite(*price); }

BenchmarkResult unresolved(const char* reason)
{
    BenchmarkResult result;
    result.reason = reason;
    return result;
}

} // namespace

MarketSeriesIndex::MarketSeriesIndex(std::vector<MarketObservation> observations, const SeriesIndexOptions& options)
{
    for (auto& observation : observations) {
        if (!options.marketState.empty() && !observation.marketState.empty() &&
            observation.marketState != options.marketState) {
            ++m_filteredCount;
            continue;
        }
        validate(observation);
        m_series[observation.instrumentId].push_back(std::move(observation));
    }

    for (auto& [instrumentId, series] : m_series) {
        m_duplicateCount += normalize(instrumentId, series);
        m_observationCount += series.size();
    }
}

void MarketSeriesIndex::validate(const MarketObservation& observation)
{
    std::ostringstream message;
    message << "market observation for '" << observation.instrumentId << "' at " << observation.timestamp << ": ";

    if (observation.instrumentId.empty()) {
        throw DataIntegrityError("market observation without instrument id at " +
                                 std::to_string(observation.timestamp));
    }
    if (!finiteOrAbsent(observation.bid) || !finiteOrAbsent(observation.ask) || !finiteOrAbsent(observation.last)) {
        message << "non-finite price";
        throw DataIntegrityError(message.str());
    }
    if (observation.hasQuote() && *observation.bid > *observation.ask) {
        message << "crossed quote (bid " << *observation.bid << " > ask " << *observation.ask << ")";
        throw DataIntegrityError(message.str());
    }
    if (!std::isfinite(observation.volume) || observation.volume < 0.0) {
        message << "invalid volume " << observation.volume;
        throw DataIntegrityError(message.str());
    }
}

size_t MarketSeriesIndex::normalize(const std::string& instrumentId, Series& series)
{
    std::stable_sort(series.begin(), series.end(), [](const MarketObservation& lhs, const MarketObservation& rhs) {
        return lhs.timestamp < rhs.timestamp;
    });

    Series unique;
    unique.reserve(series.size());
    for (auto& observation : series) {
        if (!unique.empty() && unique.back().timestamp == observation.timestamp) {
            if (!unique.back().samePrices(observation)) {
                std::ostringstream message;
                message << "conflicting market observations for '" << instrumentId << "' at timestamp "
                        << observation.timestamp;
                throw DataIntegrityError(message.str());
            }
            continue;
        }
        unique.push_back(std::move(observation));
    }

    size_t removed = series.size() - unique.size();
    series = std::move(unique);
    return removed;
}

BenchmarkResult MarketSeriesIndex::resolveBenchmark(const std::string& instrumentId, Timestamp timestamp,
                                                    Duration tolerance) const
{
    if (tolerance < 0) {
        throw std::invalid_argument("benchmark tolerance must be non-negative");
    }

    const Series* series = seriesFor(instrumentId);
    if (series == nullptr || series->empty()) {
        return unresolved(kNoMarketDataReason);
    }

    auto pivot = std::lower_bound(series->begin(), series->end(), timestamp,
                                  [](const MarketObservation& observation, Timestamp target) {
                                      return observation.timestamp < target;
                                  });

    // Nearest usable at-or-after, skipping observations without any price
    const MarketObservation* after = nullptr;
    for (auto it = pivot; it != series->end() && it->timestamp - timestamp <= tolerance; ++it) {
        if (it->usablePrice()) {
            after = &*it;
            break;
        }
    }

    // Nearest usable strictly before
    const MarketObservation* before = nullptr;
    for (auto it = pivot; it != series->begin();) {
        --it;
        if (timestamp - it->timestamp > tolerance) {
            break;
        }
        if (it->usablePrice()) {
            before = &*it;
            break;
        }
    }

    if (before == nullptr && after == nullptr) {
        return unresolved(kOutsideToleranceReason);
    }

    Benchmark benchmark{};
    if (after != nullptr && (after->timestamp == timestamp || before == nullptr)) {
        benchmark.price = *after->usablePrice();
        benchmark.interpolated = false;
    } else if (after == nullptr) {
        benchmark.price = *before->usablePrice();
        benchmark.interpolated = false;
    } else {
        Price beforePrice = *before->usablePrice();
        Price afterPrice = *after->usablePrice();
        double fraction = static_cast<double>(timestamp - before->timestamp) /
                          static_cast<double>(after->timestamp - before->timestamp);
        benchmark.price = beforePrice + (afterPrice - beforePrice) * fraction;
        benchmark.interpolated = true;
    }

    // Prevailing two-sided quote at-or-before the target
    auto upper = std::upper_bound(series->begin(), series->end(), timestamp,
                                  [](Timestamp target, const MarketObservation& observation) {
                                      return target < observation.timestamp;
                                  });
    for (auto it = upper; it != series->begin();) {
        --it;
        if (timestamp - it->timestamp > tolerance) {
            break;
        }
        if (it->hasQuote()) {
            benchmark.prevailingQuote = Quote{*it->bid, *it->ask};
            break;
        }
    }

    BenchmarkResult result;
    result.benchmark = benchmark;
    return result;
}

const MarketSeriesIndex::Series* MarketSeriesIndex::seriesFor(const std::string& instrumentId) const
{
    auto iterator = m_series.find(instrumentId);
    if (iterator == m_series.end()) {
        return nullptr;
    }
    return &iterator->second;
}

std::optional<std::pair<Timestamp, Timestamp>> MarketSeriesIndex::timeRange() const
{
    std::optional<std::pair<Timestamp, Timestamp>> range;
    for (const auto& [instrumentId, series] : m_series) {
        if (series.empty()) {
            continue;
        }
        if (!range) {
            range = std::make_pair(series.front().timestamp, series.back().timestamp);
            continue;
        }
        range->first = std::min(range->first, series.front().timestamp);
        range->second = std::max(range->second, series.back().timestamp);
    }
    return range;
}

} // namespace execmetrics
