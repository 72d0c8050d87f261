#pragma once

#include "marketobservation.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace execmetrics {

inline constexpr char kNoMarketDataReason[] = "no market data for instrument";
inline constexpr char kOutsideToleranceReason[] = "no observation within tolerance";

struct Quote {
    Price bid;
    Price ask;
};

struct Benchmark {
    Price price;
    bool interpolated;                   // false for exact match or single-sided fallback
    std::optional<Quote> prevailingQuote; // Nearest two-sided quote at-or-before the target
};

struct BenchmarkResult {
    std::optional<Benchmark> benchmark;
    std::string reason; // Set when unresolved

    [[nodiscard]] bool resolved() const { return benchmark.has_value(); }
};

struct SeriesIndexOptions {
    // Keep only observations in this market state (observations without a state are kept)
    std::string marketState;
};

class MarketSeriesIndex {
public:
    using Series = std::vector<MarketObservation>;

    MarketSeriesIndex() = default;

    // Group by instrument, sort by time, validate; throws DataIntegrityError
    explicit MarketSeriesIndex(std::vector<MarketObservation> observations, const SeriesIndexOptions& options = {});

    // Benchmark price at timestamp, looking at most `tolerance` away on either side
    [[nodiscard]] BenchmarkResult resolveBenchmark(const std::string& instrumentId, Timestamp timestamp,
                                                   Duration tolerance) const;

    // Ordered series for one instrument, nullptr when none
    [[nodiscard]] const Series* seriesFor(const std::string& instrumentId) const;

    // Earliest and latest indexed timestamp
    [[nodiscard]] std::optional<std::pair<Timestamp, Timestamp>> timeRange() const;

    [[nodiscard]] size_t instrumentCount() const { return m_series.size(); }
    [[nodiscard]] size_t observationCount() const { return m_observationCount; }
    [[nodiscard]] size_t filteredCount() const { return m_filteredCount; }
    [[nodiscard]] size_t duplicateCount() const { return m_duplicateCount; }

private:
    static void validate(const MarketObservation& observation);

    // Sort and collapse identical duplicates; returns number of removed rows
    static size_t normalize(const std::string& instrumentId, Series& series);

    std::unordered_map<std::string, Series> m_series;
    size_t m_observationCount = 0;
    size_t m_filteredCount = 0;
    size_t m_duplicateCount = 0;
};

} // namespace execmetrics
