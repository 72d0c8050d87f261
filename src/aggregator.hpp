#pragma once

#include "metricrecord.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace execmetrics {

inline constexpr char kOverallKey[] = "overall";

enum class GroupDimension : uint8_t { Overall = 0, Instrument = 1, Side = 2, Venue = 3 };

[[nodiscard]] const char* toString(GroupDimension dimension);

struct AggregateRow {
    GroupDimension dimension;
    std::string key;
    size_t executionCount;
    Qty totalQuantity;
    double totalNotional;
    double weightedSlippage;    // Quantity-weighted, price units
    double weightedSlippageBps; // Quantity-weighted, basis points
};

// Order-independent fold of MetricRecords into grouped summaries.
// Weighted averages are kept as sums of (quantity * value) and divided once in rows().
class Aggregator {
public:
    void add(const MetricRecord& record);

    // Combine partial results (e.g. from separate workers)
    void merge(const Aggregator& other);

    // Overall row first, then instrument, side and venue groups sorted by key
    [[nodiscard]] std::vector<AggregateRow> rows() const;

    [[nodiscard]] size_t count() const { return m_overall.count; }

private:
    // Neumaier compensated sum
    class StableSum {
    public:
        void add(double value);
        void merge(const StableSum& other);
        [[nodiscard]] double value() const { return m_sum + m_compensation; }

    private:
        double m_sum = 0.0;
        double m_compensation = 0.0;
    };

    struct Accumulator {
        size_t count = 0;
        StableSum quantity;
        StableSum notional;
        StableSum weightedSlippage;
        StableSum weightedSlippageBps;

        void add(const MetricRecord& record);
        void merge(const Accumulator& other);
        [[nodiscard]] AggregateRow toRow(GroupDimension dimension, const std::string& key) const;
    };

    static void mergeGroups(std::map<std::string, Accumulator>& into, const std::map<std::string, Accumulator>& from);

    Accumulator m_overall;
    std::map<std::string, Accumulator> m_byInstrument;
    std::map<std::string, Accumulator> m_bySide;
    std::map<std::string, Accumulator> m_byVenue;
};

} // namespace execmetrics
