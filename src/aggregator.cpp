#include "aggregator.hpp"

#include <cmath>

namespace execmetrics {

const char* toString(GroupDimension dimension)
{
    switch (dimension) {
    case GroupDimension::Overall:
        return "overall";
    case GroupDimension::Instrument:
        return "instrument";
    case GroupDimension::Side:
        return "side";
    case GroupDimension::Venue:
        return "venue";
    }
    return "unknown";
}

void Aggregator::StableSum::add(double value)
{
    double total = m_sum + value;
    if (std::fabs(m_sum) >= std::fabs(value)) {
        m_compensation += (m_sum - total) + value;
    } else {
        m_compensation += (value - total) + m_sum;
    }
    m_sum = total;
}

void Aggregator::StableSum::merge(const StableSum& other)
{
    add(other.m_sum);
    add(other.m_compensation);
}

void Aggregator::Accumulator::add(const MetricRecord& record)
{
    ++count;
    quantity.add(record.quantity);
    notional.add(record.notional);
    weightedSlippage.add(record.quantity * record.slippage);
    weightedSlippageBps.add(record.quantity * record.slippageBps);
}

void Aggregator::Accumulator::merge(const Accumulator& other)
{
    count += other.count;
    quantity.merge(other.quantity);
    notional.merge(other.notional);
    weightedSlippage.merge(other.weightedSlippage);
    weightedSlippageBps.merge(other.weightedSlippageBps);
}

AggregateRow Aggregator::Accumulator::toRow(GroupDimension dimension, const std::string& key) const
{
    AggregateRow row{dimension, key, count, quantity.value(), notional.value(), 0.0, 0.0};
    double weight = quantity.value();
    if (weight > 0.0) {
        row.weightedSlippage = weightedSlippage.value() / weight;
        row.weightedSlippageBps = weightedSlippageBps.value() / weight;
    }
    return row;
}

void Aggregator::add(const MetricRecord& record)
{
    m_overall.add(record);
    m_byInstrument[record.instrumentId].add(record);
    m_bySide[toString(record.side)].add(record);
    if (!record.venue.empty()) {
        m_byVenue[record.venue].add(record);
    }
}

void Aggregator::mergeGroups(std::map<std::string, Accumulator>& into, const std::map<std::string, Accumulator>& from)
{
    for (const auto& [key, accumulator] : from) {
        into[key].merge(accumulator);
    }
}

void Aggregator::merge(const Aggregator& other)
{
    m_overall.merge(other.m_overall);
    mergeGroups(m_byInstrument, other.m_byInstrument);
    mergeGroups(m_bySide, other.m_bySide);
    mergeGroups(m_byVenue, other.m_byVenue);
}

std::vector<AggregateRow> Aggregator::rows() const
{
    std::vector<AggregateRow> result;
    result.reserve(1 + m_byInstrument.size() + m_bySide.size() + m_byVenue.size());

    result.push_back(m_overall.toRow(GroupDimension::Overall, kOverallKey));
    for (const auto& [key, accumulator] : m_byInstrument) {
        result.push_back(accumulator.toRow(GroupDimension::Instrument, key));
    }
    for (const auto& [key, accumulator] : m_bySide) {
        result.push_back(accumulator.toRow(GroupDimension::Side, key));
    }
    for (const auto& [key, accumulator] : m_byVenue) {
        result.push_back(accumulator.toRow(GroupDimension::Venue, key));
    }
    return result;
}

} // namespace execmetrics
