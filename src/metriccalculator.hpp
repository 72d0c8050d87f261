#pragma once

#include "execution.hpp"
#include "instrument.hpp"
#include "marketseriesindex.hpp"
#include "metricrecord.hpp"

namespace execmetrics {

class MetricCalculator {
public:
    explicit MetricCalculator(SlippageConvention convention = SlippageConvention::PositiveIsFavorable)
        : m_convention(convention)
    {
    }

    // Throws ValidationError for invalid executions or non-finite results,
    // UnresolvedError when the benchmark price is zero
    [[nodiscard]] MetricRecord compute(const Execution& execution, const Instrument& instrument,
                                       const Benchmark& benchmark) const;

    // Convenience overload without a prevailing quote
    [[nodiscard]] MetricRecord compute(const Execution& execution, const Instrument& instrument,
                                       Price benchmarkPrice) const;

    [[nodiscard]] double sideSign(Side side) const;

    [[nodiscard]] SlippageConvention convention() const { return m_convention; }

private:
    SlippageConvention m_convention;
};

} // namespace execmetrics
