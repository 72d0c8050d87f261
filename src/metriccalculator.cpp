#include "metriccalculator.hpp"
#include "errors.hpp"

#include <cmath>
#include <sstream>

namespace execmetrics {

namespace {

constexpr double kBasisPoints = 10000.0;

void requireFinite(double value, const char* name, const Execution& execution)
{
    if (!std::isfinite(value)) {
        throw ValidationError(std::string("non-finite ") + name + " for execution " + execution.id);
    }
}

} // namespace

double MetricCalculator::sideSign(Side side) const
{
    double favorableSign = (side == Side::Sell) ? 1.0 : -1.0;
    return m_convention == SlippageConvention::PositiveIsFavorable ? favorableSign : -favorableSign;
}

MetricRecord MetricCalculator::compute(const Execution& execution, const Instrument& instrument,
                                       Price benchmarkPrice) const
{
    return compute(execution, instrument, Benchmark{benchmarkPrice, false, std::nullopt});
}

MetricRecord MetricCalculator::compute(const Execution& execution, const Instrument& instrument,
                                       const Benchmark& benchmark) const
{
    if (!std::isfinite(execution.quantity) || execution.quantity <= 0.0) {
        std::ostringstream message;
        message << "non-positive quantity " << execution.quantity;
        throw ValidationError(message.str());
    }
    if (!std::isfinite(execution.price) || execution.price <= 0.0) {
        std::ostringstream message;
        message << "non-positive price " << execution.price;
        throw ValidationError(message.str());
    }
    if (!std::isfinite(benchmark.price)) {
        std::ostringstream message;
        message << "non-finite benchmark price " << benchmark.price;
        throw UnresolvedError(message.str());
    }
    if (benchmark.price == 0.0) {
        throw UnresolvedError("benchmark price is zero");
    }

    MetricRecord record{};
    record.executionId = execution.id;
    record.instrumentId = execution.instrumentId;
    record.currency = instrument.currency;
    record.venue = execution.venue;
    record.side = execution.side;
    record.quantity = execution.quantity;
    record.price = execution.price;
    record.benchmarkPrice = benchmark.price;

    record.notional = execution.quantity * execution.price * instrument.multiplier;
    record.slippage = (execution.price - benchmark.price) * sideSign(execution.side);
    record.slippageBps = record.slippage / benchmark.price * kBasisPoints;
    record.slippageTicks = instrument.toTicks(record.slippage);

    if (benchmark.prevailingQuote) {
        const Quote& quote = *benchmark.prevailingQuote;
        double spread = quote.ask - quote.bid;
        if (spread > 0.0) {
            record.spreadCapture = (execution.side == Side::Buy) ? (quote.ask - execution.price) / spread
                                                                 : (execution.price - quote.bid) / spread;
            requireFinite(*record.spreadCapture, "spread capture", execution);
        }
    }

    requireFinite(record.notional, "notional", execution);
    requireFinite(record.slippage, "slippage", execution);
    requireFinite(record.slippageBps, "slippage bps", execution);
    requireFinite(record.slippageTicks, "slippage ticks", execution);

    return record;
}

} // namespace execmetrics
