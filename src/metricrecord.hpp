#pragma once

#include "types.hpp"

#include <optional>
#include <string>

namespace execmetrics {

// Execution-quality metrics of one resolved execution
struct MetricRecord {
    std::string executionId;
    std::string instrumentId;
    std::string currency;
    std::string venue;
    Side side;
    Qty quantity;
    Price price;
    Price benchmarkPrice;
    double slippage;      // Price units, sign per SlippageConvention
    double slippageBps;   // slippage / benchmark * 10000
    double slippageTicks; // slippage / tick size
    double notional;      // quantity * price * multiplier
    std::optional<double> spreadCapture; // 1 = favorable touch, 0 = far touch
};

// Execution excluded from the metrics, with the reason
struct SkippedExecution {
    std::string executionId;
    std::string reason;
};

} // namespace execmetrics
