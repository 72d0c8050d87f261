#pragma once

#include <cstdint>
#include <string>

namespace execmetrics {

using Price = double;       // Raw instrument price (multiplier not applied)
using Qty = double;         // Filled quantity, always positive after validation
using Timestamp = int64_t;  // Nanoseconds since epoch (UTC)
using Duration = int64_t;   // Nanoseconds

constexpr Duration kNanosPerMilli = 1'000'000;
constexpr Duration kNanosPerSecond = 1'000'000'000;

// Side of the execution
enum class Side : uint8_t { Buy = 1, Sell = 2 };

// Sign applied to (execution price - benchmark)
enum class SlippageConvention : uint8_t {
    PositiveIsFavorable = 1, // sell +1, buy -1
    PositiveIsAdverse = 2    // sell -1, buy +1
};

[[nodiscard]] inline const char* toString(Side side) { return side == Side::Buy ? "BUY" : "SELL"; }

[[nodiscard]] inline const char* toString(SlippageConvention convention)
{
    return convention == SlippageConvention::PositiveIsFavorable ? "favorable" : "adverse";
}

} // namespace execmetrics
