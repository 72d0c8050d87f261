#pragma once

#include "types.hpp"

#include <cmath>
#include <string>

namespace execmetrics {

struct Instrument {
    std::string id;       // "XYZ", ISIN, listing id...
    std::string currency; // "USD", "EUR"
    double multiplier;    // Scales raw price to notional
    Price tickSize;       // Minimum price increment

    // Reference data is usable only with a positive multiplier and tick
    [[nodiscard]] bool isValid() const
    {
        return !id.empty() && std::isfinite(multiplier) && multiplier > 0.0 && std::isfinite(tickSize) &&
               tickSize > 0.0;
    }

    // Number of ticks spanned by a price difference
    [[nodiscard]] double toTicks(Price difference) const { return difference / tickSize; }
};

} // namespace execmetrics
