#pragma once

#include "types.hpp"

#include <optional>
#include <string>

namespace execmetrics {

struct MarketObservation {
    std::string instrumentId;
    Timestamp timestamp;
    std::optional<Price> bid;
    std::optional<Price> ask;
    std::optional<Price> last;
    double volume;           // Traded volume, non-negative
    std::string marketState; // "CONTINUOUS_TRADING", "AUCTION"... empty when not reported

    // Price used as benchmark: last trade, else mid, else the sole quoted side
    [[nodiscard]] std::optional<Price> usablePrice() const
    {
        if (last) {
            return last;
        }
        if (bid && ask) {
            return (*bid + *ask) / 2.0;
        }
        if (bid) {
            return bid;
        }
        return ask;
    }

    [[nodiscard]] bool hasQuote() const { return bid.has_value() && ask.has_value(); }

    // Same bid/ask/last, absent matching absent
    [[nodiscard]] bool samePrices(const MarketObservation& other) const
    {
        return bid == other.bid && ask == other.ask && last == other.last;
    }
};

} // namespace execmetrics
