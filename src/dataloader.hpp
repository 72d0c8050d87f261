#pragma once

#include "execution.hpp"
#include "instrument.hpp"
#include "marketobservation.hpp"
#include "metricrecord.hpp"

#include <istream>
#include <string>
#include <vector>

namespace execmetrics {

struct LoadedExecutions {
    std::vector<Execution> executions;
    std::vector<SkippedExecution> rejected; // Rows that could not be parsed
};

// Executions: execution_id, instrument_id, side, quantity, price, timestamp [, venue, phase]
LoadedExecutions loadExecutions(const std::string& path);
LoadedExecutions loadExecutions(std::istream& input, const std::string& source);

// Reference data: instrument_id, currency, multiplier, tick_size
// Unparseable rows throw DataIntegrityError
std::vector<Instrument> loadInstruments(const std::string& path);
std::vector<Instrument> loadInstruments(std::istream& input, const std::string& source);

// Market data: instrument_id, timestamp, bid, ask, last, volume [, market_state]
// Unparseable rows throw DataIntegrityError
std::vector<MarketObservation> loadMarketData(const std::string& path);
std::vector<MarketObservation> loadMarketData(std::istream& input, const std::string& source);

} // namespace execmetrics
