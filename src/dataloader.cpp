#include "dataloader.hpp"
#include "csvutils.hpp"
#include "errors.hpp"

#include <cmath>
#include <fstream>
#include <functional>
#include <optional>
#include <stdexcept>

namespace execmetrics {

using namespace csv;

namespace {

std::ifstream openFile(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    return file;
}

// Reads the header, then calls `handleRow(fields, lineNumber)` for every non-blank line
void forEachRow(std::istream& input, const std::string& source, const std::function<void(const Header&)>& onHeader,
                const std::function<void(const std::vector<std::string>&, size_t)>& handleRow)
{
    std::string line;
    size_t lineNumber = 0;
    std::optional<Header> header;

    while (std::getline(input, line)) {
        ++lineNumber;
        if (trim(line).empty()) {
            continue;
        }
        if (!header) {
            header.emplace(line);
            onHeader(*header);
            continue;
        }
        handleRow(splitLine(line), lineNumber);
    }

    if (!header) {
        throw std::runtime_error("Missing header row in " + source);
    }
}

Side parseSide(const std::string& text)
{
    std::string side = toUpper(text);
    if (side == "BUY" || side == "B" || side == "1") {
        return Side::Buy;
    }
    if (side == "SELL" || side == "S" || side == "2") {
        return Side::Sell;
    }
    throw std::invalid_argument("invalid side '" + text + "'");
}

std::string rowContext(const std::string& source, size_t lineNumber)
{
    return source + ":" + std::to_string(lineNumber);
}

} // namespace

LoadedExecutions loadExecutions(const std::string& path)
{
    auto file = openFile(path);
    return loadExecutions(file, path);
}

LoadedExecutions loadExecutions(std::istream& input, const std::string& source)
{
    struct Columns {
        size_t id, instrument, side, quantity, price, timestamp;
        std::optional<size_t> venue, phase;
    };
    std::optional<Columns> columns;
    LoadedExecutions loaded;

    forEachRow(
        input, source,
        [&](const Header& header) {
            columns = Columns{header.require("execution_id", source), header.require("instrument_id", source),
                              header.require("side", source),         header.require("quantity", source),
                              header.require("price", source),        header.require("timestamp", source),
                              header.find("venue"),                   header.find("phase")};
        },
        [&](const std::vector<std::string>& fields, size_t lineNumber) {
            std::string id = field(fields, columns->id);
            if (id.empty()) {
                std::string placeholder = "<" + rowContext(source, lineNumber) + ">";
                loaded.rejected.push_back({placeholder, "invalid row: missing execution id"});
                return;
            }

            try {
                Execution execution{};
                execution.id = id;
                execution.instrumentId = field(fields, columns->instrument);
                if (execution.instrumentId.empty()) {
                    throw std::invalid_argument("missing instrument id");
                }
                execution.quantity = parseDouble(field(fields, columns->quantity), "quantity");
                execution.price = parseDouble(field(fields, columns->price), "price");
                execution.timestamp = parseTimestamp(field(fields, columns->timestamp));

                const std::string& side = field(fields, columns->side);
                if (side.empty()) {
                    // Signed quantity: negative means sell
                    execution.side = execution.quantity < 0.0 ? Side::Sell : Side::Buy;
                    execution.quantity = std::fabs(execution.quantity);
                } else {
                    execution.side = parseSide(side);
                }

                execution.venue = field(fields, columns->venue);
                execution.phase = field(fields, columns->phase);
                loaded.executions.push_back(std::move(execution));
            } catch (const std::logic_error& e) {
                loaded.rejected.push_back({id, std::string("invalid row: ") + e.what()});
            }
        });

    return loaded;
}

std::vector<Instrument> loadInstruments(const std::string& path)
{
    auto file = openFile(path);
    return loadInstruments(file, path);
}

std::vector<Instrument> loadInstruments(std::istream& input, const std::string& source)
{
    struct Columns {
        size_t id, currency, multiplier, tickSize;
    };
    std::optional<Columns> columns;
    std::vector<Instrument> instruments;

    forEachRow(
        input, source,
        [&](const Header& header) {
            columns = Columns{header.require("instrument_id", source), header.require("currency", source),
                              header.require("multiplier", source), header.require("tick_size", source)};
        },
        [&](const std::vector<std::string>& fields, size_t lineNumber) {
            try {
                Instrument instrument{};
                instrument.id = field(fields, columns->id);
                instrument.currency = field(fields, columns->currency);
                instrument.multiplier = parseDouble(field(fields, columns->multiplier), "multiplier");
                instrument.tickSize = parseDouble(field(fields, columns->tickSize), "tick size");
                if (instrument.id.empty()) {
                    throw std::invalid_argument("missing instrument id");
                }
                instruments.push_back(std::move(instrument));
            } catch (const std::logic_error& e) {
                throw DataIntegrityError("malformed reference row " + rowContext(source, lineNumber) + ": " +
                                         e.what());
            }
        });

    return instruments;
}

std::vector<MarketObservation> loadMarketData(const std::string& path)
{
    auto file = openFile(path);
    return loadMarketData(file, path);
}

std::vector<MarketObservation> loadMarketData(std::istream& input, const std::string& source)
{
    struct Columns {
        size_t instrument, timestamp, bid, ask, last, volume;
        std::optional<size_t> marketState;
    };
    std::optional<Columns> columns;
    std::vector<MarketObservation> observations;

    forEachRow(
        input, source,
        [&](const Header& header) {
            columns = Columns{header.require("instrument_id", source), header.require("timestamp", source),
                              header.require("bid", source),           header.require("ask", source),
                              header.require("last", source),          header.require("volume", source),
                              header.find("market_state")};
        },
        [&](const std::vector<std::string>& fields, size_t lineNumber) {
            try {
                MarketObservation observation{};
                observation.instrumentId = field(fields, columns->instrument);
                if (observation.instrumentId.empty()) {
                    throw std::invalid_argument("missing instrument id");
                }
                observation.timestamp = parseTimestamp(field(fields, columns->timestamp));
                observation.bid = parseOptionalDouble(field(fields, columns->bid));
                observation.ask = parseOptionalDouble(field(fields, columns->ask));
                observation.last = parseOptionalDouble(field(fields, columns->last));
                observation.volume = parseOptionalDouble(field(fields, columns->volume)).value_or(0.0);
                observation.marketState = field(fields, columns->marketState);
                observations.push_back(std::move(observation));
            } catch (const std::logic_error& e) {
                throw DataIntegrityError("malformed market data row " + rowContext(source, lineNumber) + ": " +
                                         e.what());
            }
        });

    return observations;
}

} // namespace execmetrics
