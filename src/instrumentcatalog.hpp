#pragma once

#include "instrument.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace execmetrics {

class InstrumentCatalog {
public:
    InstrumentCatalog() = default;

    // Build from reference rows; throws DataIntegrityError on duplicates or invalid attributes
    static InstrumentCatalog fromInstruments(std::vector<Instrument> instruments);

    // Add a single instrument (same checks as fromInstruments)
    void addInstrument(Instrument instrument);

    // Lookup by id, nullptr when unknown
    [[nodiscard]] const Instrument* find(const std::string& id) const;

    [[nodiscard]] bool contains(const std::string& id) const { return m_instruments.count(id) != 0; }

    // All instrument ids, sorted
    [[nodiscard]] std::vector<std::string> allIds() const;

    [[nodiscard]] size_t count() const { return m_instruments.size(); }

private:
    std::unordered_map<std::string, Instrument> m_instruments;
};

} // namespace execmetrics
