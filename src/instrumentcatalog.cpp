#include "instrumentcatalog.hpp"
#include "errors.hpp"

#include <algorithm>
#include <sstream>

namespace execmetrics {

InstrumentCatalog InstrumentCatalog::fromInstruments(std::vector<Instrument> instruments)
{
    InstrumentCatalog catalog;
    catalog.m_instruments.reserve(instruments.size());
    for (auto& instrument : instruments) {
        catalog.addInstrument(std::move(instrument));
    }
    return catalog;
}

void InstrumentCatalog::addInstrument(Instrument instrument)
{
    if (!instrument.isValid()) {
        std::ostringstream message;
        message << "invalid reference data for instrument '" << instrument.id << "' (multiplier "
                << instrument.multiplier << ", tick size " << instrument.tickSize << ")";
        throw DataIntegrityError(message.str());
    }

    auto [iterator, inserted] = m_instruments.try_emplace(instrument.id, instrument);
    if (!inserted) {
        throw DataIntegrityError("duplicate instrument id in reference data: " + iterator->first);
    }
}

const Instrument* InstrumentCatalog::find(const std::string& id) const
{
    auto iterator = m_instruments.find(id);
    if (iterator == m_instruments.end()) {
        return nullptr;
    }
    return &iterator->second;
}

std::vector<std::string> InstrumentCatalog::allIds() const
{
    std::vector<std::string> ids;
    ids.reserve(m_instruments.size());
    for (const auto& [id, instrument] : m_instruments) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace execmetrics
