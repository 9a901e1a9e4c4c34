#include "UnitRegistry.hpp"
#include "SIResolver.hpp"
#include "UnitErrors.hpp"

namespace PhysUnits {

UnitRegistry::UnitRegistry(std::shared_ptr<const UnitTable> table)
    : table_(std::move(table)) {
    if (!table_) {
        throw std::invalid_argument("UnitRegistry requires a unit table");
    }
}

std::shared_ptr<const UnitTable> UnitRegistry::table() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return table_;
}

Unit UnitRegistry::unit(const std::string& units) const {
    return Unit(units, table());
}

bool UnitRegistry::hasUnit(const std::string& symbol) const {
    return table()->hasUnit(symbol);
}

std::vector<std::string> UnitRegistry::symbols() const {
    return table()->unitSymbols();
}

Unit UnitRegistry::registerUnit(const std::string& symbol, const std::string& composition,
                                double factor) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (table_->hasUnit(symbol)) {
        throw UnitAlreadyRegistered(symbol);
    }

    auto extended = std::make_shared<UnitTable>(*table_);
    extended->addDerivedUnit(DerivedUnit(symbol, composition, factor));

    // Throws before publishing if the composition does not resolve
    SIResolver(*extended).resolve(symbol);

    table_ = extended;
    return Unit(symbol, table_);
}

Unit UnitRegistry::registerUnit(const std::string& symbol, const Unit& unit) {
    return registerUnit(symbol, unit.name(), 1.0);
}

} // namespace PhysUnits
