#include "UnitSystem.hpp"
#include "Unit.hpp"
#include "Quantity.hpp"
#include "UnitErrors.hpp"
#include <sstream>

namespace PhysUnits {

// =============================================================================
// Construction
// =============================================================================

UnitSystem::UnitSystem() : UnitSystem("SI") {}

UnitSystem::UnitSystem(std::shared_ptr<const UnitTable> table)
    : table_(std::move(table)) {
    if (!table_) {
        throw std::invalid_argument("UnitSystem requires a unit table");
    }
}

UnitSystem::UnitSystem(const std::string& system, std::shared_ptr<const UnitTable> table)
    : UnitSystem(std::move(table)) {
    units_ = table_->unitSystem(system);

    // Systems loaded from a table file are validated like any other
    for (const auto& kv : units_) {
        validateSlot(kv.first, kv.second);
    }
    validateComplete();
}

UnitSystem::UnitSystem(const std::string& system, const UnitSystemDefinition& overrides,
                       std::shared_ptr<const UnitTable> table)
    : UnitSystem(system, std::move(table)) {
    update(overrides);
}

UnitSystem UnitSystem::fromBaseUnits(const UnitSystemDefinition& base_units,
                                     std::shared_ptr<const UnitTable> table) {
    UnitSystem result(std::move(table));

    for (BaseDimension dim : ALL_BASE_DIMENSIONS) {
        auto it = base_units.find(dim);
        if (it == base_units.end()) {
            throw InsufficientArguments("no base unit given for " + PhysUnits::toString(dim));
        }
        result.validateSlot(dim, it->second);
        result.units_[dim] = it->second;
    }
    return result;
}

UnitSystem UnitSystem::fromUnits(const std::vector<std::string>& units,
                                 std::shared_ptr<const UnitTable> table) {
    UnitSystem result(std::move(table));

    for (const auto& symbol : units) {
        const FundamentalUnit* unit = result.table_->findFundamental(symbol);
        if (!unit) {
            throw NotFundamentalUnit(symbol);
        }

        auto existing = result.units_.find(unit->type);
        if (existing != result.units_.end()) {
            throw DuplicateDimensionType(symbol, existing->second);
        }
        result.units_[unit->type] = symbol;
    }

    result.validateComplete();
    return result;
}

UnitSystem UnitSystem::create(const UnitSystemOptions& options) {
    if (options.system && options.copy_from) {
        throw ExcessiveParameters("give either a unit system name or a system "
                                  "to copy, not both");
    }

    if (options.copy_from) {
        UnitSystem result(*options.copy_from);
        result.update(options.base_units);
        return result;
    }

    std::shared_ptr<const UnitTable> table =
        options.table ? options.table : UnitTable::builtin();
    return UnitSystem(options.system.value_or("SI"), options.base_units, table);
}

// =============================================================================
// Access
// =============================================================================

const std::string& UnitSystem::unitFor(BaseDimension dim) const {
    auto it = units_.find(dim);
    if (it == units_.end()) {
        throw InvalidUnitSystem("no base unit assigned for " + PhysUnits::toString(dim));
    }
    return it->second;
}

void UnitSystem::setUnit(BaseDimension dim, const std::string& unit) {
    validateSlot(dim, unit);
    units_[dim] = unit;
}

void UnitSystem::update(const UnitSystemDefinition& base_units) {
    for (const auto& kv : base_units) {
        validateSlot(kv.first, kv.second);
    }
    for (const auto& kv : base_units) {
        units_[kv.first] = kv.second;
    }
}

void UnitSystem::validateSlot(BaseDimension dim, const std::string& unit) const {
    const FundamentalUnit* fundamental = table_->findFundamental(unit);
    if (!fundamental) {
        throw NotFundamentalUnit(unit);
    }
    if (fundamental->type != dim) {
        throw IncorrectUnitType(unit, PhysUnits::toString(dim));
    }
}

void UnitSystem::validateComplete() const {
    for (BaseDimension dim : ALL_BASE_DIMENSIONS) {
        if (units_.find(dim) == units_.end()) {
            throw InvalidUnitSystem("no base unit assigned for " + PhysUnits::toString(dim));
        }
    }
}

// =============================================================================
// Conversion
// =============================================================================

Unit UnitSystem::unitFor(const DimensionVector& dims) const {
    return Unit::fromDimensions(dims, *this);
}

Quantity UnitSystem::convert(const Quantity& quantity) const {
    return quantity.to(unitFor(quantity.dimensions()));
}

std::string UnitSystem::toString() const {
    std::ostringstream ss;
    bool first = true;
    for (const auto& kv : units_) {
        if (!first) ss << ", ";
        ss << PhysUnits::toString(kv.first) << ": " << kv.second;
        first = false;
    }
    return ss.str();
}

std::ostream& operator<<(std::ostream& os, const UnitSystem& system) {
    return os << system.toString();
}

} // namespace PhysUnits
