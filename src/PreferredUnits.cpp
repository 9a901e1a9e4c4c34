#include "PreferredUnits.hpp"
#include "UnitErrors.hpp"

namespace PhysUnits {

PreferredUnits::PreferredUnits(const std::vector<std::string>& units,
                               std::shared_ptr<const UnitTable> table) {
    std::vector<Unit> resolved;
    resolved.reserve(units.size());
    for (const auto& u : units) {
        resolved.emplace_back(u, table);
    }
    add(resolved);
}

const Unit* PreferredUnits::conflictWith(const Unit& unit) const {
    for (const auto& chosen : units_) {
        if (chosen.dimensions() == unit.dimensions()) return &chosen;
    }
    return nullptr;
}

void PreferredUnits::add(const Unit& unit) {
    if (unit.isDimensionless()) {
        throw IncompatibleValue(unit.name(), "a dimensionless unit cannot be preferred");
    }
    if (const Unit* chosen = conflictWith(unit)) {
        throw RequiresUniqueDimensions(unit.name(), chosen->name());
    }
    units_.push_back(unit);
}

void PreferredUnits::add(const std::vector<Unit>& units) {
    PreferredUnits staged(*this);
    for (const auto& unit : units) {
        staged.add(unit);
    }
    units_.swap(staged.units_);
}

bool PreferredUnits::remove(const Unit& unit) {
    for (auto it = units_.begin(); it != units_.end(); ++it) {
        if (*it == unit) {
            units_.erase(it);
            return true;
        }
    }
    return false;
}

const Unit* PreferredUnits::find(const DimensionVector& dims) const {
    for (const auto& chosen : units_) {
        if (chosen.dimensions() == dims) return &chosen;
    }
    return nullptr;
}

Quantity PreferredUnits::apply(const Quantity& quantity) const {
    const Unit* target = find(quantity.dimensions());
    if (!target || target->name() == quantity.units()) {
        return quantity;
    }
    return quantity.to(*target);
}

} // namespace PhysUnits
