#ifndef PREFERRED_UNITS_HPP
#define PREFERRED_UNITS_HPP

#include "Unit.hpp"
#include "Quantity.hpp"
#include <string>
#include <vector>
#include <memory>

namespace PhysUnits {

/**
 * @brief Ordered set of target units, at most one per dimension vector
 *
 * A policy object the caller owns and passes where results should land in
 * fixed units. Nothing is applied implicitly: Quantity construction and
 * arithmetic never consult it.
 *
 * Example:
 * @code
 *   PreferredUnits preferred({"psi", "kg"});
 *   Quantity p = preferred.apply(Quantity(10.0, "Pa"));   // 0.00145 psi
 * @endcode
 */
class PreferredUnits {
public:
    PreferredUnits() = default;

    /**
     * @brief Start from a list of unit strings
     * @throws RequiresUniqueDimensions, IncompatibleValue, UnknownUnit
     */
    explicit PreferredUnits(const std::vector<std::string>& units,
                            std::shared_ptr<const UnitTable> table = UnitTable::builtin());

    /**
     * @brief Add a unit
     *
     * Another unit with the same dimensions must be removed first. A
     * dimensionless unit is refused, it would capture every plain number.
     * @throws RequiresUniqueDimensions, IncompatibleValue
     */
    void add(const Unit& unit);

    /// Adds all or none
    void add(const std::vector<Unit>& units);

    /// Removes an equal unit (same dimensions, scale and offset); false if absent
    bool remove(const Unit& unit);

    void clear() { units_.clear(); }

    /// Preferred unit for a dimension vector, nullptr when none is set
    const Unit* find(const DimensionVector& dims) const;

    /**
     * @brief Express a quantity in the preferred unit for its dimensions
     *
     * Quantities with no matching preference come back unchanged.
     */
    Quantity apply(const Quantity& quantity) const;

    const std::vector<Unit>& units() const { return units_; }
    size_t size() const { return units_.size(); }
    bool empty() const { return units_.empty(); }

private:
    const Unit* conflictWith(const Unit& unit) const;

    std::vector<Unit> units_;
};

} // namespace PhysUnits

#endif // PREFERRED_UNITS_HPP
