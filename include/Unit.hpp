#ifndef UNIT_HPP
#define UNIT_HPP

#include "PhysUnits.hpp"
#include "UnitTable.hpp"
#include "DimensionVector.hpp"
#include <string>
#include <vector>
#include <utility>
#include <memory>
#include <functional>
#include <ostream>

namespace PhysUnits {

/// Ordered (quantity name, exponent) pairs, e.g. {{"Mass", 1}, {"Velocity", 2}}
using QuantityTable = std::vector<std::pair<std::string, double>>;

/**
 * @brief Classify a unit string
 *
 * - ""                        -> NO_TYPE
 * - exact fundamental symbol  -> its declared dimension type
 * - exact derived symbol      -> DERIVED
 * - otherwise a term whose base is a temperature unit decides: an absolute
 *   scale written without an exponent ("kg K") is TEMPERATURE, any explicit
 *   exponent ("K^-1") or a delta_ unit is TEMPERATURE_DIFFERENCE, and a
 *   difference term takes precedence
 * - anything else             -> COMPOSITE
 *
 * Temperature terms are matched on their parsed base symbol, never on a
 * trailing letter.
 */
UnitType classifyUnits(const std::string& units, const UnitTable& table);

/**
 * @brief Resolved unit: canonical name plus SI scale, offset and dimensions
 *
 * A Unit is an immutable value. The name is the condensed form of the
 * string it was built from; two units compare equal when they share
 * dimensions, SI scale and SI offset ("J" == "N m").
 */
class Unit {
public:
    /// Dimensionless unit ("") of the built-in table
    Unit();

    /**
     * @brief Resolve a unit string
     * @throws UnknownUnit, UnitConfigurationError
     */
    explicit Unit(const std::string& units,
                  std::shared_ptr<const UnitTable> table = UnitTable::builtin());

    /// Compose one base unit of the system per nonzero dimension component
    static Unit fromDimensions(const DimensionVector& dims, const UnitSystem& system);

    /**
     * @brief Multiply together named quantities raised to exponents
     * @throws UnknownQuantityName
     */
    static Unit fromQuantityTable(const QuantityTable& entries,
                                  std::shared_ptr<const UnitTable> table = UnitTable::builtin());

    // =========================================================================
    // Properties
    // =========================================================================

    const std::string& name() const { return name_; }
    const DimensionVector& dimensions() const { return dims_; }
    UnitType type() const { return type_; }
    double siScale() const { return si_scale_; }
    double siOffset() const { return si_offset_; }
    const std::string& siUnits() const { return si_units_; }
    const std::shared_ptr<const UnitTable>& table() const { return table_; }

    bool isDimensionless() const { return dims_.isDimensionless(); }
    bool isAbsoluteTemperature() const { return type_ == UnitType::TEMPERATURE; }
    bool isTemperatureDifference() const { return type_ == UnitType::TEMPERATURE_DIFFERENCE; }

    // =========================================================================
    // Algebra
    // =========================================================================

    Unit multiply(const Unit& other) const;
    Unit divide(const Unit& other) const;
    Unit power(double exponent) const;

    Unit operator*(const Unit& other) const { return multiply(other); }
    Unit operator/(const Unit& other) const { return divide(other); }

    /**
     * @brief Result unit of this + other
     *
     * @return (result unit, unit the right operand must be converted into)
     * @throws ProhibitedTemperatureOperation when both are absolute temperatures
     * @throws IncompatibleDimensions
     */
    std::pair<Unit, Unit> additionResult(const Unit& other) const;

    /**
     * @brief Result unit of this - other
     *
     * Absolute minus absolute of the same scale gives the difference unit
     * ("C" - "C" -> "delta_C").
     */
    std::pair<Unit, Unit> subtractionResult(const Unit& other) const;

    /// Absolute temperature terms rewritten to delta_ form ("kg C" -> "kg delta_C")
    Unit differenceCounterpart() const;

    /// delta_ terms rewritten to their absolute scale ("delta_F" -> "F")
    Unit absoluteCounterpart() const;

    // =========================================================================
    // Queries
    // =========================================================================

    /// Table symbols (other than this one) with exactly the same dimensions
    std::vector<std::string> compatibleUnits() const;

    /// Equivalent unit built from the base units of a unit system
    Unit convert(const UnitSystem& system) const;

    bool operator==(const Unit& other) const;
    bool operator!=(const Unit& other) const { return !(*this == other); }

private:
    std::string name_;
    DimensionVector dims_;
    UnitType type_;
    double si_scale_;
    double si_offset_;
    std::string si_units_;
    std::shared_ptr<const UnitTable> table_;

    std::pair<Unit, Unit> sumResult(const Unit& other, bool subtract) const;

    // Replaces term bases; the callback returns "" to keep a base unchanged
    Unit rewriteBases(const std::function<std::string(const std::string&)>& rewrite) const;
};

std::ostream& operator<<(std::ostream& os, const Unit& unit);

} // namespace PhysUnits

#endif // UNIT_HPP
