#ifndef QUANTITY_HPP
#define QUANTITY_HPP

#include "PhysUnits.hpp"
#include "Unit.hpp"
#include "UnitSystem.hpp"
#include "DimensionVector.hpp"
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <ostream>

namespace PhysUnits {

/**
 * @brief Optional construction arguments for Quantity::create
 *
 * Exactly one of value / values / copy_from supplies the number(s); at most
 * one of units / dimensions / quantity_table supplies the unit. system only
 * applies together with dimensions (default SI).
 */
struct QuantityArgs {
    std::optional<double> value;
    std::optional<std::vector<double>> values;
    std::optional<std::string> units;
    std::optional<DimensionVector> dimensions;
    std::optional<QuantityTable> quantity_table;
    std::optional<UnitSystem> system;
    const Quantity* copy_from = nullptr;
    std::shared_ptr<const UnitTable> table;
};

/**
 * @brief Value (scalar or fixed-length array) bound to a resolved unit
 *
 * Quantities are immutable; every operation returns a new one.
 *
 * An absolute temperature unit never holds a reading below its physical
 * floor: Quantity(-1, "K") is stored as -1 delta_K.
 *
 * Example:
 * @code
 *   Quantity p(5000.0, "kPa");
 *   double psi = p.to("psi").value();
 *   Quantity dT = Quantity(2.0, "K") - Quantity(1.0, "K");   // 1 delta_K
 * @endcode
 */
class Quantity {
public:
    Quantity(double value, const std::string& units,
             std::shared_ptr<const UnitTable> table = UnitTable::builtin());
    Quantity(double value, const Unit& unit);

    Quantity(const std::vector<double>& values, const std::string& units,
             std::shared_ptr<const UnitTable> table = UnitTable::builtin());
    Quantity(const std::vector<double>& values, const Unit& unit);

    /// Unit composed from the base units of a system (default SI)
    Quantity(double value, const DimensionVector& dims, const UnitSystem& system = UnitSystem());

    /// Unit composed from named quantities, e.g. {{"Mass", 1}, {"Velocity", 2}}
    Quantity(double value, const QuantityTable& entries,
             std::shared_ptr<const UnitTable> table = UnitTable::builtin());

    /**
     * @brief Build from optional arguments
     * @throws ExcessiveParameters, InsufficientArguments
     */
    static Quantity create(const QuantityArgs& args);

    /**
     * @brief Parse "<value> <unit>" text, e.g. "5000 kPa" or "9.81 m s^-2"
     *
     * Text without a unit gives a dimensionless quantity.
     * @throws std::runtime_error if no number leads the text
     */
    static Quantity parse(const std::string& text,
                          std::shared_ptr<const UnitTable> table = UnitTable::builtin());

    /// Split "<value> <unit>" text; false if no number leads the text
    static bool parseValueWithUnit(const std::string& text, double& value, std::string& unit);

    // =========================================================================
    // Properties
    // =========================================================================

    /// Scalar value; throws std::logic_error for array quantities
    double value() const;
    const std::vector<double>& values() const { return values_; }
    bool isArray() const { return is_array_; }
    size_t size() const { return values_.size(); }

    const Unit& unit() const { return unit_; }
    const std::string& units() const { return unit_.name(); }

    double siValue() const;
    std::vector<double> siValues() const;
    const std::string& siUnits() const { return unit_.siUnits(); }

    const DimensionVector& dimensions() const { return unit_.dimensions(); }
    bool isDimensionless() const { return unit_.isDimensionless(); }
    UnitType type() const { return unit_.type(); }

    // =========================================================================
    // Conversion
    // =========================================================================

    /**
     * @brief Same quantity in other units
     * @throws IncompatibleDimensions
     */
    Quantity to(const Unit& target) const;
    Quantity to(const std::string& target) const;

    /// Same quantity in the base units of a unit system
    Quantity convert(const UnitSystem& system) const;

    std::vector<std::string> compatibleUnits() const { return unit_.compatibleUnits(); }

    /**
     * @brief Numeric value for dimensionless, angle and solid angle quantities
     *
     * Returns the SI value (an angle in degrees gives radians).
     * @throws InvalidFloatCoercion for anything else
     */
    double asDouble() const;
    explicit operator double() const { return asDouble(); }

    /// Element of an array quantity (or the scalar itself at index 0)
    Quantity operator[](size_t index) const;

    // =========================================================================
    // Arithmetic
    // =========================================================================

    /**
     * @brief Sum with temperature-aware unit resolution
     *
     * The result is in this quantity's units (or the absolute counterpart of
     * a difference when the other operand is absolute); the other operand is
     * converted before the values are combined.
     * @throws IncompatibleDimensions, ProhibitedTemperatureOperation
     */
    Quantity add(const Quantity& other) const;

    /// Difference; absolute - absolute of the same scale gives a delta
    Quantity subtract(const Quantity& other) const;

    Quantity multiply(const Quantity& other) const;
    Quantity divide(const Quantity& other) const;
    Quantity power(double exponent) const;
    Quantity negate() const;

    Quantity operator+(const Quantity& other) const { return add(other); }
    Quantity operator-(const Quantity& other) const { return subtract(other); }
    Quantity operator*(const Quantity& other) const { return multiply(other); }
    Quantity operator/(const Quantity& other) const { return divide(other); }
    Quantity operator-() const { return negate(); }

    // Plain numbers scale the value; a unit multiplies the units
    Quantity operator*(double factor) const;
    Quantity operator/(double divisor) const;
    Quantity operator*(const Unit& unit) const;
    Quantity operator/(const Unit& unit) const;

    // A plain number in a sum is a dimensionless quantity
    Quantity operator+(double value) const;
    Quantity operator-(double value) const;

    // =========================================================================
    // Comparison
    // =========================================================================

    // Compared by SI value; dimensions must be compatible.
    // < <= > >= are defined for scalars only.
    bool operator==(const Quantity& other) const;
    bool operator!=(const Quantity& other) const { return !(*this == other); }
    bool operator<(const Quantity& other) const;
    bool operator<=(const Quantity& other) const;
    bool operator>(const Quantity& other) const;
    bool operator>=(const Quantity& other) const;

    // Only dimensionless quantities compare against plain numbers
    bool operator==(double other) const;
    bool operator!=(double other) const { return !(*this == other); }
    bool operator<(double other) const;
    bool operator<=(double other) const;
    bool operator>(double other) const;
    bool operator>=(double other) const;

private:
    std::vector<double> values_;
    bool is_array_;
    Unit unit_;

    Quantity(const std::vector<double>& values, bool is_array, const Unit& unit);

    void reclassifyTemperature();
    Quantity sum(const Quantity& other, bool subtract) const;
    std::pair<double, double> siPair(const Quantity& other) const;
    double dimensionlessSI(double other) const;
};

// Plain number on the left
Quantity operator*(double factor, const Quantity& q);
Quantity operator/(double dividend, const Quantity& q);
Quantity operator+(double value, const Quantity& q);
Quantity operator-(double value, const Quantity& q);

inline bool operator==(double a, const Quantity& q) { return q == a; }
inline bool operator!=(double a, const Quantity& q) { return q != a; }
inline bool operator<(double a, const Quantity& q) { return q > a; }
inline bool operator<=(double a, const Quantity& q) { return q >= a; }
inline bool operator>(double a, const Quantity& q) { return q < a; }
inline bool operator>=(double a, const Quantity& q) { return q <= a; }

/// Quantity raised to a power
Quantity pow(const Quantity& q, double exponent);

/// Prints (value, "units"), arrays as ([v0, v1, ...], "units")
std::ostream& operator<<(std::ostream& os, const Quantity& q);

} // namespace PhysUnits

#endif // QUANTITY_HPP
