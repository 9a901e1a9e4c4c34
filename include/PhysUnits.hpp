#ifndef PHYS_UNITS_HPP
#define PHYS_UNITS_HPP

#include <array>
#include <string>

namespace PhysUnits {

// Forward declarations
class UnitTable;
class UnitRegistry;
class DimensionVector;
class Unit;
class UnitSystem;
class Quantity;

/**
 * @brief Base dimensions used in dimensional analysis
 *
 * The enumerator value is the component index inside a DimensionVector, so
 * the order here is the canonical order used when composing unit strings
 * from dimensions (mass first, solid angle last).
 */
enum class BaseDimension {
    MASS = 0,
    LENGTH,
    TIME,
    TEMPERATURE,
    TEMPERATURE_DIFFERENCE,
    ANGLE,
    CHEMICAL_AMOUNT,
    LIGHT,
    CURRENT,
    SOLID_ANGLE
};

constexpr int NUM_BASE_DIMENSIONS = 10;

/// All base dimensions in component order
constexpr std::array<BaseDimension, NUM_BASE_DIMENSIONS> ALL_BASE_DIMENSIONS = {
    BaseDimension::MASS,
    BaseDimension::LENGTH,
    BaseDimension::TIME,
    BaseDimension::TEMPERATURE,
    BaseDimension::TEMPERATURE_DIFFERENCE,
    BaseDimension::ANGLE,
    BaseDimension::CHEMICAL_AMOUNT,
    BaseDimension::LIGHT,
    BaseDimension::CURRENT,
    BaseDimension::SOLID_ANGLE
};

/**
 * @brief Classified type of a unit string
 *
 * Fundamental units report the base dimension they were declared with.
 * Everything else is one of the compound classifications.
 */
enum class UnitType {
    NO_TYPE,                 ///< Empty unit string (dimensionless)
    MASS,
    LENGTH,
    TIME,
    TEMPERATURE,             ///< Absolute temperature reading
    TEMPERATURE_DIFFERENCE,  ///< Temperature delta
    ANGLE,
    CHEMICAL_AMOUNT,
    LIGHT,
    CURRENT,
    SOLID_ANGLE,
    DERIVED,                 ///< Exactly one derived unit symbol
    COMPOSITE                ///< Any other compound unit string
};

// Parsing and printing of enum names ("TEMPERATURE_DIFFERENCE" etc.)
BaseDimension parseBaseDimension(const std::string& name);
std::string toString(BaseDimension dim);

/// Type a fundamental unit of the given dimension reports
UnitType unitTypeOf(BaseDimension dim);

/// Display name, e.g. "Temperature Difference"
std::string toString(UnitType type);

inline int index(BaseDimension dim) {
    return static_cast<int>(dim);
}

} // namespace PhysUnits

#endif // PHYS_UNITS_HPP
