#ifndef UNIT_SYSTEM_HPP
#define UNIT_SYSTEM_HPP

#include "PhysUnits.hpp"
#include "UnitTable.hpp"
#include "DimensionVector.hpp"
#include <string>
#include <map>
#include <vector>
#include <memory>
#include <optional>
#include <ostream>

namespace PhysUnits {

class Unit;
class Quantity;

/**
 * @brief Optional construction arguments for UnitSystem::create
 *
 * At most one of system / copy_from may be given. base_units overrides
 * individual dimensions of whichever system is selected (SI by default).
 */
struct UnitSystemOptions {
    std::optional<std::string> system;
    UnitSystemDefinition base_units;
    const UnitSystem* copy_from = nullptr;
    std::shared_ptr<const UnitTable> table;
};

/**
 * @brief One fundamental unit per base dimension, used as a conversion target
 *
 * Predefined systems (SI, CGS, BT) come from the unit table. Every assigned
 * unit must be a fundamental unit of the slot's dimension, so two
 * dimensions can never share a unit.
 *
 * Example:
 * @code
 *   UnitSystem bt("BT");
 *   Quantity q(10.0, "kg ft s");
 *   Quantity r = bt.convert(q);    // 0.68521766 slug ft s
 * @endcode
 */
class UnitSystem {
public:
    /// SI system of the built-in table
    UnitSystem();

    /**
     * @brief Predefined system by name
     * @throws InvalidUnitSystem if the table does not define it
     */
    explicit UnitSystem(const std::string& system,
                        std::shared_ptr<const UnitTable> table = UnitTable::builtin());

    /// Predefined system with some dimensions replaced
    UnitSystem(const std::string& system, const UnitSystemDefinition& overrides,
               std::shared_ptr<const UnitTable> table = UnitTable::builtin());

    /**
     * @brief Build from an explicit per-dimension map
     * @throws InsufficientArguments if a dimension is missing
     */
    static UnitSystem fromBaseUnits(const UnitSystemDefinition& base_units,
                                    std::shared_ptr<const UnitTable> table = UnitTable::builtin());

    /**
     * @brief Build from a list of units; each unit's type selects its slot
     * @throws DuplicateDimensionType if two units have the same type
     * @throws InvalidUnitSystem if a dimension is left without a unit
     */
    static UnitSystem fromUnits(const std::vector<std::string>& units,
                                std::shared_ptr<const UnitTable> table = UnitTable::builtin());

    /**
     * @brief Build from optional arguments
     * @throws ExcessiveParameters if both system and copy_from are given
     */
    static UnitSystem create(const UnitSystemOptions& options);

    // =========================================================================
    // Access
    // =========================================================================

    const std::string& unitFor(BaseDimension dim) const;
    const UnitSystemDefinition& baseUnits() const { return units_; }
    const std::shared_ptr<const UnitTable>& table() const { return table_; }

    /**
     * @brief Replace the unit of one dimension
     * @throws NotFundamentalUnit, IncorrectUnitType
     */
    void setUnit(BaseDimension dim, const std::string& unit);

    /// Replace several dimensions at once; validated before anything changes
    void update(const UnitSystemDefinition& base_units);

    // =========================================================================
    // Conversion
    // =========================================================================

    /// Compound unit with the given dimensions in this system
    Unit unitFor(const DimensionVector& dims) const;

    /// Quantity expressed in this system's base units
    Quantity convert(const Quantity& quantity) const;

    bool operator==(const UnitSystem& other) const { return units_ == other.units_; }
    bool operator!=(const UnitSystem& other) const { return !(*this == other); }

    std::string toString() const;

private:
    UnitSystemDefinition units_;
    std::shared_ptr<const UnitTable> table_;

    explicit UnitSystem(std::shared_ptr<const UnitTable> table);

    void validateSlot(BaseDimension dim, const std::string& unit) const;
    void validateComplete() const;
};

std::ostream& operator<<(std::ostream& os, const UnitSystem& system);

} // namespace PhysUnits

#endif // UNIT_SYSTEM_HPP
