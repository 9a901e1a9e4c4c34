#ifndef UNIT_TABLE_HPP
#define UNIT_TABLE_HPP

#include "PhysUnits.hpp"
#include <string>
#include <map>
#include <vector>
#include <memory>

namespace PhysUnits {

/**
 * @brief Scale-modifying prefix (e.g. "k" -> 1000)
 */
struct MultiplierPrefix {
    std::string symbol;
    double factor;

    MultiplierPrefix(const std::string& s, double f) : symbol(s), factor(f) {}
};

/**
 * @brief Directly defined unit
 *
 * The SI value of a reading x in this unit is (x + offset) * factor.
 * The offset is nonzero only for absolute temperature scales.
 */
struct FundamentalUnit {
    std::string symbol;
    BaseDimension type;
    double factor;
    double offset;

    FundamentalUnit(const std::string& s, BaseDimension t,
                    double f = 1.0, double off = 0.0)
        : symbol(s), type(t), factor(f), offset(off) {}
};

/**
 * @brief Unit defined as a composition of other units times a factor
 *
 * The composition may refer to other derived units (e.g. Pa -> "N m^-2").
 */
struct DerivedUnit {
    std::string symbol;
    std::string composition;
    double factor;

    DerivedUnit(const std::string& s, const std::string& comp, double f = 1.0)
        : symbol(s), composition(comp), factor(f) {}
};

/// Base unit symbol assigned to each base dimension
using UnitSystemDefinition = std::map<BaseDimension, std::string>;

/**
 * @brief Static unit data: multipliers, fundamental and derived units,
 *        quantity names and predefined unit systems
 *
 * A table is filled once and then shared read-only through
 * std::shared_ptr<const UnitTable>. Insertion order is preserved for every
 * section; the parser relies on it for multiplier matching.
 */
class UnitTable {
public:
    UnitTable() = default;

    /**
     * @brief Built-in table (SI prefixes, SI/CGS/BT units, common derived units)
     *
     * Built on first use and never modified afterwards.
     */
    static std::shared_ptr<const UnitTable> builtin();

    // =========================================================================
    // Table Construction
    // =========================================================================

    void addMultiplier(const std::string& symbol, double factor);

    /**
     * @brief Add a fundamental unit
     * @throws UnitAlreadyRegistered if the symbol is already a unit
     */
    void addFundamentalUnit(const FundamentalUnit& unit);

    /**
     * @brief Add a derived unit
     * @throws UnitAlreadyRegistered if the symbol is already a unit
     */
    void addDerivedUnit(const DerivedUnit& unit);

    void addQuantityName(const std::string& name, const std::string& units);

    void addUnitSystem(const std::string& name, const UnitSystemDefinition& units);

    // =========================================================================
    // Lookup
    // =========================================================================

    const std::vector<MultiplierPrefix>& multipliers() const { return multipliers_; }
    const MultiplierPrefix* findMultiplier(const std::string& symbol) const;

    bool hasUnit(const std::string& symbol) const;
    bool isFundamental(const std::string& symbol) const;
    bool isDerived(const std::string& symbol) const;

    /// @return Pointer to the unit, or nullptr if not found
    const FundamentalUnit* findFundamental(const std::string& symbol) const;
    const DerivedUnit* findDerived(const std::string& symbol) const;

    const std::vector<FundamentalUnit>& fundamentalUnits() const { return fundamentals_; }
    const std::vector<DerivedUnit>& derivedUnits() const { return derived_; }

    /// All unit symbols, fundamental units first, in insertion order
    std::vector<std::string> unitSymbols() const;

    /**
     * @brief SI representative of a base dimension
     *
     * The first fundamental unit of that dimension whose factor is exactly 1
     * (kg, m, s, K, delta_K, ...).
     * @throws UnitConfigurationError if the table has none
     */
    const std::string& siUnitFor(BaseDimension dim) const;

    /**
     * @brief Unit string of a named quantity (e.g. "Velocity" -> "m s^-1")
     * @throws UnknownQuantityName
     */
    const std::string& quantityUnits(const std::string& name) const;
    bool hasQuantityName(const std::string& name) const;
    const std::map<std::string, std::string>& quantityNames() const { return quantity_names_; }

    /**
     * @brief Predefined unit system by name ("SI", "CGS", "BT")
     * @throws InvalidUnitSystem
     */
    const UnitSystemDefinition& unitSystem(const std::string& name) const;
    bool hasUnitSystem(const std::string& name) const;
    std::vector<std::string> unitSystemNames() const { return system_order_; }

private:
    std::vector<MultiplierPrefix> multipliers_;
    std::vector<FundamentalUnit> fundamentals_;
    std::vector<DerivedUnit> derived_;
    std::map<std::string, size_t> fundamental_index_;
    std::map<std::string, size_t> derived_index_;

    std::map<std::string, std::string> quantity_names_;

    std::map<std::string, UnitSystemDefinition> unit_systems_;
    std::vector<std::string> system_order_;

    // Built-in data, one block per group
    void addSIMultipliers();
    void addMassUnits();
    void addLengthUnits();
    void addTimeUnits();
    void addElectricalUnits();
    void addAmountAndLightUnits();
    void addAngleUnits();
    void addTemperatureUnits();
    void addMechanicalUnits();
    void addElectromagneticUnits();
    void addEnergyUnits();
    void addVolumeUnits();
    void addQuantityNames();
    void addUnitSystems();
};

} // namespace PhysUnits

#endif // UNIT_TABLE_HPP
