#ifndef UNIT_REGISTRY_HPP
#define UNIT_REGISTRY_HPP

#include "UnitTable.hpp"
#include "Unit.hpp"
#include <string>
#include <vector>
#include <memory>
#include <mutex>

namespace PhysUnits {

/**
 * @brief Named access to the units of a table, extendable at runtime
 *
 * The registry hands out immutable table snapshots. Registering a unit
 * copies the current table, adds the new derived unit and swaps the
 * snapshot under a mutex; units resolved earlier keep the snapshot they
 * were built against. Each symbol can be registered at most once.
 *
 * Example:
 * @code
 *   UnitRegistry registry;
 *   registry.registerUnit("fps", "ft s^-1");
 *   Quantity v(10.0, "fps", registry.table());
 * @endcode
 */
class UnitRegistry {
public:
    explicit UnitRegistry(std::shared_ptr<const UnitTable> table = UnitTable::builtin());

    /// Current snapshot
    std::shared_ptr<const UnitTable> table() const;

    /**
     * @brief Resolved unit for a symbol or compound string of the current table
     * @throws UnknownUnit
     */
    Unit unit(const std::string& units) const;

    bool hasUnit(const std::string& symbol) const;

    /// Every unit symbol of the current table
    std::vector<std::string> symbols() const;

    /**
     * @brief Add a derived unit
     *
     * The composition is resolved against the extended table before the
     * snapshot is published, so an unknown term or a self-reference leaves
     * the registry unchanged.
     *
     * @throws UnitAlreadyRegistered if the symbol already names a unit
     * @throws UnknownUnit, UnitConfigurationError for a bad composition
     */
    Unit registerUnit(const std::string& symbol, const std::string& composition,
                      double factor = 1.0);

    /// Register a symbol for an existing unit ("fps" for "ft s^-1")
    Unit registerUnit(const std::string& symbol, const Unit& unit);

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const UnitTable> table_;
};

} // namespace PhysUnits

#endif // UNIT_REGISTRY_HPP
