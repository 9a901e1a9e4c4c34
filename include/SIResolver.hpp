#ifndef SI_RESOLVER_HPP
#define SI_RESOLVER_HPP

#include "UnitTable.hpp"
#include "DimensionVector.hpp"
#include <string>
#include <vector>
#include <utility>

namespace PhysUnits {

/**
 * @brief SI equivalent of a unit string
 *
 * A reading x in the source units has the SI value
 * (x + si_offset) * si_scale, expressed in si_units.
 */
struct SIData {
    std::string si_units;       // Condensed, e.g. "kg m^-1 s^-2"
    double si_scale;
    double si_offset;
    DimensionVector dimensions;

    SIData() : si_scale(1.0), si_offset(0.0) {}
};

/**
 * @brief Collect like terms of a unit string
 *
 * Powers of repeated symbols are summed (the multiplier is part of the
 * symbol, so "km" and "m" stay separate), zero powers are dropped and
 * first-occurrence order is kept:
 *   condense("kg ft^3 kg^-2") == "kg^-1 ft^3"
 *   condense("s^2 s^-2") == ""
 *
 * A symbol that appears once, written as "^1", keeps the exponent:
 *   condense("C^1") == "C^1"
 * since an explicit exponent marks a temperature difference.
 */
std::string condense(const std::string& units);

/**
 * @brief Resolves unit strings to their SI scale, offset and dimensions
 *
 * Derived units are expanded recursively through their compositions.
 */
class SIResolver {
public:
    /// Derived-unit expansions nested deeper than this are rejected
    static constexpr int MAX_EXPANSION_DEPTH = 32;

    explicit SIResolver(const UnitTable& table) : table_(table) {}

    /**
     * @brief Resolve a compound unit string
     *
     * The offset is only carried when the whole string is one bare
     * fundamental unit ("C"); "C^2" or "kg C" have zero offset.
     * @throws UnknownUnit for an unresolvable token at any depth
     * @throws UnitConfigurationError for cyclic or too deep derived units
     */
    SIData resolve(const std::string& units) const;

private:
    const UnitTable& table_;

    void accumulate(const std::string& units, double power,
                    std::vector<std::pair<std::string, double>>& si_terms,
                    double& scale, DimensionVector& dims,
                    std::vector<std::string>& expanding) const;
};

} // namespace PhysUnits

#endif // SI_RESOLVER_HPP
