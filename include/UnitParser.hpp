#ifndef UNIT_PARSER_HPP
#define UNIT_PARSER_HPP

#include "UnitTable.hpp"
#include <string>
#include <vector>

namespace PhysUnits {

/**
 * @brief One parsed term of a compound unit string
 *
 * "kPa^-2" -> multiplier "k", base "Pa", power -2.
 */
struct UnitTerm {
    std::string multiplier;     // Empty when the term carries no prefix
    std::string base;           // Fundamental or derived unit symbol
    double power;

    UnitTerm() : power(1.0) {}
    UnitTerm(const std::string& mult, const std::string& b, double p)
        : multiplier(mult), base(b), power(p) {}

    /// Prefixed symbol without the power ("kPa")
    std::string symbol() const { return multiplier + base; }
};

/**
 * @brief Split a token into its symbol and power parts
 *
 * Purely syntactic: "m^-2" -> ("m", -2), "kg" -> ("kg", 1). The table is
 * not consulted.
 * @throws UnknownUnit if the text after '^' is not a number
 */
void splitPower(const std::string& token, std::string& symbol, double& power);

/**
 * @brief Parse one whitespace-free token against a unit table
 *
 * An exact fundamental/derived symbol never carries a multiplier. Otherwise
 * the table's multipliers are tried in insertion order and the first one
 * whose remainder is a known symbol wins.
 * @throws UnknownUnit
 */
UnitTerm parseUnitTerm(const std::string& token, const UnitTable& table);

/// Split a unit string on whitespace, dropping empty tokens
std::vector<std::string> splitTerms(const std::string& units);

/// Render a power; whole numbers print without a decimal point
std::string formatPower(double power);

/// Render symbol (power 1) or symbol^power
std::string formatTerm(const std::string& symbol, double power);

} // namespace PhysUnits

#endif // UNIT_PARSER_HPP
