#include "UnitParser.hpp"
#include "UnitErrors.hpp"
#include <sstream>
#include <iomanip>
#include <cmath>

namespace PhysUnits {

namespace {

// Powers closer than this to a whole number are treated as whole
constexpr double POWER_SNAP_TOL = 1e-9;

double snapPower(double power) {
    double rounded = std::round(power);
    if (std::abs(power - rounded) < POWER_SNAP_TOL) return rounded;
    return power;
}

} // namespace

void splitPower(const std::string& token, std::string& symbol, double& power) {
    power = 1.0;
    size_t caret = token.find('^');
    if (caret == std::string::npos) {
        symbol = token;
        return;
    }

    symbol = token.substr(0, caret);
    std::string exponent = token.substr(caret + 1);
    if (exponent.empty()) {
        throw UnknownUnit(token);
    }

    size_t consumed = 0;
    try {
        power = std::stod(exponent, &consumed);
    } catch (const std::exception&) {
        throw UnknownUnit(token);
    }
    if (consumed != exponent.size() || !std::isfinite(power)) {
        throw UnknownUnit(token);
    }
}

UnitTerm parseUnitTerm(const std::string& token, const UnitTable& table) {
    std::string symbol;
    double power = 1.0;
    splitPower(token, symbol, power);

    if (table.hasUnit(symbol)) {
        return UnitTerm("", symbol, power);
    }

    for (const auto& mult : table.multipliers()) {
        const std::string& prefix = mult.symbol;
        if (symbol.size() > prefix.size() &&
            symbol.compare(0, prefix.size(), prefix) == 0) {
            std::string remainder = symbol.substr(prefix.size());
            if (table.hasUnit(remainder)) {
                return UnitTerm(prefix, remainder, power);
            }
        }
    }

    throw UnknownUnit(symbol.empty() ? token : symbol);
}

std::vector<std::string> splitTerms(const std::string& units) {
    std::vector<std::string> terms;
    std::istringstream ss(units);
    std::string term;
    while (ss >> term) {
        terms.push_back(term);
    }
    return terms;
}

std::string formatPower(double power) {
    power = snapPower(power);
    if (std::floor(power) == power && std::abs(power) < 1e15) {
        return std::to_string(static_cast<long long>(power));
    }

    // Shortest representation that reads back to the same double
    for (int precision = 1; precision <= 17; ++precision) {
        std::ostringstream ss;
        ss << std::setprecision(precision) << power;
        if (std::stod(ss.str()) == power) {
            return ss.str();
        }
    }
    std::ostringstream ss;
    ss << std::setprecision(17) << power;
    return ss.str();
}

std::string formatTerm(const std::string& symbol, double power) {
    if (snapPower(power) == 1.0) return symbol;
    return symbol + "^" + formatPower(power);
}

} // namespace PhysUnits
