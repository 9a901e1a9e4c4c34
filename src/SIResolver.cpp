#include "SIResolver.hpp"
#include "UnitParser.hpp"
#include "UnitErrors.hpp"
#include <algorithm>
#include <cmath>

namespace PhysUnits {

namespace {

constexpr double ZERO_POWER_TOL = 1e-12;

std::string joinTerms(const std::vector<std::pair<std::string, double>>& terms) {
    std::string result;
    for (const auto& t : terms) {
        if (!result.empty()) result += " ";
        result += formatTerm(t.first, t.second);
    }
    return result;
}

} // namespace

// =============================================================================
// Condensation
// =============================================================================

std::string condense(const std::string& units) {
    std::vector<std::pair<std::string, double>> terms;
    // a symbol written once with an exponent keeps it, "C^1" is not "C"
    std::vector<bool> keep_exponent;

    for (const auto& token : splitTerms(units)) {
        std::string symbol;
        double power = 1.0;
        splitPower(token, symbol, power);

        auto it = std::find_if(terms.begin(), terms.end(),
            [&symbol](const std::pair<std::string, double>& t) {
                return t.first == symbol;
            });
        if (it != terms.end()) {
            it->second += power;
            keep_exponent[it - terms.begin()] = false;
        } else {
            terms.emplace_back(symbol, power);
            keep_exponent.push_back(token.find('^') != std::string::npos);
        }
    }

    std::string result;
    for (size_t i = 0; i < terms.size(); ++i) {
        if (std::abs(terms[i].second) < ZERO_POWER_TOL) continue;

        if (!result.empty()) result += " ";
        if (keep_exponent[i] && formatPower(terms[i].second) == "1") {
            result += terms[i].first + "^1";
        } else {
            result += formatTerm(terms[i].first, terms[i].second);
        }
    }
    return result;
}

// =============================================================================
// SI Resolution
// =============================================================================

SIData SIResolver::resolve(const std::string& units) const {
    std::vector<std::pair<std::string, double>> si_terms;
    std::vector<std::string> expanding;
    SIData data;

    accumulate(units, 1.0, si_terms, data.si_scale, data.dimensions, expanding);
    data.si_units = condense(joinTerms(si_terms));

    // Offsets only apply to a lone absolute reading such as "C"
    std::vector<std::string> tokens = splitTerms(units);
    if (tokens.size() == 1) {
        const FundamentalUnit* unit = table_.findFundamental(tokens.front());
        if (unit) data.si_offset = unit->offset;
    }

    return data;
}

void SIResolver::accumulate(const std::string& units, double power,
                            std::vector<std::pair<std::string, double>>& si_terms,
                            double& scale, DimensionVector& dims,
                            std::vector<std::string>& expanding) const {
    for (const auto& token : splitTerms(units)) {
        UnitTerm term = parseUnitTerm(token, table_);
        double term_power = term.power * power;

        if (!term.multiplier.empty()) {
            scale *= std::pow(table_.findMultiplier(term.multiplier)->factor, term_power);
        }

        if (const FundamentalUnit* fundamental = table_.findFundamental(term.base)) {
            if (std::abs(term_power) > ZERO_POWER_TOL) {
                si_terms.emplace_back(table_.siUnitFor(fundamental->type), term_power);
            }
            scale *= std::pow(fundamental->factor, term_power);
            dims = dims + DimensionVector::of(fundamental->type, term_power);
            continue;
        }

        const DerivedUnit* derived = table_.findDerived(term.base);
        if (std::find(expanding.begin(), expanding.end(), derived->symbol) != expanding.end()) {
            throw UnitConfigurationError("derived unit `" + derived->symbol +
                                         "` is defined in terms of itself");
        }
        if (static_cast<int>(expanding.size()) >= MAX_EXPANSION_DEPTH) {
            throw UnitConfigurationError("derived unit `" + derived->symbol +
                                         "` exceeds the maximum expansion depth");
        }

        scale *= std::pow(derived->factor, term_power);

        expanding.push_back(derived->symbol);
        accumulate(derived->composition, term_power, si_terms, scale, dims, expanding);
        expanding.pop_back();
    }
}

} // namespace PhysUnits
