#include "Unit.hpp"
#include "UnitSystem.hpp"
#include "UnitParser.hpp"
#include "SIResolver.hpp"
#include "UnitErrors.hpp"
#include <cmath>
#include <algorithm>

namespace PhysUnits {

namespace {

const std::string DELTA_PREFIX = "delta_";

bool sameScale(double a, double b) {
    return std::abs(a - b) <= 1e-12 * std::max(std::abs(a), std::abs(b));
}

std::string scaleTerms(const std::string& units, double factor) {
    std::string result;
    for (const auto& token : splitTerms(units)) {
        std::string symbol;
        double power = 1.0;
        splitPower(token, symbol, power);
        if (!result.empty()) result += " ";
        if (token.find('^') != std::string::npos && formatPower(power * factor) == "1") {
            result += symbol + "^1";
        } else {
            result += formatTerm(symbol, power * factor);
        }
    }
    return result;
}

// Condensed names list each symbol once, so sorting the terms gives a
// spelling that ignores term order ("K kg" and "kg K")
bool sameTerms(const std::string& a, const std::string& b) {
    std::vector<std::string> lhs = splitTerms(a);
    std::vector<std::string> rhs = splitTerms(b);
    std::sort(lhs.begin(), lhs.end());
    std::sort(rhs.begin(), rhs.end());
    return lhs == rhs;
}

} // namespace

// =============================================================================
// Classification
// =============================================================================

UnitType classifyUnits(const std::string& units, const UnitTable& table) {
    std::vector<std::string> tokens = splitTerms(units);
    if (tokens.empty()) {
        return UnitType::NO_TYPE;
    }

    if (tokens.size() == 1) {
        if (const FundamentalUnit* unit = table.findFundamental(tokens.front())) {
            return unitTypeOf(unit->type);
        }
        if (table.isDerived(tokens.front())) {
            return UnitType::DERIVED;
        }
    }

    bool absolute = false;
    bool difference = false;
    for (const auto& token : tokens) {
        UnitTerm term = parseUnitTerm(token, table);
        const FundamentalUnit* unit = table.findFundamental(term.base);
        if (!unit) continue;

        if (unit->type == BaseDimension::TEMPERATURE) {
            if (token.find('^') != std::string::npos) {
                difference = true;
            } else {
                absolute = true;
            }
        } else if (unit->type == BaseDimension::TEMPERATURE_DIFFERENCE) {
            difference = true;
        }
    }

    if (difference) return UnitType::TEMPERATURE_DIFFERENCE;
    if (absolute) return UnitType::TEMPERATURE;
    return UnitType::COMPOSITE;
}

// =============================================================================
// Construction
// =============================================================================

Unit::Unit() : Unit("") {}

Unit::Unit(const std::string& units, std::shared_ptr<const UnitTable> table)
    : type_(UnitType::NO_TYPE), si_scale_(1.0), si_offset_(0.0), table_(std::move(table)) {
    if (!table_) {
        throw std::invalid_argument("Unit requires a unit table");
    }

    name_ = condense(units);

    SIData si = SIResolver(*table_).resolve(name_);
    dims_ = si.dimensions;
    si_scale_ = si.si_scale;
    si_offset_ = si.si_offset;
    si_units_ = si.si_units;
    type_ = classifyUnits(name_, *table_);
}

Unit Unit::fromDimensions(const DimensionVector& dims, const UnitSystem& system) {
    std::string units;
    for (const auto& kv : dims.nonZero()) {
        if (!units.empty()) units += " ";
        units += formatTerm(system.unitFor(kv.first), kv.second);
    }
    return Unit(units, system.table());
}

Unit Unit::fromQuantityTable(const QuantityTable& entries,
                             std::shared_ptr<const UnitTable> table) {
    for (const auto& entry : entries) {
        if (!table->hasQuantityName(entry.first)) {
            throw UnknownQuantityName(entry.first);
        }
    }

    Unit result("", table);
    for (const auto& entry : entries) {
        Unit named(table->quantityUnits(entry.first), table);
        result = result.multiply(named.power(entry.second));
    }
    return result;
}

// =============================================================================
// Algebra
// =============================================================================

Unit Unit::multiply(const Unit& other) const {
    return Unit(name_ + " " + other.name_, table_);
}

Unit Unit::divide(const Unit& other) const {
    return Unit(name_ + " " + scaleTerms(other.name_, -1.0), table_);
}

Unit Unit::power(double exponent) const {
    return Unit(scaleTerms(name_, exponent), table_);
}

std::pair<Unit, Unit> Unit::additionResult(const Unit& other) const {
    return sumResult(other, false);
}

std::pair<Unit, Unit> Unit::subtractionResult(const Unit& other) const {
    return sumResult(other, true);
}

std::pair<Unit, Unit> Unit::sumResult(const Unit& other, bool subtract) const {
    const bool lhs_abs = isAbsoluteTemperature();
    const bool rhs_abs = other.isAbsoluteTemperature();

    // absolute - absolute = difference; absolute + absolute is meaningless
    if (lhs_abs && rhs_abs) {
        if (!subtract) {
            throw ProhibitedTemperatureOperation(
                "cannot add absolute temperatures `" + name_ + "` and `" +
                other.name_ + "`; convert one to a difference first");
        }
        if (!sameTerms(name_, other.name_)) {
            throw IncompatibleDimensions(name_, other.name_);
        }
        return {differenceCounterpart(), *this};
    }

    if (sameTerms(name_, other.name_)) {
        return {*this, *this};
    }

    if (!dims_.isCompatible(other.dims_)) {
        throw IncompatibleDimensions(name_, other.name_);
    }

    // absolute +/- difference stays absolute, on the left operand's scale
    if ((lhs_abs && other.isTemperatureDifference()) ||
        (isTemperatureDifference() && rhs_abs)) {
        Unit result = lhs_abs ? *this : absoluteCounterpart();
        Unit rhs_target = rhs_abs ? result : result.differenceCounterpart();
        return {result, rhs_target};
    }

    return {*this, *this};
}

Unit Unit::rewriteBases(const std::function<std::string(const std::string&)>& rewrite) const {
    std::string units;
    for (const auto& token : splitTerms(name_)) {
        UnitTerm term = parseUnitTerm(token, *table_);
        std::string base = rewrite(term.base);
        if (base.empty()) base = term.base;

        size_t caret = token.find('^');
        if (!units.empty()) units += " ";
        units += term.multiplier + base;
        if (caret != std::string::npos) units += token.substr(caret);
    }
    return Unit(units, table_);
}

Unit Unit::differenceCounterpart() const {
    const UnitTable& table = *table_;
    return rewriteBases([&table](const std::string& base) -> std::string {
        const FundamentalUnit* unit = table.findFundamental(base);
        if (!unit || unit->type != BaseDimension::TEMPERATURE) return "";

        const FundamentalUnit* delta = table.findFundamental(DELTA_PREFIX + base);
        if (!delta || delta->type != BaseDimension::TEMPERATURE_DIFFERENCE) return "";
        return delta->symbol;
    });
}

Unit Unit::absoluteCounterpart() const {
    const UnitTable& table = *table_;
    return rewriteBases([&table](const std::string& base) -> std::string {
        const FundamentalUnit* unit = table.findFundamental(base);
        if (!unit || unit->type != BaseDimension::TEMPERATURE_DIFFERENCE) return "";
        if (base.compare(0, DELTA_PREFIX.size(), DELTA_PREFIX) != 0) return "";

        const FundamentalUnit* absolute = table.findFundamental(base.substr(DELTA_PREFIX.size()));
        if (!absolute || absolute->type != BaseDimension::TEMPERATURE) return "";
        return absolute->symbol;
    });
}

// =============================================================================
// Queries
// =============================================================================

std::vector<std::string> Unit::compatibleUnits() const {
    std::vector<std::string> result;
    SIResolver resolver(*table_);

    for (const auto& symbol : table_->unitSymbols()) {
        if (symbol == name_) continue;
        if (resolver.resolve(symbol).dimensions == dims_) {
            result.push_back(symbol);
        }
    }
    return result;
}

Unit Unit::convert(const UnitSystem& system) const {
    return fromDimensions(dims_, system);
}

bool Unit::operator==(const Unit& other) const {
    return dims_ == other.dims_ &&
           sameScale(si_scale_, other.si_scale_) &&
           si_offset_ == other.si_offset_;
}

std::ostream& operator<<(std::ostream& os, const Unit& unit) {
    return os << unit.name();
}

} // namespace PhysUnits
