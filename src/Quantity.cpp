#include "Quantity.hpp"
#include "UnitConversion.hpp"
#include "UnitParser.hpp"
#include "UnitErrors.hpp"
#include <cmath>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <algorithm>

namespace PhysUnits {

namespace {

const double EQUALITY_RTOL = 1e-12;

bool nearlyEqual(double a, double b) {
    if (a == b) return true;
    return std::abs(a - b) <= EQUALITY_RTOL * std::max(std::abs(a), std::abs(b));
}

// Element-wise op with scalar broadcasting
template <typename Op>
std::vector<double> combine(const std::vector<double>& a, bool a_array,
                            const std::vector<double>& b, bool b_array, Op op) {
    if (a_array && b_array && a.size() != b.size()) {
        throw std::invalid_argument("array quantities have different lengths (" +
                                    std::to_string(a.size()) + " and " +
                                    std::to_string(b.size()) + ")");
    }

    const size_t n = a_array ? a.size() : (b_array ? b.size() : 1);
    std::vector<double> result(n);
    for (size_t i = 0; i < n; ++i) {
        double x = a_array ? a[i] : a[0];
        double y = b_array ? b[i] : b[0];
        result[i] = op(x, y);
    }
    return result;
}

template <typename Op>
std::vector<double> mapValues(const std::vector<double>& values, Op op) {
    std::vector<double> result(values.size());
    std::transform(values.begin(), values.end(), result.begin(), op);
    return result;
}

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

} // namespace

// =============================================================================
// Construction
// =============================================================================

Quantity::Quantity(const std::vector<double>& values, bool is_array, const Unit& unit)
    : values_(values), is_array_(is_array), unit_(unit) {
    reclassifyTemperature();
}

Quantity::Quantity(double value, const std::string& units, std::shared_ptr<const UnitTable> table)
    : Quantity(std::vector<double>{value}, false, Unit(units, std::move(table))) {}

Quantity::Quantity(double value, const Unit& unit)
    : Quantity(std::vector<double>{value}, false, unit) {}

Quantity::Quantity(const std::vector<double>& values, const std::string& units,
                   std::shared_ptr<const UnitTable> table)
    : Quantity(values, true, Unit(units, std::move(table))) {}

Quantity::Quantity(const std::vector<double>& values, const Unit& unit)
    : Quantity(values, true, unit) {}

Quantity::Quantity(double value, const DimensionVector& dims, const UnitSystem& system)
    : Quantity(std::vector<double>{value}, false, Unit::fromDimensions(dims, system)) {}

Quantity::Quantity(double value, const QuantityTable& entries,
                   std::shared_ptr<const UnitTable> table)
    : Quantity(std::vector<double>{value}, false, Unit::fromQuantityTable(entries, std::move(table))) {}

Quantity Quantity::create(const QuantityArgs& args) {
    const int unit_sources = (args.units ? 1 : 0) + (args.dimensions ? 1 : 0) +
                             (args.quantity_table ? 1 : 0);
    if (unit_sources > 1) {
        throw ExcessiveParameters("give only one of units, dimensions or quantity_table");
    }
    if (args.value && args.values) {
        throw ExcessiveParameters("give either a scalar value or an array of values");
    }
    if (args.system && !args.dimensions) {
        throw ExcessiveParameters("a unit system only applies together with dimensions");
    }

    const bool has_value = args.value || args.values;

    if (args.copy_from) {
        if (unit_sources > 0) {
            throw ExcessiveParameters("units cannot be given together with copy_from");
        }
        if (!has_value) {
            return *args.copy_from;
        }
        if (args.values) {
            return Quantity(*args.values, args.copy_from->unit());
        }
        return Quantity(*args.value, args.copy_from->unit());
    }

    if (!has_value) {
        throw InsufficientArguments("requires at least one of value, values or copy_from");
    }

    std::shared_ptr<const UnitTable> table = args.table ? args.table : UnitTable::builtin();

    Unit unit("", table);
    if (args.units) {
        unit = Unit(*args.units, table);
    } else if (args.dimensions) {
        UnitSystem system = args.system ? *args.system : UnitSystem("SI", table);
        unit = Unit::fromDimensions(*args.dimensions, system);
    } else if (args.quantity_table) {
        unit = Unit::fromQuantityTable(*args.quantity_table, table);
    }

    if (args.values) {
        return Quantity(*args.values, unit);
    }
    return Quantity(*args.value, unit);
}

bool Quantity::parseValueWithUnit(const std::string& text, double& value, std::string& unit) {
    std::string trimmed = trim(text);
    if (trimmed.empty()) return false;

    size_t consumed = 0;
    try {
        value = std::stod(trimmed, &consumed);
    } catch (const std::exception&) {
        return false;
    }

    // The number must end at whitespace ("5kPa" is not accepted)
    if (consumed < trimmed.size() && !std::isspace(static_cast<unsigned char>(trimmed[consumed]))) {
        return false;
    }

    unit = trim(trimmed.substr(consumed));
    return true;
}

Quantity Quantity::parse(const std::string& text, std::shared_ptr<const UnitTable> table) {
    double value = 0.0;
    std::string unit;
    if (!parseValueWithUnit(text, value, unit)) {
        throw std::runtime_error("Failed to parse: " + text);
    }
    return Quantity(value, unit, std::move(table));
}

void Quantity::reclassifyTemperature() {
    if (!unit_.isAbsoluteTemperature()) return;

    // Only a bare scale ("K", "C") has a physical floor
    const FundamentalUnit* scale = unit_.table()->findFundamental(unit_.name());
    if (!scale) return;

    const double floor = -scale->offset;
    bool below = std::any_of(values_.begin(), values_.end(),
                             [floor](double v) { return v < floor; });
    if (below) {
        unit_ = unit_.differenceCounterpart();
    }
}

// =============================================================================
// Properties
// =============================================================================

double Quantity::value() const {
    if (is_array_) {
        throw std::logic_error("value() called on an array quantity; use values()");
    }
    return values_.front();
}

double Quantity::siValue() const {
    return (value() + unit_.siOffset()) * unit_.siScale();
}

std::vector<double> Quantity::siValues() const {
    const double offset = unit_.siOffset();
    const double scale = unit_.siScale();
    return mapValues(values_, [offset, scale](double v) { return (v + offset) * scale; });
}

// =============================================================================
// Conversion
// =============================================================================

Quantity Quantity::to(const Unit& target) const {
    AffineConversion conversion = conversionBetween(unit_, target);
    return Quantity(mapValues(values_, [&conversion](double v) { return conversion.apply(v); }),
                    is_array_, conversion.target);
}

Quantity Quantity::to(const std::string& target) const {
    return to(Unit(target, unit_.table()));
}

Quantity Quantity::convert(const UnitSystem& system) const {
    return system.convert(*this);
}

double Quantity::asDouble() const {
    const DimensionVector& dims = dimensions();
    if (dims.isDimensionless() ||
        dims == DimensionVector::of(BaseDimension::ANGLE) ||
        dims == DimensionVector::of(BaseDimension::SOLID_ANGLE)) {
        return siValue();
    }
    throw InvalidFloatCoercion();
}

Quantity Quantity::operator[](size_t index) const {
    if (index >= values_.size()) {
        throw std::out_of_range("quantity index " + std::to_string(index) +
                                " out of range (size " + std::to_string(values_.size()) + ")");
    }
    return Quantity(values_[index], unit_);
}

// =============================================================================
// Arithmetic
// =============================================================================

Quantity Quantity::sum(const Quantity& other, bool subtract) const {
    std::pair<Unit, Unit> units = subtract ? unit_.subtractionResult(other.unit_)
                                           : unit_.additionResult(other.unit_);

    AffineConversion conversion = conversionBetween(other.unit_, units.second);
    std::vector<double> rhs = mapValues(other.values_,
        [&conversion](double v) { return conversion.apply(v); });

    std::vector<double> result;
    if (subtract) {
        result = combine(values_, is_array_, rhs, other.is_array_,
                         [](double a, double b) { return a - b; });
    } else {
        result = combine(values_, is_array_, rhs, other.is_array_,
                         [](double a, double b) { return a + b; });
    }
    return Quantity(result, is_array_ || other.is_array_, units.first);
}

Quantity Quantity::add(const Quantity& other) const {
    return sum(other, false);
}

Quantity Quantity::subtract(const Quantity& other) const {
    return sum(other, true);
}

Quantity Quantity::multiply(const Quantity& other) const {
    return Quantity(combine(values_, is_array_, other.values_, other.is_array_,
                            [](double a, double b) { return a * b; }),
                    is_array_ || other.is_array_, unit_.multiply(other.unit_));
}

Quantity Quantity::divide(const Quantity& other) const {
    return Quantity(combine(values_, is_array_, other.values_, other.is_array_,
                            [](double a, double b) { return a / b; }),
                    is_array_ || other.is_array_, unit_.divide(other.unit_));
}

Quantity Quantity::power(double exponent) const {
    return Quantity(mapValues(values_, [exponent](double v) { return std::pow(v, exponent); }),
                    is_array_, unit_.power(exponent));
}

Quantity Quantity::negate() const {
    return Quantity(mapValues(values_, [](double v) { return -v; }), is_array_, unit_);
}

Quantity Quantity::operator*(double factor) const {
    return Quantity(mapValues(values_, [factor](double v) { return v * factor; }),
                    is_array_, unit_);
}

Quantity Quantity::operator/(double divisor) const {
    return Quantity(mapValues(values_, [divisor](double v) { return v / divisor; }),
                    is_array_, unit_);
}

Quantity Quantity::operator*(const Unit& unit) const {
    return multiply(Quantity(1.0, unit));
}

Quantity Quantity::operator/(const Unit& unit) const {
    return divide(Quantity(1.0, unit));
}

Quantity Quantity::operator+(double value) const {
    return add(Quantity(value, "", unit_.table()));
}

Quantity Quantity::operator-(double value) const {
    return subtract(Quantity(value, "", unit_.table()));
}

Quantity operator*(double factor, const Quantity& q) {
    return q * factor;
}

Quantity operator/(double dividend, const Quantity& q) {
    return Quantity(dividend, "", q.unit().table()).divide(q);
}

Quantity operator+(double value, const Quantity& q) {
    return Quantity(value, "", q.unit().table()).add(q);
}

Quantity operator-(double value, const Quantity& q) {
    return Quantity(value, "", q.unit().table()).subtract(q);
}

Quantity pow(const Quantity& q, double exponent) {
    return q.power(exponent);
}

// =============================================================================
// Comparison
// =============================================================================

std::pair<double, double> Quantity::siPair(const Quantity& other) const {
    if (!dimensions().isCompatible(other.dimensions())) {
        throw IncompatibleDimensions(units(), other.units());
    }
    return {siValue(), other.siValue()};
}

double Quantity::dimensionlessSI(double other) const {
    if (!isDimensionless()) {
        std::ostringstream ss;
        ss << other;
        throw IncompatibleDimensions(units(), ss.str());
    }
    return siValue();
}

bool Quantity::operator==(const Quantity& other) const {
    if (!dimensions().isCompatible(other.dimensions())) {
        throw IncompatibleDimensions(units(), other.units());
    }
    if (!is_array_ && !other.is_array_) {
        return nearlyEqual(siValue(), other.siValue());
    }

    std::vector<double> a = siValues();
    std::vector<double> b = other.siValues();
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (!nearlyEqual(a[i], b[i])) return false;
    }
    return true;
}

bool Quantity::operator<(const Quantity& other) const {
    auto si = siPair(other);
    return si.first < si.second;
}

bool Quantity::operator<=(const Quantity& other) const {
    auto si = siPair(other);
    return si.first <= si.second;
}

bool Quantity::operator>(const Quantity& other) const {
    auto si = siPair(other);
    return si.first > si.second;
}

bool Quantity::operator>=(const Quantity& other) const {
    auto si = siPair(other);
    return si.first >= si.second;
}

bool Quantity::operator==(double other) const {
    return nearlyEqual(dimensionlessSI(other), other);
}

bool Quantity::operator<(double other) const {
    return dimensionlessSI(other) < other;
}

bool Quantity::operator<=(double other) const {
    return dimensionlessSI(other) <= other;
}

bool Quantity::operator>(double other) const {
    return dimensionlessSI(other) > other;
}

bool Quantity::operator>=(double other) const {
    return dimensionlessSI(other) >= other;
}

std::ostream& operator<<(std::ostream& os, const Quantity& q) {
    os << "(";
    if (q.isArray()) {
        os << "[";
        for (size_t i = 0; i < q.size(); ++i) {
            if (i > 0) os << ", ";
            os << q.values()[i];
        }
        os << "]";
    } else {
        os << q.value();
    }
    return os << ", \"" << q.units() << "\")";
}

} // namespace PhysUnits
