#include "DimensionVector.hpp"
#include "UnitParser.hpp"
#include <sstream>
#include <cmath>

namespace PhysUnits {

namespace {
constexpr double EXPONENT_TOL = 1e-10;
}

DimensionVector::DimensionVector(const std::map<BaseDimension, double>& exponents) {
    exponents_.fill(0.0);
    for (const auto& kv : exponents) {
        exponents_[index(kv.first)] = kv.second;
    }
}

DimensionVector DimensionVector::of(BaseDimension dim, double power) {
    DimensionVector result;
    result.set(dim, power);
    return result;
}

DimensionVector DimensionVector::operator+(const DimensionVector& other) const {
    DimensionVector result;
    for (int i = 0; i < NUM_BASE_DIMENSIONS; ++i) {
        result.exponents_[i] = exponents_[i] + other.exponents_[i];
    }
    return result;
}

DimensionVector DimensionVector::operator-(const DimensionVector& other) const {
    DimensionVector result;
    for (int i = 0; i < NUM_BASE_DIMENSIONS; ++i) {
        result.exponents_[i] = exponents_[i] - other.exponents_[i];
    }
    return result;
}

DimensionVector DimensionVector::operator*(double power) const {
    DimensionVector result;
    for (int i = 0; i < NUM_BASE_DIMENSIONS; ++i) {
        result.exponents_[i] = exponents_[i] * power;
    }
    return result;
}

bool DimensionVector::operator==(const DimensionVector& other) const {
    for (int i = 0; i < NUM_BASE_DIMENSIONS; ++i) {
        if (std::abs(exponents_[i] - other.exponents_[i]) > EXPONENT_TOL) {
            return false;
        }
    }
    return true;
}

bool DimensionVector::isCompatible(const DimensionVector& other) const {
    DimensionVector diff = *this - other;

    const int temp = index(BaseDimension::TEMPERATURE);
    const int delta = index(BaseDimension::TEMPERATURE_DIFFERENCE);
    if (std::abs(diff.exponents_[temp] + diff.exponents_[delta]) < EXPONENT_TOL) {
        diff.exponents_[temp] = 0.0;
        diff.exponents_[delta] = 0.0;
    }
    return diff.isDimensionless();
}

bool DimensionVector::isDimensionless() const {
    for (double e : exponents_) {
        if (std::abs(e) > EXPONENT_TOL) return false;
    }
    return true;
}

std::map<BaseDimension, double> DimensionVector::nonZero() const {
    std::map<BaseDimension, double> result;
    for (BaseDimension dim : ALL_BASE_DIMENSIONS) {
        double e = exponents_[index(dim)];
        if (std::abs(e) > EXPONENT_TOL) result[dim] = e;
    }
    return result;
}

std::string DimensionVector::toString() const {
    std::stringstream ss;
    bool first = true;

    ss << "{";
    for (const auto& kv : nonZero()) {
        if (!first) ss << ", ";
        ss << PhysUnits::toString(kv.first) << ": " << formatPower(kv.second);
        first = false;
    }
    ss << "}";

    return first ? "dimensionless" : ss.str();
}

std::ostream& operator<<(std::ostream& os, const DimensionVector& dims) {
    return os << dims.toString();
}

} // namespace PhysUnits
