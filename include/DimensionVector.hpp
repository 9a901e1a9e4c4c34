#ifndef DIMENSION_VECTOR_HPP
#define DIMENSION_VECTOR_HPP

#include "PhysUnits.hpp"
#include <array>
#include <map>
#include <string>
#include <ostream>

namespace PhysUnits {

/**
 * @brief Unit dimension as exponents over the ten base dimensions
 *
 * Every physical quantity can be expressed as a product of base
 * dimensions raised to (possibly fractional) powers:
 * M^a L^b T^c Theta^d dTheta^e ...
 *
 * The vector never depends on multiplier prefixes: km and m share a vector.
 */
class DimensionVector {
public:
    DimensionVector() { exponents_.fill(0.0); }

    explicit DimensionVector(const std::map<BaseDimension, double>& exponents);

    /// Single base dimension raised to a power
    static DimensionVector of(BaseDimension dim, double power = 1.0);

    double operator[](BaseDimension dim) const { return exponents_[index(dim)]; }
    void set(BaseDimension dim, double exponent) { exponents_[index(dim)] = exponent; }

    // Composition: multiplying units adds exponents, dividing subtracts
    DimensionVector operator+(const DimensionVector& other) const;
    DimensionVector operator-(const DimensionVector& other) const;
    DimensionVector operator*(double power) const;

    /// True iff every exponent matches
    bool operator==(const DimensionVector& other) const;
    bool operator!=(const DimensionVector& other) const { return !(*this == other); }

    /**
     * @brief Convertibility check
     *
     * Like ==, but also accepts vectors that differ only by an equal and
     * opposite amount between TEMPERATURE and TEMPERATURE_DIFFERENCE, so an
     * absolute temperature can be converted to a difference unit and back.
     */
    bool isCompatible(const DimensionVector& other) const;

    bool isDimensionless() const;

    /// Nonzero components in dimension order
    std::map<BaseDimension, double> nonZero() const;

    // Human-readable form, e.g. "{MASS: 1, LENGTH: -1, TIME: -2}"
    std::string toString() const;

private:
    std::array<double, NUM_BASE_DIMENSIONS> exponents_;
};

std::ostream& operator<<(std::ostream& os, const DimensionVector& dims);

} // namespace PhysUnits

#endif // DIMENSION_VECTOR_HPP
