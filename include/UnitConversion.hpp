#ifndef UNIT_CONVERSION_HPP
#define UNIT_CONVERSION_HPP

#include "Unit.hpp"

namespace PhysUnits {

/**
 * @brief Affine map from readings in one unit to readings in another
 *
 * new_value = value * scale + shift
 *
 * The target may differ from the requested unit: converting a temperature
 * difference into an absolute scale lands on that scale's difference unit.
 */
struct AffineConversion {
    double scale;
    double shift;
    Unit target;

    AffineConversion(double s, double sh, const Unit& t) : scale(s), shift(sh), target(t) {}

    double apply(double value) const { return value * scale + shift; }
};

/**
 * @brief Conversion between two units
 *
 * - Differences ("delta_F", "kg K^-1") are converted with scale only.
 * - A difference converted to an absolute scale targets the difference
 *   counterpart of that scale ("delta_K" -> "C" gives "delta_C").
 * - Absolute readings use the full (x + off_from) * s_from / s_to - off_to.
 *
 * @throws IncompatibleDimensions unless the dimension vectors are compatible
 */
AffineConversion conversionBetween(const Unit& from, const Unit& to);

} // namespace PhysUnits

#endif // UNIT_CONVERSION_HPP
