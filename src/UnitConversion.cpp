#include "UnitConversion.hpp"
#include "UnitErrors.hpp"

namespace PhysUnits {

AffineConversion conversionBetween(const Unit& from, const Unit& to) {
    if (!from.dimensions().isCompatible(to.dimensions())) {
        throw IncompatibleDimensions(from.name(), to.name());
    }

    Unit target = to;
    if (from.isTemperatureDifference() && to.isAbsoluteTemperature()) {
        target = to.differenceCounterpart();
    }

    const double scale = from.siScale() / target.siScale();

    // A difference carries no zero point, so no offset on either side
    if (target.isTemperatureDifference()) {
        return AffineConversion(scale, 0.0, target);
    }

    const double shift = from.siOffset() * scale - target.siOffset();
    return AffineConversion(scale, shift, target);
}

} // namespace PhysUnits
