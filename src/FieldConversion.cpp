#include "FieldConversion.hpp"
#include "UnitConversion.hpp"
#include "UnitErrors.hpp"

namespace PhysUnits {

PetscErrorCode convertField(Vec field, const Unit& from, const Unit& to, Unit* result) {
    PetscErrorCode ierr;
    AffineConversion conversion(1.0, 0.0, to);

    PetscFunctionBeginUser;
    try {
        conversion = conversionBetween(from, to);
    } catch (const IncompatibleDimensions& e) {
        SETERRQ(PetscObjectComm((PetscObject)field), PETSC_ERR_ARG_INCOMP, "%s", e.what());
    }

    if (conversion.scale != 1.0) {
        ierr = VecScale(field, conversion.scale);CHKERRQ(ierr);
    }
    if (conversion.shift != 0.0) {
        ierr = VecShift(field, conversion.shift);CHKERRQ(ierr);
    }

    if (result) {
        *result = conversion.target;
    }
    PetscFunctionReturn(0);
}

PetscErrorCode convertField(Vec field, const std::string& from, const std::string& to) {
    PetscErrorCode ierr;
    Unit from_unit;
    Unit to_unit;

    PetscFunctionBeginUser;
    try {
        from_unit = Unit(from);
        to_unit = Unit(to);
    } catch (const UnitError& e) {
        SETERRQ(PetscObjectComm((PetscObject)field), PETSC_ERR_ARG_WRONG, "%s", e.what());
    }

    ierr = convertField(field, from_unit, to_unit);CHKERRQ(ierr);
    PetscFunctionReturn(0);
}

PetscErrorCode fieldToSI(Vec field, const Unit& from) {
    PetscErrorCode ierr;

    PetscFunctionBeginUser;
    if (from.siOffset() != 0.0) {
        ierr = VecShift(field, from.siOffset());CHKERRQ(ierr);
    }
    if (from.siScale() != 1.0) {
        ierr = VecScale(field, from.siScale());CHKERRQ(ierr);
    }
    PetscFunctionReturn(0);
}

} // namespace PhysUnits
