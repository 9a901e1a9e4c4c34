#ifndef FIELD_CONVERSION_HPP
#define FIELD_CONVERSION_HPP

#include "Unit.hpp"
#include <petscvec.h>
#include <string>

namespace PhysUnits {

// In-place unit conversion of PETSc field vectors. Every entry is treated as
// a reading in the source unit and rewritten with the same affine map
// Quantity::to applies. Unit errors are reported through PETSc (SETERRQ)
// before the vector is touched, so a failed conversion leaves the field
// unchanged.

/**
 * @brief Convert a field from one unit to another
 *
 * @param field   Vector converted in place
 * @param from    Units of the current entries
 * @param to      Requested units
 * @param result  Optional; receives the unit the entries end up in (a
 *                difference converted to an absolute scale lands on its
 *                delta_ counterpart)
 * @return PETSC_ERR_ARG_INCOMP when the dimensions are incompatible
 */
PetscErrorCode convertField(Vec field, const Unit& from, const Unit& to,
                            Unit* result = nullptr);

/// String form; an unknown unit gives PETSC_ERR_ARG_WRONG
PetscErrorCode convertField(Vec field, const std::string& from, const std::string& to);

/// Convert a field to SI: x -> (x + offset) * scale
PetscErrorCode fieldToSI(Vec field, const Unit& from);

} // namespace PhysUnits

#endif // FIELD_CONVERSION_HPP
