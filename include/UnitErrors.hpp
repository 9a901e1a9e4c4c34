#ifndef UNIT_ERRORS_HPP
#define UNIT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace PhysUnits {

/**
 * @brief Base class for every error raised by the unit engine
 *
 * All errors are raised synchronously where they are detected. An operation
 * either fully succeeds or throws one of these; nothing is retried.
 */
class UnitError : public std::runtime_error {
public:
    explicit UnitError(const std::string& what) : std::runtime_error(what) {}
};

/// A token does not resolve to any known prefix + symbol combination
class UnknownUnit : public UnitError {
public:
    explicit UnknownUnit(const std::string& unit)
        : UnitError("`" + unit + "` is an unknown or unconfigured unit.") {}
};

/// Conversion, addition or comparison across mismatched dimensions
class IncompatibleDimensions : public UnitError {
public:
    IncompatibleDimensions(const std::string& from_unit, const std::string& to_unit)
        : UnitError("`" + from_unit + "` and `" + to_unit +
                    "` have incompatible dimensions.") {}
};

class ExcessiveParameters : public UnitError {
public:
    explicit ExcessiveParameters(const std::string& what)
        : UnitError("Excessive parameters: " + what) {}
};

class InsufficientArguments : public UnitError {
public:
    explicit InsufficientArguments(const std::string& what)
        : UnitError("Insufficient arguments: " + what) {}
};

class InvalidUnitSystem : public UnitError {
public:
    explicit InvalidUnitSystem(const std::string& what)
        : UnitError("Invalid unit system: " + what) {}
};

class NotFundamentalUnit : public UnitError {
public:
    explicit NotFundamentalUnit(const std::string& unit)
        : UnitError("`" + unit + "` is not a fundamental unit and cannot be "
                    "used as a unit system base unit.") {}
};

class DuplicateDimensionType : public UnitError {
public:
    DuplicateDimensionType(const std::string& unit, const std::string& other)
        : UnitError("`" + unit + "` and `" + other +
                    "` have the same dimension type.") {}
};

class IncorrectUnitType : public UnitError {
public:
    IncorrectUnitType(const std::string& unit, const std::string& slot)
        : UnitError("The unit `" + unit +
                    "` is incompatible with unit system type: `" + slot + "`") {}
};

class InvalidFloatCoercion : public UnitError {
public:
    InvalidFloatCoercion()
        : UnitError("Only dimensionless quantities, angles and solid angles "
                    "can be used as a plain number.") {}
};

class ProhibitedTemperatureOperation : public UnitError {
public:
    explicit ProhibitedTemperatureOperation(const std::string& what)
        : UnitError("Prohibited temperature operation: " + what) {}
};

class UnitAlreadyRegistered : public UnitError {
public:
    explicit UnitAlreadyRegistered(const std::string& unit)
        : UnitError("Unable to override `" + unit +
                    "`, it has already been registered.") {}
};

class UnknownQuantityName : public UnitError {
public:
    explicit UnknownQuantityName(const std::string& name)
        : UnitError("`" + name + "` is not a valid quantity name.") {}
};

/// Two preferred units may not share a dimension vector
class RequiresUniqueDimensions : public UnitError {
public:
    RequiresUniqueDimensions(const std::string& unit, const std::string& other_unit)
        : UnitError("For '" + unit + "' to be added '" + other_unit +
                    "' must be removed.") {}
};

class IncompatibleValue : public UnitError {
public:
    IncompatibleValue(const std::string& value, const std::string& reason)
        : UnitError("`" + value + "` is incompatible: " + reason) {}
};

/// Malformed unit table data (bad entry, cyclic derived unit)
class UnitConfigurationError : public UnitError {
public:
    explicit UnitConfigurationError(const std::string& what)
        : UnitError("Unit configuration error: " + what) {}
};

} // namespace PhysUnits

#endif // UNIT_ERRORS_HPP
