#include "PhysUnits.hpp"
#include "UnitErrors.hpp"
#include <algorithm>
#include <cctype>

namespace PhysUnits {

BaseDimension parseBaseDimension(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    for (BaseDimension dim : ALL_BASE_DIMENSIONS) {
        if (toString(dim) == upper) return dim;
    }
    throw UnitConfigurationError("unknown base dimension '" + name + "'");
}

std::string toString(BaseDimension dim) {
    switch (dim) {
        case BaseDimension::MASS: return "MASS";
        case BaseDimension::LENGTH: return "LENGTH";
        case BaseDimension::TIME: return "TIME";
        case BaseDimension::TEMPERATURE: return "TEMPERATURE";
        case BaseDimension::TEMPERATURE_DIFFERENCE: return "TEMPERATURE_DIFFERENCE";
        case BaseDimension::ANGLE: return "ANGLE";
        case BaseDimension::CHEMICAL_AMOUNT: return "CHEMICAL_AMOUNT";
        case BaseDimension::LIGHT: return "LIGHT";
        case BaseDimension::CURRENT: return "CURRENT";
        case BaseDimension::SOLID_ANGLE: return "SOLID_ANGLE";
    }
    return "UNKNOWN";
}

UnitType unitTypeOf(BaseDimension dim) {
    switch (dim) {
        case BaseDimension::MASS: return UnitType::MASS;
        case BaseDimension::LENGTH: return UnitType::LENGTH;
        case BaseDimension::TIME: return UnitType::TIME;
        case BaseDimension::TEMPERATURE: return UnitType::TEMPERATURE;
        case BaseDimension::TEMPERATURE_DIFFERENCE: return UnitType::TEMPERATURE_DIFFERENCE;
        case BaseDimension::ANGLE: return UnitType::ANGLE;
        case BaseDimension::CHEMICAL_AMOUNT: return UnitType::CHEMICAL_AMOUNT;
        case BaseDimension::LIGHT: return UnitType::LIGHT;
        case BaseDimension::CURRENT: return UnitType::CURRENT;
        case BaseDimension::SOLID_ANGLE: return UnitType::SOLID_ANGLE;
    }
    return UnitType::COMPOSITE;
}

std::string toString(UnitType type) {
    switch (type) {
        case UnitType::NO_TYPE: return "No Type";
        case UnitType::MASS: return "Mass";
        case UnitType::LENGTH: return "Length";
        case UnitType::TIME: return "Time";
        case UnitType::TEMPERATURE: return "Temperature";
        case UnitType::TEMPERATURE_DIFFERENCE: return "Temperature Difference";
        case UnitType::ANGLE: return "Angle";
        case UnitType::CHEMICAL_AMOUNT: return "Chemical Amount";
        case UnitType::LIGHT: return "Light";
        case UnitType::CURRENT: return "Current";
        case UnitType::SOLID_ANGLE: return "Solid Angle";
        case UnitType::DERIVED: return "Derived";
        case UnitType::COMPOSITE: return "Composite";
    }
    return "Unknown";
}

} // namespace PhysUnits
