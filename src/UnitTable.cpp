#include "UnitTable.hpp"
#include "UnitErrors.hpp"

namespace PhysUnits {

// =============================================================================
// Built-in Table
// =============================================================================

std::shared_ptr<const UnitTable> UnitTable::builtin() {
    static const std::shared_ptr<const UnitTable> table = [] {
        auto t = std::make_shared<UnitTable>();
        t->addSIMultipliers();

        // Fundamental units. Within a dimension the first unit with factor 1
        // is the SI representative, so kg/m/s/K/delta_K lead their blocks.
        t->addMassUnits();
        t->addLengthUnits();
        t->addTimeUnits();
        t->addElectricalUnits();
        t->addAmountAndLightUnits();
        t->addAngleUnits();
        t->addTemperatureUnits();

        // Derived units
        t->addMechanicalUnits();
        t->addElectromagneticUnits();
        t->addEnergyUnits();
        t->addVolumeUnits();

        t->addQuantityNames();
        t->addUnitSystems();
        return std::shared_ptr<const UnitTable>(t);
    }();
    return table;
}

void UnitTable::addSIMultipliers() {
    // Matching order: longer prefixes that share a first letter ("da")
    // come before their single-letter counterparts ("d").
    addMultiplier("Q", 1.0e30);
    addMultiplier("R", 1.0e27);
    addMultiplier("Y", 1.0e24);
    addMultiplier("Z", 1.0e21);
    addMultiplier("E", 1.0e18);
    addMultiplier("P", 1.0e15);
    addMultiplier("T", 1.0e12);
    addMultiplier("G", 1.0e9);
    addMultiplier("M", 1.0e6);
    addMultiplier("k", 1.0e3);
    addMultiplier("h", 1.0e2);
    addMultiplier("da", 1.0e1);
    addMultiplier("d", 1.0e-1);
    addMultiplier("c", 1.0e-2);
    addMultiplier("m", 1.0e-3);
    addMultiplier("u", 1.0e-6);
    addMultiplier("n", 1.0e-9);
    addMultiplier("p", 1.0e-12);
    addMultiplier("f", 1.0e-15);
    addMultiplier("a", 1.0e-18);
    addMultiplier("z", 1.0e-21);
    addMultiplier("y", 1.0e-24);
    addMultiplier("r", 1.0e-27);
    addMultiplier("q", 1.0e-30);
}

void UnitTable::addMassUnits() {
    const BaseDimension mass = BaseDimension::MASS;

    addFundamentalUnit(FundamentalUnit("kg", mass, 1.0));
    addFundamentalUnit(FundamentalUnit("g", mass, 0.001));
    addFundamentalUnit(FundamentalUnit("lb", mass, 0.45359237));
    addFundamentalUnit(FundamentalUnit("lbm", mass, 0.45359237));
    addFundamentalUnit(FundamentalUnit("slug", mass, 14.59390293720637));
}

void UnitTable::addLengthUnits() {
    const BaseDimension length = BaseDimension::LENGTH;

    addFundamentalUnit(FundamentalUnit("m", length, 1.0));
    addFundamentalUnit(FundamentalUnit("cm", length, 0.01));
    addFundamentalUnit(FundamentalUnit("ft", length, 0.30479999999999996));
    addFundamentalUnit(FundamentalUnit("inch", length, 0.0254));
    addFundamentalUnit(FundamentalUnit("in", length, 0.0254));
}

void UnitTable::addTimeUnits() {
    addFundamentalUnit(FundamentalUnit("s", BaseDimension::TIME, 1.0));
}

void UnitTable::addElectricalUnits() {
    addFundamentalUnit(FundamentalUnit("A", BaseDimension::CURRENT, 1.0));
}

void UnitTable::addAmountAndLightUnits() {
    addFundamentalUnit(FundamentalUnit("mol", BaseDimension::CHEMICAL_AMOUNT, 1.0));
    addFundamentalUnit(FundamentalUnit("slugmol", BaseDimension::CHEMICAL_AMOUNT, 14593.9));
    addFundamentalUnit(FundamentalUnit("cd", BaseDimension::LIGHT, 1.0));
}

void UnitTable::addAngleUnits() {
    addFundamentalUnit(FundamentalUnit("sr", BaseDimension::SOLID_ANGLE, 1.0));
    addFundamentalUnit(FundamentalUnit("radian", BaseDimension::ANGLE, 1.0));
    addFundamentalUnit(FundamentalUnit("degree", BaseDimension::ANGLE, 0.017453292519943295));
}

void UnitTable::addTemperatureUnits() {
    const BaseDimension temp = BaseDimension::TEMPERATURE;
    const BaseDimension delta = BaseDimension::TEMPERATURE_DIFFERENCE;
    const double rankine = 0.5555555555555555;

    // Absolute scales
    addFundamentalUnit(FundamentalUnit("K", temp, 1.0, 0.0));
    addFundamentalUnit(FundamentalUnit("C", temp, 1.0, 273.15));
    addFundamentalUnit(FundamentalUnit("F", temp, rankine, 459.67));
    addFundamentalUnit(FundamentalUnit("R", temp, rankine, 0.0));

    // Differences
    addFundamentalUnit(FundamentalUnit("delta_K", delta, 1.0));
    addFundamentalUnit(FundamentalUnit("delta_C", delta, 1.0));
    addFundamentalUnit(FundamentalUnit("delta_F", delta, rankine));
    addFundamentalUnit(FundamentalUnit("delta_R", delta, rankine));
}

void UnitTable::addMechanicalUnits() {
    addDerivedUnit(DerivedUnit("N", "kg m s^-2"));
    addDerivedUnit(DerivedUnit("Pa", "N m^-2"));
    addDerivedUnit(DerivedUnit("W", "N m s^-1"));
    addDerivedUnit(DerivedUnit("J", "N m"));
    addDerivedUnit(DerivedUnit("dyne", "g cm s^-2"));
    addDerivedUnit(DerivedUnit("erg", "dyne cm"));
    addDerivedUnit(DerivedUnit("h", "s", 3600.0));
    addDerivedUnit(DerivedUnit("pdl", "lbm ft s^-2"));
    addDerivedUnit(DerivedUnit("lbf", "slug ft s^-2"));
    addDerivedUnit(DerivedUnit("psi", "lbf inch^-2"));
    addDerivedUnit(DerivedUnit("psf", "lbf ft^-2"));
    addDerivedUnit(DerivedUnit("Hz", "s^-1"));
}

void UnitTable::addElectromagneticUnits() {
    addDerivedUnit(DerivedUnit("ohm", "kg m^2 s^-3 A^-2"));
    addDerivedUnit(DerivedUnit("V", "A ohm"));
    addDerivedUnit(DerivedUnit("farad", "N m V^-2"));
    addDerivedUnit(DerivedUnit("H", "N m A^-2"));
    addDerivedUnit(DerivedUnit("S", "ohm^-1"));
    addDerivedUnit(DerivedUnit("Wb", "N m A^-1"));
    addDerivedUnit(DerivedUnit("T", "Wb m^-2"));
    addDerivedUnit(DerivedUnit("coulomb", "A s"));
}

void UnitTable::addEnergyUnits() {
    addDerivedUnit(DerivedUnit("BTU", "J", 1055.056));
    addDerivedUnit(DerivedUnit("cal", "J", 4.184));
}

void UnitTable::addVolumeUnits() {
    addDerivedUnit(DerivedUnit("l", "m^3", 0.001));
    addDerivedUnit(DerivedUnit("gal", "m^3", 0.0037854117839999993));
}

void UnitTable::addQuantityNames() {
    // Base quantities
    addQuantityName("Mass", "kg");
    addQuantityName("Length", "m");
    addQuantityName("Time", "s");
    addQuantityName("Temperature", "K");
    addQuantityName("Current", "A");
    addQuantityName("SubstanceAmount", "mol");
    addQuantityName("Light", "cd");
    addQuantityName("Angle", "radian");
    addQuantityName("SolidAngle", "sr");

    // Kinematics and mechanics
    addQuantityName("Acceleration", "m s^-2");
    addQuantityName("AngularAcceleration", "radian s^-2");
    addQuantityName("AngularVelocity", "radian s^-1");
    addQuantityName("Area", "m^2");
    addQuantityName("Density", "kg m^-3");
    addQuantityName("DynamicViscosity", "Pa s");
    addQuantityName("Force", "N");
    addQuantityName("Frequency", "Hz");
    addQuantityName("KinematicViscosity", "m^2 s^-1");
    addQuantityName("MassFlow", "kg s^-1");
    addQuantityName("MassFlux", "kg s^-1 m^-2");
    addQuantityName("Moment", "N m");
    addQuantityName("Pressure", "Pa");
    addQuantityName("PressureGradient", "Pa m^-1");
    addQuantityName("Stiffness", "N m^-1");
    addQuantityName("SurfaceTension", "N m^-1");
    addQuantityName("Torque", "N m");
    addQuantityName("Velocity", "m s^-1");
    addQuantityName("Volume", "m^3");
    addQuantityName("VolumetricFlow", "m^3 s^-1");

    // Thermal
    addQuantityName("Energy", "J");
    addQuantityName("HeatFlux", "W m^-2");
    addQuantityName("HeatGeneration", "W m^-3");
    addQuantityName("HeatRate", "W");
    addQuantityName("HeatTransferCoefficient", "W m^-2 K^-1");
    addQuantityName("Power", "W");
    addQuantityName("SpecificEnergy", "J kg^-1");
    addQuantityName("SpecificHeatCapacity", "J kg^-1 K^-1");
    addQuantityName("TemperatureGradient", "K m^-1");
    addQuantityName("ThermalConductivity", "W m^-1 K^-1");
    addQuantityName("ThermalExpansivity", "K^-1");

    // Chemistry
    addQuantityName("MolarConcentration", "mol m^-3");
    addQuantityName("MolarEnergy", "J mol^-1");
    addQuantityName("MolarMass", "kg kmol^-1");

    // Electromagnetics
    addQuantityName("Capacitance", "farad");
    addQuantityName("ElectricCharge", "A s");
    addQuantityName("ElectricField", "V m^-1");
    addQuantityName("ElectricalConductivity", "S m^-1");
    addQuantityName("ElectricalResistance", "ohm");
    addQuantityName("Inductance", "H");
    addQuantityName("MagneticFlux", "Wb");
    addQuantityName("MagneticFluxDensity", "T");
}

void UnitTable::addUnitSystems() {
    addUnitSystem("SI", {
        {BaseDimension::MASS, "kg"},
        {BaseDimension::LENGTH, "m"},
        {BaseDimension::TIME, "s"},
        {BaseDimension::TEMPERATURE, "K"},
        {BaseDimension::TEMPERATURE_DIFFERENCE, "delta_K"},
        {BaseDimension::ANGLE, "radian"},
        {BaseDimension::CHEMICAL_AMOUNT, "mol"},
        {BaseDimension::LIGHT, "cd"},
        {BaseDimension::CURRENT, "A"},
        {BaseDimension::SOLID_ANGLE, "sr"}
    });

    addUnitSystem("CGS", {
        {BaseDimension::MASS, "g"},
        {BaseDimension::LENGTH, "cm"},
        {BaseDimension::TIME, "s"},
        {BaseDimension::TEMPERATURE, "K"},
        {BaseDimension::TEMPERATURE_DIFFERENCE, "delta_K"},
        {BaseDimension::ANGLE, "radian"},
        {BaseDimension::CHEMICAL_AMOUNT, "mol"},
        {BaseDimension::LIGHT, "cd"},
        {BaseDimension::CURRENT, "A"},
        {BaseDimension::SOLID_ANGLE, "sr"}
    });

    // British technical (foot-pound-second)
    addUnitSystem("BT", {
        {BaseDimension::MASS, "slug"},
        {BaseDimension::LENGTH, "ft"},
        {BaseDimension::TIME, "s"},
        {BaseDimension::TEMPERATURE, "R"},
        {BaseDimension::TEMPERATURE_DIFFERENCE, "delta_R"},
        {BaseDimension::ANGLE, "radian"},
        {BaseDimension::CHEMICAL_AMOUNT, "slugmol"},
        {BaseDimension::LIGHT, "cd"},
        {BaseDimension::CURRENT, "A"},
        {BaseDimension::SOLID_ANGLE, "sr"}
    });
}

// =============================================================================
// Table Construction
// =============================================================================

void UnitTable::addMultiplier(const std::string& symbol, double factor) {
    if (findMultiplier(symbol)) {
        throw UnitConfigurationError("duplicate multiplier '" + symbol + "'");
    }
    multipliers_.emplace_back(symbol, factor);
}

void UnitTable::addFundamentalUnit(const FundamentalUnit& unit) {
    if (unit.symbol.empty()) {
        throw UnitConfigurationError("fundamental unit with empty symbol");
    }
    if (hasUnit(unit.symbol)) {
        throw UnitAlreadyRegistered(unit.symbol);
    }
    fundamental_index_[unit.symbol] = fundamentals_.size();
    fundamentals_.push_back(unit);
}

void UnitTable::addDerivedUnit(const DerivedUnit& unit) {
    if (unit.symbol.empty()) {
        throw UnitConfigurationError("derived unit with empty symbol");
    }
    if (hasUnit(unit.symbol)) {
        throw UnitAlreadyRegistered(unit.symbol);
    }
    derived_index_[unit.symbol] = derived_.size();
    derived_.push_back(unit);
}

void UnitTable::addQuantityName(const std::string& name, const std::string& units) {
    quantity_names_[name] = units;
}

void UnitTable::addUnitSystem(const std::string& name, const UnitSystemDefinition& units) {
    if (unit_systems_.find(name) == unit_systems_.end()) {
        system_order_.push_back(name);
    }
    unit_systems_[name] = units;
}

// =============================================================================
// Lookup
// =============================================================================

const MultiplierPrefix* UnitTable::findMultiplier(const std::string& symbol) const {
    for (const auto& mult : multipliers_) {
        if (mult.symbol == symbol) return &mult;
    }
    return nullptr;
}

bool UnitTable::hasUnit(const std::string& symbol) const {
    return isFundamental(symbol) || isDerived(symbol);
}

bool UnitTable::isFundamental(const std::string& symbol) const {
    return fundamental_index_.find(symbol) != fundamental_index_.end();
}

bool UnitTable::isDerived(const std::string& symbol) const {
    return derived_index_.find(symbol) != derived_index_.end();
}

const FundamentalUnit* UnitTable::findFundamental(const std::string& symbol) const {
    auto it = fundamental_index_.find(symbol);
    if (it == fundamental_index_.end()) return nullptr;
    return &fundamentals_[it->second];
}

const DerivedUnit* UnitTable::findDerived(const std::string& symbol) const {
    auto it = derived_index_.find(symbol);
    if (it == derived_index_.end()) return nullptr;
    return &derived_[it->second];
}

std::vector<std::string> UnitTable::unitSymbols() const {
    std::vector<std::string> symbols;
    symbols.reserve(fundamentals_.size() + derived_.size());
    for (const auto& u : fundamentals_) symbols.push_back(u.symbol);
    for (const auto& u : derived_) symbols.push_back(u.symbol);
    return symbols;
}

const std::string& UnitTable::siUnitFor(BaseDimension dim) const {
    for (const auto& u : fundamentals_) {
        if (u.type == dim && u.factor == 1.0) return u.symbol;
    }
    throw UnitConfigurationError("no SI unit (factor 1) configured for " + toString(dim));
}

const std::string& UnitTable::quantityUnits(const std::string& name) const {
    auto it = quantity_names_.find(name);
    if (it == quantity_names_.end()) {
        throw UnknownQuantityName(name);
    }
    return it->second;
}

bool UnitTable::hasQuantityName(const std::string& name) const {
    return quantity_names_.find(name) != quantity_names_.end();
}

const UnitSystemDefinition& UnitTable::unitSystem(const std::string& name) const {
    auto it = unit_systems_.find(name);
    if (it == unit_systems_.end()) {
        throw InvalidUnitSystem("`" + name + "` is not a supported unit system.");
    }
    return it->second;
}

bool UnitTable::hasUnitSystem(const std::string& name) const {
    return unit_systems_.find(name) != unit_systems_.end();
}

} // namespace PhysUnits
