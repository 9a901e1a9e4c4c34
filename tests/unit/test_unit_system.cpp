/**
 * @file test_unit_system.cpp
 * @brief Unit tests for UnitSystem construction, validation and conversion
 */

#include <gtest/gtest.h>
#include "UnitSystem.hpp"
#include "Quantity.hpp"
#include "UnitErrors.hpp"
#include <sstream>

using namespace PhysUnits;

class UnitSystemTest : public ::testing::Test {
protected:
    UnitSystemDefinition britishUnits() const {
        return {
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
        };
    }
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(UnitSystemTest, DefaultIsSI) {
    UnitSystem si;
    EXPECT_EQ(si.unitFor(BaseDimension::MASS), "kg");
    EXPECT_EQ(si.unitFor(BaseDimension::LENGTH), "m");
    EXPECT_EQ(si.unitFor(BaseDimension::TEMPERATURE_DIFFERENCE), "delta_K");
    EXPECT_EQ(si, UnitSystem("SI"));
}

TEST_F(UnitSystemTest, PredefinedSystems) {
    UnitSystem cgs("CGS");
    EXPECT_EQ(cgs.unitFor(BaseDimension::MASS), "g");
    EXPECT_EQ(cgs.unitFor(BaseDimension::LENGTH), "cm");

    UnitSystem bt("BT");
    EXPECT_EQ(bt.unitFor(BaseDimension::MASS), "slug");
    EXPECT_EQ(bt.unitFor(BaseDimension::TEMPERATURE), "R");
    EXPECT_EQ(bt.unitFor(BaseDimension::CHEMICAL_AMOUNT), "slugmol");
}

TEST_F(UnitSystemTest, UnknownSystemName) {
    EXPECT_THROW(UnitSystem("FPS"), InvalidUnitSystem);
}

TEST_F(UnitSystemTest, NameWithOverrides) {
    UnitSystem custom("SI", UnitSystemDefinition{{BaseDimension::LENGTH, "ft"}});
    EXPECT_EQ(custom.unitFor(BaseDimension::LENGTH), "ft");
    EXPECT_EQ(custom.unitFor(BaseDimension::MASS), "kg");
}

TEST_F(UnitSystemTest, FromBaseUnits) {
    UnitSystem bt = UnitSystem::fromBaseUnits(britishUnits());
    EXPECT_EQ(bt, UnitSystem("BT"));

    UnitSystemDefinition partial = britishUnits();
    partial.erase(BaseDimension::CURRENT);
    EXPECT_THROW(UnitSystem::fromBaseUnits(partial), InsufficientArguments);
}

TEST_F(UnitSystemTest, FromUnitList) {
    UnitSystem bt = UnitSystem::fromUnits({"slug", "ft", "s", "R", "delta_R", "radian",
                                           "slugmol", "cd", "A", "sr"});
    EXPECT_EQ(bt, UnitSystem("BT"));

    EXPECT_THROW(UnitSystem::fromUnits({"kg", "slug"}), DuplicateDimensionType);
    EXPECT_THROW(UnitSystem::fromUnits({"kg", "m", "s"}), InvalidUnitSystem);
    EXPECT_THROW(UnitSystem::fromUnits({"kg", "N"}), NotFundamentalUnit);
}

TEST_F(UnitSystemTest, CreateFromOptions) {
    UnitSystem cgs("CGS");

    UnitSystemOptions copy;
    copy.copy_from = &cgs;
    EXPECT_EQ(UnitSystem::create(copy), cgs);

    UnitSystemOptions modified;
    modified.copy_from = &cgs;
    modified.base_units = {{BaseDimension::MASS, "kg"}};
    UnitSystem mixed = UnitSystem::create(modified);
    EXPECT_EQ(mixed.unitFor(BaseDimension::MASS), "kg");
    EXPECT_EQ(mixed.unitFor(BaseDimension::LENGTH), "cm");

    UnitSystemOptions named;
    named.system = "BT";
    EXPECT_EQ(UnitSystem::create(named), UnitSystem("BT"));

    EXPECT_EQ(UnitSystem::create(UnitSystemOptions()), UnitSystem());

    UnitSystemOptions both;
    both.system = "SI";
    both.copy_from = &cgs;
    EXPECT_THROW(UnitSystem::create(both), ExcessiveParameters);
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(UnitSystemTest, SetUnitValidates) {
    UnitSystem system;
    system.setUnit(BaseDimension::MASS, "lb");
    EXPECT_EQ(system.unitFor(BaseDimension::MASS), "lb");

    EXPECT_THROW(system.setUnit(BaseDimension::MASS, "N"), NotFundamentalUnit);
    EXPECT_THROW(system.setUnit(BaseDimension::MASS, "ft"), IncorrectUnitType);
    EXPECT_THROW(system.setUnit(BaseDimension::TEMPERATURE, "delta_K"), IncorrectUnitType);
    EXPECT_EQ(system.unitFor(BaseDimension::MASS), "lb");
}

TEST_F(UnitSystemTest, UpdateIsAllOrNothing) {
    UnitSystem system;
    EXPECT_THROW(system.update({{BaseDimension::MASS, "slug"},
                                {BaseDimension::LENGTH, "kg"}}),
                 IncorrectUnitType);
    EXPECT_EQ(system.unitFor(BaseDimension::MASS), "kg");
}

// ============================================================================
// Conversion
// ============================================================================

TEST_F(UnitSystemTest, ConvertToBritishTechnical) {
    UnitSystem bt("BT");
    Quantity q = bt.convert(Quantity(10.0, "kg ft s"));
    EXPECT_NEAR(q.value(), 0.6852176585679174, 1e-12);
    EXPECT_EQ(q.units(), "slug ft s");
}

TEST_F(UnitSystemTest, ConvertToSI) {
    Quantity q = UnitSystem().convert(Quantity(4.0, "slug cm s"));
    EXPECT_NEAR(q.value(), 0.5837561174882547, 1e-12);
    EXPECT_EQ(q.units(), "kg m s");
}

TEST_F(UnitSystemTest, ConvertDerivedUnits) {
    Quantity q = UnitSystem("CGS").convert(Quantity(1.0, "N"));
    EXPECT_EQ(q.units(), "g cm s^-2");
    EXPECT_NEAR(q.value(), 1.0e5, 1e-6);
}

TEST_F(UnitSystemTest, ConvertTemperature) {
    Quantity q = UnitSystem("BT").convert(Quantity(0.0, "C"));
    EXPECT_EQ(q.units(), "R");
    EXPECT_NEAR(q.value(), 491.67, 1e-9);

    Quantity dq = UnitSystem("BT").convert(Quantity(10.0, "delta_C"));
    EXPECT_EQ(dq.units(), "delta_R");
    EXPECT_NEAR(dq.value(), 18.0, 1e-9);
}

TEST_F(UnitSystemTest, ToString) {
    UnitSystem bt("BT");
    std::ostringstream ss;
    ss << bt;
    EXPECT_EQ(ss.str().substr(0, 25), "MASS: slug, LENGTH: ft, T");
}
