/**
 * @file test_quantity.cpp
 * @brief Unit tests for Quantity conversion, arithmetic and comparison
 */

#include <gtest/gtest.h>
#include "Quantity.hpp"
#include "UnitErrors.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>

using namespace PhysUnits;

class QuantityTest : public ::testing::Test {
protected:
    static constexpr double TOL = 1e-9;
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(QuantityTest, ScalarConstruction) {
    Quantity q(5000.0, "kPa");
    EXPECT_DOUBLE_EQ(q.value(), 5000.0);
    EXPECT_EQ(q.units(), "kPa");
    EXPECT_FALSE(q.isArray());
    EXPECT_EQ(q.size(), 1u);
    EXPECT_NEAR(q.siValue(), 5.0e6, 1e-6);
    EXPECT_EQ(q.siUnits(), "kg m^-1 s^-2");
}

TEST_F(QuantityTest, FromDimensions) {
    DimensionVector accel({{BaseDimension::LENGTH, 1.0}, {BaseDimension::TIME, -2.0}});
    Quantity g(9.81, accel);
    EXPECT_EQ(g.units(), "m s^-2");

    Quantity g_bt(32.2, accel, UnitSystem("BT"));
    EXPECT_EQ(g_bt.units(), "ft s^-2");
}

TEST_F(QuantityTest, FromQuantityTable) {
    Quantity energy(3.0, QuantityTable{{"Mass", 1.0}, {"Velocity", 2.0}});
    EXPECT_EQ(energy.units(), "kg m^2 s^-2");
    EXPECT_EQ(energy.dimensions(), Unit("J").dimensions());
}

TEST_F(QuantityTest, UnknownUnitThrows) {
    EXPECT_THROW(Quantity(1.0, "furlong"), UnknownUnit);
}

TEST_F(QuantityTest, CreateFromArgs) {
    QuantityArgs args;
    args.value = 2.0;
    args.units = "ft";
    Quantity q = Quantity::create(args);
    EXPECT_EQ(q.units(), "ft");

    QuantityArgs dims;
    dims.value = 1.0;
    dims.dimensions = Unit("N").dimensions();
    dims.system = UnitSystem("BT");
    EXPECT_EQ(Quantity::create(dims).units(), "slug ft s^-2");

    QuantityArgs array;
    array.values = std::vector<double>{1.0, 2.0};
    array.units = "m";
    EXPECT_TRUE(Quantity::create(array).isArray());

    QuantityArgs copy;
    copy.copy_from = &q;
    copy.value = 7.0;
    Quantity copied = Quantity::create(copy);
    EXPECT_EQ(copied.units(), "ft");
    EXPECT_DOUBLE_EQ(copied.value(), 7.0);
}

TEST_F(QuantityTest, CreateRejectsBadArgs) {
    QuantityArgs empty;
    EXPECT_THROW(Quantity::create(empty), InsufficientArguments);

    QuantityArgs two_units;
    two_units.value = 1.0;
    two_units.units = "m";
    two_units.dimensions = Unit("m").dimensions();
    EXPECT_THROW(Quantity::create(two_units), ExcessiveParameters);

    QuantityArgs both_values;
    both_values.value = 1.0;
    both_values.values = std::vector<double>{1.0};
    EXPECT_THROW(Quantity::create(both_values), ExcessiveParameters);

    QuantityArgs stray_system;
    stray_system.value = 1.0;
    stray_system.units = "m";
    stray_system.system = UnitSystem("CGS");
    EXPECT_THROW(Quantity::create(stray_system), ExcessiveParameters);

    Quantity source(1.0, "m");
    QuantityArgs copy_with_units;
    copy_with_units.copy_from = &source;
    copy_with_units.units = "ft";
    EXPECT_THROW(Quantity::create(copy_with_units), ExcessiveParameters);
}

TEST_F(QuantityTest, ParseText) {
    Quantity p = Quantity::parse("5000 kPa");
    EXPECT_DOUBLE_EQ(p.value(), 5000.0);
    EXPECT_EQ(p.units(), "kPa");

    Quantity g = Quantity::parse("  9.81 m s^-2 ");
    EXPECT_EQ(g.units(), "m s^-2");

    Quantity ratio = Quantity::parse("1e3");
    EXPECT_TRUE(ratio.isDimensionless());
    EXPECT_DOUBLE_EQ(ratio.value(), 1000.0);

    EXPECT_THROW(Quantity::parse("kPa"), std::runtime_error);
    EXPECT_THROW(Quantity::parse("5kPa"), std::runtime_error);
    EXPECT_THROW(Quantity::parse(""), std::runtime_error);
}

// ============================================================================
// Conversion
// ============================================================================

TEST_F(QuantityTest, RoundTrip) {
    Quantity p(5000.0, "kPa");
    Quantity psi = p.to("psi");
    EXPECT_NEAR(psi.value(), 725.1886, 1e-3);
    EXPECT_NEAR(psi.to("kPa").value(), 5000.0, 1e-9);
}

TEST_F(QuantityTest, AbsoluteTemperatureConversion) {
    EXPECT_NEAR(Quantity(0.0, "C").to("K").value(), 273.15, TOL);
    EXPECT_NEAR(Quantity(212.0, "F").to("C").value(), 100.0, TOL);
    EXPECT_NEAR(Quantity(0.0, "K").to("R").value(), 0.0, TOL);
}

TEST_F(QuantityTest, DifferenceToAbsoluteTargetStaysDifference) {
    Quantity dT = Quantity(2.0, "K") - Quantity(1.0, "K");
    EXPECT_EQ(dT.units(), "delta_K");

    Quantity dC = dT.to("C");
    EXPECT_EQ(dC.units(), "delta_C");
    EXPECT_NEAR(dC.value(), 1.0, TOL);
    EXPECT_TRUE(dC == Quantity(1.0, "delta_C"));
}

TEST_F(QuantityTest, IncompatibleConversionThrows) {
    EXPECT_THROW(Quantity(1.0, "Hz").to("radian s^-1"), IncompatibleDimensions);
    EXPECT_THROW(Quantity(1.0, "m").to("s"), IncompatibleDimensions);
}

TEST_F(QuantityTest, ConvertToSystem) {
    Quantity q = Quantity(10.0, "kg ft s").convert(UnitSystem("BT"));
    EXPECT_EQ(q.units(), "slug ft s");
    EXPECT_NEAR(q.value(), 0.6852176585679174, 1e-12);
}

TEST_F(QuantityTest, CompatibleUnits) {
    EXPECT_EQ(Quantity(3.0, "ft").compatibleUnits(),
              (std::vector<std::string>{"m", "cm", "inch", "in"}));
}

TEST_F(QuantityTest, CoercionToDouble) {
    EXPECT_DOUBLE_EQ(Quantity(0.25, "").asDouble(), 0.25);
    EXPECT_NEAR(Quantity(180.0, "degree").asDouble(), M_PI, 1e-12);
    EXPECT_DOUBLE_EQ(static_cast<double>(Quantity(2.0, "sr")), 2.0);

    EXPECT_THROW(Quantity(1.0, "m").asDouble(), InvalidFloatCoercion);
    EXPECT_THROW(Quantity(1.0, "radian s^-1").asDouble(), InvalidFloatCoercion);
}

// ============================================================================
// Temperature Reclassification
// ============================================================================

TEST_F(QuantityTest, BelowAbsoluteZeroBecomesDifference) {
    Quantity q(-1.0, "K");
    EXPECT_EQ(q.type(), UnitType::TEMPERATURE_DIFFERENCE);
    EXPECT_EQ(q.units(), "delta_K");

    Quantity dr = Quantity(-40.0, "K").to("delta_R");
    EXPECT_NEAR(dr.value(), -72.0, TOL);

    // -40 C is still a valid reading
    EXPECT_EQ(Quantity(-40.0, "C").units(), "C");
    EXPECT_EQ(Quantity(-500.0, "F").units(), "delta_F");
}

TEST_F(QuantityTest, ReclassificationOnlyForBareScale) {
    EXPECT_EQ(Quantity(-5.0, "kg K").units(), "kg K");
    EXPECT_EQ(Quantity(std::vector<double>{300.0, -5.0}, "K").units(), "delta_K");
    EXPECT_EQ(Quantity(std::vector<double>{300.0, 5.0}, "K").units(), "K");
}

TEST_F(QuantityTest, ExplicitExponentIsDifference) {
    Quantity q(1.0, "C^1");
    EXPECT_EQ(q.units(), "C^1");
    EXPECT_EQ(q.type(), UnitType::TEMPERATURE_DIFFERENCE);
    EXPECT_NEAR(q.siValue(), 1.0, TOL);
    EXPECT_NEAR(Quantity(1.0, "C").siValue(), 274.15, TOL);
}

// ============================================================================
// Arithmetic
// ============================================================================

TEST_F(QuantityTest, AdditionUsesLeftUnits) {
    Quantity sum = Quantity(1.0, "m") + Quantity(1.0, "ft");
    EXPECT_EQ(sum.units(), "m");
    EXPECT_NEAR(sum.value(), 1.3048, TOL);

    Quantity diff = Quantity(1.0, "ft") - Quantity(6.0, "inch");
    EXPECT_EQ(diff.units(), "ft");
    EXPECT_NEAR(diff.value(), 0.5, TOL);
}

TEST_F(QuantityTest, AdditionIsConsistentAcrossUnits) {
    Quantity a(1.0, "m");
    Quantity b(2.0, "ft");
    EXPECT_NEAR((a + b).to("inch").value(),
                a.to("inch").value() + b.to("inch").value(), 1e-9);
}

TEST_F(QuantityTest, TemperatureAddition) {
    Quantity warmer = Quantity(50.0, "delta_F") + Quantity(50.0, "K");
    EXPECT_EQ(warmer.units(), "F");
    EXPECT_NEAR(warmer.value(), -319.67, TOL);

    Quantity shifted = Quantity(50.0, "K") + Quantity(50.0, "delta_F");
    EXPECT_EQ(shifted.units(), "K");
    EXPECT_NEAR(shifted.value(), 50.0 + 250.0 / 9.0, TOL);

    Quantity offset = Quantity(10.0, "delta_F") - Quantity(2.0, "C");
    EXPECT_EQ(offset.units(), "F");
    EXPECT_NEAR(offset.value(), -25.6, TOL);
}

TEST_F(QuantityTest, TemperatureArithmeticErrors) {
    EXPECT_THROW(Quantity(1.0, "K") + Quantity(1.0, "K"), ProhibitedTemperatureOperation);
    EXPECT_THROW(Quantity(1.0, "C") - Quantity(1.0, "F"), IncompatibleDimensions);
    EXPECT_THROW(Quantity(1.0, "m") + Quantity(1.0, "s"), IncompatibleDimensions);
    EXPECT_THROW(Quantity(1.0, "C") + 1.0, IncompatibleDimensions);
}

TEST_F(QuantityTest, SubtractionIgnoresTermOrder) {
    Quantity a = Quantity(300.0, "K") * Quantity(1.0, "kg");
    Quantity b = Quantity(1.0, "kg") * Quantity(290.0, "K");
    ASSERT_EQ(a.units(), "K kg");
    ASSERT_EQ(b.units(), "kg K");

    Quantity d = a - b;
    EXPECT_EQ(d.units(), "delta_K kg");
    EXPECT_NEAR(d.value(), 10.0, TOL);

    EXPECT_THROW(a + b, ProhibitedTemperatureOperation);
    EXPECT_THROW(a - Quantity(1.0, "kg C"), IncompatibleDimensions);
}

TEST_F(QuantityTest, MultiplyDividePower) {
    Quantity work = Quantity(2.0, "m") * Quantity(3.0, "N");
    EXPECT_DOUBLE_EQ(work.value(), 6.0);
    EXPECT_EQ(work.dimensions(), Unit("J").dimensions());

    Quantity speed = Quantity(10.0, "m") / Quantity(2.0, "s");
    EXPECT_EQ(speed.units(), "m s^-1");
    EXPECT_DOUBLE_EQ(speed.value(), 5.0);

    Quantity side = pow(Quantity(4.0, "m^2"), 0.5);
    EXPECT_EQ(side.units(), "m");
    EXPECT_DOUBLE_EQ(side.value(), 2.0);

    EXPECT_DOUBLE_EQ((-side).value(), -2.0);
}

TEST_F(QuantityTest, PlainNumbers) {
    Quantity q(4.0, "s");
    EXPECT_DOUBLE_EQ((q * 2.0).value(), 8.0);
    EXPECT_DOUBLE_EQ((2.0 * q).value(), 8.0);
    EXPECT_DOUBLE_EQ((q / 2.0).value(), 2.0);

    Quantity rate = 2.0 / q;
    EXPECT_EQ(rate.units(), "s^-1");
    EXPECT_DOUBLE_EQ(rate.value(), 0.5);

    Quantity ratio(0.25, "");
    EXPECT_DOUBLE_EQ((1.0 - ratio).value(), 0.75);
    EXPECT_DOUBLE_EQ((ratio - 1.0).value(), -0.75);
    EXPECT_DOUBLE_EQ((1.0 + ratio).value(), 1.25);

    Quantity area = Quantity(3.0, "m") * Unit("m");
    EXPECT_EQ(area.units(), "m^2");
    EXPECT_DOUBLE_EQ(area.value(), 3.0);
}

// ============================================================================
// Arrays
// ============================================================================

TEST_F(QuantityTest, ArrayBroadcasting) {
    Quantity lengths(std::vector<double>{1.0, 2.0, 3.0}, "m");
    Quantity sum = lengths + Quantity(1.0, "ft");
    ASSERT_EQ(sum.size(), 3u);
    EXPECT_TRUE(sum.isArray());
    EXPECT_NEAR(sum.values()[0], 1.3048, TOL);
    EXPECT_NEAR(sum.values()[2], 3.3048, TOL);

    Quantity scaled = lengths * Quantity(std::vector<double>{2.0, 2.0, 2.0}, "");
    EXPECT_DOUBLE_EQ(scaled.values()[1], 4.0);

    EXPECT_THROW(lengths + Quantity(std::vector<double>{1.0, 2.0}, "m"), std::invalid_argument);
}

TEST_F(QuantityTest, ArrayAccess) {
    Quantity lengths(std::vector<double>{1.0, 2.0, 3.0}, "m");
    EXPECT_DOUBLE_EQ(lengths[1].value(), 2.0);
    EXPECT_EQ(lengths[1].units(), "m");
    EXPECT_THROW(lengths[5], std::out_of_range);
    EXPECT_THROW(lengths.value(), std::logic_error);

    std::vector<double> cm = lengths.to("cm").values();
    EXPECT_NEAR(cm[2], 300.0, TOL);
}

// ============================================================================
// Comparison
// ============================================================================

TEST_F(QuantityTest, CompareAcrossUnits) {
    EXPECT_TRUE(Quantity(1.0, "m") == Quantity(100.0, "cm"));
    EXPECT_TRUE(Quantity(1.0, "ft") < Quantity(1.0, "m"));
    EXPECT_TRUE(Quantity(1.0, "m") >= Quantity(1.0, "ft"));
    EXPECT_FALSE(Quantity(1.0, "m") > Quantity(1.0, "km"));
    EXPECT_TRUE(Quantity(0.0, "C") == Quantity(273.15, "K"));
    EXPECT_TRUE(Quantity(1.0, "m") != Quantity(1.0, "ft"));

    EXPECT_THROW(Quantity(1.0, "m") < Quantity(1.0, "s"), IncompatibleDimensions);
}

TEST_F(QuantityTest, CompareWithPlainNumbers) {
    Quantity ratio = Quantity(2.0, "m") / Quantity(4.0, "m");
    EXPECT_TRUE(ratio.isDimensionless());
    EXPECT_TRUE(ratio == 0.5);
    EXPECT_TRUE(0.5 == ratio);
    EXPECT_TRUE(ratio < 1.0);
    EXPECT_TRUE(1.0 > ratio);

    EXPECT_THROW(Quantity(1.0, "m") == 1.0, IncompatibleDimensions);
    EXPECT_THROW(Quantity(1.0, "m") > 0.0, IncompatibleDimensions);
}

TEST_F(QuantityTest, ArrayEquality) {
    Quantity a(std::vector<double>{1.0, 2.0}, "m");
    Quantity b(std::vector<double>{100.0, 200.0}, "cm");
    Quantity c(std::vector<double>{100.0, 201.0}, "cm");
    EXPECT_TRUE(a == b);
    EXPECT_FALSE(a == c);
}

// ============================================================================
// Output
// ============================================================================

TEST_F(QuantityTest, StreamOutput) {
    std::ostringstream scalar;
    scalar << Quantity(5.0, "kg m");
    EXPECT_EQ(scalar.str(), "(5, \"kg m\")");

    std::ostringstream array;
    array << Quantity(std::vector<double>{1.0, 2.5}, "m");
    EXPECT_EQ(array.str(), "([1, 2.5], \"m\")");
}
