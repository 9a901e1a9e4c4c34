/**
 * @file test_unit_parser.cpp
 * @brief Unit tests for unit string parsing and term formatting
 */

#include <gtest/gtest.h>
#include "UnitParser.hpp"
#include "UnitErrors.hpp"
#include <memory>

using namespace PhysUnits;

class UnitParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        table = UnitTable::builtin();
    }

    std::shared_ptr<const UnitTable> table;
};

// ============================================================================
// Term Parsing
// ============================================================================

TEST_F(UnitParserTest, ExactSymbolHasNoMultiplier) {
    UnitTerm term = parseUnitTerm("Pa", *table);
    EXPECT_EQ(term.multiplier, "");
    EXPECT_EQ(term.base, "Pa");
    EXPECT_DOUBLE_EQ(term.power, 1.0);
}

TEST_F(UnitParserTest, PrefixedSymbolWithNegativePower) {
    UnitTerm term = parseUnitTerm("kPa^-2", *table);
    EXPECT_EQ(term.multiplier, "k");
    EXPECT_EQ(term.base, "Pa");
    EXPECT_DOUBLE_EQ(term.power, -2.0);
    EXPECT_EQ(term.symbol(), "kPa");
}

TEST_F(UnitParserTest, FractionalPower) {
    UnitTerm term = parseUnitTerm("m^0.5", *table);
    EXPECT_EQ(term.base, "m");
    EXPECT_DOUBLE_EQ(term.power, 0.5);
}

TEST_F(UnitParserTest, ExactMatchBeatsPrefix) {
    // "cm" is its own unit, "h" is an hour, "T" is a tesla
    EXPECT_EQ(parseUnitTerm("cm", *table).multiplier, "");
    EXPECT_EQ(parseUnitTerm("h", *table).base, "h");
    EXPECT_EQ(parseUnitTerm("T", *table).base, "T");

    UnitTerm hpa = parseUnitTerm("hPa", *table);
    EXPECT_EQ(hpa.multiplier, "h");
    EXPECT_EQ(hpa.base, "Pa");
}

TEST_F(UnitParserTest, MultiplierOrderPrefersDeca) {
    UnitTerm term = parseUnitTerm("daN", *table);
    EXPECT_EQ(term.multiplier, "da");
    EXPECT_EQ(term.base, "N");

    UnitTerm mm = parseUnitTerm("mm", *table);
    EXPECT_EQ(mm.multiplier, "m");
    EXPECT_EQ(mm.base, "m");
}

TEST_F(UnitParserTest, UnknownSymbolThrows) {
    EXPECT_THROW(parseUnitTerm("xyz", *table), UnknownUnit);
    EXPECT_THROW(parseUnitTerm("k", *table), UnknownUnit);
    EXPECT_THROW(parseUnitTerm("kxyz^2", *table), UnknownUnit);
}

TEST_F(UnitParserTest, MalformedPowerThrows) {
    EXPECT_THROW(parseUnitTerm("m^", *table), UnknownUnit);
    EXPECT_THROW(parseUnitTerm("m^two", *table), UnknownUnit);
    EXPECT_THROW(parseUnitTerm("m^2x", *table), UnknownUnit);
}

// ============================================================================
// Splitting and Formatting
// ============================================================================

TEST_F(UnitParserTest, SplitTermsDropsEmptyTokens) {
    std::vector<std::string> terms = splitTerms("  kg   m^-1\ts^-2 ");
    ASSERT_EQ(terms.size(), 3u);
    EXPECT_EQ(terms[0], "kg");
    EXPECT_EQ(terms[1], "m^-1");
    EXPECT_EQ(terms[2], "s^-2");

    EXPECT_TRUE(splitTerms("").empty());
}

TEST_F(UnitParserTest, SplitPowerIsSyntactic) {
    std::string symbol;
    double power = 0.0;
    splitPower("unknown^3", symbol, power);
    EXPECT_EQ(symbol, "unknown");
    EXPECT_DOUBLE_EQ(power, 3.0);
}

TEST_F(UnitParserTest, FormatPower) {
    EXPECT_EQ(formatPower(2.0), "2");
    EXPECT_EQ(formatPower(-3.0), "-3");
    EXPECT_EQ(formatPower(0.5), "0.5");
    EXPECT_EQ(formatPower(-1.5), "-1.5");
    EXPECT_EQ(formatPower(2.0000000000001), "2");
}

TEST_F(UnitParserTest, FormatTerm) {
    EXPECT_EQ(formatTerm("m", 1.0), "m");
    EXPECT_EQ(formatTerm("m", 2.0), "m^2");
    EXPECT_EQ(formatTerm("s", -1.0), "s^-1");
    EXPECT_EQ(formatTerm("kg", 0.5), "kg^0.5");
}
