#include <gtest/gtest.h>
#include "decimal.hpp"
#include "price_level.hpp"
#include <limits>
#include <sstream>
#include <stdexcept>

using namespace perp;

class DecimalTest : public ::testing::Test {
protected:
    static Decimal d(const char* text) {
        return Decimal::parse(text);
    }
};

// =============================================================================
// PARSING AND FORMATTING
// =============================================================================

TEST_F(DecimalTest, ParseAndPrintShortestForm) {
    EXPECT_EQ(d("3").to_string(), "3");
    EXPECT_EQ(d("3.000").to_string(), "3");
    EXPECT_EQ(d("0.02").to_string(), "0.02");
    EXPECT_EQ(d("-1.50").to_string(), "-1.5");
    EXPECT_EQ(d("+7.25").to_string(), "7.25");
    EXPECT_EQ(d("0.000000000000000001").to_string(), "0.000000000000000001");
    EXPECT_EQ(d("-0").to_string(), "0");
}

TEST_F(DecimalTest, NormalizedValuesCompareEqual) {
    EXPECT_EQ(d("1.0"), d("1"));
    EXPECT_EQ(d("100.00"), Decimal(100));
    EXPECT_EQ(d("0.50").scale(), 1);
    EXPECT_EQ(Decimal::from_raw(150, 2), d("1.5"));
}

TEST_F(DecimalTest, RejectsMalformedText) {
    EXPECT_THROW(Decimal::parse(""), std::invalid_argument);
    EXPECT_THROW(Decimal::parse("-"), std::invalid_argument);
    EXPECT_THROW(Decimal::parse("."), std::invalid_argument);
    EXPECT_THROW(Decimal::parse("1.2.3"), std::invalid_argument);
    EXPECT_THROW(Decimal::parse("12a"), std::invalid_argument);
    EXPECT_THROW(Decimal::parse("1e5"), std::invalid_argument);
    EXPECT_THROW(Decimal::parse("0.0000000000000000001"), std::invalid_argument);
    EXPECT_THROW(Decimal::from_raw(1, 19), std::invalid_argument);
}

TEST_F(DecimalTest, StreamOperator) {
    std::ostringstream out;
    out << d("42.125");
    EXPECT_EQ(out.str(), "42.125");
}

// =============================================================================
// ARITHMETIC
// =============================================================================

TEST_F(DecimalTest, AdditionAndSubtractionAreExact) {
    EXPECT_EQ(d("0.1") + d("0.2"), d("0.3"));
    EXPECT_EQ(d("1") - d("0.000000001"), d("0.999999999"));
    EXPECT_EQ(d("5") - d("5"), Decimal());
    EXPECT_TRUE((d("2.5") - d("3")).is_negative());
}

TEST_F(DecimalTest, MultiplicationIsExact) {
    EXPECT_EQ(d("1.0") * d("100.0"), d("100"));
    EXPECT_EQ(d("100") * d("0.0002"), d("0.02"));
    EXPECT_EQ(d("100") * d("0.0005"), d("0.05"));
    EXPECT_EQ(d("-1.5") * d("2"), d("-3"));
}

TEST_F(DecimalTest, MultiplicationRoundsBeyondEighteenDigits) {
    // Exact product is 1.5e-18, one digit past the limit
    EXPECT_EQ(d("0.000000001") * d("0.0000000015"), d("0.000000000000000002"));
    EXPECT_EQ(d("-0.000000001") * d("0.0000000015"), d("-0.000000000000000002"));
    EXPECT_EQ(d("0.0000000001") * d("0.000000004"), Decimal());
}

TEST_F(DecimalTest, DivisionProducesEighteenDigits) {
    EXPECT_EQ(d("1") / d("3"), d("0.333333333333333333"));
    EXPECT_EQ(d("2") / d("3"), d("0.666666666666666667"));
    EXPECT_EQ(d("300") / d("2.5"), d("120"));
    EXPECT_EQ(d("-1") / d("4"), d("-0.25"));
    EXPECT_THROW(d("1") / Decimal(), std::domain_error);
}

TEST_F(DecimalTest, Comparisons) {
    EXPECT_LT(d("99.99"), d("100"));
    EXPECT_GT(d("0.00000001"), Decimal());
    EXPECT_LE(d("1.50"), d("1.5"));
    EXPECT_GE(d("-1"), d("-1.1"));
    EXPECT_EQ(d("-2.5").abs(), d("2.5"));
}

TEST_F(DecimalTest, OverflowThrows) {
    Decimal huge = Decimal::from_raw(Decimal::pow10(37), 0);
    EXPECT_THROW(huge * Decimal(100), std::overflow_error);
}

// =============================================================================
// PRICE LEVEL
// =============================================================================

TEST_F(DecimalTest, PriceLevelRoundTripsEightDigits) {
    for (const char* text : {"100", "0.00000001", "65000.5", "1234.56789012", "92233720368.54775807"}) {
        Decimal price = d(text);
        EXPECT_EQ(PriceLevel::from_decimal(price).to_decimal(), price) << text;
    }
}

TEST_F(DecimalTest, PriceLevelTruncatesTowardZero) {
    EXPECT_EQ(PriceLevel::from_decimal(d("1.123456789")).raw(), 112345678);
    EXPECT_EQ(PriceLevel::from_decimal(d("-1.123456789")).raw(), -112345678);
    EXPECT_EQ(PriceLevel::from_decimal(d("0.000000009")).raw(), 0);
}

TEST_F(DecimalTest, PriceLevelOrderingIsNumeric) {
    EXPECT_LT(PriceLevel::from_decimal(d("99.5")), PriceLevel::from_decimal(d("100")));
    EXPECT_EQ(PriceLevel::from_decimal(d("100.0")), PriceLevel::from_decimal(d("100")));
}

TEST_F(DecimalTest, PriceLevelOverflowBound) {
    EXPECT_NO_THROW(PriceLevel::from_decimal(d("92233720368.54775807")));
    EXPECT_THROW(PriceLevel::from_decimal(d("92233720368.54775808")), std::out_of_range);
    EXPECT_THROW(PriceLevel::from_decimal(d("100000000000")), std::out_of_range);
}

// =============================================================================
// MAIN TEST RUNNER
// =============================================================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
