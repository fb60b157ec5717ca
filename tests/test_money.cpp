// tests/test_money.cpp
#include "core/types.h"
#include "core/errors.h"
#include <gtest/gtest.h>

namespace FairSlot {
namespace {

TEST(MoneyTest, ToMinorUnitsParsesWholeAndFractionalAmounts) {
    EXPECT_EQ(ToMinorUnits("100"), 10000);
    EXPECT_EQ(ToMinorUnits("100.00"), 10000);
    EXPECT_EQ(ToMinorUnits("12.34"), 1234);
    EXPECT_EQ(ToMinorUnits("0.5"), 50);
    EXPECT_EQ(ToMinorUnits(".07"), 7);
    EXPECT_EQ(ToMinorUnits("-3.10"), -310);
}

TEST(MoneyTest, ToMinorUnitsTruncatesExtraPrecision) {
    EXPECT_EQ(ToMinorUnits("1.239"), 123);
    EXPECT_EQ(ToMinorUnits("0.999"), 99);
    EXPECT_EQ(ToMinorUnits("0.001"), 0);
}

TEST(MoneyTest, ToMinorUnitsRejectsMalformedInput) {
    EXPECT_THROW(ToMinorUnits(""), ValidationError);
    EXPECT_THROW(ToMinorUnits("abc"), ValidationError);
    EXPECT_THROW(ToMinorUnits("1.2.3"), ValidationError);
    EXPECT_THROW(ToMinorUnits("1,50"), ValidationError);
    EXPECT_THROW(ToMinorUnits(" 1"), ValidationError);
    EXPECT_THROW(ToMinorUnits("-"), ValidationError);
}

TEST(MoneyTest, ToMinorUnitsRejectsOverflow) {
    EXPECT_THROW(ToMinorUnits("99999999999999999999"), ValidationError);
}

TEST(MoneyTest, ParseWagerAcceptsTwoDecimalPlaces) {
    EXPECT_EQ(ParseWager("1.00"), 100);
    EXPECT_EQ(ParseWager("0.01"), 1);
    EXPECT_EQ(ParseWager("2.500"), 250);
}

TEST(MoneyTest, ParseWagerRejectsSubMinorPrecision) {
    EXPECT_THROW(ParseWager("1.005"), ValidationError);
    EXPECT_THROW(ParseWager("0.001"), ValidationError);
}

TEST(MoneyTest, ParseWagerRejectsNonPositiveAmounts) {
    EXPECT_THROW(ParseWager("0"), ValidationError);
    EXPECT_THROW(ParseWager("0.00"), ValidationError);
    EXPECT_THROW(ParseWager("-1.00"), ValidationError);
}

TEST(MoneyTest, ValidationErrorCarriesKind) {
    try {
        ParseWager("oops");
        FAIL() << "expected ValidationError";
    } catch (const ServiceError& e) {
        EXPECT_EQ(e.GetKind(), ServiceError::Kind::VALIDATION);
    }
}

TEST(MoneyTest, FormatMoneyPadsMinorUnits) {
    EXPECT_EQ(FormatMoney(0), "0.00");
    EXPECT_EQ(FormatMoney(5), "0.05");
    EXPECT_EQ(FormatMoney(1234), "12.34");
    EXPECT_EQ(FormatMoney(10000), "100.00");
    EXPECT_EQ(FormatMoney(-250), "-2.50");
}

} // namespace
} // namespace FairSlot
