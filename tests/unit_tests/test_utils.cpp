#include "errors.hpp"
#include "utils.hpp"

#include "testing_utils.hpp"
#include "gtest/gtest.h"

#include <stdexcept>


TEST(Trim, RemovesSurroundingWhitespace) {
    EXPECT_EQ(text::trim("  A1 Archean \t\r\n"), "A1 Archean");
    EXPECT_EQ(text::trim("B-"), "B-");
}

TEST(Trim, WhitespaceOnlyGivesEmptyString) {
    EXPECT_EQ(text::trim(" \t "), "");
    EXPECT_TRUE(text::is_blank("   \r"));
    EXPECT_TRUE(text::is_blank(""));
    EXPECT_FALSE(text::is_blank(" 0 "));
}

TEST(Split, SplitsAtRunsOfWhitespace) {
    std::vector<std::string> expected{"3.81", "1.50", "inf"};
    EXPECT_EQ(text::split("  3.81   1.50\tinf  "), expected);
}

TEST(Split, EmptyLineGivesNoTokens) {
    EXPECT_TRUE(text::split("   ").empty());
}


TEST(ToDouble, ValidNumbers) {
    EXPECT_DOUBLE_EQ(text::to_double("6.5"), 6.5);
    EXPECT_DOUBLE_EQ(text::to_double("-4e3"), -4000.);
    EXPECT_DOUBLE_EQ(text::to_double("1.70141e+38"), 1.70141e+38);
}

TEST(ToDouble, InvalidTokenThrows) {
    EXPECT_THROW(text::to_double("abc"), ParseError);
    EXPECT_THROW(text::to_double("1.5km"), ParseError);
    EXPECT_THROW(text::to_double(""), ParseError);
}

TEST(ToDouble, SubnormalNumbersAreValid) {
    EXPECT_DOUBLE_EQ(text::to_double("1e-310"), 1e-310);
    EXPECT_GT(text::to_double("1e-310"), 0.);
    EXPECT_EQ(text::to_double("-1e-400"), 0.);
}

TEST(ToDouble, OverflowThrows) {
    EXPECT_THROW(text::to_double("1e400"), ParseError);
    EXPECT_THROW(text::to_double("-1e400"), ParseError);
}

TEST(ToDouble, ContextIsPartOfMessage) {
    try {
        text::to_double("x", "in line 7");
        FAIL() << "Expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_NE(std::string(e.what()).find("in line 7"), std::string::npos) << e.what();
    }
}

TEST(ToInt, ValidAndInvalidTokens) {
    EXPECT_EQ(text::to_int("180"), 180);
    EXPECT_EQ(text::to_int("-3"), -3);
    EXPECT_THROW(text::to_int("2.5"), ParseError);
    EXPECT_THROW(text::to_int("ny"), ParseError);
}


TEST(Linspace, IncludesBothEnds) {
    auto result = math::linspace(0, 2, 3);
    std::vector<double> expected{0, 1, 2};
    EXPECT_EQ(result, expected);
}

TEST(Linspace, LastValueIsExact) {
    auto result = math::linspace(-180, 179.9, 7);
    ASSERT_EQ(result.size(), 7U);
    EXPECT_EQ(result.back(), 179.9);
    EXPECT_TRUE(Close(result[3], (-180 + 179.9) / 2));
}

TEST(Linspace, SmallNumberOfValues) {
    EXPECT_TRUE(math::linspace(0, 1, 0).empty());
    EXPECT_EQ(math::linspace(5, 10, 1), std::vector<double>{5});
}


TEST(Arange, AscendingExcludesStop) {
    auto result = math::arange(-180, 180, 2);
    ASSERT_EQ(result.size(), 180U);
    EXPECT_EQ(result.front(), -180);
    EXPECT_EQ(result.back(), 178);
}

TEST(Arange, DescendingWithNegativeStep) {
    auto result = math::arange(90, -90, -2);
    ASSERT_EQ(result.size(), 90U);
    EXPECT_EQ(result.front(), 90);
    EXPECT_EQ(result.back(), -88);
}

TEST(Arange, WrongDirectionGivesEmptyRange) {
    EXPECT_TRUE(math::arange(0, 10, -1).empty());
}

TEST(Arange, ZeroStepThrows) {
    EXPECT_THROW(math::arange(0, 1, 0), std::invalid_argument);
}


TEST(Formatter, JoinsWithSeparator) {
    std::string s = impl::Formatter(", ") << 1 << "a" << 2.5;
    EXPECT_EQ(s, "1, a, 2.5");
}
