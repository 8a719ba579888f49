// =============================================================================
// number_normalizer_test.cpp
// =============================================================================
// Unit tests for normalizeDigits(), parseNumber() and parseNumberList().
//
// Validates:
//   - Persian and Arabic-Indic digits and separators become ASCII
//   - Thousands / decimal separator disambiguation, with and without
//     decimal_comma
//   - Malformed tokens are refused rather than guessed
//   - Comma-joined price lists are split
// =============================================================================

#include "sigtrader/parser/number_normalizer.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

using sigtrader::normalizeDigits;
using sigtrader::parseNumber;
using sigtrader::parseNumberList;

TEST(NumberNormalizerTest, PersianAndArabicDigitsBecomeAscii) {
  // "۱۲۳۴" in Persian digits, "٥٦" in Arabic-Indic digits.
  EXPECT_EQ(normalizeDigits("\xDB\xB1\xDB\xB2\xDB\xB3\xDB\xB4"), "1234");
  EXPECT_EQ(normalizeDigits("\xD9\xA5\xD9\xA6"), "56");
  // Arabic decimal separator U+066B.
  EXPECT_EQ(normalizeDigits("\xDB\xB1\xD9\xAB\xDB\xB5"), "1.5");
}

TEST(NumberNormalizerTest, OtherTextIsCopiedUnchanged) {
  const std::string persian_word = "\xD8\xAE\xD8\xB1\xDB\x8C\xD8\xAF";  // خرید
  EXPECT_EQ(normalizeDigits("BUY " + persian_word + " 1.0850"),
            "BUY " + persian_word + " 1.0850");
  EXPECT_EQ(normalizeDigits(""), "");
}

TEST(NumberNormalizerTest, PlainDecimals) {
  EXPECT_DOUBLE_EQ(*parseNumber("1.0850", false), 1.0850);
  EXPECT_DOUBLE_EQ(*parseNumber("2350", false), 2350.0);
}

TEST(NumberNormalizerTest, LoneCommaIsThousandsUnlessDecimalComma) {
  EXPECT_DOUBLE_EQ(*parseNumber("2,350", false), 2350.0);
  EXPECT_FALSE(parseNumber("1,0850", false).has_value());
  EXPECT_DOUBLE_EQ(*parseNumber("1,0850", true), 1.0850);
}

TEST(NumberNormalizerTest, LastSeparatorIsDecimalWhenBothPresent) {
  EXPECT_DOUBLE_EQ(*parseNumber("1,234.5", false), 1234.5);
  EXPECT_DOUBLE_EQ(*parseNumber("1.234,5", false), 1234.5);
  EXPECT_FALSE(parseNumber("12,34.5", false).has_value());
}

TEST(NumberNormalizerTest, ApostropheIsAlwaysThousands) {
  EXPECT_DOUBLE_EQ(*parseNumber("1'234.5", false), 1234.5);
}

TEST(NumberNormalizerTest, SeveralDotsOnlyWithDecimalComma) {
  EXPECT_FALSE(parseNumber("1.234.567", false).has_value());
  EXPECT_DOUBLE_EQ(*parseNumber("1.234.567", true), 1234567.0);
}

TEST(NumberNormalizerTest, NumberListFindsEveryToken) {
  const std::vector<double> values =
      parseNumberList("TP 1.0900 / 1.0950 | 1.1000", false);
  ASSERT_EQ(values.size(), 3u);
  EXPECT_DOUBLE_EQ(values[0], 1.0900);
  EXPECT_DOUBLE_EQ(values[1], 1.0950);
  EXPECT_DOUBLE_EQ(values[2], 1.1000);
}

TEST(NumberNormalizerTest, CommaJoinedPricesAreSplit) {
  const std::vector<double> values = parseNumberList("4220,4230", false);
  ASSERT_EQ(values.size(), 2u);
  EXPECT_DOUBLE_EQ(values[0], 4220.0);
  EXPECT_DOUBLE_EQ(values[1], 4230.0);
}
