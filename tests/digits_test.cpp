// Unit tests for brvalid/digits.hpp
// Tests: Digit extraction from noisy input

#include <gtest/gtest.h>

#include <brvalid/digits.hpp>

#include <string>

namespace brvalid {
namespace {

class ExtractDigitsTest : public ::testing::Test {};

TEST_F(ExtractDigitsTest, EmptyString) {
  RawDigits raw = ExtractDigits("");
  EXPECT_TRUE(raw.empty());
  EXPECT_EQ(raw.source_length, 0u);
  EXPECT_FALSE(raw.had_noise);
}

TEST_F(ExtractDigitsTest, DigitsOnly) {
  RawDigits raw = ExtractDigits("50542983800");
  EXPECT_EQ(raw.digits, "50542983800");
  EXPECT_EQ(raw.source_length, 11u);
  EXPECT_FALSE(raw.had_noise);
}

TEST_F(ExtractDigitsTest, StripsPunctuationAndKeepsOrder) {
  RawDigits raw = ExtractDigits("505.429.838-00");
  EXPECT_EQ(raw.digits, "50542983800");
  EXPECT_EQ(raw.source_length, 14u);
  EXPECT_TRUE(raw.had_noise);
}

TEST_F(ExtractDigitsTest, StripsWhitespaceLettersAndSymbols) {
  EXPECT_EQ(ExtractDigits(" +55 (16) 99718-4720 ").digits, "5516997184720");
  EXPECT_EQ(ExtractDigits("CNPJ: 60.204.424/0001-08").digits, "60204424000108");
  EXPECT_EQ(ExtractDigits("a1b2c3").digits, "123");
}

TEST_F(ExtractDigitsTest, AllNoise) {
  RawDigits raw = ExtractDigits("abc - ./");
  EXPECT_TRUE(raw.empty());
  EXPECT_TRUE(raw.had_noise);
}

TEST_F(ExtractDigitsTest, NonAsciiDigitsAreNoise) {
  // Fullwidth 1 (U+FF11) and Arabic-Indic 2 (U+0662) are not ASCII digits
  RawDigits raw = ExtractDigits("\xef\xbc\x91" "7" "\xd9\xa2");
  EXPECT_EQ(raw.digits, "7");
  EXPECT_TRUE(raw.had_noise);
}

TEST_F(ExtractDigitsTest, EmbeddedNulByte) {
  std::string input("12\0" "34", 5);
  RawDigits raw = ExtractDigits(input);
  EXPECT_EQ(raw.digits, "1234");
  EXPECT_EQ(raw.source_length, 5u);
}

TEST_F(ExtractDigitsTest, DigitValueAccessor) {
  RawDigits raw = ExtractDigits("09");
  EXPECT_EQ(raw.at(0), 0);
  EXPECT_EQ(raw.at(1), 9);
}

}  // namespace
}  // namespace brvalid
