// Unit tests for brvalid/phone.hpp
// Tests: Strict and flexible parsing, area code tables, formatting

#include <gtest/gtest.h>

#include <brvalid/phone.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace brvalid {
namespace {

PhoneParseResult Parse(const std::string& value, PhoneMode mode,
                       const AreaCodeTable& table = DefaultAreaCodes()) {
  return ParsePhone(ExtractDigits(value), mode, table);
}

// =============================================================================
// Area Code Table
// =============================================================================

class AreaCodeTableTest : public ::testing::Test {};

TEST_F(AreaCodeTableTest, DefaultIsEmpty) {
  AreaCodeTable table;
  EXPECT_TRUE(table.empty());
  EXPECT_FALSE(table.Contains(11));
}

TEST_F(AreaCodeTableTest, AllCoversElevenToNinetyNine) {
  AreaCodeTable all = AreaCodeTable::All();
  EXPECT_EQ(all.size(), 89u);
  EXPECT_TRUE(all.Contains(11));
  EXPECT_TRUE(all.Contains(20));
  EXPECT_TRUE(all.Contains(99));
  EXPECT_FALSE(all.Contains(10));
  EXPECT_FALSE(all.Contains(0));
  EXPECT_FALSE(all.Contains(100));
  EXPECT_FALSE(all.Contains(-1));
  EXPECT_EQ(DefaultAreaCodes(), all);
}

TEST_F(AreaCodeTableTest, AssignedPreset) {
  AreaCodeTable assigned = AreaCodeTable::Assigned();
  EXPECT_EQ(assigned.size(), 67u);
  for (int code : {11, 21, 27, 31, 41, 47, 51, 61, 71, 81, 85, 91, 98, 99}) {
    EXPECT_TRUE(assigned.Contains(code)) << code;
  }
  for (int code : {20, 23, 25, 26, 29, 30, 36, 39, 40, 50, 52, 56, 60, 70, 72, 76, 78, 80, 90}) {
    EXPECT_FALSE(assigned.Contains(code)) << code;
  }
}

TEST_F(AreaCodeTableTest, ParsePresets) {
  EXPECT_EQ(AreaCodeTable::Parse("all"), AreaCodeTable::All());
  EXPECT_EQ(AreaCodeTable::Parse("assigned"), AreaCodeTable::Assigned());
}

TEST_F(AreaCodeTableTest, ParseListAndRanges) {
  AreaCodeTable table = AreaCodeTable::Parse("11-13, 21 ,27");
  EXPECT_EQ(table.Codes(), (std::vector<int>{11, 12, 13, 21, 27}));
}

TEST_F(AreaCodeTableTest, ParseUnionsPresetWithCodes) {
  AreaCodeTable table = AreaCodeTable::Parse("assigned,20");
  EXPECT_EQ(table.size(), 68u);
  EXPECT_TRUE(table.Contains(20));
}

TEST_F(AreaCodeTableTest, ParseRejectsMalformed) {
  EXPECT_THROW(AreaCodeTable::Parse(""), std::invalid_argument);
  EXPECT_THROW(AreaCodeTable::Parse("11,,12"), std::invalid_argument);
  EXPECT_THROW(AreaCodeTable::Parse("1"), std::invalid_argument);
  EXPECT_THROW(AreaCodeTable::Parse("111"), std::invalid_argument);
  EXPECT_THROW(AreaCodeTable::Parse("ab"), std::invalid_argument);
  EXPECT_THROW(AreaCodeTable::Parse("10"), std::invalid_argument);
  EXPECT_THROW(AreaCodeTable::Parse("05-12"), std::invalid_argument);
  EXPECT_THROW(AreaCodeTable::Parse("19-11"), std::invalid_argument);
  EXPECT_THROW(AreaCodeTable::Parse("everything"), std::invalid_argument);
}

TEST_F(AreaCodeTableTest, AddOutOfRangeThrows) {
  AreaCodeTable table;
  EXPECT_THROW(table.Add(10), std::invalid_argument);
  EXPECT_THROW(table.Add(100), std::invalid_argument);
  table.Add(42);
  EXPECT_TRUE(table.Contains(42));
  EXPECT_EQ(table.size(), 1u);
}

// =============================================================================
// Strict Mode
// =============================================================================

class StrictPhoneTest : public ::testing::Test {};

TEST_F(StrictPhoneTest, MobileWithCountryCode) {
  PhoneParseResult r = Parse("+55 (11) 98765-4321", PhoneMode::kStrict);
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r.shape.country_code, "55");
  EXPECT_EQ(r.shape.area_code, "11");
  EXPECT_EQ(r.shape.subscriber, "987654321");
  EXPECT_TRUE(r.shape.mobile());
}

TEST_F(StrictPhoneTest, NationalMobileAndLandline) {
  EXPECT_TRUE(IsValidPhone("(11) 98765-4321", PhoneMode::kStrict));

  PhoneParseResult landline = Parse("11 3456-7890", PhoneMode::kStrict);
  ASSERT_TRUE(landline.ok());
  EXPECT_EQ(landline.shape.subscriber, "34567890");
  EXPECT_FALSE(landline.shape.mobile());
}

TEST_F(StrictPhoneTest, TrunkPrefixStripped) {
  PhoneParseResult r = Parse("011 98765-4321", PhoneMode::kStrict);
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r.shape.area_code, "11");
}

TEST_F(StrictPhoneTest, TrunkPrefixAfterCountryCodeRejected) {
  EXPECT_EQ(Parse("+55 011 98765-4321", PhoneMode::kStrict).status,
            PhoneParseStatus::kBadLength);
}

TEST_F(StrictPhoneTest, AreaCodeFiftyFiveIsNotMistakenForCountryCode) {
  // Stripping "55" would leave 9 digits, so it is kept as the area code
  PhoneParseResult r = Parse("55 98765-4321", PhoneMode::kStrict);
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r.shape.area_code, "55");
  EXPECT_EQ(r.shape.subscriber, "987654321");
}

TEST_F(StrictPhoneTest, NineDigitSubscriberMustStartWithNine) {
  PhoneParseResult r = Parse("11 87654-3210", PhoneMode::kStrict);
  EXPECT_EQ(r.status, PhoneParseStatus::kBadSubscriber);
}

TEST_F(StrictPhoneTest, MultipleLeadingZerosRejected) {
  EXPECT_EQ(Parse("0055 11 98765-4321", PhoneMode::kStrict).status,
            PhoneParseStatus::kBadLength);
  EXPECT_EQ(Parse("00 11 98765-4321", PhoneMode::kStrict).status,
            PhoneParseStatus::kBadLength);
}

TEST_F(StrictPhoneTest, BadLength) {
  EXPECT_EQ(Parse("98765-4321", PhoneMode::kStrict).status, PhoneParseStatus::kBadLength);
  EXPECT_EQ(Parse("1", PhoneMode::kStrict).status, PhoneParseStatus::kBadLength);
  EXPECT_EQ(Parse("119876543210", PhoneMode::kStrict).status, PhoneParseStatus::kBadLength);
}

TEST_F(StrictPhoneTest, BadAreaCode) {
  EXPECT_EQ(Parse("10 98765-4321", PhoneMode::kStrict).status, PhoneParseStatus::kBadAreaCode);
  EXPECT_EQ(Parse("0198765432", PhoneMode::kStrict).status, PhoneParseStatus::kBadAreaCode);
}

TEST_F(StrictPhoneTest, EmptyInput) {
  EXPECT_EQ(Parse("", PhoneMode::kStrict).status, PhoneParseStatus::kEmpty);
  EXPECT_EQ(Parse("n/a", PhoneMode::kStrict).status, PhoneParseStatus::kEmpty);
}

TEST_F(StrictPhoneTest, AssignedTableRejectsUnassignedCode) {
  AreaCodeTable assigned = AreaCodeTable::Assigned();
  EXPECT_TRUE(Parse("20 98765-4321", PhoneMode::kStrict).ok());
  EXPECT_EQ(Parse("20 98765-4321", PhoneMode::kStrict, assigned).status,
            PhoneParseStatus::kBadAreaCode);
  EXPECT_TRUE(Parse("21 98765-4321", PhoneMode::kStrict, assigned).ok());
}

TEST_F(StrictPhoneTest, StatusNames) {
  EXPECT_STREQ(PhoneParseStatusName(PhoneParseStatus::kOk), "ok");
  EXPECT_STREQ(PhoneParseStatusName(PhoneParseStatus::kEmpty), "empty");
  EXPECT_STREQ(PhoneParseStatusName(PhoneParseStatus::kBadLength), "bad_length");
  EXPECT_STREQ(PhoneParseStatusName(PhoneParseStatus::kBadAreaCode), "bad_area_code");
  EXPECT_STREQ(PhoneParseStatusName(PhoneParseStatus::kBadSubscriber), "bad_subscriber");
}

// =============================================================================
// Flexible Mode
// =============================================================================

class FlexiblePhoneTest : public ::testing::Test {};

TEST_F(FlexiblePhoneTest, AcceptsEverythingStrictAccepts) {
  for (const char* value : {"+55 (11) 98765-4321", "11 3456-7890", "011 98765-4321",
                            "55 98765-4321"}) {
    EXPECT_TRUE(IsValidPhone(value, PhoneMode::kStrict)) << value;
    EXPECT_TRUE(IsValidPhone(value, PhoneMode::kFlexible)) << value;
  }
}

TEST_F(FlexiblePhoneTest, NineDigitSubscriberAnyLeadingDigit) {
  PhoneParseResult r = Parse("11 87654-3210", PhoneMode::kFlexible);
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r.shape.subscriber, "876543210");
}

TEST_F(FlexiblePhoneTest, StripsRunsOfLeadingZeros) {
  PhoneParseResult r = Parse("0055 11 98765-4321", PhoneMode::kFlexible);
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r.shape.area_code, "11");

  EXPECT_TRUE(IsValidPhone("00 11 98765-4321", PhoneMode::kFlexible));
  EXPECT_TRUE(IsValidPhone("+55 011 98765-4321", PhoneMode::kFlexible));
  EXPECT_TRUE(IsValidPhone("55 00 11 3456-7890", PhoneMode::kFlexible));
}

TEST_F(FlexiblePhoneTest, StillChecksLengthAndAreaCode) {
  EXPECT_EQ(Parse("98765-4321", PhoneMode::kFlexible).status, PhoneParseStatus::kBadLength);
  EXPECT_EQ(Parse("10 98765-4321", PhoneMode::kFlexible).status,
            PhoneParseStatus::kBadAreaCode);
  EXPECT_EQ(Parse("000", PhoneMode::kFlexible).status, PhoneParseStatus::kBadLength);
}

// =============================================================================
// Formatting
// =============================================================================

class FormatPhoneTest : public ::testing::Test {};

TEST_F(FormatPhoneTest, Mobile) {
  EXPECT_EQ(FormatPhone("11987654321"), "+55 (11) 98765-4321");
  EXPECT_EQ(FormatPhone("+55 11 98765 4321"), "+55 (11) 98765-4321");
}

TEST_F(FormatPhoneTest, Landline) {
  EXPECT_EQ(FormatPhone("(11) 3456-7890"), "+55 (11) 3456-7890");
}

TEST_F(FormatPhoneTest, UsesFlexibleParsing) {
  EXPECT_EQ(FormatPhone("11 87654-3210"), "+55 (11) 87654-3210");
  EXPECT_EQ(FormatPhone("0055 021 3456-7890"), "+55 (21) 3456-7890");
}

TEST_F(FormatPhoneTest, FormattedOutputIsStable) {
  std::string once = *FormatPhone("011987654321");
  EXPECT_EQ(FormatPhone(once), once);
}

TEST_F(FormatPhoneTest, InvalidIsAbsent) {
  EXPECT_FALSE(FormatPhone("").has_value());
  EXPECT_FALSE(FormatPhone("12345").has_value());
  EXPECT_FALSE(FormatPhone("10 98765-4321").has_value());
}

TEST_F(FormatPhoneTest, RespectsAreaCodeTable) {
  AreaCodeTable only_sp = AreaCodeTable::Parse("11-19");
  EXPECT_TRUE(FormatPhoneDigits(ExtractDigits("11987654321"), only_sp).has_value());
  EXPECT_FALSE(FormatPhoneDigits(ExtractDigits("21987654321"), only_sp).has_value());
}

TEST_F(FormatPhoneTest, FormatShapeDirect) {
  PhoneShape shape;
  shape.area_code = "48";
  shape.subscriber = "32221234";
  EXPECT_EQ(FormatShape(shape), "+55 (48) 3222-1234");
}

}  // namespace
}  // namespace brvalid
