#pragma once

#include <brvalid/digits.hpp>

#include <bitset>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace brvalid {

/** How strictly a phone number must conform to the national numbering plan. */
enum class PhoneMode {
  kStrict,    // Exact length, 9-digit subscribers must start with 9
  kFlexible   // Any 8/9-digit subscriber, extra leading zeros tolerated
};

constexpr char kBrazilCountryCode[] = "55";
constexpr int kMinAreaCode = 11;
constexpr int kMaxAreaCode = 99;

/**
 * Set of two-digit area codes accepted by the phone parser.
 *
 * Area code assignments change over time, so the table is data rather
 * than code. It is immutable once built and safe to share across threads.
 */
class AreaCodeTable {
 public:
  /** An empty table (accepts nothing). */
  AreaCodeTable() = default;

  /** Every code from 11 to 99. */
  static AreaCodeTable All();

  /** The codes currently assigned in Brazil (67 codes). */
  static AreaCodeTable Assigned();

  /**
   * Build a table from text: "all", "assigned", or a comma-separated list
   * of codes and lo-hi ranges, e.g. "11-19,21,27". Tokens are unioned.
   * @throws std::invalid_argument on a malformed token or a code outside 11-99.
   */
  static AreaCodeTable Parse(std::string_view text);

  /** @throws std::invalid_argument if code is outside 11-99. */
  void Add(int code);

  bool Contains(int code) const {
    return code >= kMinAreaCode && code <= kMaxAreaCode && codes_.test(static_cast<size_t>(code));
  }

  size_t size() const { return codes_.count(); }
  bool empty() const { return codes_.none(); }

  /** Codes in ascending order. */
  std::vector<int> Codes() const;

  bool operator==(const AreaCodeTable& other) const { return codes_ == other.codes_; }
  bool operator!=(const AreaCodeTable& other) const { return codes_ != other.codes_; }

 private:
  std::bitset<kMaxAreaCode + 1> codes_;
};

/** Shared default table, equal to AreaCodeTable::All(). */
const AreaCodeTable& DefaultAreaCodes();

/** Why a phone number failed to parse. */
enum class PhoneParseStatus {
  kOk,
  kEmpty,          // No digits at all
  kBadLength,      // Not 10/11 national digits after prefix stripping
  kBadAreaCode,    // Area code not in the table
  kBadSubscriber   // 9-digit subscriber without leading 9 (strict only)
};

const char* PhoneParseStatusName(PhoneParseStatus status);

/** A structurally valid Brazilian phone number. */
struct PhoneShape {
  std::string country_code = kBrazilCountryCode;
  std::string area_code;   // 2 digits
  std::string subscriber;  // 8 digits (landline) or 9 digits (mobile)

  bool mobile() const { return subscriber.size() == 9; }
};

struct PhoneParseResult {
  PhoneParseStatus status = PhoneParseStatus::kEmpty;
  PhoneShape shape;  // Only meaningful when ok()

  bool ok() const { return status == PhoneParseStatus::kOk; }
};

/**
 * Parse a digit sequence into country code, area code and subscriber.
 *
 * Steps:
 *  1. Strip a leading "55" if 10 or 11 digits remain.
 *  2. Strip a trunk-prefix "0" if 10 or 11 digits remain. Flexible mode
 *     strips any run of leading zeros, before and after the country code.
 *  3. The next 2 digits are the area code; it must be in area_codes.
 *  4. The rest is the subscriber: 8 digits, or 9 digits. Strict mode
 *     requires a 9-digit subscriber to start with 9.
 *
 * Never throws; every failure is reported through the status.
 */
PhoneParseResult ParsePhone(const RawDigits& raw,
                            PhoneMode mode,
                            const AreaCodeTable& area_codes = DefaultAreaCodes());

inline bool ValidatePhone(const RawDigits& raw,
                          PhoneMode mode,
                          const AreaCodeTable& area_codes = DefaultAreaCodes()) {
  return ParsePhone(raw, mode, area_codes).ok();
}

/** "+55 (AA) SSSSS-SSSS" for mobile, "+55 (AA) SSSS-SSSS" for landline. */
std::string FormatShape(const PhoneShape& shape);

/**
 * Parse in flexible mode and render the canonical international form.
 * Returns std::nullopt if the number does not parse.
 */
std::optional<std::string> FormatPhoneDigits(
    const RawDigits& raw,
    const AreaCodeTable& area_codes = DefaultAreaCodes());

// Convenience wrappers over ExtractDigits().
bool IsValidPhone(std::string_view value, PhoneMode mode);
std::optional<std::string> FormatPhone(std::string_view value);

}  // namespace brvalid
