#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace brvalid {

/**
 * Digits extracted from a noisy input value.
 *
 * Only ASCII '0'-'9' are kept, in their original order. Every other byte
 * (punctuation, whitespace, letters, UTF-8 sequences) is noise.
 */
struct RawDigits {
  std::string digits;
  size_t source_length = 0;  // Byte length of the value the digits came from
  bool had_noise = false;    // True if any non-digit byte was dropped

  size_t size() const { return digits.size(); }
  bool empty() const { return digits.empty(); }

  // Digit value at position i (0-9). No bounds check.
  int at(size_t i) const { return digits[i] - '0'; }
};

inline bool IsAsciiDigit(char c) { return c >= '0' && c <= '9'; }

/**
 * Strip every non-digit byte from value. Never fails: an empty or
 * all-noise value yields an empty digit sequence.
 */
RawDigits ExtractDigits(std::string_view value);

}  // namespace brvalid
