#include <brvalid/digits.hpp>

namespace brvalid {

RawDigits ExtractDigits(std::string_view value) {
  RawDigits out;
  out.source_length = value.size();
  out.digits.reserve(value.size());

  for (char c : value) {
    if (IsAsciiDigit(c)) {
      out.digits += c;
    } else {
      out.had_noise = true;
    }
  }
  return out;
}

}  // namespace brvalid
