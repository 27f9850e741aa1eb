#include <brvalid/phone.hpp>

#include <stdexcept>

namespace brvalid {

namespace {

constexpr int kAssignedAreaCodes[] = {
    11, 12, 13, 14, 15, 16, 17, 18, 19,  // SP
    21, 22, 24,                          // RJ
    27, 28,                              // ES
    31, 32, 33, 34, 35, 37, 38,          // MG
    41, 42, 43, 44, 45, 46,              // PR
    47, 48, 49,                          // SC
    51, 53, 54, 55,                      // RS
    61,                                  // DF
    62, 64,                              // GO
    63,                                  // TO
    65, 66,                              // MT
    67,                                  // MS
    68,                                  // AC
    69,                                  // RO
    71, 73, 74, 75, 77,                  // BA
    79,                                  // SE
    81, 87,                              // PE
    82,                                  // AL
    83,                                  // PB
    84,                                  // RN
    85, 88,                              // CE
    86, 89,                              // PI
    91, 93, 94,                          // PA
    92, 97,                              // AM
    95,                                  // RR
    96,                                  // AP
    98, 99,                              // MA
};

constexpr size_t kAreaCodeDigits = 2;
constexpr size_t kLandlineDigits = 8;
constexpr size_t kMobileDigits = 9;

bool FitsNationalNumber(size_t n) {
  return n == kAreaCodeDigits + kLandlineDigits || n == kAreaCodeDigits + kMobileDigits;
}

std::string_view StripLeadingZeros(std::string_view d) {
  size_t pos = d.find_first_not_of('0');
  return pos == std::string_view::npos ? std::string_view() : d.substr(pos);
}

std::string_view Trim(std::string_view s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string_view::npos) return {};
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

int ParseAreaCodeToken(std::string_view token) {
  if (token.size() != kAreaCodeDigits || !IsAsciiDigit(token[0]) || !IsAsciiDigit(token[1])) {
    throw std::invalid_argument("Invalid area code: '" + std::string(token) + "'");
  }
  return (token[0] - '0') * 10 + (token[1] - '0');
}

}  // namespace

// --- AreaCodeTable ---

AreaCodeTable AreaCodeTable::All() {
  AreaCodeTable table;
  for (int code = kMinAreaCode; code <= kMaxAreaCode; ++code) {
    table.Add(code);
  }
  return table;
}

AreaCodeTable AreaCodeTable::Assigned() {
  AreaCodeTable table;
  for (int code : kAssignedAreaCodes) {
    table.Add(code);
  }
  return table;
}

AreaCodeTable AreaCodeTable::Parse(std::string_view text) {
  AreaCodeTable table;
  bool any = false;

  while (!text.empty()) {
    size_t comma = text.find(',');
    std::string_view token = Trim(text.substr(0, comma));
    text = (comma == std::string_view::npos) ? std::string_view() : text.substr(comma + 1);

    if (token.empty()) {
      throw std::invalid_argument("Empty entry in area code list");
    }
    any = true;

    if (token == "all") {
      table.codes_ |= All().codes_;
    } else if (token == "assigned") {
      table.codes_ |= Assigned().codes_;
    } else if (size_t dash = token.find('-'); dash != std::string_view::npos) {
      int lo = ParseAreaCodeToken(Trim(token.substr(0, dash)));
      int hi = ParseAreaCodeToken(Trim(token.substr(dash + 1)));
      if (lo > hi) {
        throw std::invalid_argument("Empty area code range: '" + std::string(token) + "'");
      }
      for (int code = lo; code <= hi; ++code) {
        table.Add(code);
      }
    } else {
      table.Add(ParseAreaCodeToken(token));
    }
  }

  if (!any) {
    throw std::invalid_argument("Area code list is empty");
  }
  return table;
}

void AreaCodeTable::Add(int code) {
  if (code < kMinAreaCode || code > kMaxAreaCode) {
    throw std::invalid_argument("Area code out of range 11-99: " + std::to_string(code));
  }
  codes_.set(static_cast<size_t>(code));
}

std::vector<int> AreaCodeTable::Codes() const {
  std::vector<int> out;
  out.reserve(size());
  for (int code = kMinAreaCode; code <= kMaxAreaCode; ++code) {
    if (codes_.test(static_cast<size_t>(code))) out.push_back(code);
  }
  return out;
}

const AreaCodeTable& DefaultAreaCodes() {
  static const AreaCodeTable kDefault = AreaCodeTable::All();
  return kDefault;
}

// --- Parsing ---

const char* PhoneParseStatusName(PhoneParseStatus status) {
  switch (status) {
    case PhoneParseStatus::kOk:
      return "ok";
    case PhoneParseStatus::kEmpty:
      return "empty";
    case PhoneParseStatus::kBadLength:
      return "bad_length";
    case PhoneParseStatus::kBadAreaCode:
      return "bad_area_code";
    case PhoneParseStatus::kBadSubscriber:
      return "bad_subscriber";
  }
  return "unknown";
}

PhoneParseResult ParsePhone(const RawDigits& raw,
                            PhoneMode mode,
                            const AreaCodeTable& area_codes) {
  PhoneParseResult result;
  if (raw.empty()) {
    return result;
  }

  const bool flexible = (mode == PhoneMode::kFlexible);
  std::string_view d(raw.digits);

  if (flexible) {
    d = StripLeadingZeros(d);
  }

  // Country code
  if (d.size() > 2 && d.compare(0, 2, kBrazilCountryCode) == 0) {
    std::string_view rest = d.substr(2);
    if (flexible) rest = StripLeadingZeros(rest);
    if (FitsNationalNumber(rest.size())) {
      d = rest;
    }
  }

  // Trunk prefix (flexible mode already dropped every leading zero)
  if (!flexible && !d.empty() && d.front() == '0' && FitsNationalNumber(d.size() - 1)) {
    d.remove_prefix(1);
  }

  if (!FitsNationalNumber(d.size())) {
    result.status = PhoneParseStatus::kBadLength;
    return result;
  }

  const int area = (d[0] - '0') * 10 + (d[1] - '0');
  if (!area_codes.Contains(area)) {
    result.status = PhoneParseStatus::kBadAreaCode;
    return result;
  }

  std::string_view subscriber = d.substr(kAreaCodeDigits);
  if (!flexible && subscriber.size() == kMobileDigits && subscriber.front() != '9') {
    result.status = PhoneParseStatus::kBadSubscriber;
    return result;
  }

  result.status = PhoneParseStatus::kOk;
  result.shape.area_code = std::string(d.substr(0, kAreaCodeDigits));
  result.shape.subscriber = std::string(subscriber);
  return result;
}

// --- Formatting ---

std::string FormatShape(const PhoneShape& shape) {
  const size_t split = shape.subscriber.size() - 4;

  std::string out;
  out.reserve(20);
  out += '+';
  out += shape.country_code;
  out += " (";
  out += shape.area_code;
  out += ") ";
  out.append(shape.subscriber, 0, split);
  out += '-';
  out.append(shape.subscriber, split, std::string::npos);
  return out;
}

std::optional<std::string> FormatPhoneDigits(const RawDigits& raw,
                                             const AreaCodeTable& area_codes) {
  PhoneParseResult parsed = ParsePhone(raw, PhoneMode::kFlexible, area_codes);
  if (!parsed.ok()) {
    return std::nullopt;
  }
  return FormatShape(parsed.shape);
}

bool IsValidPhone(std::string_view value, PhoneMode mode) {
  return ValidatePhone(ExtractDigits(value), mode);
}

std::optional<std::string> FormatPhone(std::string_view value) {
  return FormatPhoneDigits(ExtractDigits(value));
}

}  // namespace brvalid
