#include <brvalid/document.hpp>

namespace brvalid {

namespace {

// Weights for the second check digit. The first check digit uses the same
// table starting one position later (CPF: 10..2, CNPJ: 5,4,3,2,9..2).
constexpr int kCpfWeights[10] = {11, 10, 9, 8, 7, 6, 5, 4, 3, 2};
constexpr int kCnpjWeights[13] = {6, 5, 4, 3, 2, 9, 8, 7, 6, 5, 4, 3, 2};

constexpr size_t kCpfBaseLength = 9;
constexpr size_t kCnpjBaseLength = 12;

// Weighted sum over digits[0, n) reduced modulo 11.
// A remainder below 2 maps to check digit 0.
int Mod11CheckDigit(std::string_view digits, size_t n, const int* weights) {
  int sum = 0;
  for (size_t i = 0; i < n; ++i) {
    sum += (digits[i] - '0') * weights[i];
  }
  int remainder = sum % 11;
  return remainder < 2 ? 0 : 11 - remainder;
}

bool AllSameDigit(std::string_view digits) {
  for (char c : digits) {
    if (c != digits.front()) return false;
  }
  return true;
}

bool AllDigits(std::string_view s) {
  for (char c : s) {
    if (!IsAsciiDigit(c)) return false;
  }
  return true;
}

}  // namespace

const char* KindName(IdentifierKind kind) {
  switch (kind) {
    case IdentifierKind::kCPF:
      return "CPF";
    case IdentifierKind::kCNPJ:
      return "CNPJ";
    case IdentifierKind::kUnrecognized:
      break;
  }
  return "";
}

IdentifierKind ClassifyLength(size_t digit_count) {
  switch (digit_count) {
    case kCpfLength:
      return IdentifierKind::kCPF;
    case kCnpjLength:
      return IdentifierKind::kCNPJ;
    default:
      return IdentifierKind::kUnrecognized;
  }
}

std::optional<std::string> ComputeCheckDigits(IdentifierKind kind,
                                              std::string_view base) {
  const int* weights = nullptr;
  size_t base_len = 0;

  switch (kind) {
    case IdentifierKind::kCPF:
      weights = kCpfWeights;
      base_len = kCpfBaseLength;
      break;
    case IdentifierKind::kCNPJ:
      weights = kCnpjWeights;
      base_len = kCnpjBaseLength;
      break;
    case IdentifierKind::kUnrecognized:
      return std::nullopt;
  }

  if (base.size() != base_len || !AllDigits(base)) {
    return std::nullopt;
  }

  std::string extended(base);
  extended += static_cast<char>('0' + Mod11CheckDigit(extended, base_len, weights + 1));
  extended += static_cast<char>('0' + Mod11CheckDigit(extended, base_len + 1, weights));
  return extended.substr(base_len);
}

ValidationOutcome ValidateDigits(const RawDigits& raw) {
  ValidationOutcome outcome;
  outcome.kind = Classify(raw);
  if (outcome.kind == IdentifierKind::kUnrecognized) {
    return outcome;
  }

  // e.g. 111.111.111-11 passes the checksum but is not a real number
  if (AllSameDigit(raw.digits)) {
    return outcome;
  }

  std::string_view digits(raw.digits);
  const size_t base_len = digits.size() - 2;
  auto expected = ComputeCheckDigits(outcome.kind, digits.substr(0, base_len));
  outcome.valid = expected && *expected == digits.substr(base_len);
  return outcome;
}

std::optional<std::string> FormatDigits(const RawDigits& raw) {
  std::string_view d(raw.digits);
  std::string out;

  switch (Classify(raw)) {
    case IdentifierKind::kCPF:
      out.reserve(14);
      out.append(d.substr(0, 3)).append(".");
      out.append(d.substr(3, 3)).append(".");
      out.append(d.substr(6, 3)).append("-");
      out.append(d.substr(9, 2));
      return out;
    case IdentifierKind::kCNPJ:
      out.reserve(18);
      out.append(d.substr(0, 2)).append(".");
      out.append(d.substr(2, 3)).append(".");
      out.append(d.substr(5, 3)).append("/");
      out.append(d.substr(8, 4)).append("-");
      out.append(d.substr(12, 2));
      return out;
    case IdentifierKind::kUnrecognized:
      break;
  }
  return std::nullopt;
}

bool IsValidDocument(std::string_view value) {
  return ValidateDigits(ExtractDigits(value)).valid;
}

std::optional<std::string> FormatDocument(std::string_view value) {
  return FormatDigits(ExtractDigits(value));
}

}  // namespace brvalid
