#pragma once

#include <brvalid/digits.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace brvalid {

/** Taxpayer identifier kind, decided by digit count alone. */
enum class IdentifierKind {
  kUnrecognized,
  kCPF,   // Individual taxpayer, 11 digits
  kCNPJ   // Corporate taxpayer, 14 digits
};

constexpr size_t kCpfLength = 11;
constexpr size_t kCnpjLength = 14;

/** Result of CPF/CNPJ validation. `valid` is always false for kUnrecognized. */
struct ValidationOutcome {
  IdentifierKind kind = IdentifierKind::kUnrecognized;
  bool valid = false;
};

/** "CPF", "CNPJ" or "" for kUnrecognized. */
const char* KindName(IdentifierKind kind);

/** 11 digits -> kCPF, 14 digits -> kCNPJ, anything else -> kUnrecognized. */
IdentifierKind ClassifyLength(size_t digit_count);

inline IdentifierKind Classify(const RawDigits& raw) {
  return ClassifyLength(raw.size());
}

/**
 * Compute the two modulo-11 check digits for a document base.
 *
 * @param kind kCPF (9-digit base) or kCNPJ (12-digit base)
 * @param base The base digits, without check digits
 * @return Two-character check digit string, or std::nullopt when the base
 *         length does not match the kind or contains a non-digit
 */
std::optional<std::string> ComputeCheckDigits(IdentifierKind kind,
                                              std::string_view base);

/**
 * Classify and validate a digit sequence.
 *
 * Sequences made of a single repeated digit are rejected before the
 * checksum is computed. Never throws.
 */
ValidationOutcome ValidateDigits(const RawDigits& raw);

/**
 * Render the canonical punctuated form:
 *   CPF  -> DDD.DDD.DDD-DD
 *   CNPJ -> DD.DDD.DDD/DDDD-DD
 * Formatting does not look at the check digits. Returns std::nullopt for
 * any other length.
 */
std::optional<std::string> FormatDigits(const RawDigits& raw);

// Convenience wrappers over ExtractDigits().
bool IsValidDocument(std::string_view value);
std::optional<std::string> FormatDocument(std::string_view value);

}  // namespace brvalid
