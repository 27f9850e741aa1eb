#pragma once

#include <brvalid/batch.hpp>
#include <brvalid/document.hpp>

#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace brvalid::testing {

// =============================================================================
// Deterministic Document Generator
// =============================================================================

/**
 * Generates checksum-valid CPF and CNPJ digit strings from a seed.
 * Same seed, same sequence; suitable for property tests and benchmarks.
 */
class DocumentGenerator {
 public:
  explicit DocumentGenerator(uint64_t seed = 42) : rng_(seed) {}

  std::string Cpf() { return Complete(IdentifierKind::kCPF, 9); }

  std::string Cnpj() { return Complete(IdentifierKind::kCNPJ, 12); }

  /** A checksum-valid value with its last check digit changed. */
  std::string CorruptCheckDigit(const std::string& digits) {
    std::string out = digits;
    char& last = out.back();
    last = static_cast<char>('0' + ((last - '0' + 1 + Digit() % 9) % 10));
    return out;
  }

  int Digit() { return static_cast<int>(rng_() % 10); }

 private:
  std::string Complete(IdentifierKind kind, size_t base_len) {
    for (;;) {
      std::string base;
      base.reserve(base_len + 2);
      for (size_t i = 0; i < base_len; ++i) {
        base += static_cast<char>('0' + Digit());
      }
      std::string full = base + *ComputeCheckDigits(kind, base);
      // Repeated-digit sequences are never valid; draw again
      if (full.find_first_not_of(full.front()) != std::string::npos) {
        return full;
      }
    }
  }

  std::mt19937_64 rng_;
};

// =============================================================================
// Noise Decorators
// =============================================================================

/** Wrap digits in spaces, letters and punctuation without adding digits. */
inline std::string AddNoise(const std::string& digits, uint64_t seed) {
  static const char kNoise[] = " .-/()_abcXYZ\t";
  std::mt19937_64 rng(seed);
  std::string out;
  out += kNoise[rng() % (sizeof(kNoise) - 1)];
  for (char c : digits) {
    out += c;
    if (rng() % 3 == 0) {
      out += kNoise[rng() % (sizeof(kNoise) - 1)];
    }
  }
  out += kNoise[rng() % (sizeof(kNoise) - 1)];
  return out;
}

/** A column that cycles through values and puts an absent value every null_every rows. */
inline Column MakeColumn(const std::vector<std::string>& values, size_t rows,
                         size_t null_every = 0) {
  Column column;
  column.reserve(rows);
  for (size_t i = 0; i < rows; ++i) {
    if (null_every != 0 && i % null_every == null_every - 1) {
      column.emplace_back(std::nullopt);
    } else {
      column.emplace_back(values[i % values.size()]);
    }
  }
  return column;
}

}  // namespace brvalid::testing
