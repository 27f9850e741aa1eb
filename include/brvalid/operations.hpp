#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace brvalid {

/** Per-value operations that can be applied to a column. */
enum class Operation {
  kValidateDocument,       // bool: CPF/CNPJ checksum valid
  kClassifyDocument,       // "CPF" / "CNPJ" by digit count, absent otherwise
  kIdentifyDocument,       // "CPF" / "CNPJ" only when checksum valid
  kFormatDocument,         // DDD.DDD.DDD-DD / DD.DDD.DDD/DDDD-DD
  kValidatePhone,          // bool, strict mode
  kValidatePhoneFlexible,  // bool, flexible mode
  kFormatPhone,            // +55 (AA) SSSSS-SSSS
  kRemoveAccents,
  kTitleCase
};

/** Snake-case name, e.g. "validate_document". */
const char* OperationName(Operation op);

/** Inverse of OperationName(). */
std::optional<Operation> ParseOperation(std::string_view name);

/** Every operation, in declaration order. */
const std::vector<Operation>& AllOperations();

/** True for operations whose present results are booleans. */
bool IsPredicate(Operation op);

/** One output value: absent, a boolean, or a string. */
using Cell = std::variant<std::monostate, bool, std::string>;

inline bool IsAbsent(const Cell& cell) { return std::holds_alternative<std::monostate>(cell); }

}  // namespace brvalid
