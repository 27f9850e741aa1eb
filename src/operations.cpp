#include <brvalid/operations.hpp>

namespace brvalid {

const char* OperationName(Operation op) {
  switch (op) {
    case Operation::kValidateDocument:
      return "validate_document";
    case Operation::kClassifyDocument:
      return "classify_document";
    case Operation::kIdentifyDocument:
      return "identify_document";
    case Operation::kFormatDocument:
      return "format_document";
    case Operation::kValidatePhone:
      return "validate_phone";
    case Operation::kValidatePhoneFlexible:
      return "validate_phone_flexible";
    case Operation::kFormatPhone:
      return "format_phone";
    case Operation::kRemoveAccents:
      return "remove_accents";
    case Operation::kTitleCase:
      return "title_case";
  }
  return "unknown";
}

const std::vector<Operation>& AllOperations() {
  static const std::vector<Operation> kAll = {
      Operation::kValidateDocument, Operation::kClassifyDocument,
      Operation::kIdentifyDocument, Operation::kFormatDocument,
      Operation::kValidatePhone,    Operation::kValidatePhoneFlexible,
      Operation::kFormatPhone,      Operation::kRemoveAccents,
      Operation::kTitleCase,
  };
  return kAll;
}

std::optional<Operation> ParseOperation(std::string_view name) {
  for (Operation op : AllOperations()) {
    if (name == OperationName(op)) return op;
  }
  return std::nullopt;
}

bool IsPredicate(Operation op) {
  return op == Operation::kValidateDocument || op == Operation::kValidatePhone ||
         op == Operation::kValidatePhoneFlexible;
}

}  // namespace brvalid
