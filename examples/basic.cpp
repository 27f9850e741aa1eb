#include <brvalid/batch.hpp>
#include <brvalid/document.hpp>
#include <brvalid/phone.hpp>

#include <iostream>

int main() {
  // Single values
  std::cout << "505.429.838-00 valid: " << std::boolalpha
            << brvalid::IsValidDocument("505.429.838-00") << "\n";

  auto formatted = brvalid::FormatDocument("60204424000108");
  std::cout << "formatted CNPJ: " << formatted.value_or("<none>") << "\n";

  auto phone = brvalid::ParsePhone(brvalid::ExtractDigits("011 98765-4321"),
                                   brvalid::PhoneMode::kStrict);
  if (!phone.ok()) {
    std::cerr << "phone rejected: " << brvalid::PhoneParseStatusName(phone.status) << "\n";
    return 1;
  }
  std::cout << "phone: " << brvalid::FormatShape(phone.shape) << "\n";

  // A column with an absent value and a malformed one
  brvalid::ExecutorOptions opt;
  opt.threads = 2;
  brvalid::BatchExecutor executor(opt);

  brvalid::Column docs = {std::string("529.982.247-25"), std::nullopt,
                          std::string("11.222.333/0001-81"), std::string("123")};
  auto kinds = executor.ClassifyDocument(docs);
  auto valid = executor.ValidateDocument(docs);
  for (size_t i = 0; i < docs.size(); ++i) {
    std::cout << i << ": " << docs[i].value_or("<null>") << " -> "
              << (kinds[i] ? brvalid::KindName(*kinds[i]) : "<null>") << " "
              << (valid[i] ? (*valid[i] ? "valid" : "invalid") : "<null>") << "\n";
  }

  std::cout << "done\n";
  return 0;
}
