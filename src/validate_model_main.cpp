#include <fgen-engine/SchemaValidator.hpp>
#include <iostream>
using namespace fgen;

int main(int argc, char *argv[]) {
  if (argc != 2) {
    std::cerr << "Usage: " << argv[0] << " <model.yaml>\n";
    return 1;
  }
  auto result = SchemaValidator::validate_model(argv[1]);
  for (const auto &warning : result.warnings) {
    std::cout << "  warning: " << warning << "\n";
  }
  if (result.valid) {
    std::cout << "Validation succeeded.\n";
    return 0;
  } else {
    std::cout << "Validation failed:\n";
    for (const auto &err : result.errors) {
      std::cout << "  - " << err.path;
      if (err.line > 0)
        std::cout << " (line " << err.line << ", column " << err.column << ")";
      std::cout << ": " << err.message << "\n";
    }
    return 2;
  }
}
