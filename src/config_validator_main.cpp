#include "autocode/Config.hpp"

#include <iostream>
#include <yaml-cpp/yaml.h>
using namespace autocode;

int main(int argc, char *argv[]) {
  if (argc != 2) {
    std::cerr << "Usage: " << argv[0] << " <config.yaml>\n";
    return 1;
  }
  auto result = ConfigValidator::validate_file(argv[1]);
  for (const auto &warning : result.warnings) {
    std::cout << "Warning: " << warning << "\n";
  }
  if (result.valid) {
    std::cout << "Validation succeeded.\n";
    return 0;
  } else {
    std::cout << "Validation failed:\n";
    for (const auto &err : result.errors) {
      std::cout << "  - " << err.path << ": " << err.message << "\n";
    }
    return 2;
  }
}
