#pragma once
#include "autocode/types.hpp"

#include <string>

namespace autocode {
namespace generate {

/// Source of new functions from a natural-language description.
///
/// Implementations throw std::runtime_error when generation fails; the
/// `generate_function` and `generate_test` tools report that as a
/// GenerationFailed error.
class CodeGenerator {
public:
  virtual ~CodeGenerator() = default;

  virtual GeneratedFunction generate(const std::string &description) = 0;

  /// Unit test code for `function` checking the behaviour in `description`.
  virtual std::string generate_test(const FunctionRecord &function,
                                    const std::string &description) = 0;
};

} // namespace generate
} // namespace autocode
