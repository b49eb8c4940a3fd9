#pragma once
#include "autocode/types.hpp"

#include <set>
#include <string>

namespace autocode {
namespace lint {

struct LinterOptions {
  std::string shadow_suffix{"_"};
  bool block_unsafe{true};   // errors fail the lint
  bool allow_warnings{true}; // warnings alone do not fail the lint
};

/// Static checks over source code before it is stored or executed.
class Linter {
public:
  virtual ~Linter() = default;

  /// Report issues; with `fix`, also return rewritten code when at least
  /// one fixable issue was repaired.
  virtual LintResult lint(const std::string &code, bool fix) const = 0;
};

/// Compatibility checks for Julia sources.
///
/// Rules:
///  - `unsupported_regex_flags` (error): JS-style `/re/u` or `/re/y`.
///  - `js_regex_syntax` (warning): any other JS-style `/re/flags` literal.
///  - `parameter_shadowing` (warning, fixable): a parameter named after a
///    Julia builtin; the fix appends `shadow_suffix` inside that function.
class JuliaLinter : public Linter {
public:
  explicit JuliaLinter(LinterOptions options = {});

  LintResult lint(const std::string &code, bool fix) const override;

  const LinterOptions &options() const { return options_; }
  static const std::set<std::string> &builtins();

private:
  LinterOptions options_;
};

} // namespace lint
} // namespace autocode
