#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace autocode {

enum class TestStatus { Pending, Passed, Failed };

std::string to_string(TestStatus status);

struct UnitTest {
  std::string id;
  std::string function_id;
  std::string name;
  std::string description;
  std::string code;
};

struct TestResult {
  std::string test_id;
  std::string function_id;
  TestStatus status{TestStatus::Pending};
  std::string output;
  std::chrono::system_clock::time_point executed_at;
};

struct Modification {
  std::string modifier;
  std::string description;
  std::chrono::system_clock::time_point modified_at;
};

struct FunctionRecord {
  std::string id;
  std::string name;
  std::string description;
  std::string code;
  std::vector<std::string> modules;
  std::vector<std::string> tags;
  std::vector<std::string> dependencies; // ids this function depends on
  std::vector<UnitTest> tests;
  std::vector<Modification> history;
  std::chrono::system_clock::time_point created_at;
  std::chrono::system_clock::time_point modified_at;
};

struct RecursionReport {
  std::string function_id;
  bool direct{false};
  bool mutual{false};
  std::vector<std::vector<std::string>> cycles; // mutual recursion paths
};

struct CoverageEntry {
  std::string function_id;
  std::string name;
  size_t test_count{0};
  size_t passed{0};
  size_t failed{0};
};

enum class LintSeverity { Info, Warning, Error };

std::string to_string(LintSeverity severity);

struct LintIssue {
  std::string type;
  std::string message;
  int line{0};
  int column{0};
  LintSeverity severity{LintSeverity::Warning};
  bool can_fix{false};
  std::optional<std::string> fix_suggestion;
};

struct LintResult {
  std::vector<LintIssue> issues;
  std::optional<std::string> fixed_code;
  bool success{true};

  bool has_errors() const;
  bool has_warnings() const;
};

/// Output of a CodeGenerator: one function plus a test for it.
struct GeneratedFunction {
  std::string function_name;
  std::string short_description;
  std::string code;
  std::string test_name;
  std::string test_description;
  std::string tests;
};

} // namespace autocode
