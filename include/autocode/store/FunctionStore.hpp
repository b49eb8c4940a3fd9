#pragma once
#include "autocode/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace autocode {
namespace store {

/// Persistent catalogue of functions, their unit tests and test results.
///
/// Operations on unknown ids throw StoreError(FunctionNotFound), except
/// get_function() and delete_function() which report absence through
/// their return value.
class FunctionStore {
public:
  virtual ~FunctionStore() = default;

  virtual std::string add_function(const std::string &name,
                                   const std::string &description,
                                   const std::string &code,
                                   const std::vector<std::string> &modules,
                                   const std::vector<std::string> &tags) = 0;

  virtual std::optional<FunctionRecord>
  get_function(const std::string &id) const = 0;

  /// Empty filters match everything.
  virtual std::vector<FunctionRecord>
  list_functions(const std::string &module = "",
                 const std::string &tag = "") const = 0;

  /// Replace the code and log the change in the function's history.
  virtual void modify_function(const std::string &id,
                               const std::string &modifier,
                               const std::string &description,
                               const std::string &code) = 0;

  /// Remove the function, its tests, its results and every dependency edge
  /// pointing at it. Returns false if the id is unknown.
  virtual bool delete_function(const std::string &id) = 0;

  /// Case-insensitive substring match over name, description and code.
  virtual std::vector<FunctionRecord>
  search(const std::string &query) const = 0;

  virtual std::vector<std::string> list_modules() const = 0;
  virtual std::vector<std::string> list_tags() const = 0;
  virtual void add_tag(const std::string &function_id,
                       const std::string &tag) = 0;

  // Tests and results
  virtual std::string add_test(const std::string &function_id,
                               const std::string &name,
                               const std::string &description,
                               const std::string &code) = 0;
  virtual void clear_results(const std::vector<std::string> &function_ids) = 0;
  virtual void record_result(const TestResult &result) = 0;
  virtual std::vector<TestResult>
  test_results(const std::string &function_id = "") const = 0;
  virtual std::vector<CoverageEntry> coverage_report() const = 0;

  // Dependency graph
  /// Throws StoreError(DependencyCycle) if the edge would close a cycle.
  virtual void add_dependency(const std::string &function_id,
                              const std::string &depends_on_id) = 0;
  /// Throws StoreError(InvalidArgument) if the edge does not exist.
  virtual void remove_dependency(const std::string &function_id,
                                 const std::string &depends_on_id) = 0;
  virtual std::vector<std::string>
  list_dependencies(const std::string &function_id) const = 0;
  virtual std::vector<std::vector<std::string>> find_cycles() const = 0;
  virtual RecursionReport detect_recursion(const std::string &id) const = 0;
};

} // namespace store
} // namespace autocode
