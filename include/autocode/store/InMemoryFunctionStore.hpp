#pragma once
#include "autocode/store/FunctionStore.hpp"

#include <map>
#include <mutex>
#include <random>
#include <set>

namespace autocode {
namespace store {

/// FunctionStore held in memory behind one mutex, optionally mirrored to
/// a JSON file that is rewritten after every mutation.
class InMemoryFunctionStore : public FunctionStore {
public:
  /// An empty path keeps the store purely in memory.
  explicit InMemoryFunctionStore(std::string path = "");

  /// Read the JSON file if it exists. Throws StoreError(Persistence) on an
  /// unreadable or malformed file.
  void load();

  /// Write the JSON file. Throws StoreError(Persistence) on failure.
  void save() const;

  const std::string &path() const { return path_; }

  std::string add_function(const std::string &name,
                           const std::string &description,
                           const std::string &code,
                           const std::vector<std::string> &modules,
                           const std::vector<std::string> &tags) override;
  std::optional<FunctionRecord>
  get_function(const std::string &id) const override;
  std::vector<FunctionRecord>
  list_functions(const std::string &module = "",
                 const std::string &tag = "") const override;
  void modify_function(const std::string &id, const std::string &modifier,
                       const std::string &description,
                       const std::string &code) override;
  bool delete_function(const std::string &id) override;
  std::vector<FunctionRecord> search(const std::string &query) const override;
  std::vector<std::string> list_modules() const override;
  std::vector<std::string> list_tags() const override;
  void add_tag(const std::string &function_id,
               const std::string &tag) override;

  std::string add_test(const std::string &function_id, const std::string &name,
                       const std::string &description,
                       const std::string &code) override;
  void clear_results(const std::vector<std::string> &function_ids) override;
  void record_result(const TestResult &result) override;
  std::vector<TestResult>
  test_results(const std::string &function_id = "") const override;
  std::vector<CoverageEntry> coverage_report() const override;

  void add_dependency(const std::string &function_id,
                      const std::string &depends_on_id) override;
  void remove_dependency(const std::string &function_id,
                         const std::string &depends_on_id) override;
  std::vector<std::string>
  list_dependencies(const std::string &function_id) const override;
  std::vector<std::vector<std::string>> find_cycles() const override;
  RecursionReport detect_recursion(const std::string &id) const override;

private:
  FunctionRecord &require_locked(const std::string &id);
  const FunctionRecord &require_locked(const std::string &id) const;
  std::string make_id_locked(const std::string &prefix);
  bool reachable_locked(const std::string &from, const std::string &to) const;
  std::vector<std::vector<std::string>> find_cycles_locked() const;
  void save_locked() const;
  void persist_locked() const;

  std::string path_;
  mutable std::mutex mutex_;
  std::map<std::string, FunctionRecord> functions_;
  std::vector<TestResult> results_;
  std::set<std::string> ids_;
  std::mt19937_64 rng_;
};

} // namespace store
} // namespace autocode
