#include "autocode/store/InMemoryFunctionStore.hpp"
#include "autocode/Logger.hpp"
#include "autocode/errors.hpp"
#include "autocode/store/Serialization.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <functional>
#include <regex>

using json = nlohmann::json;

namespace autocode {
namespace store {

namespace {

constexpr int STORE_FORMAT_VERSION = 1;

std::string lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

bool contains(const std::vector<std::string> &v, const std::string &s) {
  return std::find(v.begin(), v.end(), s) != v.end();
}

std::string escape_regex(const std::string &text) {
  static const std::regex special(R"([.^$|()\[\]{}*+?\\])");
  return std::regex_replace(text, special, R"(\$&)");
}

// A call site `name(` that is not the function's own definition.
bool calls_itself(const std::string &name, const std::string &code) {
  std::regex call("\\b" + escape_regex(name) + "\\s*\\(");
  std::regex long_def("function\\s+$");
  std::regex short_def("^\\s*$");

  bool definition_skipped = false;
  for (auto it = std::sregex_iterator(code.begin(), code.end(), call);
       it != std::sregex_iterator(); ++it) {
    size_t pos = static_cast<size_t>(it->position());
    size_t line_start = code.rfind('\n', pos);
    line_start = line_start == std::string::npos ? 0 : line_start + 1;
    std::string before = code.substr(line_start, pos - line_start);

    bool is_definition =
        std::regex_search(before, long_def) ||
        (std::regex_match(before, short_def) &&
         std::regex_search(code.substr(pos, code.find('\n', pos) - pos),
                           std::regex("\\)\\s*=[^=]")));
    if (is_definition && !definition_skipped) {
      definition_skipped = true;
      continue;
    }
    return true;
  }
  return false;
}

} // namespace

InMemoryFunctionStore::InMemoryFunctionStore(std::string path)
    : path_(std::move(path)), rng_(std::random_device{}()) {}

// ---------------------------------------------------------------------------
// Persistence
// ---------------------------------------------------------------------------

void InMemoryFunctionStore::load() {
  if (path_.empty())
    return;

  std::lock_guard lock(mutex_);
  if (!std::filesystem::exists(path_)) {
    LOG_INFO("STORE", "LOAD", "No store at {}, starting empty", path_);
    return;
  }

  std::ifstream in(path_);
  if (!in)
    throw StoreError(StoreError::Kind::Persistence,
                     "Cannot open store file: " + path_);

  try {
    json doc = json::parse(in);
    std::map<std::string, FunctionRecord> functions;
    for (const auto &item : doc.at("functions")) {
      auto record = item.get<FunctionRecord>();
      functions[record.id] = std::move(record);
    }
    auto results = doc.value("results", std::vector<TestResult>{});

    functions_ = std::move(functions);
    results_ = std::move(results);
    ids_.clear();
    for (const auto &[id, f] : functions_) {
      ids_.insert(id);
      for (const auto &t : f.tests)
        ids_.insert(t.id);
    }
  } catch (const std::exception &ex) {
    throw StoreError(StoreError::Kind::Persistence,
                     "Malformed store file " + path_ + ": " + ex.what());
  }

  LOG_INFO("STORE", "LOAD", "Loaded {} functions from {}", functions_.size(),
           path_);
}

void InMemoryFunctionStore::save() const {
  std::lock_guard lock(mutex_);
  save_locked();
}

void InMemoryFunctionStore::save_locked() const {
  if (path_.empty())
    return;

  json doc;
  doc["version"] = STORE_FORMAT_VERSION;
  doc["functions"] = json::array();
  for (const auto &[id, f] : functions_)
    doc["functions"].push_back(f);
  doc["results"] = results_;

  // Write-then-rename so a crash never leaves a truncated store.
  std::string tmp = path_ + ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out)
      throw StoreError(StoreError::Kind::Persistence,
                       "Cannot write store file: " + tmp);
    out << doc.dump(2, ' ', false, json::error_handler_t::replace);
    if (!out)
      throw StoreError(StoreError::Kind::Persistence,
                       "Write failed for store file: " + tmp);
  }
  std::error_code ec;
  std::filesystem::rename(tmp, path_, ec);
  if (ec)
    throw StoreError(StoreError::Kind::Persistence,
                     "Cannot replace store file " + path_ + ": " +
                         ec.message());
}

void InMemoryFunctionStore::persist_locked() const {
  try {
    save_locked();
  } catch (const StoreError &ex) {
    // The in-memory state stays authoritative; the next mutation retries.
    LOG_ERROR("STORE", "SAVE", "{}", ex.what());
  }
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

FunctionRecord &InMemoryFunctionStore::require_locked(const std::string &id) {
  auto it = functions_.find(id);
  if (it == functions_.end())
    throw StoreError(StoreError::Kind::FunctionNotFound,
                     "Function " + id + " not found");
  return it->second;
}

const FunctionRecord &
InMemoryFunctionStore::require_locked(const std::string &id) const {
  auto it = functions_.find(id);
  if (it == functions_.end())
    throw StoreError(StoreError::Kind::FunctionNotFound,
                     "Function " + id + " not found");
  return it->second;
}

std::string InMemoryFunctionStore::make_id_locked(const std::string &prefix) {
  std::string id;
  do {
    id = fmt::format("{}-{:012x}", prefix, rng_() & 0xFFFFFFFFFFFFULL);
  } while (ids_.count(id));
  ids_.insert(id);
  return id;
}

// ---------------------------------------------------------------------------
// Functions
// ---------------------------------------------------------------------------

std::string InMemoryFunctionStore::add_function(
    const std::string &name, const std::string &description,
    const std::string &code, const std::vector<std::string> &modules,
    const std::vector<std::string> &tags) {
  if (name.empty())
    throw StoreError(StoreError::Kind::InvalidArgument,
                     "Function name must not be empty");

  std::lock_guard lock(mutex_);
  FunctionRecord record;
  record.id = make_id_locked("fn");
  record.name = name;
  record.description = description;
  record.code = code;
  for (const auto &m : modules) {
    if (!m.empty() && !contains(record.modules, m))
      record.modules.push_back(m);
  }
  for (const auto &t : tags) {
    if (!t.empty() && !contains(record.tags, t))
      record.tags.push_back(t);
  }
  record.created_at = record.modified_at = std::chrono::system_clock::now();

  std::string id = record.id;
  functions_[id] = std::move(record);
  LOG_INFO("STORE", id, "Added function {}", name);
  persist_locked();
  return id;
}

std::optional<FunctionRecord>
InMemoryFunctionStore::get_function(const std::string &id) const {
  std::lock_guard lock(mutex_);
  auto it = functions_.find(id);
  if (it == functions_.end())
    return std::nullopt;
  return it->second;
}

std::vector<FunctionRecord>
InMemoryFunctionStore::list_functions(const std::string &module,
                                      const std::string &tag) const {
  std::lock_guard lock(mutex_);
  std::vector<FunctionRecord> out;
  for (const auto &[id, f] : functions_) {
    if (!module.empty() && !contains(f.modules, module))
      continue;
    if (!tag.empty() && !contains(f.tags, tag))
      continue;
    out.push_back(f);
  }
  return out;
}

void InMemoryFunctionStore::modify_function(const std::string &id,
                                            const std::string &modifier,
                                            const std::string &description,
                                            const std::string &code) {
  std::lock_guard lock(mutex_);
  FunctionRecord &f = require_locked(id);
  auto now = std::chrono::system_clock::now();
  f.code = code;
  f.modified_at = now;
  f.history.push_back(Modification{modifier, description, now});
  LOG_INFO("STORE", id, "Modified by {}: {}", modifier, description);
  persist_locked();
}

bool InMemoryFunctionStore::delete_function(const std::string &id) {
  std::lock_guard lock(mutex_);
  auto it = functions_.find(id);
  if (it == functions_.end())
    return false;

  ids_.erase(id);
  for (const auto &t : it->second.tests)
    ids_.erase(t.id);
  functions_.erase(it);

  for (auto &[other_id, f] : functions_) {
    f.dependencies.erase(
        std::remove(f.dependencies.begin(), f.dependencies.end(), id),
        f.dependencies.end());
  }
  results_.erase(std::remove_if(results_.begin(), results_.end(),
                                [&id](const TestResult &r) {
                                  return r.function_id == id;
                                }),
                 results_.end());

  LOG_INFO("STORE", id, "Deleted function");
  persist_locked();
  return true;
}

std::vector<FunctionRecord>
InMemoryFunctionStore::search(const std::string &query) const {
  std::string needle = lowercase(query);
  std::lock_guard lock(mutex_);
  std::vector<FunctionRecord> out;
  for (const auto &[id, f] : functions_) {
    if (lowercase(f.name).find(needle) != std::string::npos ||
        lowercase(f.description).find(needle) != std::string::npos ||
        lowercase(f.code).find(needle) != std::string::npos)
      out.push_back(f);
  }
  return out;
}

std::vector<std::string> InMemoryFunctionStore::list_modules() const {
  std::lock_guard lock(mutex_);
  std::set<std::string> modules;
  for (const auto &[id, f] : functions_)
    modules.insert(f.modules.begin(), f.modules.end());
  return {modules.begin(), modules.end()};
}

std::vector<std::string> InMemoryFunctionStore::list_tags() const {
  std::lock_guard lock(mutex_);
  std::set<std::string> tags;
  for (const auto &[id, f] : functions_)
    tags.insert(f.tags.begin(), f.tags.end());
  return {tags.begin(), tags.end()};
}

void InMemoryFunctionStore::add_tag(const std::string &function_id,
                                    const std::string &tag) {
  if (tag.empty())
    throw StoreError(StoreError::Kind::InvalidArgument,
                     "Tag must not be empty");
  std::lock_guard lock(mutex_);
  FunctionRecord &f = require_locked(function_id);
  if (contains(f.tags, tag))
    return;
  f.tags.push_back(tag);
  persist_locked();
}

// ---------------------------------------------------------------------------
// Tests
// ---------------------------------------------------------------------------

std::string InMemoryFunctionStore::add_test(const std::string &function_id,
                                            const std::string &name,
                                            const std::string &description,
                                            const std::string &code) {
  std::lock_guard lock(mutex_);
  FunctionRecord &f = require_locked(function_id);
  UnitTest test;
  test.id = make_id_locked("test");
  test.function_id = function_id;
  test.name = name;
  test.description = description;
  test.code = code;
  f.tests.push_back(test);
  LOG_INFO("STORE", function_id, "Added test {} ({})", test.id, name);
  persist_locked();
  return test.id;
}

void InMemoryFunctionStore::clear_results(
    const std::vector<std::string> &function_ids) {
  std::lock_guard lock(mutex_);
  results_.erase(std::remove_if(results_.begin(), results_.end(),
                                [&function_ids](const TestResult &r) {
                                  return contains(function_ids,
                                                  r.function_id);
                                }),
                 results_.end());
  persist_locked();
}

void InMemoryFunctionStore::record_result(const TestResult &result) {
  std::lock_guard lock(mutex_);
  results_.push_back(result);
  persist_locked();
}

std::vector<TestResult>
InMemoryFunctionStore::test_results(const std::string &function_id) const {
  std::lock_guard lock(mutex_);
  if (function_id.empty())
    return results_;
  std::vector<TestResult> out;
  for (const auto &r : results_) {
    if (r.function_id == function_id)
      out.push_back(r);
  }
  return out;
}

std::vector<CoverageEntry> InMemoryFunctionStore::coverage_report() const {
  std::lock_guard lock(mutex_);
  std::vector<CoverageEntry> report;
  for (const auto &[id, f] : functions_) {
    CoverageEntry entry;
    entry.function_id = id;
    entry.name = f.name;
    entry.test_count = f.tests.size();
    for (const auto &t : f.tests) {
      // Latest result per test wins.
      auto last = std::find_if(
          results_.rbegin(), results_.rend(),
          [&t](const TestResult &r) { return r.test_id == t.id; });
      if (last == results_.rend())
        continue;
      if (last->status == TestStatus::Passed)
        entry.passed++;
      else if (last->status == TestStatus::Failed)
        entry.failed++;
    }
    report.push_back(entry);
  }
  return report;
}

// ---------------------------------------------------------------------------
// Dependencies
// ---------------------------------------------------------------------------

bool InMemoryFunctionStore::reachable_locked(const std::string &from,
                                             const std::string &to) const {
  std::vector<std::string> pending{from};
  std::set<std::string> seen;
  while (!pending.empty()) {
    std::string current = pending.back();
    pending.pop_back();
    if (current == to)
      return true;
    if (!seen.insert(current).second)
      continue;
    auto it = functions_.find(current);
    if (it == functions_.end())
      continue;
    for (const auto &dep : it->second.dependencies)
      pending.push_back(dep);
  }
  return false;
}

void InMemoryFunctionStore::add_dependency(const std::string &function_id,
                                           const std::string &depends_on_id) {
  std::lock_guard lock(mutex_);
  FunctionRecord &f = require_locked(function_id);
  require_locked(depends_on_id);

  if (contains(f.dependencies, depends_on_id))
    return;
  if (reachable_locked(depends_on_id, function_id)) {
    throw StoreError(StoreError::Kind::DependencyCycle,
                     "Adding this dependency would create a circular "
                     "dependency between '" +
                         function_id + "' and '" + depends_on_id + "'");
  }
  f.dependencies.push_back(depends_on_id);
  persist_locked();
}

void InMemoryFunctionStore::remove_dependency(
    const std::string &function_id, const std::string &depends_on_id) {
  std::lock_guard lock(mutex_);
  FunctionRecord &f = require_locked(function_id);
  auto it = std::find(f.dependencies.begin(), f.dependencies.end(),
                      depends_on_id);
  if (it == f.dependencies.end()) {
    throw StoreError(StoreError::Kind::InvalidArgument,
                     "Function '" + function_id + "' does not depend on '" +
                         depends_on_id + "'");
  }
  f.dependencies.erase(it);
  persist_locked();
}

std::vector<std::string>
InMemoryFunctionStore::list_dependencies(const std::string &function_id) const {
  std::lock_guard lock(mutex_);
  return require_locked(function_id).dependencies;
}

std::vector<std::vector<std::string>>
InMemoryFunctionStore::find_cycles() const {
  std::lock_guard lock(mutex_);
  return find_cycles_locked();
}

std::vector<std::vector<std::string>>
InMemoryFunctionStore::find_cycles_locked() const {
  std::set<std::string> visited;
  std::set<std::string> on_stack;
  std::vector<std::string> stack;
  std::set<std::vector<std::string>> seen;
  std::vector<std::vector<std::string>> cycles;

  std::function<void(const std::string &)> dfs = [&](const std::string &node) {
    visited.insert(node);
    on_stack.insert(node);
    stack.push_back(node);

    auto it = functions_.find(node);
    if (it != functions_.end()) {
      for (const auto &next : it->second.dependencies) {
        if (!visited.count(next)) {
          dfs(next);
        } else if (on_stack.count(next)) {
          auto start = std::find(stack.begin(), stack.end(), next);
          std::vector<std::string> cycle(start, stack.end());
          // Rotate so the smallest id leads, then dedupe.
          std::rotate(cycle.begin(),
                      std::min_element(cycle.begin(), cycle.end()),
                      cycle.end());
          if (seen.insert(cycle).second)
            cycles.push_back(cycle);
        }
      }
    }

    stack.pop_back();
    on_stack.erase(node);
  };

  for (const auto &[id, f] : functions_) {
    if (!visited.count(id))
      dfs(id);
  }
  return cycles;
}

RecursionReport
InMemoryFunctionStore::detect_recursion(const std::string &id) const {
  std::lock_guard lock(mutex_);
  const FunctionRecord &f = require_locked(id);

  RecursionReport report;
  report.function_id = id;
  report.direct = calls_itself(f.name, f.code);
  for (auto &cycle : find_cycles_locked()) {
    if (contains(cycle, id))
      report.cycles.push_back(std::move(cycle));
  }
  report.mutual = !report.cycles.empty();
  return report;
}

} // namespace store
} // namespace autocode
