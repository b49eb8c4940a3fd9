#include "autocode/errors.hpp"
#include "autocode/types.hpp"

#include <algorithm>

using json = nlohmann::json;

namespace autocode {

std::string to_string(StoreError::Kind kind) {
  switch (kind) {
  case StoreError::Kind::FunctionNotFound:
    return "FunctionNotFound";
  case StoreError::Kind::TestNotFound:
    return "TestNotFound";
  case StoreError::Kind::DependencyCycle:
    return "DependencyCycle";
  case StoreError::Kind::InvalidArgument:
    return "InvalidArgument";
  case StoreError::Kind::Persistence:
    return "PersistenceError";
  }
  return "UnknownError";
}

std::string to_string(TestStatus status) {
  switch (status) {
  case TestStatus::Pending:
    return "pending";
  case TestStatus::Passed:
    return "passed";
  case TestStatus::Failed:
    return "failed";
  }
  return "unknown";
}

std::string to_string(LintSeverity severity) {
  switch (severity) {
  case LintSeverity::Info:
    return "info";
  case LintSeverity::Warning:
    return "warning";
  case LintSeverity::Error:
    return "error";
  }
  return "unknown";
}

bool LintResult::has_errors() const {
  return std::any_of(issues.begin(), issues.end(), [](const LintIssue &i) {
    return i.severity == LintSeverity::Error;
  });
}

bool LintResult::has_warnings() const {
  return std::any_of(issues.begin(), issues.end(), [](const LintIssue &i) {
    return i.severity == LintSeverity::Warning;
  });
}

json structured_success(const json &result, const json &meta) {
  json out = json::object();
  out["ok"] = true;
  out["result"] = result;
  if (meta.is_object()) {
    for (auto &[key, val] : meta.items()) {
      out[key] = val;
    }
  }
  return out;
}

json structured_error(const std::string &kind, const std::string &message,
                      const std::string &suggested_action,
                      const json &details) {
  json error = {{"type", kind}, {"message", message}};
  if (!suggested_action.empty())
    error["suggested_action"] = suggested_action;
  if (!details.is_null())
    error["details"] = details;
  return {{"ok", false}, {"error", error}};
}

json structured_error(const ToolError &err) {
  return structured_error(err.kind(), err.what(), err.suggested_action(),
                          err.details());
}

} // namespace autocode
