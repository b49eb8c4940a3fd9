#include "autocode/store/Serialization.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace autocode {

std::string format_time(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

std::chrono::system_clock::time_point parse_time(const std::string &text) {
  std::tm tm{};
  std::istringstream in(text);
  in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (in.fail())
    throw std::invalid_argument("invalid timestamp '" + text + "'");
  return std::chrono::system_clock::from_time_t(timegm(&tm));
}

TestStatus test_status_from_string(const std::string &text) {
  if (text == "passed")
    return TestStatus::Passed;
  if (text == "failed")
    return TestStatus::Failed;
  return TestStatus::Pending;
}

void to_json(json &j, const UnitTest &t) {
  j = {{"id", t.id},
       {"function_id", t.function_id},
       {"name", t.name},
       {"description", t.description},
       {"code", t.code}};
}

void from_json(const json &j, UnitTest &t) {
  j.at("id").get_to(t.id);
  t.function_id = j.value("function_id", "");
  t.name = j.value("name", "");
  t.description = j.value("description", "");
  t.code = j.value("code", "");
}

void to_json(json &j, const TestResult &r) {
  j = {{"test_id", r.test_id},
       {"function_id", r.function_id},
       {"status", to_string(r.status)},
       {"output", r.output},
       {"executed_at", format_time(r.executed_at)}};
}

void from_json(const json &j, TestResult &r) {
  j.at("test_id").get_to(r.test_id);
  r.function_id = j.value("function_id", "");
  r.status = test_status_from_string(j.value("status", "pending"));
  r.output = j.value("output", "");
  if (j.contains("executed_at"))
    r.executed_at = parse_time(j["executed_at"].get<std::string>());
}

void to_json(json &j, const Modification &m) {
  j = {{"modifier", m.modifier},
       {"description", m.description},
       {"modified_at", format_time(m.modified_at)}};
}

void from_json(const json &j, Modification &m) {
  m.modifier = j.value("modifier", "");
  m.description = j.value("description", "");
  if (j.contains("modified_at"))
    m.modified_at = parse_time(j["modified_at"].get<std::string>());
}

void to_json(json &j, const FunctionRecord &f) {
  j = {{"id", f.id},
       {"name", f.name},
       {"description", f.description},
       {"code", f.code},
       {"modules", f.modules},
       {"tags", f.tags},
       {"dependencies", f.dependencies},
       {"tests", f.tests},
       {"history", f.history},
       {"created_at", format_time(f.created_at)},
       {"modified_at", format_time(f.modified_at)}};
}

void from_json(const json &j, FunctionRecord &f) {
  j.at("id").get_to(f.id);
  j.at("name").get_to(f.name);
  f.description = j.value("description", "");
  f.code = j.value("code", "");
  f.modules = j.value("modules", std::vector<std::string>{});
  f.tags = j.value("tags", std::vector<std::string>{});
  f.dependencies = j.value("dependencies", std::vector<std::string>{});
  f.tests = j.value("tests", std::vector<UnitTest>{});
  f.history = j.value("history", std::vector<Modification>{});
  if (j.contains("created_at"))
    f.created_at = parse_time(j["created_at"].get<std::string>());
  if (j.contains("modified_at"))
    f.modified_at = parse_time(j["modified_at"].get<std::string>());
}

void to_json(json &j, const RecursionReport &r) {
  j = {{"function_id", r.function_id},
       {"direct", r.direct},
       {"mutual", r.mutual},
       {"mutual_cycles", r.cycles}};
}

void to_json(json &j, const CoverageEntry &c) {
  double percent = c.test_count == 0 ? 0.0
                                     : 100.0 * static_cast<double>(c.passed) /
                                           static_cast<double>(c.test_count);
  j = {{"id", c.function_id},
       {"name", c.name},
       {"num_tests", c.test_count},
       {"passed", c.passed},
       {"failed", c.failed},
       {"coverage_percent", percent}};
}

void to_json(json &j, const LintIssue &i) {
  j = {{"type", i.type},
       {"message", i.message},
       {"line", i.line},
       {"column", i.column},
       {"severity", to_string(i.severity)},
       {"can_fix", i.can_fix}};
  if (i.fix_suggestion)
    j["fix_suggestion"] = *i.fix_suggestion;
}

void to_json(json &j, const LintResult &r) {
  j = {{"success", r.success}, {"issues", r.issues}};
  if (r.fixed_code)
    j["fixed_code"] = *r.fixed_code;
}

json summary_json(const FunctionRecord &f) {
  return {{"id", f.id},
          {"name", f.name},
          {"description", f.description},
          {"modules", f.modules},
          {"tags", f.tags}};
}

} // namespace autocode
