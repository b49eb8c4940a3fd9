#pragma once
#include "autocode/types.hpp"

#include <chrono>
#include <nlohmann/json.hpp>
#include <string>

namespace autocode {

/// UTC `YYYY-MM-DDTHH:MM:SSZ`.
std::string format_time(std::chrono::system_clock::time_point tp);

/// Inverse of format_time; throws std::invalid_argument on bad input.
std::chrono::system_clock::time_point parse_time(const std::string &text);

// nlohmann::json ADL hooks for the record types.
void to_json(nlohmann::json &j, const UnitTest &t);
void from_json(const nlohmann::json &j, UnitTest &t);
void to_json(nlohmann::json &j, const TestResult &r);
void from_json(const nlohmann::json &j, TestResult &r);
void to_json(nlohmann::json &j, const Modification &m);
void from_json(const nlohmann::json &j, Modification &m);
void to_json(nlohmann::json &j, const FunctionRecord &f);
void from_json(const nlohmann::json &j, FunctionRecord &f);
void to_json(nlohmann::json &j, const RecursionReport &r);
void to_json(nlohmann::json &j, const CoverageEntry &c);
void to_json(nlohmann::json &j, const LintIssue &i);
void to_json(nlohmann::json &j, const LintResult &r);

/// Short listing form: {id, name, description, modules, tags}.
nlohmann::json summary_json(const FunctionRecord &f);

TestStatus test_status_from_string(const std::string &text);

} // namespace autocode
