#include "autocode/errors.hpp"
#include "autocode/store/Serialization.hpp"

#include <gtest/gtest.h>

using namespace autocode;
using json = nlohmann::json;

TEST(Serialization, TimestampsAreUtcSeconds) {
  auto tp = std::chrono::system_clock::from_time_t(1700000000);
  EXPECT_EQ(format_time(tp), "2023-11-14T22:13:20Z");
  EXPECT_EQ(parse_time("2023-11-14T22:13:20Z"), tp);
  EXPECT_THROW(parse_time("yesterday"), std::invalid_argument);
}

TEST(Serialization, TestResultUsesLowercaseStatus) {
  TestResult r{"test-1", "fn-1", TestStatus::Failed, "boom",
               std::chrono::system_clock::from_time_t(0)};
  json j = r;
  EXPECT_EQ(j["status"], "failed");
  EXPECT_EQ(j["executed_at"], "1970-01-01T00:00:00Z");
  EXPECT_EQ(j.get<TestResult>().status, TestStatus::Failed);
}

TEST(Serialization, FunctionRecordToleratesMissingOptionalFields) {
  json j = {{"id", "fn-1"}, {"name", "f"}};
  auto f = j.get<FunctionRecord>();
  EXPECT_EQ(f.id, "fn-1");
  EXPECT_TRUE(f.code.empty());
  EXPECT_TRUE(f.tests.empty());

  EXPECT_THROW(json({{"name", "f"}}).get<FunctionRecord>(), json::exception);
}

TEST(Serialization, CoverageEntryReportsPercent) {
  CoverageEntry c{"fn-1", "f", 4, 3, 1};
  json j = c;
  EXPECT_EQ(j["id"], "fn-1");
  EXPECT_EQ(j["num_tests"], 4);
  EXPECT_DOUBLE_EQ(j["coverage_percent"].get<double>(), 75.0);

  json empty = CoverageEntry{"fn-2", "g", 0, 0, 0};
  EXPECT_DOUBLE_EQ(empty["coverage_percent"].get<double>(), 0.0);
}

TEST(Serialization, LintResultOmitsAbsentFix) {
  LintResult r;
  r.issues.push_back({"js_regex_syntax", "msg", 2, 4, LintSeverity::Warning,
                      false, std::nullopt});
  json j = r;
  EXPECT_TRUE(j["success"].get<bool>());
  EXPECT_FALSE(j.contains("fixed_code"));
  EXPECT_EQ(j["issues"][0]["severity"], "warning");
  EXPECT_FALSE(j["issues"][0].contains("fix_suggestion"));
}

TEST(StructuredResults, SuccessMergesMeta) {
  json out = structured_success(json{{"x", 1}}, {{"count", 3}});
  EXPECT_TRUE(out["ok"].get<bool>());
  EXPECT_EQ(out["result"]["x"], 1);
  EXPECT_EQ(out["count"], 3);
}

TEST(StructuredResults, ErrorCarriesKindAndSuggestion) {
  ToolError err("FunctionNotFound", "Function fn-x not found", "Check the ID",
                {{"function_id", "fn-x"}});
  json out = structured_error(err);
  EXPECT_FALSE(out["ok"].get<bool>());
  EXPECT_EQ(out["error"]["type"], "FunctionNotFound");
  EXPECT_EQ(out["error"]["message"], "Function fn-x not found");
  EXPECT_EQ(out["error"]["suggested_action"], "Check the ID");
  EXPECT_EQ(out["error"]["details"]["function_id"], "fn-x");

  json bare = structured_error("ExecutionFailed", "oops");
  EXPECT_FALSE(bare["error"].contains("suggested_action"));
  EXPECT_FALSE(bare["error"].contains("details"));
}

TEST(StructuredResults, StoreErrorKindNames) {
  EXPECT_EQ(to_string(StoreError::Kind::DependencyCycle), "DependencyCycle");
  EXPECT_EQ(to_string(StoreError::Kind::Persistence), "PersistenceError");
}
