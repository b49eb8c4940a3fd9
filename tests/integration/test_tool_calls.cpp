#include "../test_utils/TestFixtures.hpp"
#include "autocode/ipc/RuntimeProfile.hpp"
#include "autocode/lint/Linter.hpp"
#include "autocode/server/ToolHandlers.hpp"
#include "autocode/store/InMemoryFunctionStore.hpp"

#include <gtest/gtest.h>

using namespace autocode;
using namespace autocode::server;
using json = nlohmann::json;

namespace {

// End-to-end tool calls against a live Python worker.
class ToolCallTest : public test::RpcHarness {
protected:
  void SetUp() override {
    RpcHarness::SetUp();
    if (!test::python_available())
      GTEST_SKIP() << "python3 not found on PATH";

    ipc::RunnerOptions options;
    options.stop_grace = std::chrono::milliseconds(500);
    runner_ = std::make_unique<ipc::ScriptRunner>(ipc::python_profile(),
                                                  options);
    RuntimeConfig runtime;
    runtime.profile = "python";
    runtime.test_timeout_ms = 20000;
    register_builtin_tools(registry_, ToolContext{*runner_, store_, linter_,
                                                  nullptr, runtime});
  }

  void TearDown() override {
    RpcHarness::TearDown();
    if (runner_)
      runner_->stop();
  }

  json call(const std::string &tool, const json &args) {
    auto response = send(test::tool_call(next_id_++, tool, args));
    EXPECT_TRUE(response.has_value());
    if (!response || !response->contains("result"))
      return json();
    return (*response)["result"]["content"][0]["json"];
  }

  std::string add_double(const std::string &module = "math") {
    std::string id = store_.add_function(
        "double", "Doubles a number", "def double(x: int):\n    return 2 * x\n",
        {module}, {});
    store_.add_test(id, "double_two", "2 doubles to 4",
                    "assert double(2) == 4");
    return id;
  }

  std::unique_ptr<ipc::ScriptRunner> runner_;
  store::InMemoryFunctionStore store_;
  lint::JuliaLinter linter_;
  int next_id_{1};
};

} // namespace

TEST_F(ToolCallTest, EvalReturnsWorkerOutput) {
  json out = call("eval", {{"expression", "sum(range(10))"}});
  ASSERT_TRUE(out["ok"].get<bool>()) << out.dump();
  EXPECT_EQ(out["result"]["output"], "45");
}

TEST_F(ToolCallTest, EvalErrorIsExecutionFailed) {
  json out = call("eval", {{"expression", "undefined_name"}});
  EXPECT_FALSE(out["ok"].get<bool>());
  EXPECT_EQ(out["error"]["type"], "ExecutionFailed");
  EXPECT_NE(out["error"]["message"].get<std::string>().find("NameError"),
            std::string::npos);
}

TEST_F(ToolCallTest, EvalTimeout) {
  json out = call("eval", {{"expression", "__import__('time').sleep(5)"},
                           {"timeout_ms", 300}});
  EXPECT_EQ(out["error"]["type"], "ExecutionTimeout");

  json next = call("eval", {{"expression", "6*7"}});
  EXPECT_EQ(next["result"]["output"], "42");
}

TEST_F(ToolCallTest, RunTestsRecordsPassAndFail) {
  std::string id = add_double();
  store_.add_test(id, "double_wrong", "expects the wrong value",
                  "assert double(2) == 5");

  json out = call("run_tests", {{"function_id", id}});
  ASSERT_TRUE(out["ok"].get<bool>()) << out.dump();
  ASSERT_EQ(out["test_count"], 2);

  auto results = out["result"]["results"];
  EXPECT_EQ(results[0]["status"], "passed");
  EXPECT_EQ(results[1]["status"], "failed");
  EXPECT_NE(results[1]["output"].get<std::string>().find("AssertionError"),
            std::string::npos);

  json coverage = call("coverage_report", json::object());
  EXPECT_EQ(coverage["result"][0]["passed"], 1);
  EXPECT_EQ(coverage["result"][0]["failed"], 1);
}

TEST_F(ToolCallTest, StreamingRunTestsEmitsOneChunkPerTest) {
  add_double("a");
  add_double("b");

  auto ack = send(test::tool_call("rt", "run_tests", json::object(), true));
  ASSERT_TRUE(ack);
  EXPECT_TRUE((*ack)["result"]["streaming"].get<bool>());
  ASSERT_TRUE(server().sessions().wait_idle(std::chrono::seconds(30)));

  auto events = stream_events("rt");
  ASSERT_EQ(events.size(), 3u);
  EXPECT_EQ(events[0]["event"], "chunk");
  EXPECT_EQ(events[0]["data"]["index"], 1);
  EXPECT_EQ(events[1]["data"]["total"], 2);
  EXPECT_DOUBLE_EQ(events[1]["data"]["progress"].get<double>(), 1.0);
  EXPECT_EQ(events[2]["event"], "complete");
  EXPECT_EQ(events[2]["data"]["results"].size(), 2u);
}

TEST_F(ToolCallTest, CancelStopsStreamingRunTests) {
  for (int i = 0; i < 5; i++) {
    std::string id = store_.add_function(
        "slow" + std::to_string(i), "sleeps",
        "def slow():\n    __import__('time').sleep(0.3)\n", {}, {});
    store_.add_test(id, "t", "sleeps", "slow()");
  }

  send(test::tool_call("slow", "run_tests", json::object(), true));
  send({{"jsonrpc", "2.0"},
        {"id", "c1"},
        {"method", "tools/cancel"},
        {"params", {{"callId", "slow"}}}});
  ASSERT_TRUE(server().sessions().wait_idle(std::chrono::seconds(30)));

  auto events = stream_events("slow");
  ASSERT_FALSE(events.empty());
  EXPECT_EQ(events.back()["event"], "cancelled");
  EXPECT_LT(events.back()["data"]["completed"].get<int>(), 5);
  int terminals = 0;
  for (const auto &e : events) {
    if (e["event"] != "chunk")
      terminals++;
  }
  EXPECT_EQ(terminals, 1);
}

TEST_F(ToolCallTest, PropertyTestCountsTrials) {
  std::string id = store_.add_function(
      "half", "Halves non-negative numbers",
      "def half(x: int):\n    return None if x < 0 else x / 2\n", {}, {});

  json out = call("property_test",
                  {{"function_id", id}, {"num_tests", 20}, {"seed", 3}});
  ASSERT_TRUE(out["ok"].get<bool>()) << out.dump();
  EXPECT_EQ(out["result"]["total"], 20);
  int passes = out["result"]["passes"].get<int>();
  int fails = out["result"]["fails"].get<int>();
  EXPECT_EQ(passes + fails, 20);
  EXPECT_GT(passes, 0);
  EXPECT_GT(fails, 0);
}

TEST_F(ToolCallTest, PropertyTestSyntaxErrorIsClassified) {
  std::string id = store_.add_function("broken", "does not parse",
                                       "def broken(x):\n    return (x\n", {},
                                       {});
  json out = call("property_test", {{"function_id", id}, {"num_tests", 2}});
  EXPECT_FALSE(out["ok"].get<bool>());
  EXPECT_EQ(out["error"]["type"], "syntax_error");
}

TEST_F(ToolCallTest, StreamingPropertyTest) {
  std::string id = store_.add_function(
      "inc", "adds one", "def inc(x: int):\n    return x + 1\n", {}, {});
  send(test::tool_call("pt", "property_test",
                       {{"function_id", id}, {"num_tests", 5}}, true));
  ASSERT_TRUE(server().sessions().wait_idle(std::chrono::seconds(30)));

  auto events = stream_events("pt");
  ASSERT_EQ(events.size(), 6u);
  for (size_t i = 0; i < 5; i++) {
    EXPECT_EQ(events[i]["event"], "chunk");
    EXPECT_EQ(events[i]["data"]["status"], "pass");
  }
  EXPECT_EQ(events[5]["event"], "complete");
  EXPECT_EQ(events[5]["data"]["passes"], 5);
}

TEST_F(ToolCallTest, BenchmarkTimesEachIteration) {
  std::string id = add_double();
  json out = call("benchmark_function", {{"function_id", id},
                                         {"input_code", "print(double(21))"},
                                         {"iterations", 3}});
  ASSERT_TRUE(out["ok"].get<bool>()) << out.dump();
  EXPECT_EQ(out["run_count"], 3);

  auto runs = out["result"]["runs"];
  ASSERT_EQ(runs.size(), 3u);
  for (const auto &run : runs) {
    EXPECT_EQ(run["output"], "42");
    EXPECT_GE(run["seconds"].get<double>(), 0.0);
  }
  auto stats = out["result"]["stats"];
  EXPECT_LE(stats["min_seconds"].get<double>(),
            stats["mean_seconds"].get<double>());
  EXPECT_LE(stats["mean_seconds"].get<double>(),
            stats["max_seconds"].get<double>());
}

TEST_F(ToolCallTest, BenchmarkInputErrorIsExecutionFailed) {
  std::string id = add_double();
  json out = call("benchmark_function",
                  {{"function_id", id}, {"input_code", "double(1) / 0"}});
  EXPECT_FALSE(out["ok"].get<bool>());
  EXPECT_EQ(out["error"]["type"], "ExecutionFailed");
  EXPECT_NE(out["error"]["message"].get<std::string>().find(
                "ZeroDivisionError"),
            std::string::npos);
}

TEST_F(ToolCallTest, WorkerStatusAndRestart) {
  call("eval", {{"expression", "1"}});
  json status = call("worker_status", json::object());
  EXPECT_EQ(status["result"]["state"], "running");
  EXPECT_TRUE(status["result"]["alive"].get<bool>());
  int pid = status["result"]["pid"].get<int>();

  json restarted = call("restart_worker", json::object());
  ASSERT_TRUE(restarted["ok"].get<bool>()) << restarted.dump();
  EXPECT_NE(restarted["result"]["pid"].get<int>(), pid);
}
