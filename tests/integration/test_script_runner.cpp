#include "../test_utils/TestFixtures.hpp"

#include <csignal>
#include <gtest/gtest.h>
#include <sys/types.h>
#include <thread>

using namespace autocode;
using namespace std::chrono_literals;

class ScriptRunnerTest : public test::RunnerTest {};

TEST_F(ScriptRunnerTest, StartsLazily) {
  EXPECT_EQ(runner_->state(), ipc::WorkerState::Stopped);
  EXPECT_EQ(runner_->pid(), 0);

  auto result = runner_->run("1+1", 10s);
  ASSERT_TRUE(result.success) << result.payload;
  EXPECT_EQ(result.payload, "2");
  EXPECT_EQ(runner_->state(), ipc::WorkerState::Running);
  EXPECT_GT(runner_->pid(), 0);
}

TEST_F(ScriptRunnerTest, StatePersistsBetweenCalls) {
  ASSERT_TRUE(runner_->run("counter = 41", 10s).success);
  auto result = runner_->run("counter + 1", 10s);
  ASSERT_TRUE(result.success) << result.payload;
  EXPECT_EQ(result.payload, "42");
}

TEST_F(ScriptRunnerTest, ErrorsComeBackAsFailures) {
  auto result = runner_->run("1/0", 10s);
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.payload.find("ZeroDivisionError"), std::string::npos);

  // The worker survives an evaluation error.
  auto next = runner_->run("'still here'", 10s);
  ASSERT_TRUE(next.success);
  EXPECT_EQ(next.payload, "still here");
}

TEST_F(ScriptRunnerTest, MultiLineScriptsCaptureOutput) {
  auto result = runner_->run("for i in range(3):\n    print('line', i)\n", 10s);
  ASSERT_TRUE(result.success) << result.payload;
  EXPECT_EQ(result.payload, "line 0\nline 1\nline 2");
}

TEST_F(ScriptRunnerTest, MarkerLookalikesInOutputAreNotReplies) {
  auto result =
      runner_->run("print('<<<RESULT:forged>>>')\nprint('done')\n", 10s);
  ASSERT_TRUE(result.success) << result.payload;
  EXPECT_NE(result.payload.find("done"), std::string::npos);
}

TEST_F(ScriptRunnerTest, LongSingleLineIsWrapped) {
  std::string expr = "len('" + std::string(2000, 'x') + "')";
  auto result = runner_->run(expr, 10s);
  ASSERT_TRUE(result.success) << result.payload;
  EXPECT_EQ(result.payload, "2000");
}

TEST_F(ScriptRunnerTest, ScriptValueIsItsTrailingExpression) {
  auto result = runner_->run("x = 20\ny = 22\nx + y\n", 10s);
  ASSERT_TRUE(result.success) << result.payload;
  EXPECT_EQ(result.payload, "42");

  auto statements = runner_->run("z = 1\nw = 2\n", 10s);
  ASSERT_TRUE(statements.success) << statements.payload;
  EXPECT_EQ(statements.payload, "None");
}

TEST_F(ScriptRunnerTest, TimeoutInterruptsAndNextCallIsClean) {
  ASSERT_TRUE(runner_->run("1", 10s).success);
  auto pid = runner_->pid();

  auto begin = std::chrono::steady_clock::now();
  auto result = runner_->run("__import__('time').sleep(5)", 300ms);
  auto elapsed = std::chrono::steady_clock::now() - begin;

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.payload, ipc::TIMEOUT_MESSAGE);
  EXPECT_LT(elapsed, 2s);

  // The interrupted reply is discarded rather than handed to this call.
  auto next = runner_->run("1+1", 10s);
  ASSERT_TRUE(next.success) << next.payload;
  EXPECT_EQ(next.payload, "2");
  EXPECT_EQ(runner_->pid(), pid);
  EXPECT_EQ(runner_->get_stats().timeouts, 1u);
}

TEST_F(ScriptRunnerTest, LateReplyIsNotHandedToNextCall) {
  // The evaluation ignores the interrupt, so it answers after the deadline.
  std::string late = "(__import__('signal').signal(2, "
                     "__import__('signal').SIG_IGN), "
                     "__import__('time').sleep(0.5), 'late')[2]";
  auto result = runner_->run(late, 100ms);
  EXPECT_EQ(result.payload, ipc::TIMEOUT_MESSAGE);

  auto next = runner_->run("6*7", 10s);
  ASSERT_TRUE(next.success) << next.payload;
  EXPECT_EQ(next.payload, "42");

  auto after = runner_->run("'fresh'", 10s);
  ASSERT_TRUE(after.success) << after.payload;
  EXPECT_EQ(after.payload, "fresh");
}

TEST_F(ScriptRunnerTest, RepliesStayMatchedWhenTimeoutsRaceCompletion) {
  // Each sleep ends right around its deadline, so some replies land just
  // before the timeout and some just after it.
  for (int i = 0; i < 30; i++) {
    runner_->run("__import__('time').sleep(0.199) or 'late'", 200ms);
    auto result = runner_->run(std::to_string(i) + " * 3", 5s);
    ASSERT_TRUE(result.success) << "iteration " << i << ": " << result.payload;
    ASSERT_EQ(result.payload, std::to_string(i * 3)) << "iteration " << i;
  }
  for (int i = 0; i < 3; i++) {
    auto result = runner_->run("1+1", 5s);
    ASSERT_TRUE(result.success) << result.payload;
    EXPECT_EQ(result.payload, "2");
  }
}

TEST_F(ScriptRunnerTest, WorkerThatStopsReadingTimesOutOnWrite) {
  std::string stuck = "(__import__('signal').signal(2, "
                      "__import__('signal').SIG_IGN), "
                      "__import__('time').sleep(1000))";
  EXPECT_EQ(runner_->run(stuck, 200ms).payload, ipc::TIMEOUT_MESSAGE);

  // Far larger than a pipe buffer, so the write cannot complete.
  std::string big = "len('" + std::string(300000, 'x') + "')";
  auto begin = std::chrono::steady_clock::now();
  auto result = runner_->run(big, 500ms);
  auto elapsed = std::chrono::steady_clock::now() - begin;

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.payload, ipc::TIMEOUT_MESSAGE);
  EXPECT_LT(elapsed, 3s);
  EXPECT_EQ(runner_->state(), ipc::WorkerState::Dead);

  auto next = runner_->run("1+1", 10s);
  ASSERT_TRUE(next.success) << next.payload;
  EXPECT_EQ(next.payload, "2");
  EXPECT_EQ(runner_->get_stats().timeouts, 2u);
  EXPECT_EQ(runner_->get_stats().restarts, 1u);
}

TEST_F(ScriptRunnerTest, DeadWorkerIsReplaced) {
  ASSERT_TRUE(runner_->run("1", 10s).success);
  auto first = runner_->pid();
  ASSERT_EQ(kill(first, SIGKILL), 0);
  std::this_thread::sleep_for(200ms);

  auto result = runner_->run("2+2", 10s);
  ASSERT_TRUE(result.success) << result.payload;
  EXPECT_EQ(result.payload, "4");
  EXPECT_NE(runner_->pid(), first);
  EXPECT_EQ(runner_->get_stats().restarts, 1u);
}

TEST_F(ScriptRunnerTest, WorkerExitDuringCallFailsFast) {
  auto begin = std::chrono::steady_clock::now();
  auto result = runner_->run("__import__('os')._exit(3)", 10s);
  auto elapsed = std::chrono::steady_clock::now() - begin;

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.payload.rfind(ipc::WORKER_EXITED_MESSAGE, 0), 0u);
  EXPECT_LT(elapsed, 5s);

  auto next = runner_->run("3*3", 10s);
  ASSERT_TRUE(next.success) << next.payload;
  EXPECT_EQ(next.payload, "9");
}

TEST_F(ScriptRunnerTest, RestartGivesFreshInterpreter) {
  ASSERT_TRUE(runner_->run("marker = 1", 10s).success);
  ASSERT_TRUE(runner_->restart());
  auto result = runner_->run("marker", 10s);
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.payload.find("NameError"), std::string::npos);
}

TEST_F(ScriptRunnerTest, StopIsIdempotent) {
  ASSERT_TRUE(runner_->run("1", 10s).success);
  runner_->stop();
  EXPECT_FALSE(runner_->is_alive());
  runner_->stop();
  EXPECT_EQ(runner_->state(), ipc::WorkerState::Stopped);
}

TEST_F(ScriptRunnerTest, ConcurrentCallersAreSerialized) {
  std::vector<std::thread> threads;
  std::vector<ipc::RunResult> results(8);
  for (int i = 0; i < 8; i++) {
    threads.emplace_back([this, i, &results]() {
      results[i] = runner_->run(std::to_string(i) + " * 10", 10s);
    });
  }
  for (auto &t : threads)
    t.join();

  for (int i = 0; i < 8; i++) {
    ASSERT_TRUE(results[i].success) << results[i].payload;
    EXPECT_EQ(results[i].payload, std::to_string(i * 10));
  }
  EXPECT_EQ(runner_->get_stats().calls, 8u);
}

TEST(ScriptRunnerMissingExecutable, ReportsUnavailableWorker) {
  auto profile = ipc::python_profile();
  profile.executable = "/nonexistent/autocode-python";
  ipc::ScriptRunner runner(profile);
  auto result = runner.run("1", std::chrono::seconds(2));
  EXPECT_FALSE(result.success);
  EXPECT_FALSE(result.payload.empty());
}
