#include "../test_utils/TestFixtures.hpp"
#include "autocode/errors.hpp"
#include "autocode/server/StreamSessionManager.hpp"

#include <chrono>
#include <gtest/gtest.h>
#include <set>
#include <thread>

using namespace autocode;
using namespace autocode::server;
using json = nlohmann::json;

namespace {

class StreamTest : public test::RpcHarness {
protected:
  void SetUp() override {
    RpcHarness::SetUp();

    // Emits chunks until cancelled (or `limit` chunks, then completes).
    Tool ticker;
    ticker.name = "ticker";
    ticker.input_schema = make_schema({{"limit", "integer"}});
    ticker.stream_handler = [](const json &args, StreamContext &ctx) {
      int limit = args.value("limit", 1000);
      for (int i = 0; i < limit; i++) {
        if (ctx.cancel_requested()) {
          ctx.cancelled({{"completed", i}});
          return;
        }
        ctx.chunk({{"index", i}, {"text", std::string(64, 'x')}});
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
      }
      ctx.complete({{"total", limit}});
    };
    registry_.add(ticker);

    Tool forgetful;
    forgetful.name = "forgetful";
    forgetful.stream_handler = [](const json &, StreamContext &ctx) {
      ctx.chunk({{"n", 1}});
    };
    registry_.add(forgetful);

    Tool thrower;
    thrower.name = "thrower";
    thrower.stream_handler = [](const json &, StreamContext &) {
      throw ToolError("ExecutionFailed", "worker said no");
    };
    registry_.add(thrower);

    Tool sync_only;
    sync_only.name = "sync_only";
    sync_only.handler = [](const json &) { return json::object(); };
    registry_.add(sync_only);
  }

  void wait_idle() {
    ASSERT_TRUE(server().sessions().wait_idle(std::chrono::seconds(10)));
  }

  static size_t count_events(const std::vector<json> &events,
                             const std::string &name) {
    size_t n = 0;
    for (const auto &e : events) {
      if (e["event"] == name)
        n++;
    }
    return n;
  }
};

} // namespace

TEST_F(StreamTest, AckThenChunksThenComplete) {
  auto ack = send(test::tool_call("s1", "ticker", {{"limit", 3}}, true));
  ASSERT_TRUE(ack);
  EXPECT_TRUE((*ack)["result"]["streaming"].get<bool>());
  EXPECT_EQ((*ack)["result"]["callId"], "s1");
  wait_idle();

  auto events = stream_events("s1");
  ASSERT_EQ(events.size(), 4u);
  EXPECT_EQ(count_events(events, "chunk"), 3u);
  EXPECT_EQ(events.back()["event"], "complete");
  EXPECT_EQ(events.back()["data"]["total"], 3);
  EXPECT_FALSE(server().sessions().is_active("s1"));

  // The acknowledgement precedes every notification of the call.
  auto messages = output_messages();
  EXPECT_EQ(messages.front()["id"], "s1");
}

TEST_F(StreamTest, CancelYieldsExactlyOneCancelledEvent) {
  send(test::tool_call(10, "ticker", json::object(), true));
  std::this_thread::sleep_for(std::chrono::milliseconds(30));

  auto cancel = send({{"jsonrpc", "2.0"},
                      {"id", 11},
                      {"method", "tools/cancel"},
                      {"params", {{"callId", 10}}}});
  ASSERT_TRUE(cancel);
  EXPECT_TRUE((*cancel)["result"]["cancelled"].get<bool>());
  wait_idle();

  auto events = stream_events(10);
  EXPECT_EQ(count_events(events, "cancelled"), 1u);
  EXPECT_EQ(count_events(events, "complete"), 0u);
  EXPECT_EQ(events.back()["event"], "cancelled");
  EXPECT_FALSE(server().sessions().is_active(10));
}

TEST_F(StreamTest, CancelUnknownCallReportsNotFound) {
  auto cancel = send({{"jsonrpc", "2.0"},
                      {"id", 1},
                      {"method", "tools/cancel"},
                      {"params", {{"callId", "ghost"}}}});
  ASSERT_TRUE(cancel);
  EXPECT_FALSE((*cancel)["result"]["cancelled"].get<bool>());
  EXPECT_EQ((*cancel)["result"]["reason"], "not_found");
}

TEST_F(StreamTest, HandlerWithoutTerminalEventGetsError) {
  send(test::tool_call("f", "forgetful", json::object(), true));
  wait_idle();
  auto events = stream_events("f");
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[1]["event"], "error");
  EXPECT_EQ(events[1]["data"]["error"],
            "stream ended without a terminal event");
}

TEST_F(StreamTest, ToolErrorBecomesErrorEvent) {
  send(test::tool_call("t", "thrower", json::object(), true));
  wait_idle();
  auto events = stream_events("t");
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0]["event"], "error");
  EXPECT_EQ(events[0]["data"]["type"], "ExecutionFailed");
}

TEST_F(StreamTest, StreamingUnsupportedToolIsInvalidParams) {
  auto response = send(test::tool_call(1, "sync_only", json::object(), true));
  ASSERT_TRUE(response);
  EXPECT_EQ((*response)["error"]["code"], INVALID_PARAMS);
}

TEST_F(StreamTest, StreamOnlyToolRejectsSyncCall) {
  auto response = send(test::tool_call(1, "ticker", json::object()));
  ASSERT_TRUE(response);
  EXPECT_EQ((*response)["error"]["code"], INVALID_PARAMS);
}

TEST_F(StreamTest, DuplicateActiveCallIdIsRejected) {
  send(test::tool_call("dup", "ticker", json::object(), true));
  auto second = send(test::tool_call("dup", "ticker", json::object(), true));
  ASSERT_TRUE(second);
  EXPECT_EQ((*second)["error"]["code"], INVALID_PARAMS);
  server().sessions().cancel("dup");
  wait_idle();
}

TEST_F(StreamTest, ConcurrentStreamsKeepLinesIntact) {
  send(test::tool_call("A", "ticker", {{"limit", 40}}, true));
  send(test::tool_call("B", "ticker", {{"limit", 40}}, true));
  wait_idle();

  std::set<json> ids;
  for (const auto &msg : output_messages()) {
    if (msg.value("method", "") == "tools/stream")
      ids.insert(msg["params"]["callId"]);
  }
  EXPECT_EQ(ids, (std::set<json>{"A", "B"}));
  EXPECT_EQ(stream_events("A").size(), 41u);
  EXPECT_EQ(stream_events("B").size(), 41u);
}

TEST_F(StreamTest, AuditHoldsRequestsAndStreamEvents) {
  const int n = 3, m = 5;
  for (int i = 0; i < n; i++)
    send({{"jsonrpc", "2.0"}, {"id", i}, {"method", "ping"}});
  send(test::tool_call("s", "ticker", {{"limit", m}}, true));
  wait_idle();

  auto lines = test::read_lines(temp_->file("audit.log"));
  EXPECT_GE(lines.size(), static_cast<size_t>(n + m));
  size_t stream_events_logged = 0;
  for (const auto &line : lines) {
    if (json::parse(line)["event"] == "stream_event")
      stream_events_logged++;
  }
  EXPECT_EQ(stream_events_logged, static_cast<size_t>(m + 1));
}

TEST(StreamContext, EventsAfterTerminalAreDropped) {
  std::vector<std::string> seen;
  StreamContext ctx(1, std::make_shared<std::atomic<bool>>(false),
                    [&seen](const std::string &event, const json &) {
                      seen.push_back(event);
                    });
  EXPECT_TRUE(ctx.chunk({{"a", 1}}));
  EXPECT_TRUE(ctx.complete(json::object()));
  EXPECT_FALSE(ctx.chunk({{"a", 2}}));
  EXPECT_FALSE(ctx.cancelled(json::object()));
  EXPECT_TRUE(ctx.finished());
  EXPECT_EQ(seen, (std::vector<std::string>{"chunk", "complete"}));
}

TEST(StreamContext, ErrorMessageAndPayloadForms) {
  std::vector<json> seen;
  auto sink = [&seen](const std::string &, const json &data) {
    seen.push_back(data);
  };

  StreamContext text(1, std::make_shared<std::atomic<bool>>(false), sink);
  EXPECT_TRUE(text.error(std::string("worker went away")));
  StreamContext payload(2, std::make_shared<std::atomic<bool>>(false), sink);
  EXPECT_TRUE(payload.error(json{{"error", "boom"}, {"type", "Timeout"}}));

  ASSERT_EQ(seen.size(), 2u);
  EXPECT_EQ(seen[0], (json{{"error", "worker went away"}}));
  EXPECT_EQ(seen[1]["type"], "Timeout");
}
