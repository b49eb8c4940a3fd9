#include "../test_utils/TestFixtures.hpp"
#include "autocode/errors.hpp"
#include "autocode/server/StreamSessionManager.hpp"

#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <streambuf>
#include <thread>

using namespace autocode;
using namespace autocode::server;
using json = nlohmann::json;

namespace {

class RpcServerTest : public test::RpcHarness {
protected:
  void SetUp() override {
    RpcHarness::SetUp();

    Tool add;
    add.name = "add_item";
    add.description = "Append an item";
    add.input_schema = make_schema({{"item", "string"}}, {"item"});
    add.handler = [this](const json &args) {
      items_.push_back(args["item"].get<std::string>());
      return structured_success({{"count", items_.size()}});
    };
    registry_.add(add);

    Tool fail;
    fail.name = "fail_domain";
    fail.handler = [](const json &) -> json {
      throw ToolError("FunctionNotFound", "Function fn-x not found",
                      "Check the ID");
    };
    registry_.add(fail);

    Tool crash;
    crash.name = "crash";
    crash.handler = [](const json &) -> json {
      throw std::runtime_error("kaboom");
    };
    registry_.add(crash);
  }

  std::vector<std::string> items_;
};

// Input that never ends: a blank line every few milliseconds.
class EndlessInput : public std::streambuf {
protected:
  int_type underflow() override {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    line_ = '\n';
    setg(&line_, &line_, &line_ + 1);
    return traits_type::to_int_type(line_);
  }

private:
  char line_{'\n'};
};

} // namespace

TEST_F(RpcServerTest, Initialize) {
  auto response = send({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"}});
  ASSERT_TRUE(response);
  EXPECT_EQ((*response)["jsonrpc"], "2.0");
  EXPECT_EQ((*response)["id"], 1);
  auto &result = (*response)["result"];
  EXPECT_EQ(result["protocolVersion"], PROTOCOL_VERSION);
  EXPECT_EQ(result["serverInfo"]["name"], "autocode-mcp");
  EXPECT_TRUE(result["capabilities"].contains("tools"));
}

TEST_F(RpcServerTest, ToolsListDescribesSchemas) {
  auto response = send({{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/list"}});
  ASSERT_TRUE(response);
  auto &tools = (*response)["result"]["tools"];
  ASSERT_EQ(tools.size(), 3u);
  bool found = false;
  for (const auto &t : tools) {
    if (t["name"] == "add_item") {
      found = true;
      EXPECT_EQ(t["inputSchema"]["required"], json::array({"item"}));
    }
  }
  EXPECT_TRUE(found);
}

TEST_F(RpcServerTest, ToolCallWrapsResultInContent) {
  auto response = send(test::tool_call(3, "add_item", {{"item", "a"}}));
  ASSERT_TRUE(response);
  auto &content = (*response)["result"]["content"];
  ASSERT_EQ(content.size(), 1u);
  EXPECT_EQ(content[0]["type"], "json");
  EXPECT_TRUE(content[0]["json"]["ok"].get<bool>());
  EXPECT_EQ(content[0]["json"]["result"]["count"], 1);
  EXPECT_FALSE((*response)["result"].contains("isError"));
}

TEST_F(RpcServerTest, MissingArgumentIsInvalidParamsWithoutSideEffects) {
  auto response = send(test::tool_call(4, "add_item", json::object()));
  ASSERT_TRUE(response);
  EXPECT_EQ((*response)["error"]["code"], INVALID_PARAMS);
  EXPECT_TRUE(items_.empty());
}

TEST_F(RpcServerTest, NonObjectArgumentsAreInvalidParams) {
  auto response = send(test::tool_call(5, "add_item", json::array({1})));
  ASSERT_TRUE(response);
  EXPECT_EQ((*response)["error"]["code"], INVALID_PARAMS);
}

TEST_F(RpcServerTest, UnknownMethodAndToolAreNotFound) {
  auto method = send({{"jsonrpc", "2.0"}, {"id", 6}, {"method", "nope"}});
  ASSERT_TRUE(method);
  EXPECT_EQ((*method)["error"]["code"], METHOD_NOT_FOUND);

  auto tool = send(test::tool_call(7, "no_such_tool", json::object()));
  ASSERT_TRUE(tool);
  EXPECT_EQ((*tool)["error"]["code"], METHOD_NOT_FOUND);
  EXPECT_TRUE(items_.empty());
}

TEST_F(RpcServerTest, ToolErrorBecomesStructuredResult) {
  auto response = send(test::tool_call(8, "fail_domain", json::object()));
  ASSERT_TRUE(response);
  ASSERT_TRUE(response->contains("result"));
  EXPECT_TRUE((*response)["result"]["isError"].get<bool>());
  auto &payload = (*response)["result"]["content"][0]["json"];
  EXPECT_FALSE(payload["ok"].get<bool>());
  EXPECT_EQ(payload["error"]["type"], "FunctionNotFound");
  EXPECT_EQ(payload["error"]["suggested_action"], "Check the ID");
}

TEST_F(RpcServerTest, UnexpectedExceptionIsServerError) {
  auto response = send(test::tool_call(9, "crash", json::object()));
  ASSERT_TRUE(response);
  EXPECT_EQ((*response)["error"]["code"], SERVER_ERROR);
  EXPECT_EQ((*response)["error"]["message"], "Tool 'crash' failed: kaboom");
}

TEST_F(RpcServerTest, ParseErrorHasNullId) {
  auto response = server().handle_line("{not json");
  ASSERT_TRUE(response);
  EXPECT_EQ((*response)["error"]["code"], PARSE_ERROR);
  EXPECT_TRUE((*response)["id"].is_null());
}

TEST_F(RpcServerTest, BlankLineIsIgnored) {
  EXPECT_FALSE(server().handle_line("   ").has_value());
}

TEST_F(RpcServerTest, NotificationsAreExecutedButNotAnswered) {
  json notification = test::tool_call(0, "add_item", {{"item", "quiet"}});
  notification.erase("id");
  EXPECT_FALSE(send(notification).has_value());
  EXPECT_EQ(items_, std::vector<std::string>{"quiet"});
}

TEST_F(RpcServerTest, BatchAnswersInOrderAsOneArray) {
  json batch = json::array({test::tool_call(1, "add_item", {{"item", "x"}}),
                            {{"jsonrpc", "2.0"}, {"method", "ping"}},
                            {{"jsonrpc", "2.0"}, {"id", 2}, {"method", "ping"}},
                            42});
  auto response = server().handle_line(batch.dump());
  ASSERT_TRUE(response);
  ASSERT_TRUE(response->is_array());
  ASSERT_EQ(response->size(), 3u);
  EXPECT_EQ((*response)[0]["id"], 1);
  EXPECT_EQ((*response)[1]["id"], 2);
  EXPECT_EQ((*response)[2]["error"]["code"], INVALID_REQUEST);
}

TEST_F(RpcServerTest, EmptyBatchIsInvalidRequest) {
  auto response = server().handle_line("[]");
  ASSERT_TRUE(response);
  EXPECT_EQ((*response)["error"]["code"], INVALID_REQUEST);
}

TEST_F(RpcServerTest, ShutdownStopsServeLoopAfterResponse) {
  std::istringstream in(
      json({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "shutdown"}}).dump() +
      "\n" +
      test::tool_call(2, "add_item", {{"item", "late"}}).dump() + "\n");
  server().serve(in);

  EXPECT_TRUE(server().shutdown_requested());
  EXPECT_TRUE(items_.empty());
  auto messages = output_messages();
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_EQ(messages[0]["id"], 1);
}

TEST_F(RpcServerTest, AuditLogRecordsEveryRequest) {
  const int n = 5;
  for (int i = 0; i < n; i++)
    send(test::tool_call(i, "add_item", {{"item", std::to_string(i)}}));

  auto lines = test::read_lines(temp_->file("audit.log"));
  int requests = 0, tool_calls = 0;
  for (const auto &line : lines) {
    json entry = json::parse(line);
    EXPECT_TRUE(entry.contains("ts"));
    EXPECT_TRUE(entry.contains("data"));
    if (entry["event"] == "request")
      requests++;
    if (entry["event"] == "tool_call")
      tool_calls++;
  }
  EXPECT_EQ(requests, n);
  EXPECT_EQ(tool_calls, n);
}

TEST_F(RpcServerTest, RequestStopEndsServeBeforeNextLine) {
  server().request_stop();
  std::istringstream in(
      test::tool_call(1, "add_item", {{"item", "late"}}).dump() + "\n");
  server().serve(in);

  EXPECT_TRUE(server().stop_requested());
  EXPECT_TRUE(items_.empty());
  EXPECT_TRUE(output_messages().empty());

  auto lines = test::read_lines(temp_->file("audit.log"));
  ASSERT_FALSE(lines.empty());
  json last = json::parse(lines.back());
  EXPECT_EQ(last["event"], "server_shutdown");
  EXPECT_EQ(last["data"]["reason"], "stop");
}

TEST_F(RpcServerTest, RequestStopFromAnotherThreadEndsServe) {
  EndlessInput source;
  std::istream in(&source);
  auto &rpc = server();

  std::atomic<bool> returned{false};
  std::thread serving([&]() {
    rpc.serve(in);
    returned = true;
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(returned.load());

  auto begin = std::chrono::steady_clock::now();
  rpc.request_stop();
  serving.join();
  EXPECT_TRUE(returned.load());
  EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(2));
}
