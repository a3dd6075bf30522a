#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <fstream>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "mcp/client.hpp"
#include "mcp/config.hpp"
#include "mcp/registry.hpp"
#include "mcp/transport.hpp"
#include "test_server.hpp"

using namespace stepagent;
using namespace stepagent::mcp;
using test_support::Responder;
using test_support::TestHttpServer;
using test_support::TestRequest;

namespace fs = std::filesystem;

namespace {

const std::string kFakeServer = std::string(STEPAGENT_TEST_FIXTURES) + "/fake_mcp_server.sh";

json fake_stdio_entry() {
  return json{{"command", "/bin/sh"}, {"args", {kFakeServer}}};
}

McpServerConfig make_config(const std::string &name, const json &entry) {
  auto parsed = parse_server_config(name, entry);
  if (parsed.failed()) {
    throw std::runtime_error(*parsed.error);
  }
  return *parsed.value;
}

std::vector<std::string> tool_names(const std::vector<McpToolInfo> &tools) {
  std::vector<std::string> names;
  for (const auto &tool : tools) names.push_back(tool.name);
  return names;
}

// 获取一个无人监听的本地端口
std::string closed_port_url(const std::string &path) {
  TestHttpServer server([](const TestRequest &, Responder &res) {
    res.send(200, "text/plain", "");
  });
  auto url = server.url(path);
  server.stop();
  return url;
}

}  // namespace

// ============================================================
// JsonRpcTest — JSON-RPC 消息序列化
// ============================================================

TEST(JsonRpcTest, RequestSerialization) {
  JsonRpcRequest req;
  req.method = "initialize";
  req.id = 42;
  req.params = json{{"protocolVersion", "2024-11-05"}};

  auto j = req.to_json();

  EXPECT_EQ(j["jsonrpc"], "2.0");
  EXPECT_EQ(j["method"], "initialize");
  EXPECT_EQ(j["id"], 42);
  EXPECT_EQ(j["params"]["protocolVersion"], "2024-11-05");
}

TEST(JsonRpcTest, RequestSerializationEmptyParams) {
  JsonRpcRequest req;
  req.method = "tools/list";
  req.id = 1;

  auto j = req.to_json();

  // 空 params 不应被序列化
  EXPECT_FALSE(j.contains("params"));
}

TEST(JsonRpcTest, ResponseFromJson) {
  auto resp = JsonRpcResponse::from_json({{"jsonrpc", "2.0"}, {"id", 10}, {"result", {{"tools", json::array()}}}});

  EXPECT_EQ(resp.id, 10);
  EXPECT_TRUE(resp.ok());
  ASSERT_TRUE(resp.result.has_value());
  EXPECT_TRUE(resp.result->contains("tools"));
}

TEST(JsonRpcTest, StringIdIsAccepted) {
  auto resp = JsonRpcResponse::from_json({{"jsonrpc", "2.0"}, {"id", "7"}, {"result", json::object()}});
  EXPECT_EQ(resp.id, 7);
}

TEST(JsonRpcTest, ErrorMessage) {
  auto resp = JsonRpcResponse::from_json(
      {{"jsonrpc", "2.0"}, {"id", 3}, {"error", {{"code", -32601}, {"message", "Method not found"}}}});
  EXPECT_FALSE(resp.ok());
  EXPECT_EQ(resp.error_message(), "Method not found");

  auto no_message = JsonRpcResponse::from_json({{"id", 4}, {"error", {{"code", -1}}}});
  EXPECT_EQ(no_message.error_message(), R"({"code":-1})");

  auto null_error = JsonRpcResponse::from_json({{"id", 5}, {"result", 1}, {"error", nullptr}});
  EXPECT_TRUE(null_error.ok());
  EXPECT_EQ(null_error.error_message(), "");
}

TEST(JsonRpcTest, Failure) {
  auto resp = JsonRpcResponse::failure(9, "Transport disconnected");
  EXPECT_EQ(resp.id, 9);
  EXPECT_FALSE(resp.ok());
  EXPECT_EQ(resp.error_message(), "Transport disconnected");
  EXPECT_EQ((*resp.error)["code"], -32000);
}

TEST(JsonRpcTest, NotificationSerialization) {
  JsonRpcNotification notif;
  notif.method = "notifications/initialized";

  auto j = notif.to_json();
  EXPECT_EQ(j["method"], "notifications/initialized");
  EXPECT_FALSE(j.contains("id"));
  EXPECT_FALSE(j.contains("params"));
}

TEST(StateNamesTest, ToString) {
  EXPECT_EQ(to_string(TransportState::Connected), "Connected");
  EXPECT_EQ(to_string(TransportState::Failed), "Failed");
  EXPECT_EQ(to_string(ClientState::Disconnected), "Disconnected");
  EXPECT_EQ(to_string(ClientState::Connecting), "Connecting");
}

// ============================================================
// 传输类型推断与配置校验
// ============================================================

TEST(TransportKindTest, Inference) {
  EXPECT_EQ(infer_transport_kind({{"command", "npx"}}), TransportKind::Stdio);
  EXPECT_EQ(infer_transport_kind({{"url", "http://h/mcp"}}), TransportKind::StreamableHttp);
  EXPECT_EQ(infer_transport_kind({{"command", "npx"}, {"url", "http://h/mcp"}}), TransportKind::StreamableHttp);
  EXPECT_EQ(infer_transport_kind({{"type", "SSE"}, {"url", "http://h/sse"}}), TransportKind::Sse);
  EXPECT_EQ(infer_transport_kind({{"type", "http"}, {"url", "http://h/mcp"}}), TransportKind::Http);
  EXPECT_EQ(infer_transport_kind({{"type", "Streamable_HTTP"}, {"url", "http://h"}}), TransportKind::StreamableHttp);
  // 显式类型优先于字段推断
  EXPECT_EQ(infer_transport_kind({{"type", "stdio"}, {"url", "http://h"}, {"command", "x"}}), TransportKind::Stdio);
  EXPECT_EQ(infer_transport_kind(json::object()), TransportKind::Stdio);
}

TEST(TransportKindTest, Names) {
  EXPECT_EQ(to_string(TransportKind::StreamableHttp), "streamable_http");
  EXPECT_EQ(transport_kind_from_string("STDIO"), TransportKind::Stdio);
  EXPECT_FALSE(transport_kind_from_string("websocket").has_value());
  EXPECT_TRUE(is_url_kind(TransportKind::Http));
  EXPECT_FALSE(is_url_kind(TransportKind::Stdio));
}

TEST(ServerConfigTest, ParsesStdioEntry) {
  auto parsed = parse_server_config(
      "memory", {{"command", "npx"}, {"args", {"-y", "@modelcontextprotocol/server-memory"}}, {"env", {{"DEBUG", "1"}}}});

  ASSERT_TRUE(parsed.ok()) << parsed.error.value_or("");
  const auto &config = *parsed.value;
  EXPECT_EQ(config.name, "memory");
  EXPECT_EQ(config.kind(), TransportKind::Stdio);
  const auto &spec = std::get<StdioTransportSpec>(config.transport);
  EXPECT_EQ(spec.command, "npx");
  EXPECT_EQ(spec.args.size(), 2u);
  EXPECT_EQ(spec.env.at("DEBUG"), "1");
}

TEST(ServerConfigTest, ParsesUrlEntry) {
  auto parsed = parse_server_config(
      "remote", {{"type", "sse"}, {"url", "https://mcp.example.com/sse"}, {"headers", {{"Authorization", "Bearer t"}}}});

  ASSERT_TRUE(parsed.ok());
  const auto &spec = std::get<UrlTransportSpec>(parsed.value->transport);
  EXPECT_EQ(spec.kind, TransportKind::Sse);
  EXPECT_EQ(spec.url, "https://mcp.example.com/sse");
  EXPECT_EQ(spec.headers.at("Authorization"), "Bearer t");
}

TEST(ServerConfigTest, UnknownTypeFallsBackToInference) {
  // 无法识别的 type 不拒绝条目，按推断规则选择传输
  auto with_url = parse_server_config("s", {{"url", "https://x"}, {"type", "unknown"}});
  ASSERT_TRUE(with_url.ok()) << with_url.error.value_or("");
  EXPECT_EQ(with_url.value->kind(), TransportKind::StreamableHttp);
  EXPECT_EQ(std::get<UrlTransportSpec>(with_url.value->transport).url, "https://x");

  auto with_command = parse_server_config("s", {{"command", "npx"}, {"type", "carrier-pigeon"}});
  ASSERT_TRUE(with_command.ok()) << with_command.error.value_or("");
  EXPECT_EQ(with_command.value->kind(), TransportKind::Stdio);
}

TEST(ServerConfigTest, ValidationErrors) {
  auto error_of = [](const json &entry) {
    return parse_server_config("s", entry).error.value_or("");
  };

  EXPECT_NE(error_of({{"args", {"x"}}}).find("requires a non-empty command"), std::string::npos);
  EXPECT_NE(error_of({{"command", ""}}).find("requires a non-empty command"), std::string::npos);
  EXPECT_NE(error_of({{"type", "sse"}}).find("sse transport requires a non-empty url"), std::string::npos);
  EXPECT_NE(error_of({{"command", "x"}, {"args", {1, 2}}}).find("args must be an array of strings"), std::string::npos);
  EXPECT_NE(error_of({{"command", "x"}, {"env", {{"K", 1}}}}).find("env.K must be a string"), std::string::npos);
  EXPECT_NE(error_of({{"command", "x"}, {"disabled", "yes"}}).find("disabled must be a boolean"), std::string::npos);
  EXPECT_NE(error_of({{"command", "x"}, {"connect_timeout", -1}}).find("connect_timeout must be positive"),
            std::string::npos);
  EXPECT_NE(error_of({{"url", "http://h"}, {"execute_timeout", "slow"}}).find("execute_timeout must be a number"),
            std::string::npos);
  EXPECT_NE(error_of("not an object").find("entry must be an object"), std::string::npos);
}

// ============================================================
// 超时配置
// ============================================================

TEST(TimeoutConfigTest, DefaultsAndScopedOverride) {
  ScopedTimeoutConfig guard;
  set_timeout_config(McpTimeoutConfig{});

  auto defaults = get_timeout_config();
  EXPECT_DOUBLE_EQ(defaults.connect_timeout, 10.0);
  EXPECT_DOUBLE_EQ(defaults.execute_timeout, 60.0);
  EXPECT_DOUBLE_EQ(defaults.sse_read_timeout, 120.0);

  {
    ScopedTimeoutConfig inner(McpTimeoutConfig{1.0, 2.0, 3.0});
    EXPECT_DOUBLE_EQ(get_timeout_config().execute_timeout, 2.0);
  }
  EXPECT_DOUBLE_EQ(get_timeout_config().execute_timeout, 60.0);
}

TEST(TimeoutConfigTest, PartialUpdateAndValidation) {
  ScopedTimeoutConfig guard;

  set_timeout_config(5.0);
  EXPECT_DOUBLE_EQ(get_timeout_config().connect_timeout, 5.0);

  set_timeout_config(std::nullopt, 30.0);
  EXPECT_DOUBLE_EQ(get_timeout_config().connect_timeout, 5.0);
  EXPECT_DOUBLE_EQ(get_timeout_config().execute_timeout, 30.0);

  EXPECT_THROW(set_timeout_config(0.0), std::invalid_argument);
  EXPECT_THROW(set_timeout_config(std::nullopt, -2.0), std::invalid_argument);
  // 失败的更新不改变任何字段
  EXPECT_THROW(set_timeout_config(7.0, std::nullopt, -1.0), std::invalid_argument);
  EXPECT_DOUBLE_EQ(get_timeout_config().connect_timeout, 5.0);
}

TEST(TimeoutConfigTest, OverridePrecedence) {
  ScopedTimeoutConfig guard(McpTimeoutConfig{10.0, 60.0, 120.0});

  TimeoutOverrides file_defaults;
  file_defaults.execute_timeout = 45.0;

  auto config = make_config("s", {{"command", "x"}, {"connect_timeout", 3}});
  auto with_defaults = *parse_server_config("s", {{"command", "x"}, {"connect_timeout", 3}}, file_defaults).value;

  // 服务器级 > 文件级 > 进程级
  EXPECT_DOUBLE_EQ(config.connect_timeout(), 3.0);
  EXPECT_DOUBLE_EQ(config.execute_timeout(), 60.0);
  EXPECT_DOUBLE_EQ(with_defaults.execute_timeout(), 45.0);

  // 未覆盖的字段在调用时读取进程级默认值
  set_timeout_config(std::nullopt, std::nullopt, 99.0);
  EXPECT_DOUBLE_EQ(config.sse_read_timeout(), 99.0);
}

TEST(TimeoutConfigTest, ParseOverridesBlock) {
  auto parsed = parse_timeout_overrides({{"connect_timeout", 2.5}, {"sse_read_timeout", 30}});
  ASSERT_TRUE(parsed.ok());
  EXPECT_DOUBLE_EQ(parsed.value->connect_timeout.value_or(0), 2.5);
  EXPECT_FALSE(parsed.value->execute_timeout.has_value());

  EXPECT_TRUE(parse_timeout_overrides(json::array()).failed());
  EXPECT_TRUE(parse_timeout_overrides({{"execute_timeout", 0}}).failed());
}

// ============================================================
// 工具结果格式化
// ============================================================

TEST(FormatToolResultTest, JoinsTextAndLabelsOtherContent) {
  json result = {{"content",
                  {{{"type", "text"}, {"text", "line one"}},
                   {{"type", "image"}, {"data", "AAAA"}, {"mimeType", "image/png"}},
                   {{"type", "text"}, {"text", "line two"}}}}};

  auto formatted = format_tool_result(result);
  ASSERT_TRUE(formatted.success);
  EXPECT_EQ(formatted.content, "line one\n[image content]\nline two");
}

TEST(FormatToolResultTest, IsErrorBecomesFailure) {
  auto with_text = format_tool_result({{"content", {{{"type", "text"}, {"text", "bad path"}}}}, {"isError", true}});
  EXPECT_FALSE(with_text.success);
  EXPECT_EQ(with_text.error, "bad path");

  auto empty = format_tool_result({{"content", json::array()}, {"isError", true}});
  EXPECT_FALSE(empty.success);
  EXPECT_EQ(empty.error, "Tool reported an error");

  auto no_content = format_tool_result(json::object());
  EXPECT_TRUE(no_content.success);
  EXPECT_EQ(no_content.content, "");
}

// ============================================================
// McpConnection — stdio 假服务器
// ============================================================

class StdioConnectionTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(fs::exists(kFakeServer)) << kFakeServer;
  }
};

TEST_F(StdioConnectionTest, HandshakeListAndCall) {
  auto conn = std::make_shared<McpConnection>(make_config("fake", fake_stdio_entry()));

  ASSERT_TRUE(conn->connect());
  EXPECT_EQ(conn->state(), ClientState::Connected);
  EXPECT_TRUE(conn->capabilities().supports_tools);
  EXPECT_FALSE(conn->capabilities().supports_prompts);

  // 两页结果合并，缺少 name 的工具被跳过
  auto listed = conn->list_tools();
  ASSERT_TRUE(listed.ok()) << listed.error.value_or("");
  EXPECT_EQ(tool_names(*listed.value), (std::vector<std::string>{"echo", "fail", "slow", "quit"}));
  EXPECT_EQ((*listed.value)[0].input_schema["required"][0], "text");
  // 缺省的 inputSchema
  EXPECT_EQ((*listed.value)[2].input_schema, (json{{"type", "object"}, {"properties", json::object()}}));

  auto echoed = conn->execute("echo", {{"text", "hello"}});
  ASSERT_TRUE(echoed.success) << echoed.error;
  EXPECT_EQ(echoed.content, "echo: hello\n[image content]");

  auto failed = conn->execute("fail", json::object());
  EXPECT_FALSE(failed.success);
  EXPECT_EQ(failed.error, "disk full");

  auto unknown = conn->execute("missing", json::object());
  EXPECT_FALSE(unknown.success);
  EXPECT_EQ(unknown.error, "Unknown tool");

  conn->disconnect();
  EXPECT_EQ(conn->state(), ClientState::Disconnected);
  auto after = conn->execute("echo", {{"text", "x"}});
  EXPECT_FALSE(after.success);
  EXPECT_EQ(after.error, "MCP server 'fake' is not connected");

  // 重复断开无副作用
  conn->disconnect();
  EXPECT_EQ(conn->state(), ClientState::Disconnected);
}

TEST_F(StdioConnectionTest, ConcurrentCallsGetTheirOwnResults) {
  auto conn = std::make_shared<McpConnection>(make_config("fake", fake_stdio_entry()));
  ASSERT_TRUE(conn->connect());

  McpToolBridge bridge(conn, "fake", McpToolInfo{"echo", "Echo text", json::object()});

  std::vector<std::future<ToolResult>> futures;
  for (int i = 0; i < 8; ++i) {
    futures.push_back(bridge.execute({{"text", "msg" + std::to_string(i)}}));
  }
  for (int i = 0; i < 8; ++i) {
    auto result = futures[i].get();
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.content, "echo: msg" + std::to_string(i) + "\n[image content]");
  }
}

TEST_F(StdioConnectionTest, ExecuteTimeout) {
  auto entry = fake_stdio_entry();
  entry["execute_timeout"] = 1;
  auto conn = std::make_shared<McpConnection>(make_config("fake", entry));
  ASSERT_TRUE(conn->connect());

  auto start = std::chrono::steady_clock::now();
  auto result = conn->execute("slow", json::object());
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "Tool 'slow' timed out after 1 seconds");
  EXPECT_LT(elapsed, std::chrono::milliseconds(2500));

  auto begin_disconnect = std::chrono::steady_clock::now();
  conn->disconnect();
  EXPECT_LT(std::chrono::steady_clock::now() - begin_disconnect, std::chrono::seconds(3));
}

TEST_F(StdioConnectionTest, ServerExitFailsConnection) {
  auto conn = std::make_shared<McpConnection>(make_config("fake", fake_stdio_entry()));
  ASSERT_TRUE(conn->connect());

  auto result = conn->execute("quit", json::object());
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "MCP server process exited");
  EXPECT_EQ(conn->state(), ClientState::Failed);

  auto next = conn->execute("echo", {{"text", "x"}});
  EXPECT_FALSE(next.success);
}

TEST_F(StdioConnectionTest, MissingExecutableFailsToConnect) {
  McpConnection conn(make_config("ghost", {{"command", "/nonexistent/stepagent-mcp-server"}}));

  EXPECT_FALSE(conn.connect());
  EXPECT_EQ(conn.state(), ClientState::Failed);
  EXPECT_TRUE(conn.list_tools().failed());
}

TEST_F(StdioConnectionTest, BridgeOutlivingConnection) {
  std::shared_ptr<Tool> bridge;
  {
    auto conn = std::make_shared<McpConnection>(make_config("fake", fake_stdio_entry()));
    ASSERT_TRUE(conn->connect());
    bridge = std::make_shared<McpToolBridge>(conn, "fake", McpToolInfo{"echo", "", json::object()});
  }

  auto result = bridge->execute({{"text", "late"}}).get();
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "MCP server 'fake' is no longer available");
}

// ============================================================
// Streamable HTTP 假服务器
// ============================================================

class FakeStreamableServer {
 public:
  FakeStreamableServer()
      : server_([this](const TestRequest &req, Responder &res) {
          handle(req, res);
        }) {}

  std::string url() const {
    return server_.url("/mcp");
  }

  std::string session_seen() {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_seen_;
  }

  std::string session_deleted() {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_deleted_;
  }

  std::string auth_seen() {
    std::lock_guard<std::mutex> lock(mutex_);
    return auth_seen_;
  }

  int notifications() const {
    return notifications_.load();
  }

  // 同时处理中的 tools/call 请求数的峰值
  int max_calls_in_flight() const {
    return max_in_flight_.load();
  }

 private:
  void handle(const TestRequest &req, Responder &res) {
    if (req.method == "DELETE") {
      std::lock_guard<std::mutex> lock(mutex_);
      session_deleted_ = req.header("mcp-session-id");
      res.send(200, "", "");
      return;
    }

    auto msg = json::parse(req.body, nullptr, false);
    if (msg.is_discarded()) {
      res.send(400, "text/plain", "bad json");
      return;
    }
    if (!msg.contains("id")) {
      ++notifications_;
      res.send(202, "", "");
      return;
    }

    auto id = msg["id"];
    auto method = msg.value("method", "");
    if (method == "initialize") {
      json reply = {{"jsonrpc", "2.0"},
                    {"id", id},
                    {"result", {{"protocolVersion", "2024-11-05"}, {"capabilities", {{"tools", json::object()}}}}}};
      res.send(200, "application/json", reply.dump(), {{"Mcp-Session-Id", "sess-42"}});
      return;
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      session_seen_ = req.header("mcp-session-id");
      auth_seen_ = req.header("authorization");
    }

    if (method == "tools/list") {
      // 以事件流应答：先推送一条通知，再给出结果
      json notice = {{"jsonrpc", "2.0"}, {"method", "notifications/message"}, {"params", {{"level", "info"}}}};
      json reply = {{"jsonrpc", "2.0"},
                    {"id", id},
                    {"result", {{"tools", {{{"name", "lookup"}, {"description", "Look things up"}}}}}}};
      res.begin_stream("text/event-stream");
      res.write_raw("event: message\ndata: " + notice.dump() + "\n\n");
      res.write_raw("data: " + reply.dump() + "\n\n");
      return;
    }

    if (method == "tools/call") {
      auto name = msg["params"].value("name", "");
      if (name == "nap") {
        int now = ++in_flight_;
        int seen = max_in_flight_.load();
        while (now > seen && !max_in_flight_.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(400));
        --in_flight_;
      }
      json reply = {{"jsonrpc", "2.0"},
                    {"id", id},
                    {"result", {{"content", {{{"type", "text"}, {"text", "called " + name}}}}}}};
      res.send(200, "application/json", reply.dump());
      return;
    }

    json error = {{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", -32601}, {"message", "Method not found"}}}};
    res.send(200, "application/json", error.dump());
  }

  std::mutex mutex_;
  std::string session_seen_;
  std::string session_deleted_;
  std::string auth_seen_;
  std::atomic<int> notifications_{0};
  std::atomic<int> in_flight_{0};
  std::atomic<int> max_in_flight_{0};
  TestHttpServer server_;
};

TEST(StreamableHttpTest, JsonAndEventStreamResponses) {
  FakeStreamableServer server;
  auto conn = std::make_shared<McpConnection>(
      make_config("remote", {{"url", server.url()}, {"headers", {{"Authorization", "Bearer token"}}}}));

  ASSERT_TRUE(conn->connect());
  EXPECT_EQ(conn->config().kind(), TransportKind::StreamableHttp);
  EXPECT_EQ(server.notifications(), 1);

  auto listed = conn->list_tools();
  ASSERT_TRUE(listed.ok()) << listed.error.value_or("");
  EXPECT_EQ(tool_names(*listed.value), std::vector<std::string>{"lookup"});

  // 后续请求携带服务器分配的会话 ID 与自定义请求头
  EXPECT_EQ(server.session_seen(), "sess-42");
  EXPECT_EQ(server.auth_seen(), "Bearer token");

  auto result = conn->execute("lookup", {{"q", "x"}});
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.content, "called lookup");

  // 断开时以 DELETE 结束会话
  conn->disconnect();
  EXPECT_EQ(server.session_deleted(), "sess-42");
}

TEST(StreamableHttpTest, UnreachableServerFailsWithinTimeout) {
  auto url = closed_port_url("/mcp");
  McpConnection conn(make_config("down", {{"url", url}, {"connect_timeout", 2}}));

  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(conn.connect());
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(4));
  EXPECT_EQ(conn.state(), ClientState::Failed);
}

TEST(StreamableHttpTest, ConnectTimeoutOverrideBeatsGlobalDefault) {
  // 服务器接受连接但从不应答，只有 connect_timeout 能结束握手
  test_support::SilentHttpServer server;
  ScopedTimeoutConfig guard(McpTimeoutConfig{30.0, 60.0, 120.0});
  McpConnection conn(make_config("silent", {{"url", server.url("/mcp")}, {"connect_timeout", 1}}));

  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(conn.connect());
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_GE(elapsed, std::chrono::milliseconds(900));
  EXPECT_LT(elapsed, std::chrono::milliseconds(2500));
  EXPECT_EQ(conn.state(), ClientState::Failed);
  EXPECT_GE(server.request_count(), 1);
}

TEST(StreamableHttpTest, ConnectTimeoutFollowsGlobalDefault) {
  test_support::SilentHttpServer server;
  ScopedTimeoutConfig guard(McpTimeoutConfig{1.0, 60.0, 120.0});
  McpConnection conn(make_config("silent", {{"url", server.url("/mcp")}}));

  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(conn.connect());
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(2500));
  EXPECT_EQ(conn.state(), ClientState::Failed);
}

TEST(StreamableHttpTest, CallsOnOneConnectionAreSerialized) {
  FakeStreamableServer server;
  auto conn = std::make_shared<McpConnection>(make_config("remote", {{"url", server.url()}}));
  ASSERT_TRUE(conn->connect());

  auto start = std::chrono::steady_clock::now();
  auto first = std::async(std::launch::async, [&]() {
    return conn->execute("nap", json::object());
  });
  auto second = std::async(std::launch::async, [&]() {
    return conn->execute("nap", json::object());
  });
  EXPECT_TRUE(first.get().success);
  EXPECT_TRUE(second.get().success);

  EXPECT_EQ(server.max_calls_in_flight(), 1);
  EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(800));
}

TEST(StreamableHttpTest, SeparateConnectionsRunInParallel) {
  FakeStreamableServer server;
  auto a = std::make_shared<McpConnection>(make_config("a", {{"url", server.url()}}));
  auto b = std::make_shared<McpConnection>(make_config("b", {{"url", server.url()}}));
  ASSERT_TRUE(a->connect());
  ASSERT_TRUE(b->connect());

  auto start = std::chrono::steady_clock::now();
  auto first = std::async(std::launch::async, [&]() {
    return a->execute("nap", json::object());
  });
  auto second = std::async(std::launch::async, [&]() {
    return b->execute("nap", json::object());
  });
  EXPECT_TRUE(first.get().success);
  EXPECT_TRUE(second.get().success);

  EXPECT_EQ(server.max_calls_in_flight(), 2);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(800));
}

TEST(StreamableHttpTest, TransportReportsSessionId) {
  FakeStreamableServer server;
  UrlTransportSpec spec;
  spec.url = server.url();
  StreamableHttpTransport transport(spec, 5.0, 5.0);

  ASSERT_TRUE(transport.connect().get());
  EXPECT_EQ(transport.session_id(), "");

  JsonRpcRequest req;
  req.method = "initialize";
  req.id = 1;
  req.params = {{"protocolVersion", "2024-11-05"}};
  auto resp = transport.send_request(req).get();
  EXPECT_TRUE(resp.ok()) << resp.error_message();
  EXPECT_EQ(transport.session_id(), "sess-42");

  JsonRpcRequest unknown;
  unknown.method = "resources/list";
  unknown.id = 2;
  auto err = transport.send_request(unknown).get();
  EXPECT_EQ(err.error_message(), "Method not found");

  transport.disconnect();
  EXPECT_EQ(transport.state(), TransportState::Disconnected);
  EXPECT_EQ(transport.session_id(), "");

  auto after = transport.send_request(unknown).get();
  EXPECT_EQ(after.error_message(), "Transport not connected");
}

// ============================================================
// 旧版 HTTP+SSE 假服务器
// ============================================================

class FakeSseServer {
 public:
  FakeSseServer()
      : server_([this](const TestRequest &req, Responder &res) {
          handle(req, res);
        }) {}

  ~FakeSseServer() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stop_ = true;
    }
    cv_.notify_all();
    server_.stop();
  }

  std::string url() const {
    return server_.url("/sse");
  }

  std::string last_post_target() {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_post_target_;
  }

 private:
  void handle(const TestRequest &req, Responder &res) {
    if (req.method == "GET") {
      stream(res);
      return;
    }

    auto msg = json::parse(req.body, nullptr, false);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      last_post_target_ = req.target;
      if (!msg.is_discarded() && msg.contains("id")) {
        json result = json::object();
        auto method = msg.value("method", "");
        if (method == "initialize") {
          result = {{"protocolVersion", "2024-11-05"}, {"capabilities", {{"tools", json::object()}}}};
        } else if (method == "tools/list") {
          result = {{"tools", {{{"name", "ping"}, {"description", "Ping"}}}}};
        } else if (method == "tools/call") {
          result = {{"content", {{{"type", "text"}, {"text", "pong"}}}}};
        }
        queue_.push_back(json{{"jsonrpc", "2.0"}, {"id", msg["id"]}, {"result", result}}.dump());
      }
    }
    cv_.notify_all();
    res.send(202, "", "");
  }

  void stream(Responder &res) {
    res.begin_stream("text/event-stream");
    if (!res.write_raw(": connected\n\nevent: endpoint\ndata: /messages?sessionId=abc\n\n")) return;

    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_) {
      cv_.wait_for(lock, std::chrono::milliseconds(20), [this] {
        return stop_ || !queue_.empty();
      });
      while (!queue_.empty()) {
        auto data = std::move(queue_.front());
        queue_.pop_front();
        lock.unlock();
        bool written = res.write_raw("event: message\ndata: " + data + "\n\n");
        lock.lock();
        if (!written) return;
      }
    }
  }

  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::string> queue_;
  std::string last_post_target_;
  bool stop_ = false;
  TestHttpServer server_;
};

TEST(SseTransportTest, EndpointEventThenRequests) {
  FakeSseServer server;
  auto conn = std::make_shared<McpConnection>(make_config("legacy", {{"type", "sse"}, {"url", server.url()}}));

  ASSERT_TRUE(conn->connect());
  EXPECT_EQ(conn->config().kind(), TransportKind::Sse);

  auto listed = conn->list_tools();
  ASSERT_TRUE(listed.ok()) << listed.error.value_or("");
  EXPECT_EQ(tool_names(*listed.value), std::vector<std::string>{"ping"});

  // POST 发往 endpoint 事件给出的地址
  EXPECT_EQ(server.last_post_target(), "/messages?sessionId=abc");

  auto result = conn->execute("ping", json::object());
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.content, "pong");

  conn->disconnect();
  EXPECT_EQ(conn->state(), ClientState::Disconnected);
}

TEST(SseTransportTest, MissingEndpointFailsConnect) {
  TestHttpServer server([](const TestRequest &, Responder &res) {
    res.send(404, "text/plain", "not here");
  });
  McpConnection conn(make_config("legacy", {{"type", "sse"}, {"url", server.url("/sse")}, {"connect_timeout", 2}}));

  EXPECT_FALSE(conn.connect());
  EXPECT_EQ(conn.state(), ClientState::Failed);
}

// ============================================================
// ToolRegistry
// ============================================================

class ToolRegistryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir = fs::temp_directory_path() /
          ("stepagent_mcp_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    fs::create_directories(dir);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir, ec);
  }

  std::string write_config(const json &config) {
    auto path = dir / "mcp.json";
    std::ofstream out(path);
    out << config.dump(2);
    return path.string();
  }

  fs::path dir;
};

TEST_F(ToolRegistryTest, MissingOrInvalidFileYieldsNoTools) {
  ToolRegistry registry;
  EXPECT_TRUE(registry.load((dir / "absent.json").string()).empty());

  std::ofstream(dir / "broken.json") << "{ nope";
  EXPECT_TRUE(registry.load((dir / "broken.json").string()).empty());

  EXPECT_TRUE(registry.load_json({{"servers", json::object()}}).empty());
  EXPECT_EQ(registry.tool_count(), 0u);
}

TEST_F(ToolRegistryTest, SkipsDisabledInvalidAndUnreachable) {
  json config = {{"mcpServers",
                  {{"off", {{"command", "/bin/sh"}, {"args", {kFakeServer}}, {"disabled", true}}},
                   {"odd-type", {{"type", "carrier-pigeon"}, {"url", closed_port_url("/mcp")}, {"connect_timeout", 1}}},
                   {"no-command", {{"args", {"x"}}}},
                   {"ghost", {{"command", "/nonexistent/stepagent-mcp-server"}}},
                   {"down", {{"url", closed_port_url("/mcp")}, {"connect_timeout", 1}}}}}};

  ToolRegistry registry;
  auto start = std::chrono::steady_clock::now();
  auto tools = registry.load(write_config(config));

  EXPECT_TRUE(tools.empty());
  EXPECT_TRUE(registry.connection_names().empty());
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

TEST_F(ToolRegistryTest, LoadsToolsAndSkipsDuplicateNames) {
  auto entry = fake_stdio_entry();
  json config = {{"timeouts", {{"execute_timeout", 20}}},
                 {"mcpServers", {{"fake", entry}, {"fake2", entry}, {"off", {{"command", "x"}, {"disabled", true}}}}}};

  ToolRegistry registry;
  auto tools = registry.load(write_config(config));

  // 两个服务器提供同名工具：先出现者胜出
  ASSERT_EQ(tools.size(), 4u);
  EXPECT_EQ(registry.tool_count(), 4u);
  EXPECT_EQ(registry.connection_names(), (std::vector<std::string>{"fake", "fake2"}));
  for (const auto &tool : tools) {
    auto bridge = std::dynamic_pointer_cast<McpToolBridge>(tool);
    ASSERT_NE(bridge, nullptr);
    EXPECT_EQ(bridge->server_name(), "fake");
  }

  auto conn = registry.connection("fake");
  ASSERT_NE(conn, nullptr);
  EXPECT_DOUBLE_EQ(conn->config().execute_timeout(), 20.0);
  EXPECT_EQ(registry.connection("off"), nullptr);

  auto echo = find_tool(tools, "echo");
  ASSERT_NE(echo, nullptr);
  EXPECT_EQ(echo->parameters_schema()["properties"]["text"]["type"], "string");
  auto result = echo->execute({{"text", "via registry"}}).get();
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.content, "echo: via registry\n[image content]");

  // cleanup 可重复调用，之后代理工具报告服务器不可用
  registry.cleanup();
  registry.cleanup();
  EXPECT_EQ(registry.tool_count(), 0u);
  EXPECT_TRUE(registry.connection_names().empty());
  conn.reset();

  auto stale = echo->execute({{"text", "x"}}).get();
  EXPECT_FALSE(stale.success);
  EXPECT_EQ(stale.error, "MCP server 'fake' is no longer available");
}

TEST_F(ToolRegistryTest, ReloadReplacesPreviousConnections) {
  ToolRegistry registry;
  registry.load_json({{"mcpServers", {{"fake", fake_stdio_entry()}}}});
  ASSERT_EQ(registry.connection_names().size(), 1u);
  auto first = registry.connection("fake");

  registry.load_json({{"mcpServers", json::object()}});
  EXPECT_TRUE(registry.connection_names().empty());
  EXPECT_EQ(first->state(), ClientState::Disconnected);
}
