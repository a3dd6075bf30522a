#pragma once

#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "mcp/config.hpp"

namespace stepagent::mcp {

// JSON-RPC 2.0 message types
struct JsonRpcRequest {
  std::string method;
  json params = json::object();
  int64_t id = 0;

  json to_json() const;
};

struct JsonRpcResponse {
  int64_t id = 0;
  std::optional<json> result;
  std::optional<json> error;

  bool ok() const {
    return !error.has_value();
  }

  std::string error_message() const;

  static JsonRpcResponse from_json(const json &j);
  static JsonRpcResponse failure(int64_t id, const std::string &message, int code = -32000);
};

struct JsonRpcNotification {
  std::string method;
  json params = json::object();

  json to_json() const;
};

// Transport state
enum class TransportState { Disconnected, Connecting, Connected, Failed };

std::string to_string(TransportState state);

// Abstract transport interface for MCP communication
class Transport {
 public:
  virtual ~Transport() = default;

  // Send a JSON-RPC request; the future resolves with the response or a
  // transport error response
  virtual std::future<JsonRpcResponse> send_request(const JsonRpcRequest &request) = 0;

  // Abandon a request the caller stopped waiting for
  virtual void cancel_request(int64_t id) = 0;

  // Send a notification (no response expected)
  virtual void send_notification(const JsonRpcNotification &notification) = 0;

  // Set handler for incoming notifications from server
  using NotificationHandler = std::function<void(const std::string &method, const json &params)>;
  virtual void set_notification_handler(NotificationHandler handler) = 0;

  // Lifecycle. disconnect() is idempotent and unblocks a pending connect().
  virtual std::future<bool> connect() = 0;
  virtual void disconnect() = 0;

  // State
  virtual TransportState state() const = 0;
  virtual bool is_connected() const {
    return state() == TransportState::Connected;
  }
};

// Local subprocess speaking newline-delimited JSON-RPC over stdin/stdout
class StdioTransport : public Transport {
 public:
  explicit StdioTransport(StdioTransportSpec spec);
  ~StdioTransport() override;

  std::future<JsonRpcResponse> send_request(const JsonRpcRequest &request) override;
  void cancel_request(int64_t id) override;
  void send_notification(const JsonRpcNotification &notification) override;
  void set_notification_handler(NotificationHandler handler) override;

  std::future<bool> connect() override;
  void disconnect() override;
  TransportState state() const override;

  // Child pid while connected, -1 otherwise
  int pid() const;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

// Legacy HTTP+SSE: a GET event stream delivers the POST endpoint and every response
class SseTransport : public Transport {
 public:
  SseTransport(UrlTransportSpec spec, double connect_timeout, double sse_read_timeout);
  ~SseTransport() override;

  std::future<JsonRpcResponse> send_request(const JsonRpcRequest &request) override;
  void cancel_request(int64_t id) override;
  void send_notification(const JsonRpcNotification &notification) override;
  void set_notification_handler(NotificationHandler handler) override;

  std::future<bool> connect() override;
  void disconnect() override;
  TransportState state() const override;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

// Streamable HTTP: each message is a POST answered by JSON or an SSE stream
class StreamableHttpTransport : public Transport {
 public:
  StreamableHttpTransport(UrlTransportSpec spec, double connect_timeout, double sse_read_timeout);
  ~StreamableHttpTransport() override;

  std::future<JsonRpcResponse> send_request(const JsonRpcRequest &request) override;
  void cancel_request(int64_t id) override;
  void send_notification(const JsonRpcNotification &notification) override;
  void set_notification_handler(NotificationHandler handler) override;

  std::future<bool> connect() override;
  void disconnect() override;
  TransportState state() const override;

  // Mcp-Session-Id assigned by the server, empty until one is received
  std::string session_id() const;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

// Builds the transport for a server entry, resolving its timeouts now
std::unique_ptr<Transport> make_transport(const McpServerConfig &config);

}  // namespace stepagent::mcp
