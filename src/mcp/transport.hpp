#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kennel::mcp {

using json = nlohmann::json;

class ServerConfig;

// Error code used for failures produced by the transport itself rather than
// reported by the provider (disconnects, HTTP errors, write failures)
constexpr int kTransportErrorCode = -32000;

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
  int error_code() const;

  static JsonRpcResponse from_json(const json &j);
  static JsonRpcResponse transport_error(int64_t id, const std::string &message);
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

  // Send a JSON-RPC request; the future resolves with the matching response
  // or with a transport error
  virtual std::future<JsonRpcResponse> send_request(const JsonRpcRequest &request) = 0;

  // Forget a pending request. Its future is abandoned.
  virtual void cancel_request(int64_t id) = 0;

  // Send a notification (no response expected)
  virtual void send_notification(const JsonRpcNotification &notification) = 0;

  // Set handler for incoming notifications from server
  using NotificationHandler = std::function<void(const std::string &method, const json &params)>;
  virtual void set_notification_handler(NotificationHandler handler) = 0;

  // Side-channel diagnostic output (stderr lines of a local server)
  using DiagnosticsHandler = std::function<void(const std::string &line)>;
  virtual void set_diagnostics_handler(DiagnosticsHandler handler) {
    (void)handler;
  }

  // Lifecycle. disconnect() asks the provider to exit and forces it after grace.
  virtual std::future<bool> connect() = 0;
  virtual void disconnect(std::chrono::milliseconds grace) = 0;

  // State
  virtual TransportState state() const = 0;
  virtual bool is_connected() const {
    return state() == TransportState::Connected;
  }

  // Reason of the most recent connect failure, empty if none
  virtual std::string last_error() const {
    return "";
  }
};

using TransportFactory = std::function<std::unique_ptr<Transport>(const ServerConfig &config)>;

// Creates the transport matching the config's transport variant
std::unique_ptr<Transport> make_transport(const ServerConfig &config);

// Requests awaiting a response, keyed by JSON-RPC id
class PendingRequests {
 public:
  std::future<JsonRpcResponse> add(int64_t id);

  // Returns false when no request with this id is pending
  bool resolve(JsonRpcResponse response);

  void fail(int64_t id, const std::string &message);
  void fail_all(const std::string &message);
  void cancel(int64_t id);

  bool contains(int64_t id) const;
  size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<int64_t, std::promise<JsonRpcResponse>> pending_;
};

// Stdio transport: communicates with a local MCP server via stdin/stdout,
// draining its stderr into the diagnostics handler
class StdioTransport : public Transport {
 public:
  StdioTransport(std::string command, std::vector<std::string> args, std::map<std::string, std::string> env = {}, std::string cwd = "");
  ~StdioTransport() override;

  std::future<JsonRpcResponse> send_request(const JsonRpcRequest &request) override;
  void cancel_request(int64_t id) override;
  void send_notification(const JsonRpcNotification &notification) override;
  void set_notification_handler(NotificationHandler handler) override;
  void set_diagnostics_handler(DiagnosticsHandler handler) override;

  std::future<bool> connect() override;
  void disconnect(std::chrono::milliseconds grace) override;
  TransportState state() const override;
  std::string last_error() const override;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

// Streamable HTTP transport: every message is POSTed; replies arrive as a
// JSON body or as an event stream on the POST response
class HttpTransport : public Transport {
 public:
  HttpTransport(std::string url, std::map<std::string, std::string> headers = {});
  ~HttpTransport() override;

  std::future<JsonRpcResponse> send_request(const JsonRpcRequest &request) override;
  void cancel_request(int64_t id) override;
  void send_notification(const JsonRpcNotification &notification) override;
  void set_notification_handler(NotificationHandler handler) override;

  std::future<bool> connect() override;
  void disconnect(std::chrono::milliseconds grace) override;
  TransportState state() const override;
  std::string last_error() const override;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

// SSE transport: a long-lived GET event stream carries responses, requests
// are POSTed to the endpoint announced on that stream
class SseTransport : public Transport {
 public:
  SseTransport(std::string url, std::map<std::string, std::string> headers = {});
  ~SseTransport() override;

  std::future<JsonRpcResponse> send_request(const JsonRpcRequest &request) override;
  void cancel_request(int64_t id) override;
  void send_notification(const JsonRpcNotification &notification) override;
  void set_notification_handler(NotificationHandler handler) override;

  std::future<bool> connect() override;
  void disconnect(std::chrono::milliseconds grace) override;
  TransportState state() const override;
  std::string last_error() const override;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace kennel::mcp
