#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "mcp/server_config.hpp"
#include "mcp/server_state.hpp"
#include "mcp/transport.hpp"

namespace kennel {
class Bus;
}

namespace kennel::mcp {

using json = nlohmann::json;

// MCP server capabilities (returned during initialize)
struct ServerCapabilities {
  bool supports_tools = false;
  bool supports_resources = false;
  bool supports_prompts = false;
  bool supports_logging = false;
};

// Identity reported by the server during initialize
struct ServerInfo {
  std::string protocol_version;
  std::string name;
  std::string version;
};

// MCP tool definition (from tools/list)
struct McpToolInfo {
  std::string name;
  std::string description;
  json input_schema;  // JSON Schema
};

// Result of tools/call. isError is a tool-level failure, not a provider failure.
struct ToolCallResult {
  json content = json::array();
  bool is_error = false;
  json raw = json::object();

  // Text items joined by newlines, or the raw result when there are none
  std::string text() const;

  static ToolCallResult from_json(const json &result);
};

struct ManagedServerStatus {
  std::string id;
  std::string name;
  TransportType transport = TransportType::Stdio;
  ServerState state = ServerState::Stopped;
  bool enabled = true;
  bool quarantined = false;
  std::optional<ServerInfo> server_info;
  size_t diagnostic_lines = 0;
  std::string last_error;

  json to_json() const;
};

// Owns the connection to one tool-provider and drives its lifecycle:
//   Stopped -> Starting -> Running | Error, {Running, Error} -> Stopping -> Stopped
// start/stop/quarantine are serialized per instance; calls run concurrently.
class ManagedServer {
 public:
  using StateListener = std::function<void(ServerState old_state, ServerState new_state)>;

  static constexpr size_t kMaxDiagnosticLines = 1000;

  explicit ManagedServer(ServerConfig config, TransportFactory factory = make_transport, Bus *bus = nullptr);
  ~ManagedServer();

  ManagedServer(const ManagedServer &) = delete;
  ManagedServer &operator=(const ManagedServer &) = delete;

  // Connect and complete the initialize handshake within timeout. Returns
  // false (state Error) on failure; a quarantined server is never started.
  bool start(std::chrono::milliseconds timeout);

  // Graceful shutdown, forced once timeout is spent. Idempotent.
  bool stop(std::chrono::milliseconds timeout);

  // Throws ServerUnavailableError unless Running, TimeoutError,
  // ConnectionError, ProtocolError or FatalServerError on failure
  ToolCallResult call_tool(const std::string &name, const json &arguments, std::chrono::milliseconds timeout);
  std::vector<McpToolInfo> list_tools(std::chrono::milliseconds timeout);

  // Stops the server if needed and parks it in Quarantined
  void quarantine(std::chrono::milliseconds timeout);
  // Quarantined -> Stopped
  void release_quarantine();

  const ServerConfig &config() const {
    return config_;
  }
  const std::string &id() const {
    return config_.id();
  }

  bool is_enabled() const {
    return enabled_;
  }
  void enable() {
    enabled_ = true;
  }
  void disable() {
    enabled_ = false;
  }

  bool is_quarantined() const {
    return state() == ServerState::Quarantined;
  }

  ServerState state() const;
  ManagedServerStatus status() const;
  std::optional<ServerInfo> server_info() const;
  ServerCapabilities capabilities() const;
  std::string last_error() const;

  std::vector<std::string> get_captured_diagnostics() const;
  void clear_diagnostics();

  // Called once per transition, in transition order, after the lifecycle
  // lock is released. The listener may call back into this server.
  void set_state_listener(StateListener listener);

 private:
  // Requires state_mutex_
  void transition_locked(ServerState to);
  void transition(ServerState to);
  void notify_transitions();
  bool start_locked(std::chrono::milliseconds timeout);
  void stop_locked(std::chrono::milliseconds timeout);
  void fail_start(const std::shared_ptr<Transport> &transport, const std::string &reason);

  // Returns an error description, empty on success
  std::string initialize(Transport &transport, std::chrono::steady_clock::time_point deadline);

  JsonRpcResponse request(const std::shared_ptr<Transport> &transport, const std::string &method, json params,
                          std::chrono::milliseconds timeout);
  std::shared_ptr<Transport> running_transport();
  [[noreturn]] void raise_for_response(const JsonRpcResponse &response, const std::shared_ptr<Transport> &transport);
  void mark_transport_lost(const std::shared_ptr<Transport> &transport);

  void on_notification(const std::string &method, const json &params);
  void append_diagnostic(std::string line);

  ServerConfig config_;
  TransportFactory factory_;
  Bus *bus_ = nullptr;

  std::atomic<bool> enabled_;
  std::atomic<int64_t> next_request_id_{1};

  std::mutex lifecycle_mutex_;

  mutable std::mutex state_mutex_;
  ServerState state_ = ServerState::Stopped;
  std::shared_ptr<Transport> transport_;
  std::optional<ServerInfo> server_info_;
  ServerCapabilities capabilities_;
  std::string last_error_;

  std::mutex listener_mutex_;
  StateListener state_listener_;
  std::deque<std::pair<ServerState, ServerState>> pending_transitions_;
  bool notifying_ = false;

  mutable std::mutex diagnostics_mutex_;
  std::deque<std::string> diagnostics_;
};

}  // namespace kennel::mcp
