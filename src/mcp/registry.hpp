#pragma once

#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "bus/bus.hpp"
#include "core/types.hpp"
#include "mcp/error_isolator.hpp"
#include "mcp/managed_server.hpp"
#include "mcp/retry_manager.hpp"
#include "mcp/server_config.hpp"
#include "mcp/status_tracker.hpp"
#include "mcp/supervisor_settings.hpp"
#include "tool/concurrency_gate.hpp"

namespace kennel::mcp {

using json = nlohmann::json;

struct RegistryOptions {
  SupervisorSettings settings;
  TransportFactory transport_factory = make_transport;
  Bus *bus = nullptr;

  WallClock wall_clock = system_wall_clock();
  MonotonicClock monotonic_clock = system_monotonic_clock();
  Sleeper sleeper;  // retry backoff; real sleep when empty
};

// One row of Registry::list()
struct RegisteredServerInfo {
  std::string id;
  std::string name;
  TransportType transport = TransportType::Stdio;
  bool enabled = true;
  ServerState state = ServerState::Stopped;
  bool quarantined = false;
  CircuitState circuit = CircuitState::Closed;
  std::optional<std::chrono::milliseconds> uptime;
  std::string error_message;

  json to_json() const;
};

// Owns every ManagedServer by id and routes lifecycle and tool calls through
// the supervision pipeline:
//   ConcurrencyGate -> RetryManager -> ErrorIsolator -> ManagedServer
// Lifecycle operations on one id are serialized; different ids proceed in
// parallel. Expected failures (unknown id, quarantine, failed start) are
// reported as false, never thrown. ServerStateChanged is published after the
// per-id lock is released, so handlers may call back into the Registry.
// Transitions driven directly on a server returned by get() are published by
// the next Registry operation.
class Registry {
 public:
  explicit Registry(RegistryOptions options = {});
  ~Registry();

  Registry(const Registry &) = delete;
  Registry &operator=(const Registry &) = delete;

  // Throws ConfigurationError if the id or name is already taken
  std::string register_server(const ServerConfig &config);

  // Stops the server and forgets all of its state
  bool remove(const std::string &server_id);

  // Replaces the live instance with a fresh, stopped one built from the
  // current config. Quarantine survives a reload.
  bool reload(const std::string &server_id);

  // Replaces the config, then reloads. The config id must match server_id.
  bool update(const std::string &server_id, const ServerConfig &config);

  std::shared_ptr<ManagedServer> get(const std::string &server_id) const;
  std::shared_ptr<ManagedServer> get_by_name(const std::string &name) const;
  std::vector<RegisteredServerInfo> list() const;
  std::vector<std::string> server_ids() const;

  bool start(const std::string &server_id, std::optional<std::chrono::milliseconds> timeout = std::nullopt);
  bool stop(const std::string &server_id, std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  // Enabled servers only, in parallel
  std::map<std::string, bool> start_all();
  std::map<std::string, bool> stop_all();

  bool enable_server(const std::string &server_id);
  // Also stops the server if it is running
  bool disable_server(const std::string &server_id);

  bool clear_quarantine(const std::string &server_id);

  // Throws ServerNotFoundError for an unknown id and the McpError raised by
  // the pipeline otherwise. Default timeout is the server's configured one.
  ToolCallResult call_tool(const std::string &server_id, const std::string &tool_name, const json &arguments,
                           std::optional<std::chrono::milliseconds> timeout = std::nullopt);
  std::vector<McpToolInfo> list_tools(const std::string &server_id, std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  std::optional<ServerSummary> get_server_summary(const std::string &server_id) const;
  std::vector<Event> get_events(const std::string &server_id, size_t limit = 100) const;
  std::vector<std::string> get_captured_diagnostics(const std::string &server_id) const;

  // Drops status events older than the configured retention
  void cleanup_old_data();

  // Combined view of the server, tracker, isolator and retry statistics
  json get_server_status(const std::string &server_id) const;

  StatusTracker &status_tracker() {
    return tracker_;
  }
  ErrorIsolator &error_isolator() {
    return isolator_;
  }
  RetryManager &retry_manager() {
    return retry_;
  }
  tool::ConcurrencyGate &concurrency_gate() {
    return gate_;
  }
  const SupervisorSettings &settings() const {
    return options_.settings;
  }

 private:
  struct Entry {
    std::shared_ptr<ManagedServer> server;
    std::shared_ptr<std::mutex> lifecycle;
  };

  std::shared_ptr<ManagedServer> make_server(const ServerConfig &config);
  std::shared_ptr<std::mutex> lifecycle_lock(const std::string &server_id) const;

  // The *_locked helpers run under the server's lifecycle lock
  bool start_locked(const std::string &server_id, std::chrono::milliseconds timeout);
  bool stop_locked(const std::string &server_id, std::chrono::milliseconds timeout);
  bool remove_locked(const std::string &server_id);
  bool replace_locked(const std::string &server_id, const std::optional<ServerConfig> &config);
  bool clear_quarantine_locked(const std::string &server_id);
  void park_quarantined_locked(const std::string &server_id);

  bool replace_server(const std::string &server_id, const std::optional<ServerConfig> &config);
  void park_quarantined(const std::string &server_id);

  // Delivers queued state changes in order, outside every lifecycle lock
  void publish_pending();
  void record_server_metadata(const std::string &server_id, const ManagedServer &server);

  RegistryOptions options_;

  StatusTracker tracker_;
  ErrorIsolator isolator_;
  RetryManager retry_;
  tool::ConcurrencyGate gate_;

  mutable std::mutex mutex_;
  std::map<std::string, Entry> servers_;

  std::mutex publish_mutex_;
  std::deque<events::ServerStateChanged> pending_events_;
  bool publishing_ = false;
};

}  // namespace kennel::mcp
