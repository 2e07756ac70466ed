#include "mcp/registry.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>

#include "bus/bus.hpp"
#include "mcp/errors.hpp"

namespace kennel::mcp {

json RegisteredServerInfo::to_json() const {
  json j;
  j["id"] = id;
  j["name"] = name;
  j["type"] = to_string(transport);
  j["enabled"] = enabled;
  j["state"] = to_string(state);
  j["quarantined"] = quarantined;
  j["circuit_state"] = to_string(circuit);
  j["uptime_seconds"] = uptime ? json(std::chrono::duration<double>(*uptime).count()) : json(nullptr);
  j["error_message"] = error_message.empty() ? json(nullptr) : json(error_message);
  return j;
}

Registry::Registry(RegistryOptions options)
    : options_(std::move(options)),
      tracker_(options_.settings.event_capacity, options_.wall_clock, options_.monotonic_clock),
      isolator_(options_.settings.isolator, options_.monotonic_clock, options_.wall_clock, options_.bus),
      retry_(
          options_.settings.retry, options_.sleeper,
          [this](const std::string &server_id) {
            return isolator_.is_circuit_open(server_id);
          },
          options_.wall_clock),
      gate_(options_.settings.default_tool_class) {
  if (!options_.transport_factory) {
    options_.transport_factory = make_transport;
  }
  for (const auto &[name, cls] : options_.settings.tool_classes) {
    gate_.set_classification(name, cls);
  }
}

Registry::~Registry() {
  // Servers handed out by get() may outlive us; detach them first
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &[id, entry] : servers_) {
    entry.server->set_state_listener(nullptr);
  }
}

std::shared_ptr<ManagedServer> Registry::make_server(const ServerConfig &config) {
  auto server = std::make_shared<ManagedServer>(config, options_.transport_factory, options_.bus);
  server->set_state_listener([this, id = config.id()](ServerState from, ServerState to) {
    tracker_.set_status(id, to);
    if (options_.bus) {
      std::lock_guard<std::mutex> lock(publish_mutex_);
      pending_events_.push_back(events::ServerStateChanged{id, to_string(from), to_string(to)});
    }
  });
  return server;
}

void Registry::publish_pending() {
  if (!options_.bus) return;

  std::unique_lock<std::mutex> lock(publish_mutex_);
  // A handler that re-enters the Registry queues more events; the outer
  // loop delivers them after the handler returns
  if (publishing_) return;
  publishing_ = true;
  while (!pending_events_.empty()) {
    auto event = std::move(pending_events_.front());
    pending_events_.pop_front();
    lock.unlock();
    try {
      options_.bus->publish(event);
    } catch (...) {
      lock.lock();
      publishing_ = false;
      throw;
    }
    lock.lock();
  }
  publishing_ = false;
}

std::string Registry::register_server(const ServerConfig &config) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (servers_.count(config.id())) {
      throw ConfigurationError("MCP server id '" + config.id() + "' is already registered", config.id());
    }
    for (const auto &[id, entry] : servers_) {
      if (entry.server->config().name() == config.name()) {
        throw ConfigurationError("MCP server name '" + config.name() + "' is already used by '" + id + "'", config.id());
      }
    }
    servers_[config.id()] = Entry{make_server(config), std::make_shared<std::mutex>()};
  }

  tracker_.set_metadata(config.id(), "name", config.name());
  tracker_.set_metadata(config.id(), "type", to_string(config.transport_type()));
  tracker_.record_event(config.id(), "registered", json{{"name", config.name()}, {"type", to_string(config.transport_type())}});
  spdlog::info("[Registry] Registered MCP server '{}' (id: {}, {})", config.name(), config.id(), to_string(config.transport_type()));
  return config.id();
}

std::shared_ptr<ManagedServer> Registry::get(const std::string &server_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = servers_.find(server_id);
  return it == servers_.end() ? nullptr : it->second.server;
}

std::shared_ptr<ManagedServer> Registry::get_by_name(const std::string &name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &[id, entry] : servers_) {
    if (entry.server->config().name() == name) {
      return entry.server;
    }
  }
  return nullptr;
}

std::vector<std::string> Registry::server_ids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(servers_.size());
  for (const auto &[id, entry] : servers_) {
    ids.push_back(id);
  }
  return ids;
}

std::shared_ptr<std::mutex> Registry::lifecycle_lock(const std::string &server_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = servers_.find(server_id);
  return it == servers_.end() ? nullptr : it->second.lifecycle;
}

std::vector<RegisteredServerInfo> Registry::list() const {
  std::vector<std::shared_ptr<ManagedServer>> servers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &[id, entry] : servers_) {
      servers.push_back(entry.server);
    }
  }

  std::vector<RegisteredServerInfo> infos;
  infos.reserve(servers.size());
  for (const auto &server : servers) {
    const auto &id = server->id();
    RegisteredServerInfo info;
    info.id = id;
    info.name = server->config().name();
    info.transport = server->config().transport_type();
    info.enabled = server->is_enabled();
    info.state = server->state();
    info.quarantined = isolator_.is_quarantined(id);
    info.circuit = isolator_.circuit_state(id);
    info.uptime = tracker_.get_uptime(id);
    info.error_message = server->last_error();
    infos.push_back(std::move(info));
  }
  return infos;
}

bool Registry::remove(const std::string &server_id) {
  auto lifecycle = lifecycle_lock(server_id);
  if (!lifecycle) {
    spdlog::warn("[Registry] Attempted to remove non-existent server '{}'", server_id);
    return false;
  }

  bool ok;
  {
    std::lock_guard<std::mutex> guard(*lifecycle);
    ok = remove_locked(server_id);
  }
  publish_pending();
  return ok;
}

bool Registry::remove_locked(const std::string &server_id) {
  std::shared_ptr<ManagedServer> server;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(server_id);
    if (it == servers_.end()) return false;
    server = std::move(it->second.server);
    servers_.erase(it);
  }

  server->stop(options_.settings.stop_timeout);
  server->set_state_listener(nullptr);
  tracker_.remove_server(server_id);
  isolator_.remove_server(server_id);
  retry_.clear_stats(server_id);
  spdlog::info("[Registry] Removed MCP server '{}' (id: {})", server->config().name(), server_id);
  return true;
}

bool Registry::replace_server(const std::string &server_id, const std::optional<ServerConfig> &config) {
  auto lifecycle = lifecycle_lock(server_id);
  if (!lifecycle) {
    spdlog::warn("[Registry] Attempted to reload non-existent server '{}'", server_id);
    return false;
  }

  bool ok;
  {
    std::lock_guard<std::mutex> guard(*lifecycle);
    ok = replace_locked(server_id, config);
  }
  publish_pending();
  return ok;
}

bool Registry::replace_locked(const std::string &server_id, const std::optional<ServerConfig> &config) {
  auto old_server = get(server_id);
  if (!old_server) return false;

  old_server->stop(options_.settings.stop_timeout);
  old_server->set_state_listener(nullptr);

  const ServerConfig &next_config = config ? *config : old_server->config();
  std::shared_ptr<ManagedServer> server;
  try {
    server = make_server(next_config);
  } catch (const std::exception &e) {
    spdlog::error("[Registry] Failed to reload server '{}': {}", server_id, e.what());
    tracker_.record_event(server_id, "reload_error", json{{"error", e.what()}});
    return false;
  }
  bool enabled = config ? config->enabled() : old_server->is_enabled();
  if (enabled) {
    server->enable();
  } else {
    server->disable();
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(server_id);
    if (it == servers_.end()) return false;
    it->second.server = server;
  }

  if (isolator_.is_quarantined(server_id)) {
    server->quarantine(options_.settings.stop_timeout);
  } else {
    tracker_.set_status(server_id, ServerState::Stopped);
  }
  tracker_.set_metadata(server_id, "name", next_config.name());
  tracker_.set_metadata(server_id, "type", to_string(next_config.transport_type()));
  tracker_.record_event(server_id, config ? "updated" : "reloaded", json{{"name", next_config.name()}});
  spdlog::info("[Registry] Reloaded MCP server '{}' (id: {})", next_config.name(), server_id);
  return true;
}

bool Registry::reload(const std::string &server_id) {
  return replace_server(server_id, std::nullopt);
}

bool Registry::update(const std::string &server_id, const ServerConfig &config) {
  if (config.id() != server_id) {
    throw ConfigurationError("Cannot change the id of server '" + server_id + "' to '" + config.id() + "'", server_id);
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!servers_.count(server_id)) {
      spdlog::warn("[Registry] Attempted to update non-existent server '{}'", server_id);
      return false;
    }
    for (const auto &[id, entry] : servers_) {
      if (id != server_id && entry.server->config().name() == config.name()) {
        throw ConfigurationError("MCP server name '" + config.name() + "' is already used by '" + id + "'", server_id);
      }
    }
  }
  return replace_server(server_id, config);
}

void Registry::record_server_metadata(const std::string &server_id, const ManagedServer &server) {
  if (auto info = server.server_info()) {
    tracker_.set_metadata(server_id, "protocol_version", info->protocol_version);
    tracker_.set_metadata(server_id, "server_info", json{{"name", info->name}, {"version", info->version}});
  }
}

bool Registry::start(const std::string &server_id, std::optional<std::chrono::milliseconds> timeout) {
  auto lifecycle = lifecycle_lock(server_id);
  if (!lifecycle) {
    spdlog::warn("[Registry] Attempted to start non-existent server '{}'", server_id);
    return false;
  }

  bool ok;
  {
    std::lock_guard<std::mutex> guard(*lifecycle);
    ok = start_locked(server_id, timeout.value_or(options_.settings.start_timeout));
  }
  publish_pending();
  return ok;
}

bool Registry::start_locked(const std::string &server_id, std::chrono::milliseconds timeout) {
  auto server = get(server_id);
  if (!server) return false;

  if (isolator_.is_quarantined(server_id)) {
    auto reason = isolator_.get_error_stats(server_id).quarantine_reason;
    if (!server->is_quarantined()) {
      server->quarantine(options_.settings.stop_timeout);
    }
    tracker_.record_event(server_id, "start_blocked", json{{"reason", reason}});
    spdlog::warn("[Registry] Not starting quarantined server '{}': {}", server_id, reason);
    return false;
  }
  if (server->is_quarantined()) {
    // Cleared directly on the isolator
    server->release_quarantine();
    tracker_.record_event(server_id, "quarantine_cleared");
  }

  // An explicit start is also an enable
  if (!server->is_enabled()) {
    server->enable();
    tracker_.record_event(server_id, "enabled");
  }
  if (server->state() == ServerState::Running) {
    return true;
  }

  bool ok = server->start(timeout);
  if (ok) {
    record_server_metadata(server_id, *server);
    tracker_.record_event(server_id, "started");
  } else {
    tracker_.record_event(server_id, "start_failed", json{{"error", server->last_error()}});
  }
  return ok;
}

bool Registry::stop(const std::string &server_id, std::optional<std::chrono::milliseconds> timeout) {
  auto lifecycle = lifecycle_lock(server_id);
  if (!lifecycle) {
    spdlog::warn("[Registry] Attempted to stop non-existent server '{}'", server_id);
    return false;
  }

  bool ok;
  {
    std::lock_guard<std::mutex> guard(*lifecycle);
    ok = stop_locked(server_id, timeout.value_or(options_.settings.stop_timeout));
  }
  publish_pending();
  return ok;
}

bool Registry::stop_locked(const std::string &server_id, std::chrono::milliseconds timeout) {
  auto server = get(server_id);
  if (!server) return false;

  bool ok = server->stop(timeout);
  tracker_.record_event(server_id, "stopped");
  return ok;
}

std::map<std::string, bool> Registry::start_all() {
  std::map<std::string, std::future<bool>> pending;
  for (const auto &id : server_ids()) {
    auto server = get(id);
    if (!server || !server->is_enabled()) continue;
    pending[id] = std::async(std::launch::async, [this, id] {
      return start(id);
    });
  }

  std::map<std::string, bool> results;
  for (auto &[id, future] : pending) {
    results[id] = future.get();
  }
  spdlog::info("[Registry] start_all: {} of {} servers started", std::count_if(results.begin(), results.end(), [](const auto &r) {
                 return r.second;
               }),
               results.size());
  return results;
}

std::map<std::string, bool> Registry::stop_all() {
  std::map<std::string, std::future<bool>> pending;
  for (const auto &id : server_ids()) {
    pending[id] = std::async(std::launch::async, [this, id] {
      return stop(id);
    });
  }

  std::map<std::string, bool> results;
  for (auto &[id, future] : pending) {
    results[id] = future.get();
  }
  return results;
}

bool Registry::enable_server(const std::string &server_id) {
  auto server = get(server_id);
  if (!server) {
    spdlog::warn("[Registry] Attempted to enable non-existent server '{}'", server_id);
    return false;
  }
  server->enable();
  tracker_.record_event(server_id, "enabled");
  spdlog::info("[Registry] Enabled server '{}'", server_id);
  return true;
}

bool Registry::disable_server(const std::string &server_id) {
  auto server = get(server_id);
  if (!server) {
    spdlog::warn("[Registry] Attempted to disable non-existent server '{}'", server_id);
    return false;
  }
  server->disable();
  tracker_.record_event(server_id, "disabled");
  spdlog::info("[Registry] Disabled server '{}'", server_id);
  if (server->state() == ServerState::Running || server->state() == ServerState::Error) {
    return stop(server_id);
  }
  return true;
}

bool Registry::clear_quarantine(const std::string &server_id) {
  auto lifecycle = lifecycle_lock(server_id);
  if (!lifecycle) {
    spdlog::warn("[Registry] Attempted to clear quarantine of non-existent server '{}'", server_id);
    return false;
  }

  bool ok;
  {
    std::lock_guard<std::mutex> guard(*lifecycle);
    ok = clear_quarantine_locked(server_id);
  }
  publish_pending();
  return ok;
}

bool Registry::clear_quarantine_locked(const std::string &server_id) {
  auto server = get(server_id);
  if (!server) return false;

  isolator_.clear_quarantine(server_id);
  server->release_quarantine();
  tracker_.record_event(server_id, "quarantine_cleared");
  return true;
}

void Registry::park_quarantined(const std::string &server_id) {
  auto lifecycle = lifecycle_lock(server_id);
  if (!lifecycle) return;

  {
    std::lock_guard<std::mutex> guard(*lifecycle);
    park_quarantined_locked(server_id);
  }
  publish_pending();
}

void Registry::park_quarantined_locked(const std::string &server_id) {
  auto server = get(server_id);
  if (!server || server->is_quarantined() || !isolator_.is_quarantined(server_id)) return;

  auto reason = isolator_.get_error_stats(server_id).quarantine_reason;
  server->quarantine(options_.settings.stop_timeout);
  tracker_.record_event(server_id, "quarantined", json{{"reason", reason}});
}

ToolCallResult Registry::call_tool(const std::string &server_id, const std::string &tool_name, const json &arguments,
                                   std::optional<std::chrono::milliseconds> timeout) {
  auto server = get(server_id);
  if (!server) {
    throw ServerNotFoundError(server_id);
  }
  auto call_timeout = timeout.value_or(server->config().timeout());

  try {
    auto permit = gate_.acquire(tool_name, server_id + "/" + tool_name);
    return retry_.retry(server_id, [&] {
      return isolator_.call(server_id, [&] {
        return server->call_tool(tool_name, arguments, call_timeout);
      });
    });
  } catch (const std::exception &) {
    // A lost transport moved the server to Error during the call
    publish_pending();
    if (isolator_.is_quarantined(server_id)) {
      park_quarantined(server_id);
    }
    throw;
  }
}

std::vector<McpToolInfo> Registry::list_tools(const std::string &server_id, std::optional<std::chrono::milliseconds> timeout) {
  auto server = get(server_id);
  if (!server) {
    throw ServerNotFoundError(server_id);
  }
  auto list_timeout = timeout.value_or(server->config().timeout());

  try {
    return isolator_.call(server_id, [&] {
      return server->list_tools(list_timeout);
    });
  } catch (const std::exception &) {
    publish_pending();
    if (isolator_.is_quarantined(server_id)) {
      park_quarantined(server_id);
    }
    throw;
  }
}

std::optional<ServerSummary> Registry::get_server_summary(const std::string &server_id) const {
  if (!get(server_id)) return std::nullopt;
  return tracker_.get_server_summary(server_id);
}

std::vector<Event> Registry::get_events(const std::string &server_id, size_t limit) const {
  return tracker_.get_events(server_id, limit);
}

std::vector<std::string> Registry::get_captured_diagnostics(const std::string &server_id) const {
  auto server = get(server_id);
  return server ? server->get_captured_diagnostics() : std::vector<std::string>{};
}

void Registry::cleanup_old_data() {
  tracker_.cleanup_old_data(options_.settings.event_retention_days);
}

json Registry::get_server_status(const std::string &server_id) const {
  auto server = get(server_id);
  if (!server) {
    return json{{"server_id", server_id}, {"exists", false}, {"error", "Server not found"}};
  }

  json status = server->status().to_json();
  status["exists"] = true;
  status["tracker"] = tracker_.get_server_summary(server_id).to_json();
  status["errors"] = isolator_.get_error_stats(server_id).to_json();
  status["retries"] = retry_.get_retry_stats(server_id).to_json();
  json recent = json::array();
  for (const auto &event : tracker_.get_events(server_id, 5)) {
    recent.push_back(event.to_json());
  }
  status["recent_events"] = recent;
  return status;
}

}  // namespace kennel::mcp
