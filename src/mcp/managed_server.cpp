#include "mcp/managed_server.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

#include "bus/bus.hpp"
#include "mcp/errors.hpp"

#ifndef KENNEL_VERSION
#define KENNEL_VERSION "0.1.0"
#endif

namespace kennel::mcp {

namespace {

constexpr const char *kProtocolVersion = "2024-11-05";
constexpr int kMaxToolPages = 64;

std::chrono::milliseconds remaining(std::chrono::steady_clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
  return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

}  // namespace

// ============================================================
// ToolCallResult / ManagedServerStatus
// ============================================================

std::string ToolCallResult::text() const {
  std::string output;
  if (content.is_array()) {
    for (const auto &item : content) {
      if (!item.is_object() || item.value("type", "text") != "text") continue;
      if (!output.empty()) output += "\n";
      output += item.value("text", "");
    }
  }
  if (output.empty()) {
    output = raw.dump(2);
  }
  return output;
}

ToolCallResult ToolCallResult::from_json(const json &result) {
  if (!result.is_object()) {
    throw ProtocolError("tools/call result must be a JSON object, got: " + result.dump());
  }
  ToolCallResult r;
  r.raw = result;
  if (result.contains("content")) {
    if (!result["content"].is_array()) {
      throw ProtocolError("tools/call result 'content' must be an array");
    }
    r.content = result["content"];
  }
  auto is_error = result.find("isError");
  r.is_error = is_error != result.end() && is_error->is_boolean() && is_error->get<bool>();
  return r;
}

json ManagedServerStatus::to_json() const {
  json j;
  j["id"] = id;
  j["name"] = name;
  j["transport"] = to_string(transport);
  j["state"] = to_string(state);
  j["enabled"] = enabled;
  j["quarantined"] = quarantined;
  j["diagnostic_lines"] = diagnostic_lines;
  if (server_info) {
    j["server_info"] = json{{"protocol_version", server_info->protocol_version}, {"name", server_info->name}, {"version", server_info->version}};
  }
  if (!last_error.empty()) {
    j["last_error"] = last_error;
  }
  return j;
}

// ============================================================
// ManagedServer
// ============================================================

ManagedServer::ManagedServer(ServerConfig config, TransportFactory factory, Bus *bus)
    : config_(std::move(config)), factory_(std::move(factory)), bus_(bus), enabled_(config_.enabled()) {
  if (!factory_) {
    factory_ = make_transport;
  }
}

ManagedServer::~ManagedServer() {
  std::shared_ptr<Transport> transport;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    transport = std::move(transport_);
  }
  if (transport) {
    transport->disconnect(std::chrono::milliseconds(500));
  }
}

bool ManagedServer::start(std::chrono::milliseconds timeout) {
  bool ok;
  {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    ok = start_locked(timeout);
  }
  notify_transitions();
  return ok;
}

bool ManagedServer::start_locked(std::chrono::milliseconds timeout) {
  switch (state()) {
    case ServerState::Running:
      return true;
    case ServerState::Quarantined:
      spdlog::warn("[MCP] Refusing to start quarantined server '{}'", id());
      return false;
    case ServerState::Error:
      stop_locked(timeout);
      break;
    default:
      break;
  }

  transition(ServerState::Starting);
  auto deadline = std::chrono::steady_clock::now() + timeout;

  std::shared_ptr<Transport> transport;
  try {
    transport = std::shared_ptr<Transport>(factory_(config_));
  } catch (const std::exception &e) {
    fail_start(nullptr, std::string("Failed to create transport: ") + e.what());
    return false;
  }
  if (!transport) {
    fail_start(nullptr, "No transport available for " + to_string(config_.transport_type()));
    return false;
  }

  transport->set_diagnostics_handler([this](const std::string &line) {
    append_diagnostic(line);
  });
  transport->set_notification_handler([this](const std::string &method, const json &params) {
    on_notification(method, params);
  });

  auto connected = transport->connect();
  if (connected.wait_until(deadline) != std::future_status::ready) {
    fail_start(transport, "Timed out connecting after " + std::to_string(timeout.count()) + " ms");
    return false;
  }
  if (!connected.get()) {
    auto reason = transport->last_error();
    fail_start(transport, reason.empty() ? "Failed to connect transport" : reason);
    return false;
  }

  auto error = initialize(*transport, deadline);
  if (!error.empty()) {
    fail_start(transport, error);
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    transport_ = transport;
    last_error_.clear();
  }
  transition(ServerState::Running);
  spdlog::info("[MCP] Server '{}' is running", id());
  return true;
}

void ManagedServer::fail_start(const std::shared_ptr<Transport> &transport, const std::string &reason) {
  spdlog::error("[MCP] Failed to start server '{}': {}", id(), reason);
  if (transport) {
    transport->disconnect(std::chrono::milliseconds(0));
  }
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    last_error_ = reason;
  }
  transition(ServerState::Error);
}

bool ManagedServer::stop(std::chrono::milliseconds timeout) {
  {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    stop_locked(timeout);
  }
  notify_transitions();
  return true;
}

void ManagedServer::stop_locked(std::chrono::milliseconds timeout) {
  auto current = state();
  if (current != ServerState::Running && current != ServerState::Error) {
    return;
  }

  transition(ServerState::Stopping);

  std::shared_ptr<Transport> transport;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    transport = std::move(transport_);
    server_info_.reset();
    capabilities_ = ServerCapabilities{};
  }
  if (transport) {
    // Half the timeout for the polite exit, half after SIGTERM
    transport->disconnect(timeout / 2);
  }

  transition(ServerState::Stopped);
  spdlog::info("[MCP] Server '{}' stopped", id());
}

void ManagedServer::quarantine(std::chrono::milliseconds timeout) {
  {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    stop_locked(timeout);
    if (state() == ServerState::Stopped) {
      transition(ServerState::Quarantined);
    }
  }
  notify_transitions();
}

void ManagedServer::release_quarantine() {
  {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (state() == ServerState::Quarantined) {
      transition(ServerState::Stopped);
    }
  }
  notify_transitions();
}

void ManagedServer::transition_locked(ServerState to) {
  ServerState from = state_;
  if (!is_valid_transition(from, to)) {
    throw std::logic_error("Invalid state transition for '" + id() + "': " + to_string(from) + " -> " + to_string(to));
  }
  state_ = to;
  spdlog::debug("[MCP] Server '{}': {} -> {}", id(), to_string(from), to_string(to));

  std::lock_guard<std::mutex> lock(listener_mutex_);
  pending_transitions_.emplace_back(from, to);
}

void ManagedServer::transition(ServerState to) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  transition_locked(to);
}

void ManagedServer::notify_transitions() {
  std::unique_lock<std::mutex> lock(listener_mutex_);
  // Whoever is already delivering also delivers what was queued meanwhile
  if (notifying_) return;
  notifying_ = true;
  while (!pending_transitions_.empty()) {
    auto [from, to] = pending_transitions_.front();
    pending_transitions_.pop_front();
    auto listener = state_listener_;
    lock.unlock();
    if (listener) {
      try {
        listener(from, to);
      } catch (...) {
        lock.lock();
        notifying_ = false;
        throw;
      }
    }
    lock.lock();
  }
  notifying_ = false;
}

std::string ManagedServer::initialize(Transport &transport, std::chrono::steady_clock::time_point deadline) {
  JsonRpcRequest req;
  req.method = "initialize";
  req.id = next_request_id_++;
  req.params = json{{"protocolVersion", kProtocolVersion},
                    {"capabilities", json::object()},
                    {"clientInfo", json{{"name", "kennel"}, {"version", KENNEL_VERSION}}}};

  auto future = transport.send_request(req);
  if (future.wait_until(deadline) != std::future_status::ready) {
    transport.cancel_request(req.id);
    return "Initialize handshake timed out";
  }

  auto resp = future.get();
  if (!resp.ok()) {
    return "Initialize error: " + resp.error_message();
  }
  if (!resp.result || !resp.result->is_object()) {
    return "Initialize returned no result";
  }

  const auto &result = *resp.result;
  ServerInfo info;
  info.protocol_version = result.value("protocolVersion", kProtocolVersion);

  ServerCapabilities caps;
  if (result.contains("capabilities") && result["capabilities"].is_object()) {
    const auto &c = result["capabilities"];
    caps.supports_tools = c.contains("tools");
    caps.supports_resources = c.contains("resources");
    caps.supports_prompts = c.contains("prompts");
    caps.supports_logging = c.contains("logging");
  }

  if (result.contains("serverInfo") && result["serverInfo"].is_object()) {
    const auto &si = result["serverInfo"];
    info.name = si.value("name", "unknown");
    info.version = si.value("version", "unknown");
    spdlog::info("[MCP] Server '{}' info: {} v{} (protocol {})", id(), info.name, info.version, info.protocol_version);
  }

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    server_info_ = info;
    capabilities_ = caps;
  }

  JsonRpcNotification notif;
  notif.method = "notifications/initialized";
  transport.send_notification(notif);
  return "";
}

std::shared_ptr<Transport> ManagedServer::running_transport() {
  std::shared_ptr<Transport> transport;
  ServerState current;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    current = state_;
    transport = transport_;
  }
  if (current != ServerState::Running || !transport) {
    throw ServerUnavailableError(id(), to_string(current));
  }
  if (transport->state() == TransportState::Failed) {
    mark_transport_lost(transport);
    throw ConnectionError("Connection to MCP server '" + id() + "' was lost", id());
  }
  return transport;
}

JsonRpcResponse ManagedServer::request(const std::shared_ptr<Transport> &transport, const std::string &method, json params,
                                       std::chrono::milliseconds timeout) {
  JsonRpcRequest req;
  req.method = method;
  req.id = next_request_id_++;
  req.params = std::move(params);

  auto future = transport->send_request(req);
  if (future.wait_for(timeout) != std::future_status::ready) {
    transport->cancel_request(req.id);
    JsonRpcNotification cancelled;
    cancelled.method = "notifications/cancelled";
    cancelled.params = json{{"requestId", req.id}, {"reason", "timeout"}};
    transport->send_notification(cancelled);
    throw TimeoutError("MCP server '" + id() + "': " + method + " timed out after " + std::to_string(timeout.count()) + " ms", id());
  }
  return future.get();
}

void ManagedServer::raise_for_response(const JsonRpcResponse &response, const std::shared_ptr<Transport> &transport) {
  auto message = "MCP server '" + id() + "': " + response.error_message();
  int code = response.error_code();

  ErrorKind kind;
  if (code == kTransportErrorCode) {
    // A request cut off by stop() or a restart is not a provider failure
    ServerState current;
    bool superseded;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      current = state_;
      superseded = transport_ != transport;
    }
    if (superseded || (current != ServerState::Running && current != ServerState::Error)) {
      throw ServerUnavailableError(id(), to_string(current));
    }

    kind = classify_message(response.error_message());
    if (kind == ErrorKind::Unknown || kind == ErrorKind::Protocol) {
      kind = ErrorKind::Network;
    }
    if (transport->state() == TransportState::Failed) {
      mark_transport_lost(transport);
    }
  } else {
    const auto &err = *response.error;
    bool fatal = err.is_object() && err.contains("data") && err["data"].is_object() && err["data"].value("fatal", false);
    kind = fatal ? ErrorKind::Fatal : classify_rpc_error(code, response.error_message());
  }
  raise_provider_error(kind, message, id());
}

void ManagedServer::mark_transport_lost(const std::shared_ptr<Transport> &transport) {
  {
    // Only the Running instance that owns this transport moves to Error; a
    // concurrent stop() wins otherwise
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != ServerState::Running || transport_ != transport) return;
    last_error_ = transport->last_error().empty() ? "Transport lost" : transport->last_error();
    transition_locked(ServerState::Error);
  }
  spdlog::warn("[MCP] Server '{}' lost its transport", id());
  notify_transitions();
}

ToolCallResult ManagedServer::call_tool(const std::string &name, const json &arguments, std::chrono::milliseconds timeout) {
  auto transport = running_transport();

  auto resp = request(transport, "tools/call", json{{"name", name}, {"arguments", arguments.is_null() ? json::object() : arguments}}, timeout);
  if (!resp.ok()) {
    raise_for_response(resp, transport);
  }
  if (!resp.result) {
    throw ProtocolError("MCP server '" + id() + "': tools/call returned no result", id());
  }
  try {
    return ToolCallResult::from_json(*resp.result);
  } catch (const ProtocolError &e) {
    throw ProtocolError("MCP server '" + id() + "': " + e.what(), id());
  }
}

std::vector<McpToolInfo> ManagedServer::list_tools(std::chrono::milliseconds timeout) {
  auto transport = running_transport();
  auto deadline = std::chrono::steady_clock::now() + timeout;

  std::vector<McpToolInfo> tools;
  std::string cursor;
  for (int page = 0; page < kMaxToolPages; ++page) {
    json params = json::object();
    if (!cursor.empty()) params["cursor"] = cursor;

    auto resp = request(transport, "tools/list", std::move(params), remaining(deadline));
    if (!resp.ok()) {
      raise_for_response(resp, transport);
    }
    if (!resp.result || !resp.result->is_object() || !resp.result->contains("tools") || !(*resp.result)["tools"].is_array()) {
      throw ProtocolError("MCP server '" + id() + "': malformed tools/list result", id());
    }

    for (const auto &tool_json : (*resp.result)["tools"]) {
      if (!tool_json.is_object()) continue;
      McpToolInfo info;
      info.name = tool_json.value("name", "");
      info.description = tool_json.value("description", "");
      if (tool_json.contains("inputSchema")) {
        info.input_schema = tool_json["inputSchema"];
      } else {
        info.input_schema = json{{"type", "object"}, {"properties", json::object()}};
      }
      tools.push_back(std::move(info));
    }

    auto next = resp.result->find("nextCursor");
    if (next == resp.result->end() || !next->is_string() || next->get<std::string>().empty()) break;
    cursor = next->get<std::string>();
  }

  spdlog::debug("[MCP] Server '{}' provides {} tools", id(), tools.size());
  return tools;
}

void ManagedServer::on_notification(const std::string &method, const json &params) {
  spdlog::debug("[MCP] Notification from '{}': {} {}", id(), method, params.dump());

  if (method == "notifications/tools/list_changed") {
    if (bus_) {
      bus_->publish(events::McpToolsChanged{config_.name()});
    }
  } else if (method == "notifications/message") {
    // Structured log output is kept alongside stderr
    auto level = params.value("level", "info");
    auto data = params.contains("data") ? params["data"] : json();
    append_diagnostic("[" + level + "] " + (data.is_string() ? data.get<std::string>() : data.dump()));
  }
}

void ManagedServer::append_diagnostic(std::string line) {
  std::lock_guard<std::mutex> lock(diagnostics_mutex_);
  diagnostics_.push_back(std::move(line));
  while (diagnostics_.size() > kMaxDiagnosticLines) {
    diagnostics_.pop_front();
  }
}

std::vector<std::string> ManagedServer::get_captured_diagnostics() const {
  std::lock_guard<std::mutex> lock(diagnostics_mutex_);
  return {diagnostics_.begin(), diagnostics_.end()};
}

void ManagedServer::clear_diagnostics() {
  std::lock_guard<std::mutex> lock(diagnostics_mutex_);
  diagnostics_.clear();
}

ServerState ManagedServer::state() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_;
}

std::optional<ServerInfo> ManagedServer::server_info() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return server_info_;
}

ServerCapabilities ManagedServer::capabilities() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return capabilities_;
}

std::string ManagedServer::last_error() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return last_error_;
}

ManagedServerStatus ManagedServer::status() const {
  ManagedServerStatus s;
  s.id = config_.id();
  s.name = config_.name();
  s.transport = config_.transport_type();
  s.enabled = enabled_;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    s.state = state_;
    s.server_info = server_info_;
    s.last_error = last_error_;
  }
  s.quarantined = s.state == ServerState::Quarantined;
  {
    std::lock_guard<std::mutex> lock(diagnostics_mutex_);
    s.diagnostic_lines = diagnostics_.size();
  }
  return s;
}

void ManagedServer::set_state_listener(StateListener listener) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  state_listener_ = std::move(listener);
}

}  // namespace kennel::mcp
