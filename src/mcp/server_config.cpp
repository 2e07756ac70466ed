#include "mcp/server_config.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <type_traits>

#include "mcp/errors.hpp"
#include "net/http_client.hpp"

namespace kennel::mcp {

namespace {

// One day
constexpr int64_t kMaxTimeoutSeconds = 86400;

bool is_var_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string lookup_env(const std::string &name) {
  const char *value = std::getenv(name.c_str());
  return value ? value : "";
}

std::map<std::string, std::string> expand_map(const std::map<std::string, std::string> &values) {
  std::map<std::string, std::string> result;
  for (const auto &[key, value] : values) {
    result[key] = expand_env_vars(value);
  }
  return result;
}

TransportConfig resolve(const TransportConfig &raw) {
  return std::visit(
      [](const auto &cfg) -> TransportConfig {
        using T = std::decay_t<decltype(cfg)>;
        T resolved = cfg;
        if constexpr (std::is_same_v<T, StdioConfig>) {
          resolved.command = expand_env_vars(cfg.command);
          resolved.args.clear();
          for (const auto &arg : cfg.args) {
            resolved.args.push_back(expand_env_vars(arg));
          }
          resolved.env = expand_map(cfg.env);
          resolved.cwd = expand_env_vars(cfg.cwd);
        } else {
          resolved.url = expand_env_vars(cfg.url);
          resolved.headers = expand_map(cfg.headers);
        }
        return resolved;
      },
      raw);
}

std::map<std::string, std::string> string_map(const json &j, const char *key) {
  std::map<std::string, std::string> result;
  if (!j.contains(key) || j[key].is_null()) return result;
  if (!j[key].is_object()) {
    throw ConfigurationError(std::string("'") + key + "' must be an object");
  }
  for (auto it = j[key].begin(); it != j[key].end(); ++it) {
    result[it.key()] = it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
  }
  return result;
}

}  // namespace

std::string to_string(TransportType type) {
  switch (type) {
    case TransportType::Stdio:
      return "stdio";
    case TransportType::Http:
      return "http";
    case TransportType::Sse:
      return "sse";
  }
  return "unknown";
}

std::optional<TransportType> transport_type_from_string(const std::string &name) {
  if (name == "stdio" || name == "local") return TransportType::Stdio;
  if (name == "http" || name == "streamable-http" || name == "streamable_http") return TransportType::Http;
  if (name == "sse" || name == "remote") return TransportType::Sse;
  return std::nullopt;
}

std::string expand_env_vars(const std::string &value) {
  std::string result;
  result.reserve(value.size());

  size_t i = 0;
  while (i < value.size()) {
    if (value[i] != '$' || i + 1 >= value.size()) {
      result += value[i++];
      continue;
    }

    if (value[i + 1] == '{') {
      auto close = value.find('}', i + 2);
      if (close == std::string::npos) {
        result += value.substr(i);
        break;
      }
      result += lookup_env(value.substr(i + 2, close - i - 2));
      i = close + 1;
      continue;
    }

    size_t end = i + 1;
    while (end < value.size() && is_var_char(value[end])) ++end;
    if (end == i + 1) {
      result += value[i++];
      continue;
    }
    result += lookup_env(value.substr(i + 1, end - i - 1));
    i = end;
  }
  return result;
}

// ============================================================
// ServerConfig
// ============================================================

ServerConfig::ServerConfig(std::string id, std::string name, TransportConfig transport, bool enabled, std::chrono::milliseconds timeout)
    : id_(std::move(id)),
      name_(std::move(name)),
      raw_transport_(std::move(transport)),
      transport_(resolve(raw_transport_)),
      enabled_(enabled),
      timeout_(timeout) {
  if (name_.empty()) name_ = id_;
  validate();
}

void ServerConfig::validate() const {
  if (id_.empty()) {
    throw ConfigurationError("Server id must not be empty");
  }
  if (timeout_.count() <= 0) {
    throw ConfigurationError("Server '" + id_ + "': timeout must be positive", id_);
  }

  if (const auto *cfg = stdio()) {
    if (cfg->command.empty()) {
      throw ConfigurationError("Server '" + id_ + "': stdio transport requires a command", id_);
    }
    return;
  }

  const std::string &url = http() ? http()->url : sse()->url;
  if (url.empty()) {
    throw ConfigurationError("Server '" + id_ + "': " + to_string(transport_type()) + " transport requires a url", id_);
  }
  if (!net::ParsedUrl::parse(url)) {
    throw ConfigurationError("Server '" + id_ + "': malformed url '" + url + "'", id_);
  }
}

TransportType ServerConfig::transport_type() const {
  switch (transport_.index()) {
    case 0:
      return TransportType::Stdio;
    case 1:
      return TransportType::Http;
    default:
      return TransportType::Sse;
  }
}

ServerConfig ServerConfig::with_enabled(bool enabled) const {
  return ServerConfig(id_, name_, raw_transport_, enabled, timeout_);
}

ServerConfig ServerConfig::from_json(const json &j) {
  if (!j.is_object()) {
    throw ConfigurationError("Server definition must be a JSON object");
  }

  try {
    std::string name = j.value("name", "");
    std::string id = j.value("id", name);
    std::string type_name = j.value("type", "stdio");
    bool enabled = j.value("enabled", true);

    auto timeout = kDefaultTimeout;
    if (j.contains("timeout") && j["timeout"].is_number()) {
      double seconds = j["timeout"].get<double>();
      if (!std::isfinite(seconds) || seconds <= 0 || seconds > kMaxTimeoutSeconds) {
        throw ConfigurationError("Server '" + id + "': timeout must be between 0 and " + std::to_string(kMaxTimeoutSeconds) + " seconds", id);
      }
      timeout = std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000));
    }

    auto type = transport_type_from_string(type_name);
    if (!type) {
      throw ConfigurationError("Server '" + id + "': unsupported transport type '" + type_name + "'", id);
    }

    TransportConfig transport;
    switch (*type) {
      case TransportType::Stdio: {
        StdioConfig cfg;
        cfg.command = j.value("command", "");
        if (j.contains("args") && j["args"].is_array()) {
          for (const auto &arg : j["args"]) {
            cfg.args.push_back(arg.is_string() ? arg.get<std::string>() : arg.dump());
          }
        } else if (j.contains("args") && j["args"].is_string()) {
          cfg.args.push_back(j["args"].get<std::string>());
        }
        cfg.env = string_map(j, "env");
        cfg.cwd = j.value("cwd", "");
        transport = std::move(cfg);
        break;
      }
      case TransportType::Http:
        transport = HttpConfig{j.value("url", ""), string_map(j, "headers")};
        break;
      case TransportType::Sse:
        transport = SseConfig{j.value("url", ""), string_map(j, "headers")};
        break;
    }

    return ServerConfig(std::move(id), std::move(name), std::move(transport), enabled, timeout);
  } catch (const json::exception &e) {
    throw ConfigurationError(std::string("Invalid server definition: ") + e.what());
  }
}

json ServerConfig::to_json() const {
  json j;
  j["id"] = id_;
  j["name"] = name_;
  j["type"] = to_string(transport_type());
  j["enabled"] = enabled_;
  j["timeout"] = static_cast<double>(timeout_.count()) / 1000.0;

  std::visit(
      [&j](const auto &cfg) {
        using T = std::decay_t<decltype(cfg)>;
        if constexpr (std::is_same_v<T, StdioConfig>) {
          j["command"] = cfg.command;
          j["args"] = cfg.args;
          if (!cfg.env.empty()) j["env"] = cfg.env;
          if (!cfg.cwd.empty()) j["cwd"] = cfg.cwd;
        } else {
          j["url"] = cfg.url;
          if (!cfg.headers.empty()) j["headers"] = cfg.headers;
        }
      },
      raw_transport_);
  return j;
}

}  // namespace kennel::mcp
