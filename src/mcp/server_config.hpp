#pragma once

#include <chrono>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace kennel::mcp {

using json = nlohmann::json;

enum class TransportType { Stdio, Http, Sse };

std::string to_string(TransportType type);

// Accepts "stdio"/"local", "http"/"streamable-http", "sse"/"remote"
std::optional<TransportType> transport_type_from_string(const std::string &name);

struct StdioConfig {
  std::string command;
  std::vector<std::string> args;
  std::map<std::string, std::string> env;  // overrides applied on top of the inherited environment
  std::string cwd;
};

struct HttpConfig {
  std::string url;
  std::map<std::string, std::string> headers;
};

struct SseConfig {
  std::string url;
  std::map<std::string, std::string> headers;
};

using TransportConfig = std::variant<StdioConfig, HttpConfig, SseConfig>;

// Substitute $VAR and ${VAR} from the process environment. Unset variables
// become the empty string.
std::string expand_env_vars(const std::string &value);

// Immutable definition of one tool-provider. Construction validates the
// definition and resolves environment placeholders once; an invalid
// definition throws ConfigurationError.
class ServerConfig {
 public:
  static constexpr std::chrono::milliseconds kDefaultTimeout{30000};

  ServerConfig(std::string id, std::string name, TransportConfig transport, bool enabled = true,
               std::chrono::milliseconds timeout = kDefaultTimeout);

  static ServerConfig from_json(const json &j);

  // Serializes the definition as written, with placeholders unresolved
  json to_json() const;

  const std::string &id() const {
    return id_;
  }
  const std::string &name() const {
    return name_;
  }
  TransportType transport_type() const;
  bool enabled() const {
    return enabled_;
  }
  std::chrono::milliseconds timeout() const {
    return timeout_;
  }

  // Resolved transport parameters
  const TransportConfig &transport() const {
    return transport_;
  }
  const StdioConfig *stdio() const {
    return std::get_if<StdioConfig>(&transport_);
  }
  const HttpConfig *http() const {
    return std::get_if<HttpConfig>(&transport_);
  }
  const SseConfig *sse() const {
    return std::get_if<SseConfig>(&transport_);
  }

  ServerConfig with_enabled(bool enabled) const;

 private:
  void validate() const;

  std::string id_;
  std::string name_;
  TransportConfig raw_transport_;
  TransportConfig transport_;
  bool enabled_ = true;
  std::chrono::milliseconds timeout_;
};

}  // namespace kennel::mcp
