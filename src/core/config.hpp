#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "mcp/server_config.hpp"
#include "mcp/supervisor_settings.hpp"

namespace kennel {

using json = nlohmann::json;

// Application configuration
struct Config {
  std::string log_level = "info";

  std::vector<mcp::ServerConfig> mcp_servers;

  mcp::SupervisorSettings supervisor;

  // Parse a config document. Server entries that fail validation are
  // skipped with a warning; a malformed document is an error.
  static Result<Config> from_json(const json &j);
  json to_json() const;

  static Result<Config> load(const std::filesystem::path &path);

  // ~/.config/kennel/config.json, or defaults when it is missing or invalid
  static Config load_default();

  // Returns an error message, empty on success
  std::string save(const std::filesystem::path &path) const;
};

// Applies "trace|debug|info|warn|error|off" to spdlog. Unknown names fall
// back to info.
void apply_log_level(const std::string &level);

// Config paths
namespace config_paths {

std::filesystem::path home_dir();
std::filesystem::path config_dir();  // ~/.config/kennel
std::filesystem::path config_file();  // ~/.config/kennel/config.json

}  // namespace config_paths

}  // namespace kennel
