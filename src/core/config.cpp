#include "core/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

#include "mcp/errors.hpp"

namespace kennel {

namespace fs = std::filesystem;

Result<Config> Config::from_json(const json &j) {
  if (!j.is_object()) {
    return Result<Config>::failure("Config root must be a JSON object");
  }

  Config config;
  try {
    if (j.contains("log_level")) {
      config.log_level = j["log_level"].get<std::string>();
    }
    if (j.contains("supervisor")) {
      config.supervisor = mcp::SupervisorSettings::from_json(j["supervisor"]);
    }
  } catch (const json::exception &e) {
    return Result<Config>::failure(std::string("Invalid config: ") + e.what());
  } catch (const mcp::ConfigurationError &e) {
    return Result<Config>::failure(e.what());
  }

  if (j.contains("mcp_servers")) {
    const auto &servers = j["mcp_servers"];
    if (!servers.is_array()) {
      return Result<Config>::failure("mcp_servers must be an array");
    }
    for (const auto &entry : servers) {
      try {
        config.mcp_servers.push_back(mcp::ServerConfig::from_json(entry));
      } catch (const mcp::ConfigurationError &e) {
        spdlog::warn("[Config] Skipping MCP server entry: {}", e.what());
      }
    }
  }
  return Result<Config>::success(std::move(config));
}

json Config::to_json() const {
  json servers = json::array();
  for (const auto &server : mcp_servers) {
    servers.push_back(server.to_json());
  }
  return json{{"log_level", log_level}, {"mcp_servers", servers}, {"supervisor", supervisor.to_json()}};
}

Result<Config> Config::load(const fs::path &path) {
  std::ifstream file(path);
  if (!file) {
    return Result<Config>::failure("Cannot open config file: " + path.string());
  }

  json j;
  try {
    file >> j;
  } catch (const json::parse_error &e) {
    return Result<Config>::failure("Failed to parse " + path.string() + ": " + e.what());
  }
  return from_json(j);
}

Config Config::load_default() {
  auto path = config_paths::config_file();
  if (!fs::exists(path)) {
    return Config{};
  }

  auto result = load(path);
  if (!result.ok()) {
    spdlog::warn("[Config] {}; using defaults", *result.error);
    return Config{};
  }
  return std::move(*result.value);
}

std::string Config::save(const fs::path &path) const {
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      return "Cannot create " + path.parent_path().string() + ": " + ec.message();
    }
  }

  std::ofstream file(path);
  if (!file) {
    return "Cannot write config file: " + path.string();
  }
  file << to_json().dump(2) << "\n";
  return file.good() ? "" : "Failed writing config file: " + path.string();
}

void apply_log_level(const std::string &level) {
  auto parsed = spdlog::level::from_str(level);
  // from_str maps unknown names to off
  if (parsed == spdlog::level::off && level != "off") {
    spdlog::warn("[Config] Unknown log level '{}', using info", level);
    parsed = spdlog::level::info;
  }
  spdlog::set_level(parsed);
}

namespace config_paths {

fs::path home_dir() {
  if (const char *home = std::getenv("HOME")) {
    return fs::path(home);
  }
  return fs::temp_directory_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "kennel";
}

fs::path config_file() {
  return config_dir() / "config.json";
}

}  // namespace config_paths

}  // namespace kennel
