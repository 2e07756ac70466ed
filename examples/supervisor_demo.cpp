#include <spdlog/spdlog.h>

#include <iomanip>
#include <iostream>

#include "bus/bus.hpp"
#include "core/config.hpp"
#include "mcp/registry.hpp"

using namespace kennel;
using namespace kennel::mcp;

namespace {

void print_status_table(Registry &registry) {
  std::cout << std::left << std::setw(20) << "ID" << std::setw(8) << "TYPE" << std::setw(13) << "STATE" << std::setw(11) << "CIRCUIT"
            << "UPTIME" << std::endl;
  for (const auto &info : registry.list()) {
    std::cout << std::left << std::setw(20) << info.id << std::setw(8) << to_string(info.transport) << std::setw(13) << to_string(info.state)
              << std::setw(11) << to_string(info.circuit);
    if (info.uptime) {
      std::cout << std::fixed << std::setprecision(1) << std::chrono::duration<double>(*info.uptime).count() << "s";
    } else {
      std::cout << "-";
    }
    if (!info.error_message.empty()) {
      std::cout << "  (" << info.error_message << ")";
    }
    std::cout << std::endl;
  }
}

}  // namespace

// Usage: supervisor_demo [config.json] [server_id tool_name [json_args]]
int main(int argc, char *argv[]) {
  Config config;
  if (argc > 1) {
    auto loaded = Config::load(argv[1]);
    if (!loaded.ok()) {
      std::cerr << "Error: " << *loaded.error << std::endl;
      return 1;
    }
    config = std::move(*loaded.value);
  } else {
    config = Config::load_default();
  }
  apply_log_level(config.log_level);

  if (config.mcp_servers.empty()) {
    std::cerr << "No MCP servers configured in " << (argc > 1 ? argv[1] : config_paths::config_file().string()) << std::endl;
    return 1;
  }

  Bus bus;
  bus.subscribe<events::ServerStateChanged>([](const events::ServerStateChanged &e) {
    spdlog::info("[Demo] {}: {} -> {}", e.server_id, e.old_state, e.new_state);
  });
  bus.subscribe<events::ServerQuarantined>([](const events::ServerQuarantined &e) {
    spdlog::warn("[Demo] {} quarantined: {}", e.server_id, e.reason);
  });

  RegistryOptions options;
  options.settings = config.supervisor;
  options.bus = &bus;
  Registry registry(std::move(options));

  for (const auto &server : config.mcp_servers) {
    try {
      registry.register_server(server);
    } catch (const ConfigurationError &e) {
      std::cerr << "Skipping server: " << e.what() << std::endl;
    }
  }

  std::cout << "=== Starting servers ===" << std::endl;
  registry.start_all();
  print_status_table(registry);

  for (const auto &id : registry.server_ids()) {
    auto server = registry.get(id);
    if (!server || server->state() != ServerState::Running) continue;
    try {
      auto tools = registry.list_tools(id);
      std::cout << "\n" << id << ": " << tools.size() << " tools" << std::endl;
      for (const auto &tool : tools) {
        std::cout << "  - " << tool.name << ": " << tool.description << std::endl;
      }
    } catch (const McpError &e) {
      std::cerr << "  tools/list failed: " << e.what() << std::endl;
    }
  }

  int exit_code = 0;
  if (argc > 3) {
    json args = json::object();
    if (argc > 4) {
      try {
        args = json::parse(argv[4]);
      } catch (const json::parse_error &e) {
        std::cerr << "Invalid JSON arguments: " << e.what() << std::endl;
        return 1;
      }
    }

    std::cout << "\n=== Calling " << argv[2] << "/" << argv[3] << " ===" << std::endl;
    try {
      auto result = registry.call_tool(argv[2], argv[3], args);
      std::cout << (result.is_error ? "[tool error] " : "") << result.text() << std::endl;
    } catch (const McpError &e) {
      std::cerr << "Call failed: " << e.what() << std::endl;
      exit_code = 1;
    }
  }

  std::cout << "\n=== Stopping servers ===" << std::endl;
  registry.stop_all();
  print_status_table(registry);
  return exit_code;
}
