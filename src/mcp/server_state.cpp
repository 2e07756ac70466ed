#include "mcp/server_state.hpp"

namespace kennel::mcp {

std::string to_string(ServerState state) {
  switch (state) {
    case ServerState::Stopped:
      return "stopped";
    case ServerState::Starting:
      return "starting";
    case ServerState::Running:
      return "running";
    case ServerState::Stopping:
      return "stopping";
    case ServerState::Error:
      return "error";
    case ServerState::Quarantined:
      return "quarantined";
  }
  return "unknown";
}

std::optional<ServerState> server_state_from_string(const std::string &name) {
  for (auto state : {ServerState::Stopped, ServerState::Starting, ServerState::Running, ServerState::Stopping, ServerState::Error,
                     ServerState::Quarantined}) {
    if (to_string(state) == name) return state;
  }
  return std::nullopt;
}

bool is_valid_transition(ServerState from, ServerState to) {
  switch (from) {
    case ServerState::Stopped:
      return to == ServerState::Starting || to == ServerState::Quarantined;
    case ServerState::Starting:
      return to == ServerState::Running || to == ServerState::Error;
    case ServerState::Running:
      return to == ServerState::Stopping || to == ServerState::Error;
    case ServerState::Error:
      return to == ServerState::Stopping;
    case ServerState::Stopping:
      return to == ServerState::Stopped;
    case ServerState::Quarantined:
      return to == ServerState::Stopped;
  }
  return false;
}

}  // namespace kennel::mcp
