#pragma once

#include <optional>
#include <string>

namespace kennel::mcp {

enum class ServerState { Stopped, Starting, Running, Stopping, Error, Quarantined };

std::string to_string(ServerState state);

std::optional<ServerState> server_state_from_string(const std::string &name);

// Lifecycle edges:
//   Stopped -> Starting -> Running | Error
//   Running | Error -> Stopping -> Stopped
//   Running -> Error            (transport lost)
//   Stopped <-> Quarantined
bool is_valid_transition(ServerState from, ServerState to);

}  // namespace kennel::mcp
