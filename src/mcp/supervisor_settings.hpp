#pragma once

#include <chrono>
#include <map>
#include <nlohmann/json.hpp>
#include <string>

#include "mcp/error_isolator.hpp"
#include "mcp/retry_manager.hpp"
#include "mcp/status_tracker.hpp"
#include "tool/concurrency_gate.hpp"

namespace kennel::mcp {

using json = nlohmann::json;

// Tunables for the supervision layer. JSON layout:
//   {"breaker": {...}, "isolator": {...}, "retry": {...},
//    "status": {...}, "gate": {...}, "timeouts": {...}}
// Durations are written in milliseconds with an "_ms" suffix.
struct SupervisorSettings {
  IsolatorOptions isolator;
  RetryOptions retry;

  size_t event_capacity = StatusTracker::kDefaultEventCapacity;
  int event_retention_days = 7;

  std::chrono::milliseconds start_timeout{30000};
  std::chrono::milliseconds stop_timeout{10000};

  tool::ToolClass default_tool_class = tool::ToolClass::Read;
  std::map<std::string, tool::ToolClass> tool_classes;  // added on top of the built-in table

  // Missing keys keep their defaults. Malformed values throw ConfigurationError.
  static SupervisorSettings from_json(const json &j);
  json to_json() const;
};

}  // namespace kennel::mcp
