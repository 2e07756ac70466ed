#include "mcp/supervisor_settings.hpp"

#include "mcp/errors.hpp"

namespace kennel::mcp {

namespace {

template <typename T>
void read_value(const json &obj, const char *key, T &out) {
  if (obj.contains(key) && !obj[key].is_null()) {
    out = obj[key].get<T>();
  }
}

void read_ms(const json &obj, const char *key, std::chrono::milliseconds &out) {
  if (obj.contains(key) && !obj[key].is_null()) {
    out = std::chrono::milliseconds(obj[key].get<int64_t>());
  }
}

tool::ToolClass parse_tool_class(const std::string &name) {
  auto cls = tool::tool_class_from_string(name);
  if (!cls) {
    throw ConfigurationError("Unknown tool class '" + name + "' (expected read, write or execute)");
  }
  return *cls;
}

}  // namespace

SupervisorSettings SupervisorSettings::from_json(const json &j) {
  SupervisorSettings s;
  if (!j.is_object()) {
    if (j.is_null()) return s;
    throw ConfigurationError("Supervisor settings must be a JSON object");
  }

  try {
    if (j.contains("breaker")) {
      const auto &b = j["breaker"];
      auto &opts = s.isolator.breaker;
      read_value(b, "failure_threshold", opts.failure_threshold);
      read_value(b, "window_size", opts.window_size);
      read_value(b, "window_failures", opts.window_failures);
      read_ms(b, "cooldown_ms", opts.cooldown);
      read_value(b, "cooldown_multiplier", opts.cooldown_multiplier);
      read_ms(b, "max_cooldown_ms", opts.max_cooldown);
    }

    if (j.contains("isolator")) {
      read_value(j["isolator"], "quarantine_threshold", s.isolator.quarantine_threshold);
    }

    if (j.contains("retry")) {
      const auto &r = j["retry"];
      read_value(r, "max_attempts", s.retry.max_attempts);
      read_ms(r, "base_delay_ms", s.retry.base_delay);
      if (r.contains("strategy")) {
        s.retry.strategy = backoff_strategy_from_string(r["strategy"].get<std::string>());
      }
      read_value(r, "multiplier", s.retry.multiplier);
      read_value(r, "jitter", s.retry.jitter);
      read_ms(r, "min_delay_ms", s.retry.min_delay);
      read_ms(r, "max_delay_ms", s.retry.max_delay);
    }

    if (j.contains("status")) {
      read_value(j["status"], "event_capacity", s.event_capacity);
      read_value(j["status"], "retention_days", s.event_retention_days);
    }

    if (j.contains("timeouts")) {
      read_ms(j["timeouts"], "start_ms", s.start_timeout);
      read_ms(j["timeouts"], "stop_ms", s.stop_timeout);
    }

    if (j.contains("gate")) {
      const auto &g = j["gate"];
      if (g.contains("default_class")) {
        s.default_tool_class = parse_tool_class(g["default_class"].get<std::string>());
      }
      if (g.contains("tools")) {
        for (const auto &[name, cls] : g["tools"].items()) {
          s.tool_classes[name] = parse_tool_class(cls.get<std::string>());
        }
      }
    }
  } catch (const json::exception &e) {
    throw ConfigurationError(std::string("Invalid supervisor settings: ") + e.what());
  }

  if (s.isolator.breaker.failure_threshold < 1) {
    throw ConfigurationError("breaker.failure_threshold must be at least 1");
  }
  if (s.isolator.breaker.cooldown.count() <= 0) {
    throw ConfigurationError("breaker.cooldown_ms must be positive");
  }
  if (s.event_capacity == 0) {
    throw ConfigurationError("status.event_capacity must be positive");
  }
  if (s.event_retention_days < 1) {
    throw ConfigurationError("status.retention_days must be at least 1");
  }
  if (s.start_timeout.count() <= 0) {
    throw ConfigurationError("timeouts.start_ms must be positive");
  }
  if (s.stop_timeout.count() < 0) {
    throw ConfigurationError("timeouts.stop_ms must not be negative");
  }
  return s;
}

json SupervisorSettings::to_json() const {
  const auto &b = isolator.breaker;
  json tools = json::object();
  for (const auto &[name, cls] : tool_classes) {
    tools[name] = tool::to_string(cls);
  }

  return json{
      {"breaker",
       {{"failure_threshold", b.failure_threshold},
        {"window_size", b.window_size},
        {"window_failures", b.window_failures},
        {"cooldown_ms", b.cooldown.count()},
        {"cooldown_multiplier", b.cooldown_multiplier},
        {"max_cooldown_ms", b.max_cooldown.count()}}},
      {"isolator", {{"quarantine_threshold", isolator.quarantine_threshold}}},
      {"retry",
       {{"max_attempts", retry.max_attempts},
        {"base_delay_ms", retry.base_delay.count()},
        {"strategy", mcp::to_string(retry.strategy)},
        {"multiplier", retry.multiplier},
        {"jitter", retry.jitter},
        {"min_delay_ms", retry.min_delay.count()},
        {"max_delay_ms", retry.max_delay.count()}}},
      {"status", {{"event_capacity", event_capacity}, {"retention_days", event_retention_days}}},
      {"timeouts", {{"start_ms", start_timeout.count()}, {"stop_ms", stop_timeout.count()}}},
      {"gate", {{"default_class", tool::to_string(default_tool_class)}, {"tools", tools}}},
  };
}

}  // namespace kennel::mcp
