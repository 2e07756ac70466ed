#pragma once

#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "mcp/server_state.hpp"

namespace kennel::mcp {

using json = nlohmann::json;

struct Event {
  std::chrono::system_clock::time_point timestamp;
  std::string server_id;
  std::string event_type;
  json details = json::object();

  json to_json() const;
};

struct ServerSummary {
  std::string server_id;
  ServerState state = ServerState::Stopped;
  json metadata = json::object();
  std::optional<std::chrono::milliseconds> uptime;
  std::optional<std::chrono::system_clock::time_point> start_time;
  std::optional<std::chrono::system_clock::time_point> stop_time;
  size_t recent_events_count = 0;
  std::optional<std::chrono::system_clock::time_point> last_event_time;

  json to_json() const;
};

// Per-server state, timestamps, metadata and a bounded event log.
// Internally synchronized; every accessor returns a copy.
class StatusTracker {
 public:
  static constexpr size_t kDefaultEventCapacity = 1000;

  // Timestamps come from the wall clock, uptime from the monotonic clock
  explicit StatusTracker(size_t event_capacity = kDefaultEventCapacity, WallClock clock = system_wall_clock(),
                         MonotonicClock monotonic_clock = system_monotonic_clock());

  // Records a state_change event; entering Running stamps the start time,
  // leaving Running (for Stopping, Error or anything else) the stop time
  void set_status(const std::string &server_id, ServerState state);
  ServerState get_status(const std::string &server_id) const;

  void record_start_time(const std::string &server_id);
  void record_stop_time(const std::string &server_id);

  // Running: time since the last start. Stopped after a start: the last
  // start-to-stop span. Never started: nullopt.
  std::optional<std::chrono::milliseconds> get_uptime(const std::string &server_id) const;

  void set_metadata(const std::string &server_id, const std::string &key, json value);
  std::optional<json> get_metadata(const std::string &server_id, const std::string &key) const;
  json get_all_metadata(const std::string &server_id) const;

  void record_event(const std::string &server_id, const std::string &event_type, json details = json::object());

  // Most recent `limit` events, oldest first
  std::vector<Event> get_events(const std::string &server_id, size_t limit = 100) const;

  // Drops events older than `days` across all servers
  void cleanup_old_data(int days = 7);

  ServerSummary get_server_summary(const std::string &server_id) const;

  void remove_server(const std::string &server_id);
  std::vector<std::string> server_ids() const;

 private:
  struct ServerRecord {
    ServerState state = ServerState::Stopped;
    json metadata = json::object();
    std::deque<Event> events;
    std::optional<std::chrono::system_clock::time_point> start_time;
    std::optional<std::chrono::system_clock::time_point> stop_time;
    std::optional<std::chrono::steady_clock::time_point> started_at;
    std::optional<std::chrono::steady_clock::time_point> stopped_at;
  };

  void stamp_start_locked(ServerRecord &record);
  void stamp_stop_locked(ServerRecord &record);

  void append_event_locked(ServerRecord &record, Event event);
  std::optional<std::chrono::milliseconds> uptime_locked(const ServerRecord &record) const;

  size_t event_capacity_;
  WallClock clock_;
  MonotonicClock monotonic_clock_;

  mutable std::mutex mutex_;
  std::map<std::string, ServerRecord> servers_;
};

}  // namespace kennel::mcp
