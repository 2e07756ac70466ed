#include "mcp/status_tracker.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace kennel::mcp {

namespace {

double to_epoch_seconds(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

}  // namespace

json Event::to_json() const {
  return json{{"timestamp", to_epoch_seconds(timestamp)}, {"server_id", server_id}, {"event_type", event_type}, {"details", details}};
}

json ServerSummary::to_json() const {
  json j;
  j["server_id"] = server_id;
  j["state"] = to_string(state);
  j["metadata"] = metadata;
  j["uptime_seconds"] = uptime ? json(std::chrono::duration<double>(*uptime).count()) : json(nullptr);
  j["start_time"] = start_time ? json(to_epoch_seconds(*start_time)) : json(nullptr);
  j["stop_time"] = stop_time ? json(to_epoch_seconds(*stop_time)) : json(nullptr);
  j["recent_events_count"] = recent_events_count;
  j["last_event_time"] = last_event_time ? json(to_epoch_seconds(*last_event_time)) : json(nullptr);
  return j;
}

StatusTracker::StatusTracker(size_t event_capacity, WallClock clock, MonotonicClock monotonic_clock)
    : event_capacity_(event_capacity == 0 ? 1 : event_capacity),
      clock_(clock ? std::move(clock) : system_wall_clock()),
      monotonic_clock_(monotonic_clock ? std::move(monotonic_clock) : system_monotonic_clock()) {}

void StatusTracker::stamp_start_locked(ServerRecord &record) {
  record.start_time = clock_();
  record.started_at = monotonic_clock_();
  record.stop_time.reset();
  record.stopped_at.reset();
}

void StatusTracker::stamp_stop_locked(ServerRecord &record) {
  record.stop_time = clock_();
  record.stopped_at = monotonic_clock_();
}

void StatusTracker::set_status(const std::string &server_id, ServerState state) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &record = servers_[server_id];
  ServerState old_state = record.state;
  record.state = state;

  if (state == ServerState::Running) {
    stamp_start_locked(record);
  } else if (old_state == ServerState::Running && record.started_at) {
    stamp_stop_locked(record);
  }

  append_event_locked(record, Event{clock_(), server_id, "state_change", json{{"old_state", to_string(old_state)}, {"new_state", to_string(state)}}});
}

ServerState StatusTracker::get_status(const std::string &server_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = servers_.find(server_id);
  return it == servers_.end() ? ServerState::Stopped : it->second.state;
}

void StatusTracker::record_start_time(const std::string &server_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  stamp_start_locked(servers_[server_id]);
}

void StatusTracker::record_stop_time(const std::string &server_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  stamp_stop_locked(servers_[server_id]);
}

std::optional<std::chrono::milliseconds> StatusTracker::uptime_locked(const ServerRecord &record) const {
  if (!record.started_at) return std::nullopt;
  auto end = record.stopped_at ? *record.stopped_at : monotonic_clock_();
  return std::chrono::duration_cast<std::chrono::milliseconds>(end - *record.started_at);
}

std::optional<std::chrono::milliseconds> StatusTracker::get_uptime(const std::string &server_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = servers_.find(server_id);
  if (it == servers_.end()) return std::nullopt;
  return uptime_locked(it->second);
}

void StatusTracker::set_metadata(const std::string &server_id, const std::string &key, json value) {
  std::lock_guard<std::mutex> lock(mutex_);
  servers_[server_id].metadata[key] = std::move(value);
}

std::optional<json> StatusTracker::get_metadata(const std::string &server_id, const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = servers_.find(server_id);
  if (it == servers_.end() || !it->second.metadata.contains(key)) return std::nullopt;
  return it->second.metadata[key];
}

json StatusTracker::get_all_metadata(const std::string &server_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = servers_.find(server_id);
  return it == servers_.end() ? json::object() : it->second.metadata;
}

void StatusTracker::record_event(const std::string &server_id, const std::string &event_type, json details) {
  std::lock_guard<std::mutex> lock(mutex_);
  append_event_locked(servers_[server_id], Event{clock_(), server_id, event_type, std::move(details)});
}

void StatusTracker::append_event_locked(ServerRecord &record, Event event) {
  record.events.push_back(std::move(event));
  while (record.events.size() > event_capacity_) {
    record.events.pop_front();
  }
}

std::vector<Event> StatusTracker::get_events(const std::string &server_id, size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = servers_.find(server_id);
  if (it == servers_.end()) return {};
  const auto &events = it->second.events;
  size_t count = std::min(limit, events.size());
  return {events.end() - static_cast<std::ptrdiff_t>(count), events.end()};
}

void StatusTracker::cleanup_old_data(int days) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto cutoff = clock_() - std::chrono::hours(24) * days;
  size_t removed = 0;
  for (auto &[id, record] : servers_) {
    auto &events = record.events;
    // Events are appended in time order
    auto keep = std::find_if(events.begin(), events.end(), [&](const Event &e) {
      return e.timestamp >= cutoff;
    });
    removed += static_cast<size_t>(std::distance(events.begin(), keep));
    events.erase(events.begin(), keep);
  }
  if (removed > 0) {
    spdlog::debug("[MCP] Pruned {} status events older than {} days", removed, days);
  }
}

ServerSummary StatusTracker::get_server_summary(const std::string &server_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  ServerSummary summary;
  summary.server_id = server_id;

  auto it = servers_.find(server_id);
  if (it == servers_.end()) return summary;

  const auto &record = it->second;
  summary.state = record.state;
  summary.metadata = record.metadata;
  summary.uptime = uptime_locked(record);
  summary.start_time = record.start_time;
  summary.stop_time = record.stop_time;
  summary.recent_events_count = record.events.size();
  if (!record.events.empty()) {
    summary.last_event_time = record.events.back().timestamp;
  }
  return summary;
}

void StatusTracker::remove_server(const std::string &server_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  servers_.erase(server_id);
}

std::vector<std::string> StatusTracker::server_ids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(servers_.size());
  for (const auto &[id, record] : servers_) {
    ids.push_back(id);
  }
  return ids;
}

}  // namespace kennel::mcp
