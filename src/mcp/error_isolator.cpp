#include "mcp/error_isolator.hpp"

#include <spdlog/spdlog.h>

#include "bus/bus.hpp"

namespace kennel::mcp {

namespace {

double to_epoch_seconds(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

}  // namespace

json ErrorStats::to_json() const {
  json counts = json::object();
  for (const auto &[kind, count] : error_counts) {
    counts[to_string(kind)] = count;
  }
  json j;
  j["total_errors"] = total_errors;
  j["consecutive_errors"] = consecutive_errors;
  j["last_error_time"] = last_error_time ? json(to_epoch_seconds(*last_error_time)) : json(nullptr);
  j["last_error_message"] = last_error_message;
  j["error_counts"] = counts;
  j["quarantine_count"] = quarantine_count;
  j["quarantined"] = quarantined;
  if (quarantined) {
    j["quarantine_reason"] = quarantine_reason;
    j["quarantined_at"] = quarantined_at ? json(to_epoch_seconds(*quarantined_at)) : json(nullptr);
  }
  return j;
}

ErrorIsolator::ErrorIsolator(IsolatorOptions options, MonotonicClock monotonic, WallClock wall, Bus *bus)
    : options_(options),
      monotonic_(monotonic ? std::move(monotonic) : system_monotonic_clock()),
      wall_(wall ? std::move(wall) : system_wall_clock()),
      bus_(bus) {
  if (options_.quarantine_threshold <= options_.breaker.failure_threshold) {
    spdlog::warn("[Isolator] quarantine_threshold {} does not exceed breaker threshold {}, raising it", options_.quarantine_threshold,
                 options_.breaker.failure_threshold);
    options_.quarantine_threshold = options_.breaker.failure_threshold + 1;
  }
}

ErrorIsolator::Entry &ErrorIsolator::entry_locked(const std::string &server_id) {
  auto it = entries_.find(server_id);
  if (it != entries_.end()) return it->second;

  Entry entry;
  entry.breaker = std::make_shared<CircuitBreaker>(server_id, options_.breaker, monotonic_);
  if (bus_) {
    entry.breaker->set_state_listener([bus = bus_, server_id](CircuitState from, CircuitState to) {
      bus->publish(events::CircuitStateChanged{server_id, to_string(from), to_string(to)});
    });
  }
  return entries_.emplace(server_id, std::move(entry)).first->second;
}

std::shared_ptr<CircuitBreaker> ErrorIsolator::breaker(const std::string &server_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return entry_locked(server_id).breaker;
}

void ErrorIsolator::before_call(const std::string &server_id) {
  std::shared_ptr<CircuitBreaker> cb;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &entry = entry_locked(server_id);
    if (entry.stats.quarantined) {
      throw QuarantinedServerError(server_id);
    }
    cb = entry.breaker;
  }
  // Breaker calls stay outside the isolator lock; they may publish events
  if (!cb->allow_request()) {
    auto left = cb->remaining_cooldown();
    std::string detail = left.count() > 0 ? "circuit breaker is open (retry in " + std::to_string(left.count()) + " ms)"
                                          : "circuit breaker trial call already in flight";
    throw CircuitOpenError(server_id, detail);
  }
}

void ErrorIsolator::record_success(const std::string &server_id) {
  std::shared_ptr<CircuitBreaker> cb;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &entry = entry_locked(server_id);
    entry.stats.consecutive_errors = 0;
    cb = entry.breaker;
  }
  cb->record_success();
}

void ErrorIsolator::record_neutral(const std::string &server_id) {
  breaker(server_id)->release_trial();
}

void ErrorIsolator::record_failure(const std::string &server_id, ErrorKind kind, const std::string &message) {
  auto category = category_of(kind);
  std::shared_ptr<CircuitBreaker> cb;
  std::optional<std::string> quarantine_reason;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &entry = entry_locked(server_id);
    auto &stats = entry.stats;
    cb = entry.breaker;

    ++stats.total_errors;
    ++stats.error_counts[kind];
    stats.last_error_time = wall_();
    stats.last_error_message = message;

    if (category == ErrorCategory::Fatal) {
      if (!stats.quarantined) {
        quarantine_reason = "fatal " + to_string(kind) + " error: " + message;
      }
    } else {
      ++stats.consecutive_errors;
      if (!stats.quarantined && stats.consecutive_errors >= options_.quarantine_threshold) {
        quarantine_reason = std::to_string(stats.consecutive_errors) + " consecutive failures, last: " + message;
      }
    }

    if (quarantine_reason) {
      stats.quarantined = true;
      stats.quarantine_reason = *quarantine_reason;
      stats.quarantined_at = wall_();
      ++stats.quarantine_count;
    }
  }

  spdlog::warn("[Isolator] '{}' {} failure ({}): {}", server_id, to_string(category), to_string(kind), message);

  if (category == ErrorCategory::Fatal) {
    cb->release_trial();
  } else {
    cb->record_failure();
  }

  if (quarantine_reason) {
    publish_quarantine(server_id, *quarantine_reason);
  }
}

void ErrorIsolator::publish_quarantine(const std::string &server_id, const std::string &reason) {
  spdlog::error("[Isolator] Server '{}' quarantined: {}", server_id, reason);
  if (bus_) {
    bus_->publish(events::ServerQuarantined{server_id, reason});
  }
}

bool ErrorIsolator::is_quarantined(const std::string &server_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(server_id);
  return it != entries_.end() && it->second.stats.quarantined;
}

void ErrorIsolator::quarantine(const std::string &server_id, const std::string &reason) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &stats = entry_locked(server_id).stats;
    if (stats.quarantined) return;
    stats.quarantined = true;
    stats.quarantine_reason = reason;
    stats.quarantined_at = wall_();
    ++stats.quarantine_count;
  }
  publish_quarantine(server_id, reason);
}

void ErrorIsolator::clear_quarantine(const std::string &server_id) {
  std::shared_ptr<CircuitBreaker> cb;
  bool was_quarantined;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &entry = entry_locked(server_id);
    was_quarantined = entry.stats.quarantined;
    entry.stats.quarantined = false;
    entry.stats.quarantine_reason.clear();
    entry.stats.quarantined_at.reset();
    entry.stats.consecutive_errors = 0;
    cb = entry.breaker;
  }
  cb->reset();

  if (was_quarantined) {
    spdlog::info("[Isolator] Quarantine cleared for '{}'", server_id);
    if (bus_) {
      bus_->publish(events::QuarantineCleared{server_id});
    }
  }
}

CircuitState ErrorIsolator::circuit_state(const std::string &server_id) const {
  std::shared_ptr<CircuitBreaker> cb;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(server_id);
    if (it == entries_.end()) return CircuitState::Closed;
    cb = it->second.breaker;
  }
  return cb->state();
}

bool ErrorIsolator::is_circuit_open(const std::string &server_id) const {
  return circuit_state(server_id) == CircuitState::Open;
}

void ErrorIsolator::force_open(const std::string &server_id) {
  breaker(server_id)->force_open();
}

void ErrorIsolator::force_close(const std::string &server_id) {
  breaker(server_id)->force_close();
}

void ErrorIsolator::reset_breaker(const std::string &server_id) {
  breaker(server_id)->reset();
}

ErrorStats ErrorIsolator::get_error_stats(const std::string &server_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(server_id);
  return it == entries_.end() ? ErrorStats{} : it->second.stats;
}

std::map<std::string, ErrorStats> ErrorIsolator::get_all_stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::map<std::string, ErrorStats> result;
  for (const auto &[id, entry] : entries_) {
    result[id] = entry.stats;
  }
  return result;
}

void ErrorIsolator::remove_server(const std::string &server_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.erase(server_id);
}

}  // namespace kennel::mcp
