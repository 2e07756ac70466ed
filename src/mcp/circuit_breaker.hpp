#pragma once

#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "core/types.hpp"

namespace kennel::mcp {

enum class CircuitState { Closed, Open, HalfOpen };

std::string to_string(CircuitState state);

struct CircuitBreakerOptions {
  // Consecutive failures that open the circuit
  int failure_threshold = 3;

  // Optional rolling window: open when window_failures of the last
  // window_size calls failed. Disabled while window_size is 0.
  int window_size = 0;
  int window_failures = 0;

  std::chrono::milliseconds cooldown{30000};
  double cooldown_multiplier = 2.0;
  std::chrono::milliseconds max_cooldown{600000};
};

// Closed -> Open after repeated failures. Once the cooldown elapses a single
// HalfOpen trial call is admitted: success closes the circuit and resets the
// cooldown, failure reopens it with the cooldown multiplied (capped).
class CircuitBreaker {
 public:
  using StateListener = std::function<void(CircuitState old_state, CircuitState new_state)>;

  explicit CircuitBreaker(std::string name, CircuitBreakerOptions options = {}, MonotonicClock clock = system_monotonic_clock());

  const std::string &name() const {
    return name_;
  }

  // Admission check. HalfOpen admits one trial call at a time.
  bool allow_request();

  void record_success();
  void record_failure();

  // Frees a HalfOpen trial call slot whose call ended without a verdict
  void release_trial();

  CircuitState state();
  bool is_open() {
    return state() == CircuitState::Open;
  }

  void force_open();
  void force_close();
  void reset() {
    force_close();
  }

  int consecutive_failures() const;
  std::chrono::milliseconds current_cooldown() const;
  // Zero unless Open
  std::chrono::milliseconds remaining_cooldown();

  void set_state_listener(StateListener listener);

 private:
  using Change = std::optional<std::pair<CircuitState, CircuitState>>;

  Change refresh_locked();
  Change set_state_locked(CircuitState to);
  void notify(const Change &change);
  bool window_tripped_locked() const;

  std::string name_;
  CircuitBreakerOptions options_;
  MonotonicClock clock_;

  mutable std::mutex mutex_;
  CircuitState state_ = CircuitState::Closed;
  int consecutive_failures_ = 0;
  std::deque<bool> window_;  // true = failure
  std::chrono::milliseconds cooldown_;
  std::chrono::steady_clock::time_point opened_at_{};
  bool trial_in_flight_ = false;

  std::mutex listener_mutex_;
  StateListener listener_;
};

}  // namespace kennel::mcp
