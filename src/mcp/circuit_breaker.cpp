#include "mcp/circuit_breaker.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace kennel::mcp {

std::string to_string(CircuitState state) {
  switch (state) {
    case CircuitState::Closed:
      return "closed";
    case CircuitState::Open:
      return "open";
    case CircuitState::HalfOpen:
      return "half_open";
  }
  return "unknown";
}

CircuitBreaker::CircuitBreaker(std::string name, CircuitBreakerOptions options, MonotonicClock clock)
    : name_(std::move(name)),
      options_(options),
      clock_(clock ? std::move(clock) : system_monotonic_clock()),
      cooldown_(options.cooldown) {
  if (options_.failure_threshold < 1) options_.failure_threshold = 1;
  if (options_.cooldown_multiplier < 1.0) options_.cooldown_multiplier = 1.0;
  if (options_.max_cooldown < options_.cooldown) options_.max_cooldown = options_.cooldown;
}

CircuitBreaker::Change CircuitBreaker::set_state_locked(CircuitState to) {
  if (state_ == to) return std::nullopt;
  auto from = state_;
  state_ = to;
  return std::make_pair(from, to);
}

// Open -> HalfOpen once the cooldown has elapsed
CircuitBreaker::Change CircuitBreaker::refresh_locked() {
  if (state_ == CircuitState::Open && clock_() - opened_at_ >= cooldown_) {
    trial_in_flight_ = false;
    return set_state_locked(CircuitState::HalfOpen);
  }
  return std::nullopt;
}

bool CircuitBreaker::window_tripped_locked() const {
  if (options_.window_size <= 0 || options_.window_failures <= 0) return false;
  if (static_cast<int>(window_.size()) < options_.window_size) return false;
  auto failures = std::count(window_.begin(), window_.end(), true);
  return failures >= options_.window_failures;
}

void CircuitBreaker::notify(const Change &change) {
  if (!change) return;
  auto [from, to] = *change;
  if (to == CircuitState::Open) {
    spdlog::warn("[Breaker] '{}': {} -> {} (cooldown {} ms)", name_, to_string(from), to_string(to), current_cooldown().count());
  } else {
    spdlog::info("[Breaker] '{}': {} -> {}", name_, to_string(from), to_string(to));
  }

  StateListener listener;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener = listener_;
  }
  if (listener) {
    listener(from, to);
  }
}

bool CircuitBreaker::allow_request() {
  Change change;
  bool allowed = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    change = refresh_locked();
    switch (state_) {
      case CircuitState::Closed:
        allowed = true;
        break;
      case CircuitState::Open:
        allowed = false;
        break;
      case CircuitState::HalfOpen:
        allowed = !trial_in_flight_;
        trial_in_flight_ = true;
        break;
    }
  }
  notify(change);
  return allowed;
}

void CircuitBreaker::record_success() {
  Change change;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (state_) {
      case CircuitState::Closed:
        consecutive_failures_ = 0;
        if (options_.window_size > 0) {
          window_.push_back(false);
          while (static_cast<int>(window_.size()) > options_.window_size) window_.pop_front();
        }
        break;
      case CircuitState::HalfOpen:
        consecutive_failures_ = 0;
        window_.clear();
        cooldown_ = options_.cooldown;
        trial_in_flight_ = false;
        change = set_state_locked(CircuitState::Closed);
        break;
      case CircuitState::Open:
        // Late result of a call admitted before the circuit opened
        break;
    }
  }
  notify(change);
}

void CircuitBreaker::record_failure() {
  Change change;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (state_) {
      case CircuitState::Closed:
        ++consecutive_failures_;
        if (options_.window_size > 0) {
          window_.push_back(true);
          while (static_cast<int>(window_.size()) > options_.window_size) window_.pop_front();
        }
        if (consecutive_failures_ >= options_.failure_threshold || window_tripped_locked()) {
          opened_at_ = clock_();
          change = set_state_locked(CircuitState::Open);
        }
        break;
      case CircuitState::HalfOpen: {
        ++consecutive_failures_;
        auto grown = std::chrono::milliseconds(static_cast<int64_t>(static_cast<double>(cooldown_.count()) * options_.cooldown_multiplier));
        cooldown_ = std::min(grown, options_.max_cooldown);
        opened_at_ = clock_();
        trial_in_flight_ = false;
        change = set_state_locked(CircuitState::Open);
        break;
      }
      case CircuitState::Open:
        ++consecutive_failures_;
        break;
    }
  }
  notify(change);
}

void CircuitBreaker::release_trial() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ == CircuitState::HalfOpen) {
    trial_in_flight_ = false;
  }
}

CircuitState CircuitBreaker::state() {
  Change change;
  CircuitState current;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    change = refresh_locked();
    current = state_;
  }
  notify(change);
  return current;
}

void CircuitBreaker::force_open() {
  Change change;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    opened_at_ = clock_();
    trial_in_flight_ = false;
    change = set_state_locked(CircuitState::Open);
  }
  notify(change);
}

void CircuitBreaker::force_close() {
  Change change;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    consecutive_failures_ = 0;
    window_.clear();
    cooldown_ = options_.cooldown;
    trial_in_flight_ = false;
    change = set_state_locked(CircuitState::Closed);
  }
  notify(change);
}

int CircuitBreaker::consecutive_failures() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return consecutive_failures_;
}

std::chrono::milliseconds CircuitBreaker::current_cooldown() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cooldown_;
}

std::chrono::milliseconds CircuitBreaker::remaining_cooldown() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != CircuitState::Open) return std::chrono::milliseconds(0);
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(cooldown_ - (clock_() - opened_at_));
  return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

void CircuitBreaker::set_state_listener(StateListener listener) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listener_ = std::move(listener);
}

}  // namespace kennel::mcp
