#include "mcp/retry_manager.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

namespace kennel::mcp {

std::string to_string(BackoffStrategy strategy) {
  switch (strategy) {
    case BackoffStrategy::Fixed:
      return "fixed";
    case BackoffStrategy::Linear:
      return "linear";
    case BackoffStrategy::Exponential:
      return "exponential";
    case BackoffStrategy::ExponentialJitter:
      return "exponential_jitter";
  }
  return "exponential";
}

BackoffStrategy backoff_strategy_from_string(const std::string &name) {
  if (name == "fixed") return BackoffStrategy::Fixed;
  if (name == "linear") return BackoffStrategy::Linear;
  if (name == "exponential_jitter") return BackoffStrategy::ExponentialJitter;
  return BackoffStrategy::Exponential;
}

json RetryStats::to_json() const {
  json j;
  j["total_calls"] = total_calls;
  j["successful_calls"] = successful_calls;
  j["failed_calls"] = failed_calls;
  j["total_attempts"] = total_attempts;
  j["average_attempts"] = average_attempts();
  j["last_retry_time"] =
      last_retry_time ? json(std::chrono::duration<double>(last_retry_time->time_since_epoch()).count()) : json(nullptr);
  return j;
}

RetryManager::RetryManager(RetryOptions options, Sleeper sleeper, CircuitCheck circuit_open, WallClock clock)
    : options_(options),
      sleeper_(std::move(sleeper)),
      circuit_open_(std::move(circuit_open)),
      clock_(clock ? std::move(clock) : system_wall_clock()),
      rng_(std::random_device{}()) {
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds delay) {
      std::this_thread::sleep_for(delay);
    };
  }
}

std::chrono::milliseconds RetryManager::calculate_backoff(int attempt, const RetryOptions &options) {
  attempt = std::max(attempt, 1);
  double base = static_cast<double>(options.base_delay.count());
  double delay;

  switch (options.strategy) {
    case BackoffStrategy::Fixed:
      delay = base;
      break;
    case BackoffStrategy::Linear:
      delay = base * attempt;
      break;
    case BackoffStrategy::ExponentialJitter: {
      delay = base * std::pow(options.multiplier, attempt - 1);
      double factor;
      {
        std::lock_guard<std::mutex> lock(rng_mutex_);
        std::uniform_real_distribution<double> dist(1.0 - options.jitter, 1.0 + options.jitter);
        factor = dist(rng_);
      }
      delay = std::max(delay * factor, static_cast<double>(options.min_delay.count()));
      break;
    }
    case BackoffStrategy::Exponential:
    default:
      delay = base * std::pow(options.multiplier, attempt - 1);
      break;
  }

  delay = std::min(delay, static_cast<double>(options.max_delay.count()));
  return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

bool RetryManager::is_retryable(const std::exception &e) {
  if (const auto *mcp = dynamic_cast<const McpError *>(&e)) {
    return mcp->retryable();
  }
  return category_of(classify_message(e.what())) == ErrorCategory::Transient;
}

void RetryManager::record_outcome(const std::string &server_id, int attempts, bool success) {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  auto &stats = stats_[server_id];
  ++stats.total_calls;
  stats.total_attempts += static_cast<uint64_t>(attempts);
  if (success) {
    ++stats.successful_calls;
  } else {
    ++stats.failed_calls;
  }
}

void RetryManager::record_retry(const std::string &server_id) {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  stats_[server_id].last_retry_time = clock_();
}

RetryStats RetryManager::get_retry_stats(const std::string &server_id) const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  auto it = stats_.find(server_id);
  return it == stats_.end() ? RetryStats{} : it->second;
}

std::map<std::string, RetryStats> RetryManager::get_all_stats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

RetryStats RetryManager::get_aggregate_stats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  RetryStats total;
  for (const auto &[id, stats] : stats_) {
    total.total_calls += stats.total_calls;
    total.successful_calls += stats.successful_calls;
    total.failed_calls += stats.failed_calls;
    total.total_attempts += stats.total_attempts;
    if (stats.last_retry_time && (!total.last_retry_time || *stats.last_retry_time > *total.last_retry_time)) {
      total.last_retry_time = stats.last_retry_time;
    }
  }
  return total;
}

void RetryManager::clear_stats(const std::string &server_id) {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  stats_.erase(server_id);
}

void RetryManager::clear_all_stats() {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  stats_.clear();
}

}  // namespace kennel::mcp
