#pragma once

#include <spdlog/spdlog.h>

#include <chrono>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <random>
#include <string>
#include <type_traits>

#include "core/types.hpp"
#include "mcp/errors.hpp"

namespace kennel::mcp {

using json = nlohmann::json;

enum class BackoffStrategy { Fixed, Linear, Exponential, ExponentialJitter };

std::string to_string(BackoffStrategy strategy);

// Unknown names fall back to Exponential
BackoffStrategy backoff_strategy_from_string(const std::string &name);

struct RetryOptions {
  int max_attempts = 3;
  std::chrono::milliseconds base_delay{1000};
  BackoffStrategy strategy = BackoffStrategy::ExponentialJitter;
  double multiplier = 2.0;
  double jitter = 0.25;  // +/- fraction applied by ExponentialJitter
  std::chrono::milliseconds min_delay{100};
  std::chrono::milliseconds max_delay{30000};
};

struct RetryStats {
  uint64_t total_calls = 0;
  uint64_t successful_calls = 0;
  uint64_t failed_calls = 0;
  uint64_t total_attempts = 0;
  std::optional<std::chrono::system_clock::time_point> last_retry_time;

  double average_attempts() const {
    return total_calls == 0 ? 0.0 : static_cast<double>(total_attempts) / static_cast<double>(total_calls);
  }

  json to_json() const;
};

// Retries transient failures with backoff. Everything else propagates on the
// first attempt, and no retry is attempted while the server's breaker is open.
class RetryManager {
 public:
  // Reports whether a server's circuit is currently open
  using CircuitCheck = std::function<bool(const std::string &server_id)>;

  explicit RetryManager(RetryOptions options = {}, Sleeper sleeper = nullptr, CircuitCheck circuit_open = nullptr,
                        WallClock clock = system_wall_clock());

  template <typename F>
  auto retry(const std::string &server_id, F &&fn) -> std::invoke_result_t<F> {
    return retry(server_id, std::forward<F>(fn), options_);
  }

  template <typename F>
  auto retry(const std::string &server_id, F &&fn, const RetryOptions &options) -> std::invoke_result_t<F> {
    int max_attempts = options.max_attempts < 1 ? 1 : options.max_attempts;
    for (int attempt = 1;; ++attempt) {
      try {
        if constexpr (std::is_void_v<std::invoke_result_t<F>>) {
          fn();
          record_outcome(server_id, attempt, true);
          return;
        } else {
          auto result = fn();
          record_outcome(server_id, attempt, true);
          return result;
        }
      } catch (const std::exception &e) {
        if (attempt >= max_attempts || !is_retryable(e)) {
          record_outcome(server_id, attempt, false);
          throw;
        }
        if (circuit_open_ && circuit_open_(server_id)) {
          spdlog::warn("[Retry] '{}': circuit open, not retrying: {}", server_id, e.what());
          record_outcome(server_id, attempt, false);
          throw;
        }
        auto delay = calculate_backoff(attempt, options);
        spdlog::warn("[Retry] '{}' attempt {}/{} failed: {}. Retrying in {} ms", server_id, attempt, max_attempts, e.what(),
                     delay.count());
        record_retry(server_id);
        sleeper_(delay);
      }
    }
  }

  // Delay before the retry that follows failed attempt `attempt` (1-based)
  std::chrono::milliseconds calculate_backoff(int attempt, const RetryOptions &options);
  std::chrono::milliseconds calculate_backoff(int attempt) {
    return calculate_backoff(attempt, options_);
  }

  // Transient McpErrors, or plain exceptions whose message classifies as transient
  static bool is_retryable(const std::exception &e);

  RetryStats get_retry_stats(const std::string &server_id) const;
  std::map<std::string, RetryStats> get_all_stats() const;
  RetryStats get_aggregate_stats() const;
  void clear_stats(const std::string &server_id);
  void clear_all_stats();

  const RetryOptions &options() const {
    return options_;
  }

 private:
  void record_outcome(const std::string &server_id, int attempts, bool success);
  void record_retry(const std::string &server_id);

  RetryOptions options_;
  Sleeper sleeper_;
  CircuitCheck circuit_open_;
  WallClock clock_;

  std::mutex rng_mutex_;
  std::mt19937 rng_;

  mutable std::mutex stats_mutex_;
  std::map<std::string, RetryStats> stats_;
};

}  // namespace kennel::mcp
