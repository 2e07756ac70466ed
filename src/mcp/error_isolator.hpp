#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <type_traits>

#include "core/types.hpp"
#include "mcp/circuit_breaker.hpp"
#include "mcp/errors.hpp"

namespace kennel {
class Bus;
}

namespace kennel::mcp {

using json = nlohmann::json;

struct ErrorStats {
  uint64_t total_errors = 0;
  int consecutive_errors = 0;
  std::optional<std::chrono::system_clock::time_point> last_error_time;
  std::string last_error_message;
  std::map<ErrorKind, uint64_t> error_counts;
  int quarantine_count = 0;
  bool quarantined = false;
  std::string quarantine_reason;
  std::optional<std::chrono::system_clock::time_point> quarantined_at;

  json to_json() const;
};

struct IsolatorOptions {
  CircuitBreakerOptions breaker;

  // Consecutive counted failures that quarantine a server. Kept above the
  // breaker threshold so the breaker always gets a chance to recover first.
  int quarantine_threshold = 10;
};

// Classifies provider failures, owns one circuit breaker per server and the
// sticky quarantine flag. Quarantine is only lifted by clear_quarantine().
class ErrorIsolator {
 public:
  explicit ErrorIsolator(IsolatorOptions options = {}, MonotonicClock monotonic = system_monotonic_clock(),
                         WallClock wall = system_wall_clock(), Bus *bus = nullptr);

  // Throws QuarantinedServerError or CircuitOpenError when the call must not
  // reach the provider. In HalfOpen this claims the single trial call slot.
  void before_call(const std::string &server_id);

  void record_success(const std::string &server_id);

  // Counts a provider failure. Fatal failures quarantine immediately.
  void record_failure(const std::string &server_id, ErrorKind kind, const std::string &message);

  // Call ended without a verdict on the provider (e.g. rejected upstream)
  void record_neutral(const std::string &server_id);

  // Runs fn through the breaker and quarantine checks, recording the outcome
  template <typename F>
  auto call(const std::string &server_id, F &&fn) -> std::invoke_result_t<F> {
    before_call(server_id);
    try {
      if constexpr (std::is_void_v<std::invoke_result_t<F>>) {
        fn();
        record_success(server_id);
      } else {
        auto result = fn();
        record_success(server_id);
        return result;
      }
    } catch (const McpError &e) {
      if (e.category() == ErrorCategory::Transient || e.category() == ErrorCategory::Protocol || e.category() == ErrorCategory::Fatal) {
        record_failure(server_id, e.kind(), e.what());
      } else {
        record_neutral(server_id);
      }
      throw;
    } catch (const std::exception &e) {
      record_failure(server_id, classify_message(e.what()), e.what());
      throw;
    }
  }

  bool is_quarantined(const std::string &server_id) const;
  void quarantine(const std::string &server_id, const std::string &reason);
  // Lifts quarantine, resets the consecutive count and the breaker
  void clear_quarantine(const std::string &server_id);

  // Closed for servers that have not been seen yet
  CircuitState circuit_state(const std::string &server_id) const;
  bool is_circuit_open(const std::string &server_id) const;
  void force_open(const std::string &server_id);
  void force_close(const std::string &server_id);
  void reset_breaker(const std::string &server_id);

  ErrorStats get_error_stats(const std::string &server_id) const;
  std::map<std::string, ErrorStats> get_all_stats() const;

  void remove_server(const std::string &server_id);

  const IsolatorOptions &options() const {
    return options_;
  }

 private:
  struct Entry {
    std::shared_ptr<CircuitBreaker> breaker;
    ErrorStats stats;
  };

  Entry &entry_locked(const std::string &server_id);
  std::shared_ptr<CircuitBreaker> breaker(const std::string &server_id);
  void publish_quarantine(const std::string &server_id, const std::string &reason);

  IsolatorOptions options_;
  MonotonicClock monotonic_;
  WallClock wall_;
  Bus *bus_ = nullptr;

  mutable std::mutex mutex_;
  std::map<std::string, Entry> entries_;
};

}  // namespace kennel::mcp
