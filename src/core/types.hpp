#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace kennel {

// Value-or-error result for operations that report a reason instead of throwing
template <typename T>
struct Result {
  std::optional<T> value;
  std::optional<std::string> error;

  bool ok() const {
    return value.has_value();
  }
  bool failed() const {
    return error.has_value();
  }

  static Result success(T v) {
    Result r;
    r.value = std::move(v);
    return r;
  }

  static Result failure(std::string err) {
    Result r;
    r.error = std::move(err);
    return r;
  }
};

// Injectable time sources. Wall time is used for event timestamps and uptime,
// monotonic time for cooldowns and timeouts.
using WallClock = std::function<std::chrono::system_clock::time_point()>;
using MonotonicClock = std::function<std::chrono::steady_clock::time_point()>;
using Sleeper = std::function<void(std::chrono::milliseconds)>;

inline WallClock system_wall_clock() {
  return [] { return std::chrono::system_clock::now(); };
}

inline MonotonicClock system_monotonic_clock() {
  return [] { return std::chrono::steady_clock::now(); };
}

}  // namespace kennel
