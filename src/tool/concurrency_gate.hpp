#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace kennel::tool {

// How a tool invocation interacts with shared state
enum class ToolClass { Read, Write, Execute };

std::string to_string(ToolClass cls);
std::optional<ToolClass> tool_class_from_string(const std::string &name);

struct GateStats {
  std::string name;
  uint64_t acquisitions = 0;
  size_t waiting = 0;
  bool in_use = false;
  std::string holder;
};

// Capacity-1 mutual exclusion with FIFO hand-off
class Gate {
 public:
  // Releases the gate when destroyed. An empty permit holds nothing.
  class Permit {
   public:
    Permit() = default;
    Permit(Permit &&other) noexcept : gate_(std::exchange(other.gate_, nullptr)) {}
    Permit &operator=(Permit &&other) noexcept {
      if (this != &other) {
        release();
        gate_ = std::exchange(other.gate_, nullptr);
      }
      return *this;
    }
    Permit(const Permit &) = delete;
    Permit &operator=(const Permit &) = delete;
    ~Permit() {
      release();
    }

    bool holds() const {
      return gate_ != nullptr;
    }
    void release();

   private:
    friend class Gate;
    explicit Permit(Gate *gate) : gate_(gate) {}

    Gate *gate_ = nullptr;
  };

  explicit Gate(std::string name) : name_(std::move(name)) {}

  Gate(const Gate &) = delete;
  Gate &operator=(const Gate &) = delete;

  // Blocks until every earlier caller has had its turn
  Permit acquire(const std::string &holder = "");

  // Gives up the place in line after timeout
  std::optional<Permit> try_acquire_for(std::chrono::milliseconds timeout, const std::string &holder = "");

  GateStats stats() const;

  const std::string &name() const {
    return name_;
  }

 private:
  void release();

  std::string name_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<uint64_t> queue_;
  uint64_t next_ticket_ = 0;
  bool held_ = false;
  std::string holder_;
  uint64_t acquisitions_ = 0;
};

// Classification table consulted on the dispatch path. Read calls bypass the
// gates; Write and Execute each serialize through one process-wide gate.
class ConcurrencyGate {
 public:
  explicit ConcurrencyGate(ToolClass default_class = ToolClass::Read);

  ConcurrencyGate(const ConcurrencyGate &) = delete;
  ConcurrencyGate &operator=(const ConcurrencyGate &) = delete;

  // Names of the agent's built-in tools and their classes
  static const std::map<std::string, ToolClass> &builtin_classifications();

  ToolClass classify(const std::string &tool_name) const;
  void set_classification(const std::string &tool_name, ToolClass cls);
  void remove_classification(const std::string &tool_name);
  std::map<std::string, ToolClass> classifications() const;

  ToolClass default_class() const;
  void set_default_class(ToolClass cls);

  // Empty permit for Read-class tools
  Gate::Permit acquire(const std::string &tool_name, const std::string &holder = "");

  template <typename F>
  auto run(const std::string &tool_name, F &&fn) -> std::invoke_result_t<F> {
    auto permit = acquire(tool_name, tool_name);
    return fn();
  }

  Gate &write_gate() {
    return write_gate_;
  }
  Gate &execute_gate() {
    return execute_gate_;
  }

 private:
  mutable std::mutex table_mutex_;
  std::map<std::string, ToolClass> table_;
  ToolClass default_class_;

  Gate write_gate_{"write"};
  Gate execute_gate_{"execute"};
};

}  // namespace kennel::tool
