#include "tool/concurrency_gate.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace kennel::tool {

std::string to_string(ToolClass cls) {
  switch (cls) {
    case ToolClass::Read:
      return "read";
    case ToolClass::Write:
      return "write";
    case ToolClass::Execute:
      return "execute";
  }
  return "read";
}

std::optional<ToolClass> tool_class_from_string(const std::string &name) {
  if (name == "read") return ToolClass::Read;
  if (name == "write") return ToolClass::Write;
  if (name == "execute") return ToolClass::Execute;
  return std::nullopt;
}

// ============================================================
// Gate
// ============================================================

void Gate::Permit::release() {
  if (gate_) {
    gate_->release();
    gate_ = nullptr;
  }
}

Gate::Permit Gate::acquire(const std::string &holder) {
  std::unique_lock<std::mutex> lock(mutex_);
  uint64_t ticket = next_ticket_++;
  queue_.push_back(ticket);
  cv_.wait(lock, [&] {
    return !held_ && queue_.front() == ticket;
  });
  queue_.pop_front();
  held_ = true;
  holder_ = holder;
  ++acquisitions_;
  return Permit(this);
}

std::optional<Gate::Permit> Gate::try_acquire_for(std::chrono::milliseconds timeout, const std::string &holder) {
  std::unique_lock<std::mutex> lock(mutex_);
  uint64_t ticket = next_ticket_++;
  queue_.push_back(ticket);
  bool ready = cv_.wait_for(lock, timeout, [&] {
    return !held_ && queue_.front() == ticket;
  });
  if (!ready) {
    queue_.erase(std::find(queue_.begin(), queue_.end(), ticket));
    // The next waiter may now be at the front
    cv_.notify_all();
    spdlog::debug("[Gate] '{}': gave up after {} ms", name_, timeout.count());
    return std::nullopt;
  }
  queue_.pop_front();
  held_ = true;
  holder_ = holder;
  ++acquisitions_;
  return Permit(this);
}

void Gate::release() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    held_ = false;
    holder_.clear();
  }
  cv_.notify_all();
}

GateStats Gate::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  GateStats s;
  s.name = name_;
  s.acquisitions = acquisitions_;
  s.waiting = queue_.size();
  s.in_use = held_;
  s.holder = holder_;
  return s;
}

// ============================================================
// ConcurrencyGate
// ============================================================

const std::map<std::string, ToolClass> &ConcurrencyGate::builtin_classifications() {
  static const std::map<std::string, ToolClass> table = {
      // Read-only
      {"read", ToolClass::Read},
      {"read_file", ToolClass::Read},
      {"list_files", ToolClass::Read},
      {"glob", ToolClass::Read},
      {"grep", ToolClass::Read},
      {"question", ToolClass::Read},
      {"task", ToolClass::Read},
      // File mutation
      {"write", ToolClass::Write},
      {"edit", ToolClass::Write},
      {"edit_file", ToolClass::Write},
      {"create_file", ToolClass::Write},
      {"replace_in_file", ToolClass::Write},
      {"modify_file", ToolClass::Write},
      {"delete_file", ToolClass::Write},
      {"delete_snippet_from_file", ToolClass::Write},
      // Process execution
      {"bash", ToolClass::Execute},
      {"shell", ToolClass::Execute},
      {"run_shell_command", ToolClass::Execute},
      {"agent_run_shell_command", ToolClass::Execute},
  };
  return table;
}

ConcurrencyGate::ConcurrencyGate(ToolClass default_class) : table_(builtin_classifications()), default_class_(default_class) {}

ToolClass ConcurrencyGate::classify(const std::string &tool_name) const {
  std::lock_guard<std::mutex> lock(table_mutex_);
  auto it = table_.find(tool_name);
  return it == table_.end() ? default_class_ : it->second;
}

void ConcurrencyGate::set_classification(const std::string &tool_name, ToolClass cls) {
  std::lock_guard<std::mutex> lock(table_mutex_);
  table_[tool_name] = cls;
}

void ConcurrencyGate::remove_classification(const std::string &tool_name) {
  std::lock_guard<std::mutex> lock(table_mutex_);
  table_.erase(tool_name);
}

std::map<std::string, ToolClass> ConcurrencyGate::classifications() const {
  std::lock_guard<std::mutex> lock(table_mutex_);
  return table_;
}

ToolClass ConcurrencyGate::default_class() const {
  std::lock_guard<std::mutex> lock(table_mutex_);
  return default_class_;
}

void ConcurrencyGate::set_default_class(ToolClass cls) {
  std::lock_guard<std::mutex> lock(table_mutex_);
  default_class_ = cls;
}

Gate::Permit ConcurrencyGate::acquire(const std::string &tool_name, const std::string &holder) {
  switch (classify(tool_name)) {
    case ToolClass::Write:
      spdlog::debug("[Gate] '{}' waiting for the write gate", tool_name);
      return write_gate_.acquire(holder);
    case ToolClass::Execute:
      spdlog::debug("[Gate] '{}' waiting for the execute gate", tool_name);
      return execute_gate_.acquire(holder);
    case ToolClass::Read:
      break;
  }
  return Gate::Permit();
}

}  // namespace kennel::tool
