#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <typeindex>
#include <vector>

namespace kennel {

namespace events {

struct ServerStateChanged {
  std::string server_id;
  std::string old_state;
  std::string new_state;
};

struct ServerQuarantined {
  std::string server_id;
  std::string reason;
};

struct QuarantineCleared {
  std::string server_id;
};

struct CircuitStateChanged {
  std::string server_id;
  std::string old_state;
  std::string new_state;
};

struct McpToolsChanged {
  std::string server_name;
};

}  // namespace events

// Typed publish/subscribe bus. Handlers run synchronously on the publishing
// thread; the subscriber list is never locked while a handler runs.
class Bus {
 public:
  using SubscriptionId = uint64_t;

  template <typename Event>
  SubscriptionId subscribe(std::function<void(const Event &)> handler) {
    std::lock_guard lock(mutex_);
    SubscriptionId id = next_id_++;
    subscribers_.push_back(Subscriber{id, std::type_index(typeid(Event)), [handler = std::move(handler)](const void *event) {
                                        handler(*static_cast<const Event *>(event));
                                      }});
    return id;
  }

  template <typename Event>
  void publish(const Event &event) const {
    std::vector<std::function<void(const void *)>> handlers;
    {
      std::lock_guard lock(mutex_);
      for (const auto &sub : subscribers_) {
        if (sub.type == std::type_index(typeid(Event))) {
          handlers.push_back(sub.handler);
        }
      }
    }
    for (const auto &handler : handlers) {
      handler(&event);
    }
  }

  void unsubscribe(SubscriptionId id);

  size_t subscriber_count() const;

 private:
  struct Subscriber {
    SubscriptionId id;
    std::type_index type;
    std::function<void(const void *)> handler;
  };

  mutable std::mutex mutex_;
  std::vector<Subscriber> subscribers_;
  SubscriptionId next_id_ = 1;
};

}  // namespace kennel
