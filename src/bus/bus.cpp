#include "bus/bus.hpp"

#include <algorithm>

namespace kennel {

void Bus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  subscribers_.erase(std::remove_if(subscribers_.begin(), subscribers_.end(),
                                    [id](const Subscriber &sub) {
                                      return sub.id == id;
                                    }),
                     subscribers_.end());
}

size_t Bus::subscriber_count() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

}  // namespace kennel
