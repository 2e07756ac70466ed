#pragma once

#include <string>
#include <vector>

namespace kennel::net {

struct SseEvent {
  std::string event = "message";
  std::string data;
  std::string id;
};

// Incremental text/event-stream parser. Feed raw body chunks in arrival order;
// complete events are returned as soon as their terminating blank line arrives.
class SseParser {
 public:
  std::vector<SseEvent> feed(const std::string &chunk);

  void reset();

 private:
  void process_line(const std::string &line, std::vector<SseEvent> &out);

  std::string buffer_;
  SseEvent current_;
  bool has_data_ = false;
};

}  // namespace kennel::net
