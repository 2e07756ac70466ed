#include "net/sse_client.hpp"

namespace kennel::net {

std::vector<SseEvent> SseParser::feed(const std::string &chunk) {
  std::vector<SseEvent> events;
  buffer_ += chunk;

  size_t start = 0;
  while (true) {
    auto newline = buffer_.find('\n', start);
    if (newline == std::string::npos) break;
    std::string line = buffer_.substr(start, newline - start);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    process_line(line, events);
    start = newline + 1;
  }
  buffer_.erase(0, start);
  return events;
}

void SseParser::reset() {
  buffer_.clear();
  current_ = SseEvent{};
  has_data_ = false;
}

void SseParser::process_line(const std::string &line, std::vector<SseEvent> &out) {
  if (line.empty()) {
    // Blank line dispatches the pending event
    if (has_data_) {
      out.push_back(std::move(current_));
    }
    current_ = SseEvent{};
    has_data_ = false;
    return;
  }

  if (line.front() == ':') return;  // comment / keep-alive

  std::string field = line;
  std::string value;
  auto colon = line.find(':');
  if (colon != std::string::npos) {
    field = line.substr(0, colon);
    value = line.substr(colon + 1);
    if (!value.empty() && value.front() == ' ') value.erase(0, 1);
  }

  if (field == "event") {
    current_.event = value;
  } else if (field == "data") {
    if (has_data_) current_.data += "\n";
    current_.data += value;
    has_data_ = true;
  } else if (field == "id") {
    current_.id = value;
  }
}

}  // namespace kennel::net
