#include "mcp/errors.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace kennel::mcp {

namespace {

bool contains_any(const std::string &haystack, std::initializer_list<const char *> needles) {
  return std::any_of(needles.begin(), needles.end(), [&](const char *needle) {
    return haystack.find(needle) != std::string::npos;
  });
}

// Status codes only match as standalone numbers ("503" but not "15030ms")
bool contains_code(const std::string &text, std::initializer_list<const char *> codes) {
  for (const char *code : codes) {
    std::string needle(code);
    for (auto pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
      bool left_ok = pos == 0 || !std::isdigit(static_cast<unsigned char>(text[pos - 1]));
      size_t end = pos + needle.size();
      bool right_ok = end >= text.size() || !std::isdigit(static_cast<unsigned char>(text[end]));
      if (left_ok && right_ok) return true;
    }
  }
  return false;
}

}  // namespace

std::string to_string(ErrorCategory category) {
  switch (category) {
    case ErrorCategory::Configuration:
      return "configuration";
    case ErrorCategory::Rejected:
      return "rejected";
    case ErrorCategory::Transient:
      return "transient";
    case ErrorCategory::Protocol:
      return "protocol";
    case ErrorCategory::Fatal:
      return "fatal";
  }
  return "unknown";
}

std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Network:
      return "network";
    case ErrorKind::Timeout:
      return "timeout";
    case ErrorKind::RateLimit:
      return "rate_limit";
    case ErrorKind::Server:
      return "server";
    case ErrorKind::Protocol:
      return "protocol";
    case ErrorKind::Authentication:
      return "authentication";
    case ErrorKind::Fatal:
      return "fatal";
    case ErrorKind::Unknown:
      return "unknown";
  }
  return "unknown";
}

ErrorCategory category_of(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Network:
    case ErrorKind::Timeout:
    case ErrorKind::RateLimit:
    case ErrorKind::Server:
      return ErrorCategory::Transient;
    case ErrorKind::Authentication:
    case ErrorKind::Fatal:
      return ErrorCategory::Fatal;
    case ErrorKind::Protocol:
    case ErrorKind::Unknown:
      return ErrorCategory::Protocol;
  }
  return ErrorCategory::Protocol;
}

ErrorKind classify_message(const std::string &message) {
  std::string text = message;
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (contains_code(text, {"401", "403"}) || contains_any(text, {"unauthorized", "forbidden", "authentication", "auth failed", "invalid api key"})) {
    return ErrorKind::Authentication;
  }
  if (contains_code(text, {"429"}) || contains_any(text, {"rate limit", "too many requests", "throttl"})) {
    return ErrorKind::RateLimit;
  }
  if (contains_code(text, {"500", "501", "502", "503", "504"}) || contains_any(text, {"internal server error", "service unavailable", "bad gateway"})) {
    return ErrorKind::Server;
  }
  if (contains_any(text, {"timeout", "timed out"})) {
    return ErrorKind::Timeout;
  }
  if (contains_any(text, {"connection", "network", "refused", "reset", "unreachable", "broken pipe", "disconnected", "not connected"})) {
    return ErrorKind::Network;
  }
  if (contains_any(text, {"json", "parse", "decode", "malformed", "schema", "invalid response"})) {
    return ErrorKind::Protocol;
  }
  return ErrorKind::Unknown;
}

ErrorKind classify_rpc_error(int code, const std::string &message) {
  switch (code) {
    case -32700:  // parse error
    case -32600:  // invalid request
    case -32601:  // method not found
    case -32602:  // invalid params
      return ErrorKind::Protocol;
    default:
      break;
  }
  return classify_message(message);
}

McpError::McpError(const std::string &message, ErrorCategory category, ErrorKind kind, std::string server_id)
    : std::runtime_error(message), category_(category), kind_(kind), server_id_(std::move(server_id)) {}

void raise_provider_error(ErrorKind kind, const std::string &message, const std::string &server_id) {
  switch (kind) {
    case ErrorKind::Timeout:
      throw TimeoutError(message, server_id);
    case ErrorKind::Network:
      throw ConnectionError(message, server_id);
    case ErrorKind::RateLimit:
    case ErrorKind::Server:
      throw McpError(message, ErrorCategory::Transient, kind, server_id);
    case ErrorKind::Authentication:
    case ErrorKind::Fatal:
      throw FatalServerError(message, server_id, kind);
    case ErrorKind::Protocol:
    case ErrorKind::Unknown:
      throw ProtocolError(message, server_id, kind);
  }
  throw ProtocolError(message, server_id, kind);
}

}  // namespace kennel::mcp
