#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace kennel::mcp {

// How a failure is handled by the supervision layer
enum class ErrorCategory {
  Configuration,  // invalid definition, never reaches a provider
  Rejected,       // refused by the supervisor itself (not found, unavailable, breaker, quarantine)
  Transient,      // retried and counted
  Protocol,       // counted, escalates, never retried
  Fatal,          // quarantines immediately
};

// Finer-grained cause, kept in per-server error statistics
enum class ErrorKind { Network, Timeout, RateLimit, Server, Protocol, Authentication, Fatal, Unknown };

std::string to_string(ErrorCategory category);
std::string to_string(ErrorKind kind);

ErrorCategory category_of(ErrorKind kind);

// Keyword-based classification of a free-form provider or transport message
ErrorKind classify_message(const std::string &message);

// Classification of a JSON-RPC error object
ErrorKind classify_rpc_error(int code, const std::string &message);

class McpError : public std::runtime_error {
 public:
  McpError(const std::string &message, ErrorCategory category, ErrorKind kind, std::string server_id = "");

  ErrorCategory category() const noexcept {
    return category_;
  }
  ErrorKind kind() const noexcept {
    return kind_;
  }
  const std::string &server_id() const noexcept {
    return server_id_;
  }
  bool retryable() const noexcept {
    return category_ == ErrorCategory::Transient;
  }

 private:
  ErrorCategory category_;
  ErrorKind kind_;
  std::string server_id_;
};

class ConfigurationError : public McpError {
 public:
  explicit ConfigurationError(const std::string &message, std::string server_id = "")
      : McpError(message, ErrorCategory::Configuration, ErrorKind::Unknown, std::move(server_id)) {}
};

class ServerNotFoundError : public McpError {
 public:
  explicit ServerNotFoundError(const std::string &server_id)
      : McpError("MCP server '" + server_id + "' not found", ErrorCategory::Rejected, ErrorKind::Unknown, server_id) {}
};

// Raised when a call reaches a server that is not RUNNING
class ServerUnavailableError : public McpError {
 public:
  ServerUnavailableError(const std::string &server_id, const std::string &state)
      : McpError("MCP server '" + server_id + "' is not available (state: " + state + ")", ErrorCategory::Rejected, ErrorKind::Unknown,
                 server_id) {}
};

class CircuitOpenError : public McpError {
 public:
  explicit CircuitOpenError(const std::string &server_id, const std::string &detail = "circuit breaker is open")
      : McpError("MCP server '" + server_id + "': " + detail, ErrorCategory::Rejected, ErrorKind::Unknown, server_id) {}
};

class QuarantinedServerError : public McpError {
 public:
  explicit QuarantinedServerError(const std::string &server_id)
      : McpError("MCP server '" + server_id + "' is quarantined; clear the quarantine before restarting it", ErrorCategory::Rejected,
                 ErrorKind::Unknown, server_id) {}
};

class TimeoutError : public McpError {
 public:
  TimeoutError(const std::string &message, std::string server_id = "")
      : McpError(message, ErrorCategory::Transient, ErrorKind::Timeout, std::move(server_id)) {}
};

class ConnectionError : public McpError {
 public:
  ConnectionError(const std::string &message, std::string server_id = "")
      : McpError(message, ErrorCategory::Transient, ErrorKind::Network, std::move(server_id)) {}
};

class ProtocolError : public McpError {
 public:
  ProtocolError(const std::string &message, std::string server_id = "", ErrorKind kind = ErrorKind::Protocol)
      : McpError(message, ErrorCategory::Protocol, kind, std::move(server_id)) {}
};

class FatalServerError : public McpError {
 public:
  FatalServerError(const std::string &message, std::string server_id = "", ErrorKind kind = ErrorKind::Fatal)
      : McpError(message, ErrorCategory::Fatal, kind, std::move(server_id)) {}
};

// Throw the exception type matching a provider-side failure kind
[[noreturn]] void raise_provider_error(ErrorKind kind, const std::string &message, const std::string &server_id);

}  // namespace kennel::mcp
