#include "mcp/transport.hpp"

#include <fcntl.h>
#include <poll.h>
#include <spdlog/spdlog.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <asio.hpp>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include <type_traits>

#include "mcp/server_config.hpp"
#include "net/http_client.hpp"
#include "net/sse_client.hpp"

extern char **environ;

namespace kennel::mcp {

// ============================================================
// JSON-RPC 2.0 serialization
// ============================================================

json JsonRpcRequest::to_json() const {
  json j;
  j["jsonrpc"] = "2.0";
  j["method"] = method;
  j["id"] = id;
  if (!params.empty()) {
    j["params"] = params;
  }
  return j;
}

std::string JsonRpcResponse::error_message() const {
  if (!error.has_value()) return "";
  auto &err = error.value();
  if (err.is_object() && err.contains("message") && err["message"].is_string()) {
    return err["message"].get<std::string>();
  }
  return err.dump();
}

int JsonRpcResponse::error_code() const {
  if (!error.has_value() || !error->is_object()) return 0;
  auto it = error->find("code");
  if (it == error->end() || !it->is_number_integer()) return 0;
  return it->get<int>();
}

JsonRpcResponse JsonRpcResponse::from_json(const json &j) {
  JsonRpcResponse resp;
  if (j.contains("id")) {
    const auto &id = j["id"];
    if (id.is_number_integer()) {
      resp.id = id.get<int64_t>();
    } else if (id.is_string()) {
      try {
        resp.id = std::stoll(id.get<std::string>());
      } catch (const std::exception &) {
        resp.id = 0;
      }
    }
  }
  if (j.contains("result")) {
    resp.result = j["result"];
  }
  if (j.contains("error") && !j["error"].is_null()) {
    resp.error = j["error"];
  }
  return resp;
}

JsonRpcResponse JsonRpcResponse::transport_error(int64_t id, const std::string &message) {
  JsonRpcResponse resp;
  resp.id = id;
  resp.error = json{{"code", kTransportErrorCode}, {"message", message}};
  return resp;
}

json JsonRpcNotification::to_json() const {
  json j;
  j["jsonrpc"] = "2.0";
  j["method"] = method;
  if (!params.empty()) {
    j["params"] = params;
  }
  return j;
}

std::string to_string(TransportState state) {
  switch (state) {
    case TransportState::Disconnected:
      return "Disconnected";
    case TransportState::Connecting:
      return "Connecting";
    case TransportState::Connected:
      return "Connected";
    case TransportState::Failed:
      return "Failed";
  }
  return "Unknown";
}

// ============================================================
// PendingRequests
// ============================================================

std::future<JsonRpcResponse> PendingRequests::add(int64_t id) {
  std::promise<JsonRpcResponse> promise;
  auto future = promise.get_future();
  std::lock_guard<std::mutex> lock(mutex_);
  pending_[id] = std::move(promise);
  return future;
}

bool PendingRequests::resolve(JsonRpcResponse response) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = pending_.find(response.id);
  if (it == pending_.end()) return false;
  it->second.set_value(std::move(response));
  pending_.erase(it);
  return true;
}

void PendingRequests::fail(int64_t id, const std::string &message) {
  resolve(JsonRpcResponse::transport_error(id, message));
}

void PendingRequests::fail_all(const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &[id, promise] : pending_) {
    promise.set_value(JsonRpcResponse::transport_error(id, message));
  }
  pending_.clear();
}

void PendingRequests::cancel(int64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  pending_.erase(id);
}

bool PendingRequests::contains(int64_t id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.count(id) > 0;
}

size_t PendingRequests::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

namespace {

// Routes decoded messages: responses to their pending request, notifications
// to the handler. Server-to-client requests are handed to on_request.
class MessageRouter {
 public:
  using RequestHandler = std::function<void(const json &id, const std::string &method)>;

  PendingRequests &pending() {
    return pending_;
  }

  void set_notification_handler(Transport::NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    notification_handler_ = std::move(handler);
  }

  void dispatch(const json &msg, const RequestHandler &on_request = nullptr) {
    if (msg.is_array()) {
      for (const auto &item : msg) {
        dispatch(item, on_request);
      }
      return;
    }
    if (!msg.is_object()) return;

    bool has_id = msg.contains("id") && !msg["id"].is_null();

    // Response (has "id" and either "result" or "error")
    if (has_id && (msg.contains("result") || msg.contains("error"))) {
      auto resp = JsonRpcResponse::from_json(msg);
      if (!pending_.resolve(std::move(resp))) {
        spdlog::debug("[MCP] Dropping response for unknown or cancelled request {}", msg["id"].dump());
      }
      return;
    }

    if (!msg.contains("method") || !msg["method"].is_string()) return;
    std::string method = msg["method"].get<std::string>();

    if (has_id) {
      if (on_request) {
        on_request(msg["id"], method);
      } else {
        spdlog::debug("[MCP] Ignoring server request '{}'", method);
      }
      return;
    }

    json params = msg.value("params", json::object());
    std::lock_guard<std::mutex> lock(handler_mutex_);
    if (notification_handler_) {
      notification_handler_(method, params);
    }
  }

  void dispatch_text(const std::string &text, const RequestHandler &on_request = nullptr) {
    try {
      dispatch(json::parse(text), on_request);
    } catch (const json::exception &e) {
      spdlog::warn("[MCP] Failed to parse JSON message: {}", e.what());
    }
  }

 private:
  PendingRequests pending_;
  std::mutex handler_mutex_;
  Transport::NotificationHandler notification_handler_;
};

std::string trim(const std::string &s) {
  auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return "";
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

bool starts_with_icase(const std::string &s, const std::string &prefix) {
  if (s.size() < prefix.size()) return false;
  for (size_t i = 0; i < prefix.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(s[i])) != std::tolower(static_cast<unsigned char>(prefix[i]))) return false;
  }
  return true;
}

std::string http_failure(const net::HttpResponse &resp) {
  if (!resp.error.empty()) return resp.error;
  std::string message = "HTTP error: " + std::to_string(resp.status_code);
  auto body = trim(resp.body);
  if (!body.empty()) message += " " + body.substr(0, 200);
  return message;
}

// Drives one io_context on a background thread for the HTTP-based transports
class IoThread {
 public:
  ~IoThread() {
    stop();
  }

  asio::io_context &context() {
    return io_ctx_;
  }

  void start() {
    if (thread_.joinable()) return;
    io_ctx_.restart();
    work_.emplace(asio::make_work_guard(io_ctx_));
    thread_ = std::thread([this]() {
      io_ctx_.run();
    });
  }

  void stop() {
    work_.reset();
    io_ctx_.stop();
    if (thread_.joinable()) {
      thread_.join();
    }
  }

 private:
  asio::io_context io_ctx_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::thread thread_;
};

std::once_flag g_sigpipe_once;

}  // namespace

// ============================================================
// StdioTransport::Impl: child process over pipes
// ============================================================

class StdioTransport::Impl {
 public:
  Impl(std::string command, std::vector<std::string> args, std::map<std::string, std::string> env, std::string cwd)
      : command_(std::move(command)), args_(std::move(args)), env_(std::move(env)), cwd_(std::move(cwd)) {}

  ~Impl() {
    disconnect(std::chrono::milliseconds(0));
  }

  std::future<bool> connect() {
    return std::async(std::launch::async, [this]() -> bool {
      return spawn();
    });
  }

  void disconnect(std::chrono::milliseconds grace) {
    std::lock_guard<std::mutex> lock(process_mutex_);
    shutdown_locked(grace);
  }

  std::future<JsonRpcResponse> send_request(const JsonRpcRequest &request) {
    if (state_ != TransportState::Connected) {
      std::promise<JsonRpcResponse> promise;
      promise.set_value(JsonRpcResponse::transport_error(request.id, "Transport not connected"));
      return promise.get_future();
    }

    auto future = router_.pending().add(request.id);
    std::string error;
    if (!write_message(request.to_json(), error)) {
      router_.pending().fail(request.id, "Failed to write to MCP server: " + error);
    }
    return future;
  }

  void cancel_request(int64_t id) {
    router_.pending().cancel(id);
  }

  void send_notification(const JsonRpcNotification &notification) {
    if (state_ != TransportState::Connected) return;
    std::string error;
    if (!write_message(notification.to_json(), error)) {
      spdlog::warn("[MCP] Failed to send notification '{}': {}", notification.method, error);
    }
  }

  void set_notification_handler(Transport::NotificationHandler handler) {
    router_.set_notification_handler(std::move(handler));
  }

  void set_diagnostics_handler(Transport::DiagnosticsHandler handler) {
    std::lock_guard<std::mutex> lock(diagnostics_mutex_);
    diagnostics_handler_ = std::move(handler);
  }

  TransportState state() const {
    return state_;
  }

  std::string last_error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
  }

 private:
  bool spawn() {
    std::lock_guard<std::mutex> lock(process_mutex_);

    if (state_ == TransportState::Connected) return true;
    // Leftovers from a provider that died on its own
    shutdown_locked(std::chrono::milliseconds(0));
    state_ = TransportState::Connecting;

    std::call_once(g_sigpipe_once, []() {
      std::signal(SIGPIPE, SIG_IGN);
    });

    // Everything the child needs is built before fork()
    std::vector<const char *> argv;
    argv.push_back(command_.c_str());
    for (const auto &arg : args_) {
      argv.push_back(arg.c_str());
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage;
    for (char **e = environ; e && *e; ++e) {
      std::string entry(*e);
      auto eq = entry.find('=');
      if (eq != std::string::npos && env_.count(entry.substr(0, eq))) continue;
      env_storage.push_back(std::move(entry));
    }
    for (const auto &[key, val] : env_) {
      env_storage.push_back(key + "=" + val);
    }
    std::vector<const char *> envp;
    for (const auto &entry : env_storage) {
      envp.push_back(entry.c_str());
    }
    envp.push_back(nullptr);

    // [read-end, write-end]
    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};

    auto close_all = [&]() {
      for (int *p : {stdin_pipe, stdout_pipe, stderr_pipe, exec_pipe}) {
        for (int i = 0; i < 2; ++i) {
          if (p[i] >= 0) close(p[i]);
          p[i] = -1;
        }
      }
    };

    if (pipe2(stdin_pipe, O_CLOEXEC) != 0 || pipe2(stdout_pipe, O_CLOEXEC) != 0 || pipe2(stderr_pipe, O_CLOEXEC) != 0 ||
        pipe2(exec_pipe, O_CLOEXEC) != 0) {
      set_failed(std::string("Failed to create pipes: ") + strerror(errno));
      close_all();
      return false;
    }

    pid_t pid = fork();
    if (pid < 0) {
      set_failed(std::string("Fork failed: ") + strerror(errno));
      close_all();
      return false;
    }

    if (pid == 0) {
      // Child process: own process group so the whole tree can be signalled
      setpgid(0, 0);
      dup2(stdin_pipe[0], STDIN_FILENO);
      dup2(stdout_pipe[1], STDOUT_FILENO);
      dup2(stderr_pipe[1], STDERR_FILENO);

      if (!cwd_.empty() && chdir(cwd_.c_str()) != 0) {
        int err = errno;
        (void)!write(exec_pipe[1], &err, sizeof(err));
        _exit(127);
      }

      execvpe(command_.c_str(), const_cast<char *const *>(argv.data()), const_cast<char *const *>(envp.data()));

      int err = errno;
      (void)!write(exec_pipe[1], &err, sizeof(err));
      _exit(127);
    }

    // Parent process
    close(stdin_pipe[0]);
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    close(exec_pipe[1]);

    // The exec pipe closes without data when execvpe() succeeds
    int child_errno = 0;
    ssize_t n;
    do {
      n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(exec_pipe[0]);

    if (n > 0) {
      int status = 0;
      waitpid(pid, &status, 0);
      close(stdin_pipe[1]);
      close(stdout_pipe[0]);
      close(stderr_pipe[0]);
      set_failed("Failed to start '" + command_ + "': " + strerror(child_errno));
      return false;
    }

    pid_ = pid;
    write_fd_ = stdin_pipe[1];
    read_fd_ = stdout_pipe[0];
    err_fd_ = stderr_pipe[0];

    {
      std::lock_guard<std::mutex> error_lock(error_mutex_);
      last_error_.clear();
    }
    stopped_ = false;
    state_ = TransportState::Connected;

    reader_thread_ = std::thread([this]() {
      reader_loop();
    });
    stderr_thread_ = std::thread([this]() {
      stderr_loop();
    });

    spdlog::info("[MCP] Stdio transport connected: {} (pid: {})", command_, pid_);
    return true;
  }

  void shutdown_locked(std::chrono::milliseconds grace) {
    stopped_ = true;

    {
      std::lock_guard<std::mutex> lock(write_mutex_);
      if (write_fd_ >= 0) {
        // EOF on stdin is the polite request to exit
        close(write_fd_);
        write_fd_ = -1;
      }
    }

    if (pid_ > 0) {
      if (!wait_for_exit(grace)) {
        kill(-pid_, SIGTERM);
        if (!wait_for_exit(grace)) {
          spdlog::warn("[MCP] '{}' (pid: {}) ignored SIGTERM, killing", command_, pid_);
          kill(-pid_, SIGKILL);
          int status = 0;
          waitpid(pid_, &status, 0);
        }
      }
      pid_ = -1;
    }

    if (reader_thread_.joinable()) {
      reader_thread_.join();
    }
    if (stderr_thread_.joinable()) {
      stderr_thread_.join();
    }
    if (read_fd_ >= 0) {
      close(read_fd_);
      read_fd_ = -1;
    }
    if (err_fd_ >= 0) {
      close(err_fd_);
      err_fd_ = -1;
    }

    router_.pending().fail_all("Transport disconnected");
    if (state_ != TransportState::Failed) {
      state_ = TransportState::Disconnected;
    }
  }

  // Reaps the child if it exits within the grace period
  bool wait_for_exit(std::chrono::milliseconds grace) {
    auto deadline = std::chrono::steady_clock::now() + grace;
    while (true) {
      int status = 0;
      pid_t r = waitpid(pid_, &status, WNOHANG);
      if (r == pid_ || (r < 0 && errno == ECHILD)) return true;
      if (std::chrono::steady_clock::now() >= deadline) return false;
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }

  void set_failed(const std::string &error) {
    spdlog::error("[MCP] {}", error);
    {
      std::lock_guard<std::mutex> lock(error_mutex_);
      last_error_ = error;
    }
    state_ = TransportState::Failed;
  }

  // Newline-delimited JSON framing
  bool write_message(const json &msg, std::string &error) {
    std::string line = msg.dump() + "\n";

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (write_fd_ < 0) {
      error = "stdin closed";
      return false;
    }
    size_t offset = 0;
    while (offset < line.size()) {
      ssize_t written = write(write_fd_, line.data() + offset, line.size() - offset);
      if (written < 0) {
        if (errno == EINTR) continue;
        error = strerror(errno);
        spdlog::error("[MCP] Write to '{}' failed: {}", command_, error);
        state_ = TransportState::Failed;
        return false;
      }
      offset += static_cast<size_t>(written);
    }
    return true;
  }

  // Returns bytes read, 0 on EOF, -1 on error; keeps polling while not stopped
  ssize_t read_some(int fd, char *buf, size_t size) {
    while (!stopped_) {
      pollfd pfd{fd, POLLIN, 0};
      int r = poll(&pfd, 1, 100);
      if (r < 0) {
        if (errno == EINTR) continue;
        return -1;
      }
      if (r == 0) continue;
      ssize_t n = read(fd, buf, size);
      if (n < 0 && errno == EINTR) continue;
      return n;
    }
    return -1;
  }

  void reader_loop() {
    std::string buffer;
    std::array<char, 4096> read_buf{};

    while (!stopped_) {
      ssize_t n = read_some(read_fd_, read_buf.data(), read_buf.size());
      if (n <= 0) {
        if (!stopped_) {
          spdlog::warn("[MCP] '{}' closed its output stream", command_);
          {
            std::lock_guard<std::mutex> lock(error_mutex_);
            last_error_ = "Connection closed by MCP server";
          }
          state_ = TransportState::Failed;
          router_.pending().fail_all("Connection closed by MCP server");
        }
        break;
      }

      buffer.append(read_buf.data(), static_cast<size_t>(n));
      parse_buffer(buffer);
    }
  }

  // Accepts newline-delimited JSON and Content-Length framed messages
  void parse_buffer(std::string &buffer) {
    auto on_request = [this](const json &id, const std::string &method) {
      reply_to_server(id, method);
    };

    while (!buffer.empty()) {
      auto start = buffer.find_first_not_of(" \t\r\n");
      if (start == std::string::npos) {
        buffer.clear();
        return;
      }
      if (start > 0) buffer.erase(0, start);

      if (starts_with_icase(buffer, "Content-Length:")) {
        auto header_end = buffer.find("\r\n\r\n");
        if (header_end == std::string::npos) return;
        auto value_end = buffer.find("\r\n");
        size_t content_length = 0;
        try {
          content_length = std::stoul(trim(buffer.substr(15, value_end - 15)));
        } catch (const std::exception &) {
          spdlog::warn("[MCP] Malformed Content-Length header from '{}'", command_);
          buffer.erase(0, header_end + 4);
          continue;
        }
        size_t body_start = header_end + 4;
        if (buffer.size() < body_start + content_length) return;  // Not enough data yet
        std::string body = buffer.substr(body_start, content_length);
        buffer.erase(0, body_start + content_length);
        router_.dispatch_text(body, on_request);
        continue;
      }

      auto newline = buffer.find('\n');
      if (newline == std::string::npos) return;
      std::string line = trim(buffer.substr(0, newline));
      buffer.erase(0, newline + 1);
      if (line.empty()) continue;
      if (line.front() != '{' && line.front() != '[') {
        spdlog::debug("[MCP] Ignoring non-JSON output from '{}': {}", command_, line);
        continue;
      }
      router_.dispatch_text(line, on_request);
    }
  }

  void reply_to_server(const json &id, const std::string &method) {
    json reply;
    reply["jsonrpc"] = "2.0";
    reply["id"] = id;
    if (method == "ping") {
      reply["result"] = json::object();
    } else {
      reply["error"] = json{{"code", -32601}, {"message", "Method not found: " + method}};
    }
    std::string error;
    if (!write_message(reply, error)) {
      spdlog::debug("[MCP] Failed to answer server request '{}': {}", method, error);
    }
  }

  void stderr_loop() {
    std::string pending;
    std::array<char, 4096> read_buf{};

    auto emit = [this](const std::string &line) {
      if (line.empty()) return;
      spdlog::debug("[MCP] {} stderr: {}", command_, line);
      std::lock_guard<std::mutex> lock(diagnostics_mutex_);
      if (diagnostics_handler_) {
        diagnostics_handler_(line);
      }
    };

    while (!stopped_) {
      ssize_t n = read_some(err_fd_, read_buf.data(), read_buf.size());
      if (n <= 0) break;
      pending.append(read_buf.data(), static_cast<size_t>(n));
      size_t newline;
      while ((newline = pending.find('\n')) != std::string::npos) {
        std::string line = pending.substr(0, newline);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        pending.erase(0, newline + 1);
        emit(line);
      }
    }
    emit(pending);
  }

  std::string command_;
  std::vector<std::string> args_;
  std::map<std::string, std::string> env_;
  std::string cwd_;

  pid_t pid_ = -1;
  int write_fd_ = -1;
  int read_fd_ = -1;
  int err_fd_ = -1;

  std::atomic<TransportState> state_{TransportState::Disconnected};
  std::atomic<bool> stopped_{true};

  std::thread reader_thread_;
  std::thread stderr_thread_;

  std::mutex write_mutex_;
  std::mutex process_mutex_;

  mutable std::mutex error_mutex_;
  std::string last_error_;

  MessageRouter router_;

  std::mutex diagnostics_mutex_;
  Transport::DiagnosticsHandler diagnostics_handler_;
};

// ============================================================
// StdioTransport: delegates to Impl
// ============================================================

StdioTransport::StdioTransport(std::string command, std::vector<std::string> args, std::map<std::string, std::string> env, std::string cwd)
    : impl_(std::make_unique<Impl>(std::move(command), std::move(args), std::move(env), std::move(cwd))) {}

StdioTransport::~StdioTransport() = default;

std::future<JsonRpcResponse> StdioTransport::send_request(const JsonRpcRequest &request) {
  return impl_->send_request(request);
}

void StdioTransport::cancel_request(int64_t id) {
  impl_->cancel_request(id);
}

void StdioTransport::send_notification(const JsonRpcNotification &notification) {
  impl_->send_notification(notification);
}

void StdioTransport::set_notification_handler(NotificationHandler handler) {
  impl_->set_notification_handler(std::move(handler));
}

void StdioTransport::set_diagnostics_handler(DiagnosticsHandler handler) {
  impl_->set_diagnostics_handler(std::move(handler));
}

std::future<bool> StdioTransport::connect() {
  return impl_->connect();
}

void StdioTransport::disconnect(std::chrono::milliseconds grace) {
  impl_->disconnect(grace);
}

TransportState StdioTransport::state() const {
  return impl_->state();
}

std::string StdioTransport::last_error() const {
  return impl_->last_error();
}

// ============================================================
// HttpTransport::Impl: streamable HTTP
// ============================================================

class HttpTransport::Impl {
 public:
  Impl(std::string url, std::map<std::string, std::string> headers) : url_(std::move(url)), headers_(std::move(headers)) {}

  ~Impl() {
    disconnect(std::chrono::milliseconds(0));
  }

  std::future<bool> connect() {
    std::promise<bool> promise;
    {
      std::lock_guard<std::mutex> lock(http_mutex_);
      if (!http_) {
        http_ = std::make_unique<net::HttpClient>(io_.context());
      }
    }
    io_.start();
    state_ = TransportState::Connected;
    spdlog::info("[MCP] HTTP transport ready for: {}", url_);
    promise.set_value(true);
    return promise.get_future();
  }

  void disconnect(std::chrono::milliseconds) {
    state_ = TransportState::Disconnected;
    {
      std::lock_guard<std::mutex> lock(http_mutex_);
      if (http_) {
        http_->cancel();
      }
    }
    io_.stop();
    {
      std::lock_guard<std::mutex> lock(http_mutex_);
      http_.reset();
    }
    router_.pending().fail_all("Transport disconnected");
    std::lock_guard<std::mutex> lock(session_mutex_);
    session_id_.clear();
  }

  std::future<JsonRpcResponse> send_request(const JsonRpcRequest &request) {
    if (state_ != TransportState::Connected) {
      std::promise<JsonRpcResponse> promise;
      promise.set_value(JsonRpcResponse::transport_error(request.id, "Transport not connected"));
      return promise.get_future();
    }
    auto future = router_.pending().add(request.id);
    post(request.to_json().dump(), request.id);
    return future;
  }

  void cancel_request(int64_t id) {
    router_.pending().cancel(id);
  }

  void send_notification(const JsonRpcNotification &notification) {
    if (state_ != TransportState::Connected) return;
    post(notification.to_json().dump(), std::nullopt);
  }

  void set_notification_handler(Transport::NotificationHandler handler) {
    router_.set_notification_handler(std::move(handler));
  }

  TransportState state() const {
    return state_;
  }

  std::string last_error() const {
    return "";
  }

 private:
  struct Exchange {
    bool event_stream = false;
    std::string body;
    net::SseParser parser;
  };

  void post(std::string body, std::optional<int64_t> id) {
    auto exchange = std::make_shared<Exchange>();

    net::HttpOptions opts;
    opts.method = "POST";
    opts.headers = headers_;
    opts.headers["Content-Type"] = "application/json";
    opts.headers["Accept"] = "application/json, text/event-stream";
    {
      std::lock_guard<std::mutex> lock(session_mutex_);
      if (!session_id_.empty()) opts.headers["Mcp-Session-Id"] = session_id_;
    }
    opts.body = std::move(body);

    opts.on_headers = [this, exchange](int, const std::map<std::string, std::string> &headers) {
      auto session = headers.find("mcp-session-id");
      if (session != headers.end()) {
        std::lock_guard<std::mutex> lock(session_mutex_);
        session_id_ = session->second;
      }
      auto type = headers.find("content-type");
      exchange->event_stream = type != headers.end() && type->second.find("text/event-stream") != std::string::npos;
    };

    opts.on_data = [this, exchange, id](const std::string &chunk) -> bool {
      if (!exchange->event_stream) {
        exchange->body += chunk;
        return true;
      }
      for (const auto &event : exchange->parser.feed(chunk)) {
        if (event.event == "message" && !event.data.empty()) {
          router_.dispatch_text(event.data);
        }
      }
      // The stream has served its purpose once our response arrived
      return !id || router_.pending().contains(*id);
    };

    opts.on_complete = [this, exchange, id](const net::HttpResponse &resp) {
      if (!resp.error.empty() || !resp.ok()) {
        if (resp.status_code == 404) {
          std::lock_guard<std::mutex> lock(session_mutex_);
          session_id_.clear();
        }
        if (id) {
          router_.pending().fail(*id, http_failure(net::HttpResponse{resp.status_code, resp.headers, exchange->body, resp.error}));
        } else {
          spdlog::warn("[MCP] Notification to {} failed: {}", url_, http_failure(resp));
        }
        return;
      }
      if (!exchange->event_stream && !trim(exchange->body).empty()) {
        router_.dispatch_text(exchange->body);
      }
      if (id && router_.pending().contains(*id)) {
        router_.pending().fail(*id, "No response received from MCP server");
      }
    };

    std::lock_guard<std::mutex> lock(http_mutex_);
    if (http_) {
      // Result is delivered through on_complete
      (void)http_->request(url_, std::move(opts));
    } else if (id) {
      router_.pending().fail(*id, "Transport not connected");
    }
  }

  std::string url_;
  std::map<std::string, std::string> headers_;

  std::atomic<TransportState> state_{TransportState::Disconnected};

  std::mutex session_mutex_;
  std::string session_id_;

  MessageRouter router_;

  IoThread io_;
  std::mutex http_mutex_;
  std::unique_ptr<net::HttpClient> http_;
};

// ============================================================
// HttpTransport: delegates to Impl
// ============================================================

HttpTransport::HttpTransport(std::string url, std::map<std::string, std::string> headers)
    : impl_(std::make_unique<Impl>(std::move(url), std::move(headers))) {}

HttpTransport::~HttpTransport() = default;

std::future<JsonRpcResponse> HttpTransport::send_request(const JsonRpcRequest &request) {
  return impl_->send_request(request);
}

void HttpTransport::cancel_request(int64_t id) {
  impl_->cancel_request(id);
}

void HttpTransport::send_notification(const JsonRpcNotification &notification) {
  impl_->send_notification(notification);
}

void HttpTransport::set_notification_handler(NotificationHandler handler) {
  impl_->set_notification_handler(std::move(handler));
}

std::future<bool> HttpTransport::connect() {
  return impl_->connect();
}

void HttpTransport::disconnect(std::chrono::milliseconds grace) {
  impl_->disconnect(grace);
}

TransportState HttpTransport::state() const {
  return impl_->state();
}

std::string HttpTransport::last_error() const {
  return impl_->last_error();
}

// ============================================================
// SseTransport::Impl: GET event stream + POST endpoint
// ============================================================

class SseTransport::Impl {
 public:
  Impl(std::string url, std::map<std::string, std::string> headers) : url_(std::move(url)), headers_(std::move(headers)) {}

  ~Impl() {
    disconnect(std::chrono::milliseconds(0));
  }

  std::future<bool> connect() {
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();

    auto base = net::ParsedUrl::parse(url_);
    if (!base) {
      set_error("Invalid URL: " + url_);
      state_ = TransportState::Failed;
      promise->set_value(false);
      return future;
    }

    {
      std::lock_guard<std::mutex> lock(connect_mutex_);
      connect_promise_ = promise;
    }
    state_ = TransportState::Connecting;
    stopped_ = false;

    {
      std::lock_guard<std::mutex> lock(http_mutex_);
      http_ = std::make_unique<net::HttpClient>(io_.context());
    }
    io_.start();

    auto parser = std::make_shared<net::SseParser>();

    net::HttpOptions opts;
    opts.method = "GET";
    opts.headers = headers_;
    opts.headers["Accept"] = "text/event-stream";
    opts.headers["Cache-Control"] = "no-cache";

    opts.on_data = [this, parser, base = *base](const std::string &chunk) -> bool {
      for (const auto &event : parser->feed(chunk)) {
        if (event.event == "endpoint") {
          {
            std::lock_guard<std::mutex> lock(endpoint_mutex_);
            endpoint_ = base.resolve(trim(event.data));
          }
          state_ = TransportState::Connected;
          spdlog::info("[MCP] SSE transport connected: {}", url_);
          settle_connect(true);
        } else if (event.event == "message" && !event.data.empty()) {
          router_.dispatch_text(event.data);
        }
      }
      return !stopped_;
    };

    opts.on_complete = [this](const net::HttpResponse &resp) {
      if (stopped_) return;
      std::string reason = resp.ok() && resp.error.empty() ? "SSE stream closed by server" : http_failure(resp);
      set_error(reason);
      if (state_ == TransportState::Connected) {
        spdlog::warn("[MCP] SSE stream to {} ended: {}", url_, reason);
        router_.pending().fail_all(reason);
      } else {
        spdlog::error("[MCP] SSE connect to {} failed: {}", url_, reason);
      }
      state_ = TransportState::Failed;
      settle_connect(false);
    };

    {
      std::lock_guard<std::mutex> lock(http_mutex_);
      (void)http_->request(url_, std::move(opts));
    }
    return future;
  }

  void disconnect(std::chrono::milliseconds) {
    stopped_ = true;
    {
      std::lock_guard<std::mutex> lock(http_mutex_);
      if (http_) {
        http_->cancel();
      }
    }
    io_.stop();
    {
      std::lock_guard<std::mutex> lock(http_mutex_);
      http_.reset();
    }
    settle_connect(false);
    router_.pending().fail_all("Transport disconnected");
    if (state_ != TransportState::Failed) {
      state_ = TransportState::Disconnected;
    }
  }

  std::future<JsonRpcResponse> send_request(const JsonRpcRequest &request) {
    if (state_ != TransportState::Connected) {
      std::promise<JsonRpcResponse> promise;
      promise.set_value(JsonRpcResponse::transport_error(request.id, "Transport not connected"));
      return promise.get_future();
    }
    auto future = router_.pending().add(request.id);
    post(request.to_json().dump(), request.id);
    return future;
  }

  void cancel_request(int64_t id) {
    router_.pending().cancel(id);
  }

  void send_notification(const JsonRpcNotification &notification) {
    if (state_ != TransportState::Connected) return;
    post(notification.to_json().dump(), std::nullopt);
  }

  void set_notification_handler(Transport::NotificationHandler handler) {
    router_.set_notification_handler(std::move(handler));
  }

  TransportState state() const {
    return state_;
  }

  std::string last_error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
  }

 private:
  void post(std::string body, std::optional<int64_t> id) {
    std::string endpoint;
    {
      std::lock_guard<std::mutex> lock(endpoint_mutex_);
      endpoint = endpoint_;
    }

    net::HttpOptions opts;
    opts.method = "POST";
    opts.headers = headers_;
    opts.headers["Content-Type"] = "application/json";
    opts.body = std::move(body);

    opts.on_complete = [this, id](const net::HttpResponse &resp) {
      if (!resp.error.empty() || !resp.ok()) {
        if (id) {
          router_.pending().fail(*id, http_failure(resp));
        } else {
          spdlog::warn("[MCP] SSE notification send failed: {}", http_failure(resp));
        }
        return;
      }
      // Most servers answer 202 and reply on the stream; some reply inline
      auto text = trim(resp.body);
      if (!text.empty() && (text.front() == '{' || text.front() == '[')) {
        router_.dispatch_text(text);
      }
    };

    std::lock_guard<std::mutex> lock(http_mutex_);
    if (http_) {
      (void)http_->request(endpoint, std::move(opts));
    } else if (id) {
      router_.pending().fail(*id, "Transport not connected");
    }
  }

  void settle_connect(bool connected) {
    std::shared_ptr<std::promise<bool>> promise;
    {
      std::lock_guard<std::mutex> lock(connect_mutex_);
      promise.swap(connect_promise_);
    }
    if (promise) {
      promise->set_value(connected);
    }
  }

  void set_error(const std::string &error) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_ = error;
  }

  std::string url_;
  std::map<std::string, std::string> headers_;

  std::atomic<TransportState> state_{TransportState::Disconnected};
  std::atomic<bool> stopped_{true};

  std::mutex endpoint_mutex_;
  std::string endpoint_;

  std::mutex connect_mutex_;
  std::shared_ptr<std::promise<bool>> connect_promise_;

  mutable std::mutex error_mutex_;
  std::string last_error_;

  MessageRouter router_;

  IoThread io_;
  std::mutex http_mutex_;
  std::unique_ptr<net::HttpClient> http_;
};

// ============================================================
// SseTransport: delegates to Impl
// ============================================================

SseTransport::SseTransport(std::string url, std::map<std::string, std::string> headers)
    : impl_(std::make_unique<Impl>(std::move(url), std::move(headers))) {}

SseTransport::~SseTransport() = default;

std::future<JsonRpcResponse> SseTransport::send_request(const JsonRpcRequest &request) {
  return impl_->send_request(request);
}

void SseTransport::cancel_request(int64_t id) {
  impl_->cancel_request(id);
}

void SseTransport::send_notification(const JsonRpcNotification &notification) {
  impl_->send_notification(notification);
}

void SseTransport::set_notification_handler(NotificationHandler handler) {
  impl_->set_notification_handler(std::move(handler));
}

std::future<bool> SseTransport::connect() {
  return impl_->connect();
}

void SseTransport::disconnect(std::chrono::milliseconds grace) {
  impl_->disconnect(grace);
}

TransportState SseTransport::state() const {
  return impl_->state();
}

std::string SseTransport::last_error() const {
  return impl_->last_error();
}

// ============================================================
// Factory
// ============================================================

std::unique_ptr<Transport> make_transport(const ServerConfig &config) {
  return std::visit(
      [](const auto &cfg) -> std::unique_ptr<Transport> {
        using T = std::decay_t<decltype(cfg)>;
        if constexpr (std::is_same_v<T, StdioConfig>) {
          return std::make_unique<StdioTransport>(cfg.command, cfg.args, cfg.env, cfg.cwd);
        } else if constexpr (std::is_same_v<T, HttpConfig>) {
          return std::make_unique<HttpTransport>(cfg.url, cfg.headers);
        } else {
          return std::make_unique<SseTransport>(cfg.url, cfg.headers);
        }
      },
      config.transport());
}

}  // namespace kennel::mcp
