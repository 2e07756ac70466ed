#pragma once

#include <asio.hpp>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kennel::net {

struct ParsedUrl {
  std::string scheme;  // "http" or "https"
  std::string host;
  std::string port;  // empty when the url carries no explicit port
  std::string path;  // always starts with '/'
  std::string query;  // includes the leading '?', or empty

  static std::optional<ParsedUrl> parse(const std::string &url);

  bool is_https() const {
    return scheme == "https";
  }

  std::string port_or_default() const {
    if (!port.empty()) return port;
    return is_https() ? "443" : "80";
  }

  std::string target() const {
    return path + query;
  }

  // Resolve a possibly relative reference (absolute url, "/abs/path" or "rel") against this url
  std::string resolve(const std::string &reference) const;
};

struct HttpResponse;

struct HttpOptions {
  std::string method = "GET";
  std::map<std::string, std::string> headers;
  std::string body;

  // Covers connect, TLS handshake and the response headers. A streamed body
  // (on_data set) is not bounded by it.
  std::chrono::milliseconds timeout{30000};

  // Called once the status line and headers are parsed
  std::function<void(int status_code, const std::map<std::string, std::string> &headers)> on_headers;

  // When set, decoded body bytes are delivered here instead of being buffered.
  // Returning false ends the request early.
  std::function<bool(const std::string &chunk)> on_data;

  // Called on the io thread with the final response, before the future is ready
  std::function<void(const HttpResponse &response)> on_complete;
};

struct HttpResponse {
  int status_code = 0;
  std::map<std::string, std::string> headers;  // keys lower-cased
  std::string body;
  std::string error;

  bool ok() const {
    return status_code >= 200 && status_code < 300;
  }

  std::optional<std::string> header(const std::string &name) const;
};

// Incremental decoder for "Transfer-Encoding: chunked" bodies
class ChunkedDecoder {
 public:
  // Appends decoded payload to out. Returns false on a malformed stream.
  bool feed(const char *data, size_t size, std::string &out);

  bool done() const {
    return state_ == State::Done;
  }

 private:
  enum class State { Size, Data, DataEnd, Trailer, Done };

  State state_ = State::Size;
  std::string line_;
  size_t remaining_ = 0;
};

// Asynchronous HTTP/1.1 client. Requests run on the supplied io_context; the
// caller drives it (io_ctx.run()) and collects the result from the future.
class HttpClient {
 public:
  explicit HttpClient(asio::io_context &io_ctx);
  ~HttpClient();

  HttpClient(const HttpClient &) = delete;
  HttpClient &operator=(const HttpClient &) = delete;

  std::future<HttpResponse> request(const std::string &url, HttpOptions options);

  // Abort every request still in flight. Their futures resolve with an error.
  void cancel();

 private:
  class Session;

  asio::io_context &io_ctx_;
  std::mutex sessions_mutex_;
  std::vector<std::weak_ptr<Session>> sessions_;
};

}  // namespace kennel::net
