#include "net/http_client.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <asio/ssl.hpp>
#include <cctype>

namespace kennel::net {

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::string trim(const std::string &s) {
  auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return "";
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

bool has_header(const std::map<std::string, std::string> &headers, const std::string &name) {
  auto lowered = to_lower(name);
  return std::any_of(headers.begin(), headers.end(), [&](const auto &kv) {
    return to_lower(kv.first) == lowered;
  });
}

}  // namespace

// ============================================================
// ParsedUrl
// ============================================================

std::optional<ParsedUrl> ParsedUrl::parse(const std::string &url) {
  auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos || scheme_end == 0) return std::nullopt;

  ParsedUrl result;
  result.scheme = to_lower(url.substr(0, scheme_end));
  if (result.scheme != "http" && result.scheme != "https") return std::nullopt;

  auto rest = url.substr(scheme_end + 3);
  auto fragment = rest.find('#');
  if (fragment != std::string::npos) rest.erase(fragment);

  auto authority_end = rest.find_first_of("/?");
  std::string authority = rest.substr(0, authority_end);
  std::string remainder = authority_end == std::string::npos ? "" : rest.substr(authority_end);

  // Drop userinfo
  auto at = authority.rfind('@');
  if (at != std::string::npos) authority.erase(0, at + 1);

  if (!authority.empty() && authority.front() == '[') {
    auto close = authority.find(']');
    if (close == std::string::npos) return std::nullopt;
    result.host = authority.substr(1, close - 1);
    if (close + 1 < authority.size()) {
      if (authority[close + 1] != ':') return std::nullopt;
      result.port = authority.substr(close + 2);
    }
  } else {
    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
      result.host = authority.substr(0, colon);
      result.port = authority.substr(colon + 1);
    } else {
      result.host = authority;
    }
  }

  if (result.host.empty()) return std::nullopt;
  if (!std::all_of(result.port.begin(), result.port.end(), [](unsigned char c) {
        return std::isdigit(c);
      })) {
    return std::nullopt;
  }

  auto query_start = remainder.find('?');
  if (query_start != std::string::npos) {
    result.path = remainder.substr(0, query_start);
    result.query = remainder.substr(query_start);
  } else {
    result.path = remainder;
  }
  if (result.path.empty()) result.path = "/";

  return result;
}

std::string ParsedUrl::resolve(const std::string &reference) const {
  if (reference.find("://") != std::string::npos) return reference;

  std::string origin = scheme + "://" + (host.find(':') != std::string::npos ? "[" + host + "]" : host);
  if (!port.empty()) origin += ":" + port;

  if (!reference.empty() && reference.front() == '/') {
    return origin + reference;
  }

  auto dir_end = path.rfind('/');
  std::string base_dir = dir_end == std::string::npos ? "/" : path.substr(0, dir_end + 1);
  return origin + base_dir + reference;
}

std::optional<std::string> HttpResponse::header(const std::string &name) const {
  auto it = headers.find(to_lower(name));
  if (it == headers.end()) return std::nullopt;
  return it->second;
}

// ============================================================
// ChunkedDecoder
// ============================================================

bool ChunkedDecoder::feed(const char *data, size_t size, std::string &out) {
  size_t pos = 0;
  while (pos < size && state_ != State::Done) {
    switch (state_) {
      case State::Size: {
        char c = data[pos++];
        if (c != '\n') {
          line_ += c;
          break;
        }
        auto size_text = trim(line_.substr(0, line_.find(';')));
        line_.clear();
        if (size_text.empty()) return false;
        try {
          remaining_ = std::stoul(size_text, nullptr, 16);
        } catch (const std::exception &) {
          return false;
        }
        state_ = remaining_ == 0 ? State::Trailer : State::Data;
        break;
      }
      case State::Data: {
        size_t take = std::min(remaining_, size - pos);
        out.append(data + pos, take);
        pos += take;
        remaining_ -= take;
        if (remaining_ == 0) state_ = State::DataEnd;
        break;
      }
      case State::DataEnd: {
        char c = data[pos++];
        if (c == '\n') state_ = State::Size;
        break;
      }
      case State::Trailer: {
        char c = data[pos++];
        if (c != '\n') {
          line_ += c;
          break;
        }
        // An empty line terminates the trailer section
        if (trim(line_).empty()) state_ = State::Done;
        line_.clear();
        break;
      }
      case State::Done:
        break;
    }
  }
  return true;
}

// ============================================================
// HttpClient::Session: one request/response exchange
// ============================================================

class HttpClient::Session : public std::enable_shared_from_this<Session> {
 public:
  Session(asio::io_context &io_ctx, ParsedUrl url, HttpOptions options)
      : io_ctx_(io_ctx), url_(std::move(url)), options_(std::move(options)), resolver_(io_ctx), socket_(io_ctx), timer_(io_ctx) {
    if (url_.is_https()) {
      ssl_ctx_ = std::make_unique<asio::ssl::context>(asio::ssl::context::tls_client);
      ssl_ctx_->set_default_verify_paths();
      ssl_stream_ = std::make_unique<asio::ssl::stream<asio::ip::tcp::socket &>>(socket_, *ssl_ctx_);
      ssl_stream_->set_verify_mode(asio::ssl::verify_peer);
      ssl_stream_->set_verify_callback(asio::ssl::host_name_verification(url_.host));
      SSL_set_tlsext_host_name(ssl_stream_->native_handle(), url_.host.c_str());
    }
  }

  std::future<HttpResponse> start() {
    auto future = promise_.get_future();
    auto self = shared_from_this();

    timer_.expires_after(options_.timeout);
    timer_.async_wait([self](const std::error_code &ec) {
      if (!ec) self->fail("Request timed out");
    });

    resolver_.async_resolve(url_.host, url_.port_or_default(), [self](const std::error_code &ec, asio::ip::tcp::resolver::results_type results) {
      if (ec) {
        self->fail("Resolve failed: " + ec.message());
        return;
      }
      self->connect(results);
    });
    return future;
  }

  void cancel() {
    asio::post(io_ctx_, [self = shared_from_this()]() {
      self->fail("Request cancelled");
    });
  }

 private:
  enum class BodyMode { None, ContentLength, Chunked, UntilClose };

  template <typename F>
  void with_stream(F &&f) {
    if (ssl_stream_) {
      f(*ssl_stream_);
    } else {
      f(socket_);
    }
  }

  void connect(const asio::ip::tcp::resolver::results_type &results) {
    auto self = shared_from_this();
    asio::async_connect(socket_, results, [self](const std::error_code &ec, const asio::ip::tcp::endpoint &) {
      if (ec) {
        self->fail("Connect failed: " + ec.message());
        return;
      }
      if (self->ssl_stream_) {
        self->ssl_stream_->async_handshake(asio::ssl::stream_base::client, [self](const std::error_code &hs_ec) {
          if (hs_ec) {
            self->fail("TLS handshake failed: " + hs_ec.message());
            return;
          }
          self->write_request();
        });
      } else {
        self->write_request();
      }
    });
  }

  void write_request() {
    std::string host_header = url_.host;
    if (!url_.port.empty()) host_header += ":" + url_.port;

    request_ = options_.method + " " + url_.target() + " HTTP/1.1\r\n";
    request_ += "Host: " + host_header + "\r\n";
    if (!has_header(options_.headers, "User-Agent")) request_ += "User-Agent: kennel/0.1\r\n";
    if (!has_header(options_.headers, "Accept")) request_ += "Accept: */*\r\n";
    request_ += "Connection: close\r\n";
    if (!options_.body.empty() || options_.method == "POST" || options_.method == "PUT") {
      request_ += "Content-Length: " + std::to_string(options_.body.size()) + "\r\n";
    }
    for (const auto &[key, value] : options_.headers) {
      request_ += key + ": " + value + "\r\n";
    }
    request_ += "\r\n";
    request_ += options_.body;

    auto self = shared_from_this();
    with_stream([self](auto &stream) {
      asio::async_write(stream, asio::buffer(self->request_), [self](const std::error_code &ec, size_t) {
        if (ec) {
          self->fail("Write failed: " + ec.message());
          return;
        }
        self->read_headers();
      });
    });
  }

  void read_headers() {
    auto self = shared_from_this();
    with_stream([self](auto &stream) {
      asio::async_read_until(stream, asio::dynamic_buffer(self->buffer_), "\r\n\r\n", [self](const std::error_code &ec, size_t n) {
        if (ec) {
          self->fail("Read failed: " + ec.message());
          return;
        }
        self->parse_headers(n);
      });
    });
  }

  void parse_headers(size_t header_size) {
    std::string block = buffer_.substr(0, header_size);
    buffer_.erase(0, header_size);

    auto line_end = block.find("\r\n");
    std::string status_line = block.substr(0, line_end);
    auto first_space = status_line.find(' ');
    if (first_space == std::string::npos) {
      fail("Malformed status line: " + status_line);
      return;
    }
    try {
      response_.status_code = std::stoi(status_line.substr(first_space + 1, 3));
    } catch (const std::exception &) {
      fail("Malformed status line: " + status_line);
      return;
    }

    size_t pos = line_end + 2;
    while (pos < block.size()) {
      auto next = block.find("\r\n", pos);
      if (next == std::string::npos || next == pos) break;
      std::string line = block.substr(pos, next - pos);
      auto colon = line.find(':');
      if (colon != std::string::npos) {
        response_.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
      }
      pos = next + 2;
    }

    if (options_.on_headers) {
      options_.on_headers(response_.status_code, response_.headers);
    }
    if (options_.on_data) {
      // Streams stay open indefinitely once the response has started
      timer_.cancel();
    }

    auto transfer = response_.header("transfer-encoding");
    auto length = response_.header("content-length");
    bool no_body = options_.method == "HEAD" || response_.status_code == 204 || response_.status_code == 304 ||
                   (response_.status_code >= 100 && response_.status_code < 200);

    if (no_body) {
      mode_ = BodyMode::None;
    } else if (transfer && to_lower(*transfer).find("chunked") != std::string::npos) {
      mode_ = BodyMode::Chunked;
    } else if (length) {
      mode_ = BodyMode::ContentLength;
      try {
        remaining_ = std::stoull(*length);
      } catch (const std::exception &) {
        fail("Invalid Content-Length: " + *length);
        return;
      }
    } else {
      mode_ = BodyMode::UntilClose;
    }

    if (mode_ == BodyMode::None || (mode_ == BodyMode::ContentLength && remaining_ == 0)) {
      complete();
      return;
    }

    std::string pending;
    pending.swap(buffer_);
    consume(pending);
    if (!finished_) read_body();
  }

  void read_body() {
    auto self = shared_from_this();
    with_stream([self](auto &stream) {
      stream.async_read_some(asio::buffer(self->read_buf_), [self](const std::error_code &ec, size_t n) {
        if (self->finished_) return;
        if (n > 0) {
          self->consume(std::string(self->read_buf_.data(), n));
          if (self->finished_) return;
        }
        if (ec) {
          if ((ec == asio::error::eof || ec == asio::ssl::error::stream_truncated) && self->mode_ == BodyMode::UntilClose) {
            self->complete();
          } else {
            self->fail("Connection closed before body completed: " + ec.message());
          }
          return;
        }
        self->read_body();
      });
    });
  }

  void consume(const std::string &data) {
    if (data.empty()) return;
    switch (mode_) {
      case BodyMode::Chunked: {
        std::string decoded;
        if (!chunked_.feed(data.data(), data.size(), decoded)) {
          fail("Malformed chunked body");
          return;
        }
        if (!deliver(decoded)) return;
        if (chunked_.done()) complete();
        break;
      }
      case BodyMode::ContentLength: {
        size_t take = static_cast<size_t>(std::min<unsigned long long>(remaining_, data.size()));
        remaining_ -= take;
        if (!deliver(data.substr(0, take))) return;
        if (remaining_ == 0) complete();
        break;
      }
      case BodyMode::UntilClose:
        deliver(data);
        break;
      case BodyMode::None:
        break;
    }
  }

  // Returns false when the stream consumer asked to stop
  bool deliver(const std::string &chunk) {
    if (chunk.empty()) return true;
    if (options_.on_data) {
      if (!options_.on_data(chunk)) {
        complete();
        return false;
      }
      return true;
    }
    response_.body += chunk;
    return true;
  }

  void complete() {
    finish(std::move(response_));
  }

  void fail(const std::string &error) {
    if (finished_) return;
    spdlog::debug("[HTTP] {} {}: {}", options_.method, url_.host + url_.target(), error);
    HttpResponse resp;
    resp.status_code = response_.status_code;
    resp.headers = response_.headers;
    resp.error = error;
    // A failure after a successful status still reports the error
    if (resp.ok()) resp.status_code = 0;
    finish(std::move(resp));
  }

  void finish(HttpResponse resp) {
    if (finished_) return;
    finished_ = true;
    timer_.cancel();
    resolver_.cancel();
    std::error_code ignored;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
    if (options_.on_complete) {
      options_.on_complete(resp);
    }
    promise_.set_value(std::move(resp));
  }

  asio::io_context &io_ctx_;
  ParsedUrl url_;
  HttpOptions options_;

  asio::ip::tcp::resolver resolver_;
  asio::ip::tcp::socket socket_;
  asio::steady_timer timer_;
  std::unique_ptr<asio::ssl::context> ssl_ctx_;
  std::unique_ptr<asio::ssl::stream<asio::ip::tcp::socket &>> ssl_stream_;

  std::string request_;
  std::string buffer_;
  std::array<char, 8192> read_buf_{};

  BodyMode mode_ = BodyMode::None;
  unsigned long long remaining_ = 0;
  ChunkedDecoder chunked_;

  HttpResponse response_;
  bool finished_ = false;
  std::promise<HttpResponse> promise_;
};

// ============================================================
// HttpClient
// ============================================================

HttpClient::HttpClient(asio::io_context &io_ctx) : io_ctx_(io_ctx) {}

HttpClient::~HttpClient() = default;

std::future<HttpResponse> HttpClient::request(const std::string &url, HttpOptions options) {
  auto parsed = ParsedUrl::parse(url);
  if (!parsed) {
    std::promise<HttpResponse> promise;
    HttpResponse resp;
    resp.error = "Invalid URL: " + url;
    promise.set_value(std::move(resp));
    return promise.get_future();
  }

  auto session = std::make_shared<Session>(io_ctx_, std::move(*parsed), std::move(options));
  {
    std::lock_guard lock(sessions_mutex_);
    sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                   [](const std::weak_ptr<Session> &s) {
                                     return s.expired();
                                   }),
                    sessions_.end());
    sessions_.push_back(session);
  }
  return session->start();
}

void HttpClient::cancel() {
  std::lock_guard lock(sessions_mutex_);
  for (auto &weak : sessions_) {
    if (auto session = weak.lock()) {
      session->cancel();
    }
  }
  sessions_.clear();
}

}  // namespace kennel::net
