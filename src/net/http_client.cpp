#include "net/http_client.hpp"

#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <asio.hpp>
#include <asio/ssl.hpp>
#include <cctype>
#include <charconv>
#include <mutex>

namespace stepagent::net {

namespace {

std::string to_lower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return std::tolower(c); });
  return str;
}

std::string trim(std::string_view str) {
  size_t begin = 0;
  size_t end = str.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(str[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(str[end - 1]))) --end;
  return std::string(str.substr(begin, end - begin));
}

bool has_header(const std::map<std::string, std::string> &headers, const std::string &name) {
  auto lower = to_lower(name);
  return std::any_of(headers.begin(), headers.end(), [&](const auto &kv) { return to_lower(kv.first) == lower; });
}

// Parses "HTTP/1.1 200 OK\r\nName: value\r\n...\r\n\r\n"
bool parse_response_head(std::string_view head, HttpResponse &response) {
  size_t line_end = head.find("\r\n");
  if (line_end == std::string_view::npos) return false;

  auto status_line = head.substr(0, line_end);
  if (status_line.substr(0, 5) != "HTTP/") return false;

  auto sp = status_line.find(' ');
  if (sp == std::string_view::npos) return false;
  auto code = status_line.substr(sp + 1, 3);
  int status = 0;
  auto [ptr, ec] = std::from_chars(code.data(), code.data() + code.size(), status);
  if (ec != std::errc() || ptr != code.data() + code.size()) return false;
  response.status_code = status;

  size_t pos = line_end + 2;
  while (pos < head.size()) {
    size_t end = head.find("\r\n", pos);
    if (end == std::string_view::npos) end = head.size();
    auto line = head.substr(pos, end - pos);
    pos = end + 2;
    if (line.empty()) break;

    auto colon = line.find(':');
    if (colon == std::string_view::npos) continue;
    auto name = to_lower(trim(line.substr(0, colon)));
    auto value = trim(line.substr(colon + 1));
    auto [it, inserted] = response.headers.emplace(name, value);
    if (!inserted) {
      it->second += ", " + value;
    }
  }
  return true;
}

enum class BodyMode { None, Length, Chunked, UntilClose };

}  // namespace

// ============================================================
// ParsedUrl
// ============================================================

std::optional<ParsedUrl> ParsedUrl::parse(const std::string &url) {
  auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos || scheme_end == 0) {
    return std::nullopt;
  }

  ParsedUrl result;
  result.scheme = to_lower(url.substr(0, scheme_end));
  if (result.scheme != "http" && result.scheme != "https") {
    return std::nullopt;
  }

  auto rest = url.substr(scheme_end + 3);
  auto authority_end = rest.find_first_of("/?");
  auto authority = rest.substr(0, authority_end);
  if (authority.empty()) {
    return std::nullopt;
  }

  if (authority.front() == '[') {
    // IPv6 literal
    auto close = authority.find(']');
    if (close == std::string::npos) return std::nullopt;
    result.host = authority.substr(1, close - 1);
    if (close + 1 < authority.size() && authority[close + 1] == ':') {
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

  if (result.host.empty()) {
    return std::nullopt;
  }
  if (!result.port.empty() && !std::all_of(result.port.begin(), result.port.end(), ::isdigit)) {
    return std::nullopt;
  }

  if (authority_end == std::string::npos) {
    result.path = "/";
    return result;
  }

  auto path_and_query = rest.substr(authority_end);
  auto query_start = path_and_query.find('?');
  result.path = path_and_query.substr(0, query_start);
  if (query_start != std::string::npos) {
    result.query = path_and_query.substr(query_start);
  }
  if (result.path.empty()) {
    result.path = "/";
  }
  return result;
}

std::string ParsedUrl::origin() const {
  std::string out = scheme + "://";
  out += host.find(':') != std::string::npos ? "[" + host + "]" : host;
  if (!port.empty()) {
    out += ":" + port;
  }
  return out;
}

std::string ParsedUrl::resolve(const std::string &reference) const {
  if (reference.find("://") != std::string::npos) {
    return reference;
  }
  if (reference.empty()) {
    return origin() + target();
  }
  if (reference.front() == '/') {
    return origin() + reference;
  }

  auto slash = path.rfind('/');
  auto directory = slash == std::string::npos ? std::string("/") : path.substr(0, slash + 1);
  return origin() + directory + reference;
}

std::string HttpResponse::header(const std::string &name) const {
  auto it = headers.find(to_lower(name));
  return it != headers.end() ? it->second : std::string();
}

// ============================================================
// ChunkedDecoder
// ============================================================

bool ChunkedDecoder::feed(std::string_view data, std::string &out) {
  size_t i = 0;
  while (i < data.size() && state_ != State::Done) {
    switch (state_) {
      case State::Size: {
        char c = data[i++];
        if (c != '\n') {
          line_ += c;
          break;
        }
        auto size_field = trim(std::string_view(line_).substr(0, line_.find(';')));
        line_.clear();
        if (size_field.empty()) return false;

        size_t size = 0;
        auto [ptr, ec] = std::from_chars(size_field.data(), size_field.data() + size_field.size(), size, 16);
        if (ec != std::errc() || ptr != size_field.data() + size_field.size()) return false;

        remaining_ = size;
        state_ = size == 0 ? State::Trailer : State::Data;
        break;
      }
      case State::Data: {
        size_t n = std::min(remaining_, data.size() - i);
        out.append(data.substr(i, n));
        i += n;
        remaining_ -= n;
        if (remaining_ == 0) state_ = State::DataEnd;
        break;
      }
      case State::DataEnd: {
        char c = data[i++];
        if (c == '\n') {
          state_ = State::Size;
        } else if (c != '\r') {
          return false;
        }
        break;
      }
      case State::Trailer: {
        char c = data[i++];
        if (c != '\n') {
          line_ += c;
          break;
        }
        if (!line_.empty() && line_.back() == '\r') line_.pop_back();
        if (line_.empty()) state_ = State::Done;
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
// HttpClient::Impl
// ============================================================

class HttpClient::Impl {
 public:
  using tcp = asio::ip::tcp;
  using Clock = std::chrono::steady_clock;

  explicit Impl(std::atomic<bool> &cancelled) : cancelled_(cancelled), ssl_ctx_(asio::ssl::context::tls_client) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(asio::ssl::verify_peer);
  }

  HttpResponse perform(const std::string &url, const HttpOptions &options, const ChunkHandler *handler) {
    HttpResponse response;

    auto parsed = ParsedUrl::parse(url);
    if (!parsed) {
      response.error = "Invalid URL: " + url;
      return response;
    }

    bool streaming = handler != nullptr;
    auto deadline = Clock::now() + options.timeout;
    auto read_budget = [&]() -> std::chrono::milliseconds {
      if (streaming) return options.timeout;
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
      return std::max(left, std::chrono::milliseconds(0));
    };

    if (!open(*parsed, options.connect_timeout, response)) {
      close();
      return response;
    }

    // Request
    std::string request = build_request(*parsed, options);
    asio::error_code ec;
    async_write(asio::buffer(request), [&](const asio::error_code &e, size_t) { ec = e; });
    bool sent = run_op(read_budget());
    if (cancelled_.load()) {
      fail(response, "Request cancelled");
      return response;
    }
    if (!sent) {
      fail(response, "Request timed out while sending");
      return response;
    }
    if (ec) {
      fail(response, "Send failed: " + ec.message());
      return response;
    }

    // Response head
    std::string buffer;
    size_t head_size = 0;
    async_read_until(buffer, [&](const asio::error_code &e, size_t n) {
      ec = e;
      head_size = n;
    });
    bool got_head = run_op(read_budget());
    if (cancelled_.load()) {
      fail(response, "Request cancelled");
      return response;
    }
    if (!got_head) {
      fail(response, "Timed out waiting for response headers");
      return response;
    }
    if (ec) {
      fail(response, "Failed to read response headers: " + ec.message());
      return response;
    }
    if (!parse_response_head(std::string_view(buffer).substr(0, head_size), response)) {
      fail(response, "Malformed HTTP response");
      return response;
    }
    buffer.erase(0, head_size);

    // Body
    BodyMode mode = BodyMode::UntilClose;
    size_t remaining = 0;
    if (options.method == "HEAD" || response.status_code == 204 || response.status_code == 304 ||
        response.status_code < 200) {
      mode = BodyMode::None;
    } else if (to_lower(response.header("transfer-encoding")).find("chunked") != std::string::npos) {
      mode = BodyMode::Chunked;
    } else if (auto length = response.header("content-length"); !length.empty()) {
      mode = BodyMode::Length;
      auto [ptr, conv_ec] = std::from_chars(length.data(), length.data() + length.size(), remaining);
      if (conv_ec != std::errc()) {
        fail(response, "Invalid Content-Length: " + length);
        return response;
      }
    }

    bool deliver_chunks = streaming && response.ok();
    bool stopped = false;
    auto deliver = [&](std::string_view data) {
      if (data.empty()) return;
      if (deliver_chunks) {
        if (!(*handler)(response, data)) stopped = true;
      } else {
        response.body.append(data);
      }
    };

    ChunkedDecoder decoder;
    std::string decoded;
    bool complete = mode == BodyMode::None || (mode == BodyMode::Length && remaining == 0);

    auto consume = [&](std::string_view data) -> bool {
      switch (mode) {
        case BodyMode::None:
          return true;
        case BodyMode::Length: {
          auto n = std::min(remaining, data.size());
          deliver(data.substr(0, n));
          remaining -= n;
          complete = remaining == 0;
          return true;
        }
        case BodyMode::Chunked: {
          decoded.clear();
          if (!decoder.feed(data, decoded)) return false;
          deliver(decoded);
          complete = decoder.done();
          return true;
        }
        case BodyMode::UntilClose:
          deliver(data);
          return true;
      }
      return true;
    };

    if (!buffer.empty() && !consume(buffer)) {
      fail(response, "Malformed chunked body");
      return response;
    }

    std::array<char, 8192> chunk{};
    while (!complete && !stopped) {
      if (cancelled_.load()) {
        fail(response, "Request cancelled");
        return response;
      }

      size_t n = 0;
      async_read_some(asio::buffer(chunk), [&](const asio::error_code &e, size_t len) {
        ec = e;
        n = len;
      });
      if (!run_op(read_budget())) {
        fail(response, streaming ? "Stream read timed out" : "Request timed out");
        return response;
      }

      if (n > 0 && !consume(std::string_view(chunk.data(), n))) {
        fail(response, "Malformed chunked body");
        return response;
      }

      if (ec) {
        bool closed = ec == asio::error::eof || ec == asio::ssl::error::stream_truncated;
        if (closed && mode == BodyMode::UntilClose) {
          complete = true;
        } else if (cancelled_.load()) {
          fail(response, "Request cancelled");
          return response;
        } else if (closed) {
          fail(response, "Connection closed before the body was complete");
          return response;
        } else {
          fail(response, "Read failed: " + ec.message());
          return response;
        }
      }
    }

    close();
    return response;
  }

  // Posted from any thread; runs on the io_context thread
  void cancel() {
    asio::post(io_, [this] { close(); });
  }

 private:
  bool open(const ParsedUrl &url, std::chrono::milliseconds connect_timeout, HttpResponse &response) {
    auto deadline = Clock::now() + connect_timeout;
    auto remaining = [&] {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
      return std::max(left, std::chrono::milliseconds(0));
    };

    if (cancelled_.load()) {
      response.error = "Request cancelled";
      return false;
    }

    tcp::resolver resolver(io_);
    asio::error_code ec;
    tcp::resolver::results_type endpoints;
    resolver.async_resolve(url.host, url.port_or_default(),
                           [&](const asio::error_code &e, tcp::resolver::results_type results) {
                             ec = e;
                             endpoints = std::move(results);
                           });
    bool resolved = run_op(remaining(), [&] { resolver.cancel(); });
    if (was_cancelled(response)) {
      return false;
    }
    if (!resolved) {
      response.error = "Timed out resolving " + url.host;
      return false;
    }
    if (ec) {
      response.error = "Failed to resolve " + url.host + ": " + ec.message();
      return false;
    }

    {
      std::lock_guard<std::mutex> lock(socket_mutex_);
      tls_.reset();
      plain_.reset();
      if (url.is_https()) {
        tls_ = std::make_unique<asio::ssl::stream<tcp::socket>>(io_, ssl_ctx_);
        SSL_set_tlsext_host_name(tls_->native_handle(), url.host.c_str());
        tls_->set_verify_callback(asio::ssl::host_name_verification(url.host));
      } else {
        plain_ = std::make_unique<tcp::socket>(io_);
      }
    }

    asio::async_connect(lowest_layer(), endpoints, [&](const asio::error_code &e, const tcp::endpoint &) { ec = e; });
    bool connected = run_op(remaining());
    if (was_cancelled(response)) {
      return false;
    }
    if (!connected) {
      response.error = "Connection to " + url.host + ":" + url.port_or_default() + " timed out";
      return false;
    }
    if (ec) {
      response.error = "Failed to connect to " + url.host + ":" + url.port_or_default() + ": " + ec.message();
      return false;
    }

    if (tls_) {
      tls_->async_handshake(asio::ssl::stream_base::client, [&](const asio::error_code &e) { ec = e; });
      bool shook = run_op(remaining());
      if (was_cancelled(response)) {
        return false;
      }
      if (!shook) {
        response.error = "TLS handshake with " + url.host + " timed out";
        return false;
      }
      if (ec) {
        response.error = "TLS handshake with " + url.host + " failed: " + ec.message();
        return false;
      }
    }
    return true;
  }

  // A cancel posted while no socket existed closes nothing, so every phase
  // re-checks the flag once its operation returns
  bool was_cancelled(HttpResponse &response) const {
    if (!cancelled_.load()) {
      return false;
    }
    response.error = "Request cancelled";
    return true;
  }

  std::string build_request(const ParsedUrl &url, const HttpOptions &options) const {
    std::string request = options.method + " " + url.target() + " HTTP/1.1\r\n";

    request += "Host: " + url.host;
    if (!url.port.empty()) {
      request += ":" + url.port;
    }
    request += "\r\n";

    if (!has_header(options.headers, "User-Agent")) {
      request += "User-Agent: stepagent/0.1\r\n";
    }
    if (!has_header(options.headers, "Accept")) {
      request += "Accept: */*\r\n";
    }
    for (const auto &[name, value] : options.headers) {
      request += name + ": " + value + "\r\n";
    }
    if (!options.body.empty() || options.method == "POST" || options.method == "PUT") {
      request += "Content-Length: " + std::to_string(options.body.size()) + "\r\n";
    }
    request += "Connection: close\r\n\r\n";
    request += options.body;
    return request;
  }

  tcp::socket::lowest_layer_type &lowest_layer() {
    return tls_ ? tls_->lowest_layer() : plain_->lowest_layer();
  }

  template <typename Handler>
  void async_write(asio::const_buffer buffer, Handler &&handler) {
    if (tls_) {
      asio::async_write(*tls_, buffer, std::forward<Handler>(handler));
    } else {
      asio::async_write(*plain_, buffer, std::forward<Handler>(handler));
    }
  }

  template <typename Handler>
  void async_read_until(std::string &buffer, Handler &&handler) {
    if (tls_) {
      asio::async_read_until(*tls_, asio::dynamic_buffer(buffer), "\r\n\r\n", std::forward<Handler>(handler));
    } else {
      asio::async_read_until(*plain_, asio::dynamic_buffer(buffer), "\r\n\r\n", std::forward<Handler>(handler));
    }
  }

  template <typename Handler>
  void async_read_some(asio::mutable_buffer buffer, Handler &&handler) {
    if (tls_) {
      tls_->async_read_some(buffer, std::forward<Handler>(handler));
    } else {
      plain_->async_read_some(buffer, std::forward<Handler>(handler));
    }
  }

  // Runs the pending operation to completion or until `timeout` elapses.
  // On timeout the operation is aborted and false is returned.
  bool run_op(std::chrono::milliseconds timeout, const std::function<void()> &abort = nullptr) {
    io_.restart();
    io_.run_for(timeout);
    if (io_.stopped()) {
      return true;
    }
    if (abort) {
      abort();
    } else {
      close();
    }
    io_.run();
    return false;
  }

  void fail(HttpResponse &response, const std::string &error) {
    spdlog::debug("[HTTP] {}", error);
    response.error = error;
    close();
  }

  void close() {
    std::lock_guard<std::mutex> lock(socket_mutex_);
    asio::error_code ignored;
    if (tls_) {
      tls_->lowest_layer().shutdown(tcp::socket::shutdown_both, ignored);
      tls_->lowest_layer().close(ignored);
    }
    if (plain_) {
      plain_->shutdown(tcp::socket::shutdown_both, ignored);
      plain_->close(ignored);
    }
  }

  std::atomic<bool> &cancelled_;
  asio::io_context io_;
  asio::ssl::context ssl_ctx_;
  std::mutex socket_mutex_;
  std::unique_ptr<asio::ssl::stream<tcp::socket>> tls_;
  std::unique_ptr<tcp::socket> plain_;
};

// ============================================================
// HttpClient
// ============================================================

HttpClient::HttpClient() : impl_(std::make_unique<Impl>(cancelled_)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::request(const std::string &url, const HttpOptions &options) {
  return impl_->perform(url, options, nullptr);
}

HttpResponse HttpClient::stream(const std::string &url, const HttpOptions &options, ChunkHandler handler) {
  return impl_->perform(url, options, &handler);
}

void HttpClient::cancel() {
  if (!cancelled_.exchange(true)) {
    impl_->cancel();
  }
}

}  // namespace stepagent::net
