#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace stepagent::net {

// Parsed URL components
struct ParsedUrl {
  std::string scheme;  // "http" or "https"
  std::string host;
  std::string port;   // Empty when the URL does not name one
  std::string path;   // Always starts with '/'
  std::string query;  // Includes the leading '?'

  static std::optional<ParsedUrl> parse(const std::string &url);

  std::string port_or_default() const {
    if (!port.empty()) return port;
    return is_https() ? "443" : "80";
  }

  bool is_https() const {
    return scheme == "https";
  }

  // Request target: path + query
  std::string target() const {
    return path + query;
  }

  // scheme://host[:port]
  std::string origin() const;

  // Resolve a reference (absolute URL, absolute path or relative path) against this URL
  std::string resolve(const std::string &reference) const;
};

struct HttpOptions {
  std::string method = "GET";
  std::map<std::string, std::string> headers;
  std::string body;
  std::chrono::milliseconds connect_timeout{10000};
  // Whole exchange for request(); longest silence between reads for stream()
  std::chrono::milliseconds timeout{60000};
};

struct HttpResponse {
  int status_code = 0;
  std::map<std::string, std::string> headers;  // Lower-cased names
  std::string body;
  std::string error;  // Transport failure (connect, TLS, timeout, cancel)

  bool ok() const {
    return status_code >= 200 && status_code < 300;
  }

  std::string header(const std::string &name) const;
};

// Decoder for Transfer-Encoding: chunked bodies
class ChunkedDecoder {
 public:
  // Appends decoded payload to `out`. Returns false on malformed framing.
  bool feed(std::string_view data, std::string &out);

  bool done() const {
    return state_ == State::Done;
  }

 private:
  enum class State { Size, Data, DataEnd, Trailer, Done };

  State state_ = State::Size;
  std::string line_;
  size_t remaining_ = 0;
};

// Blocking HTTP/1.1 client over asio (plain TCP or TLS).
// One request is in flight per instance; cancel() may be called from any thread.
class HttpClient {
 public:
  // Receives the response head and each decoded body chunk of a 2xx response.
  // Returning false ends the exchange.
  using ChunkHandler = std::function<bool(const HttpResponse &head, std::string_view data)>;

  HttpClient();
  ~HttpClient();

  HttpClient(const HttpClient &) = delete;
  HttpClient &operator=(const HttpClient &) = delete;

  // Full request, body accumulated in the response
  HttpResponse request(const std::string &url, const HttpOptions &options);

  // Streaming request. Body chunks of a 2xx response go to `handler` instead of
  // HttpResponse::body; error responses are accumulated as usual.
  HttpResponse stream(const std::string &url, const HttpOptions &options, ChunkHandler handler);

  // Aborts the in-flight exchange. The client stays cancelled afterwards.
  void cancel();

  bool is_cancelled() const {
    return cancelled_.load();
  }

 private:
  class Impl;
  std::atomic<bool> cancelled_{false};
  std::unique_ptr<Impl> impl_;
};

}  // namespace stepagent::net
