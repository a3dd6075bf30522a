#include "mcp/transport.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spdlog/spdlog.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <thread>
#include <unordered_map>

#include "net/http_client.hpp"
#include "net/sse_parser.hpp"

namespace stepagent::mcp {

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
  const auto &err = error.value();
  if (err.is_object() && err.contains("message") && err["message"].is_string()) {
    return err["message"].get<std::string>();
  }
  if (err.is_string()) {
    return err.get<std::string>();
  }
  return err.dump();
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
        resp.id = -1;
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

JsonRpcResponse JsonRpcResponse::failure(int64_t id, const std::string &message, int code) {
  JsonRpcResponse resp;
  resp.id = id;
  resp.error = json{{"code", code}, {"message", message}};
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

namespace {

std::future<JsonRpcResponse> ready_failure(int64_t id, const std::string &message) {
  std::promise<JsonRpcResponse> promise;
  promise.set_value(JsonRpcResponse::failure(id, message));
  return promise.get_future();
}

std::future<bool> ready_bool(bool value) {
  std::promise<bool> promise;
  promise.set_value(value);
  return promise.get_future();
}

bool is_response(const json &msg) {
  return msg.is_object() && msg.contains("id") && !msg["id"].is_null() && (msg.contains("result") || msg.contains("error"));
}

// Requests awaiting a response, keyed by JSON-RPC id
class PendingRequests {
 public:
  std::future<JsonRpcResponse> add(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &promise = pending_[id];
    promise = std::promise<JsonRpcResponse>();
    return promise.get_future();
  }

  bool resolve(JsonRpcResponse response) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(response.id);
    if (it == pending_.end()) {
      return false;
    }
    it->second.set_value(std::move(response));
    pending_.erase(it);
    return true;
  }

  void fail(int64_t id, const std::string &message) {
    resolve(JsonRpcResponse::failure(id, message));
  }

  void fail_all(const std::string &message) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto &[id, promise] : pending_) {
      promise.set_value(JsonRpcResponse::failure(id, message));
    }
    pending_.clear();
  }

 private:
  std::mutex mutex_;
  std::unordered_map<int64_t, std::promise<JsonRpcResponse>> pending_;
};

// Notification handler slot shared with reader threads
class NotificationSlot {
 public:
  void set(Transport::NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
  }

  void dispatch(const json &msg) {
    if (!msg.contains("method") || !msg["method"].is_string()) {
      return;
    }
    auto method = msg["method"].get<std::string>();
    auto params = msg.value("params", json::object());

    std::lock_guard<std::mutex> lock(mutex_);
    if (handler_) {
      handler_(method, params);
    } else {
      spdlog::debug("[MCP] Notification {} {}", method, params.dump());
    }
  }

 private:
  std::mutex mutex_;
  Transport::NotificationHandler handler_;
};

// One HttpClient per in-flight request so each can be cancelled on its own
class HttpWorkers {
 public:
  using Work = std::function<void(net::HttpClient &)>;

  void launch(int64_t id, Work work) {
    auto client = std::make_shared<net::HttpClient>();
    std::lock_guard<std::mutex> lock(mutex_);
    prune();
    clients_[id] = client;
    futures_.push_back(std::async(std::launch::async, [this, id, client, work = std::move(work)]() {
      work(*client);
      std::lock_guard<std::mutex> guard(mutex_);
      auto it = clients_.find(id);
      if (it != clients_.end() && it->second == client) {
        clients_.erase(it);
      }
    }));
  }

  void cancel(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(id);
    if (it != clients_.end()) {
      it->second->cancel();
    }
  }

  void cancel_all_and_wait() {
    std::vector<std::future<void>> running;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (auto &[id, client] : clients_) {
        client->cancel();
      }
      running = std::move(futures_);
      futures_.clear();
    }
    for (auto &f : running) {
      f.wait();
    }
  }

 private:
  void prune() {
    futures_.erase(std::remove_if(futures_.begin(), futures_.end(),
                                  [](std::future<void> &f) {
                                    return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
                                  }),
                   futures_.end());
  }

  std::mutex mutex_;
  std::unordered_map<int64_t, std::shared_ptr<net::HttpClient>> clients_;
  std::vector<std::future<void>> futures_;
};

std::once_flag sigpipe_once;

void ignore_sigpipe() {
  std::call_once(sigpipe_once, [] { signal(SIGPIPE, SIG_IGN); });
}

}  // namespace

// ============================================================
// StdioTransport::Impl — child process over pipes
// ============================================================

class StdioTransport::Impl {
 public:
  explicit Impl(StdioTransportSpec spec) : spec_(std::move(spec)) {}

  ~Impl() {
    disconnect();
  }

  std::future<bool> connect() {
    return std::async(std::launch::async, [this]() -> bool {
      std::lock_guard<std::mutex> lock(process_mutex_);

      if (state_ == TransportState::Connected) return true;
      release_process();
      state_ = TransportState::Connecting;
      ignore_sigpipe();

      int stdin_pipe[2];   // parent writes, child reads
      int stdout_pipe[2];  // child writes, parent reads
      int exec_pipe[2];    // reports execvp failure; closed by exec on success

      if (pipe2(stdin_pipe, O_CLOEXEC) != 0) {
        return fail_connect(std::string("Failed to create pipes: ") + std::strerror(errno));
      }
      if (pipe2(stdout_pipe, O_CLOEXEC) != 0) {
        close_pair(stdin_pipe);
        return fail_connect(std::string("Failed to create pipes: ") + std::strerror(errno));
      }
      if (pipe2(exec_pipe, O_CLOEXEC) != 0) {
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        return fail_connect(std::string("Failed to create pipes: ") + std::strerror(errno));
      }

      // Build argv before forking
      std::vector<const char *> argv;
      argv.push_back(spec_.command.c_str());
      for (const auto &arg : spec_.args) {
        argv.push_back(arg.c_str());
      }
      argv.push_back(nullptr);

      pid_t pid = fork();
      if (pid < 0) {
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(exec_pipe);
        return fail_connect(std::string("Fork failed: ") + std::strerror(errno));
      }

      if (pid == 0) {
        // Child: own process group so disconnect can signal the whole tree
        setpgid(0, 0);

        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);

        int devnull = open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
          dup2(devnull, STDERR_FILENO);
          close(devnull);
        }

        for (const auto &[key, val] : spec_.env) {
          setenv(key.c_str(), val.c_str(), 1);
        }

        execvp(spec_.command.c_str(), const_cast<char *const *>(argv.data()));

        int err = errno;
        ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
      }

      // Parent
      setpgid(pid, pid);
      close(stdin_pipe[0]);
      close(stdout_pipe[1]);
      close(exec_pipe[1]);

      int exec_errno = 0;
      ssize_t n;
      do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
      } while (n < 0 && errno == EINTR);
      close(exec_pipe[0]);

      if (n > 0) {
        close(stdin_pipe[1]);
        close(stdout_pipe[0]);
        int status = 0;
        waitpid(pid, &status, 0);
        return fail_connect("Failed to start '" + spec_.command + "': " + std::strerror(exec_errno));
      }

      pid_ = pid;
      write_fd_ = stdin_pipe[1];
      read_fd_ = stdout_pipe[0];
      stopped_ = false;
      state_ = TransportState::Connected;

      reader_thread_ = std::thread([this]() {
        reader_loop();
      });

      spdlog::debug("[MCP] Started '{}' (pid: {})", spec_.command, pid_.load());
      return true;
    });
  }

  void disconnect() {
    std::lock_guard<std::mutex> lock(process_mutex_);
    release_process();
    state_ = TransportState::Disconnected;
  }

  std::future<JsonRpcResponse> send_request(const JsonRpcRequest &request) {
    if (state_ != TransportState::Connected) {
      return ready_failure(request.id, "Transport not connected");
    }

    auto future = pending_.add(request.id);
    if (!write_message(request.to_json())) {
      pending_.fail(request.id, "Failed to write to MCP server process");
    }
    return future;
  }

  void cancel_request(int64_t id) {
    pending_.fail(id, "Request cancelled");
  }

  void send_notification(const JsonRpcNotification &notification) {
    if (state_ != TransportState::Connected) return;
    write_message(notification.to_json());
  }

  void set_notification_handler(Transport::NotificationHandler handler) {
    notifications_.set(std::move(handler));
  }

  TransportState state() const {
    return state_;
  }

  int pid() const {
    return pid_;
  }

 private:
  // Stops the reader and the child; caller holds process_mutex_
  void release_process() {
    stopped_ = true;

    if (reader_thread_.joinable()) {
      reader_thread_.join();
    }

    {
      std::lock_guard<std::mutex> write_lock(write_mutex_);
      if (write_fd_ >= 0) {
        close(write_fd_);
        write_fd_ = -1;
      }
    }
    if (read_fd_ >= 0) {
      close(read_fd_);
      read_fd_ = -1;
    }

    if (pid_ > 0) {
      terminate_child(pid_);
      pid_ = -1;
    }

    pending_.fail_all("Transport disconnected");
  }

  bool fail_connect(const std::string &message) {
    spdlog::error("[MCP] {}", message);
    state_ = TransportState::Failed;
    return false;
  }

  static void close_pair(int fds[2]) {
    close(fds[0]);
    close(fds[1]);
  }

  static void terminate_child(pid_t pid) {
    int status = 0;
    kill(-pid, SIGTERM);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(500);
    while (std::chrono::steady_clock::now() < deadline) {
      pid_t r = waitpid(pid, &status, WNOHANG);
      if (r == pid || (r < 0 && errno != EINTR)) {
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    kill(-pid, SIGKILL);
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
  }

  // Newline-delimited JSON
  bool write_message(const json &msg) {
    std::string line = msg.dump() + "\n";

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (write_fd_ < 0) {
      return false;
    }

    size_t offset = 0;
    while (offset < line.size()) {
      ssize_t written = write(write_fd_, line.data() + offset, line.size() - offset);
      if (written < 0) {
        if (errno == EINTR) continue;
        spdlog::error("[MCP] Write to '{}' failed: {}", spec_.command, std::strerror(errno));
        return false;
      }
      offset += static_cast<size_t>(written);
    }
    return true;
  }

  void reader_loop() {
    std::string buffer;
    std::array<char, 4096> read_buf{};

    while (!stopped_) {
      pollfd pfd{read_fd_, POLLIN, 0};
      int ready = poll(&pfd, 1, 100);
      if (ready < 0) {
        if (errno == EINTR) continue;
        break;
      }
      if (ready == 0) continue;

      ssize_t n = read(read_fd_, read_buf.data(), read_buf.size());
      if (n < 0 && errno == EINTR) continue;
      if (n <= 0) {
        break;
      }

      buffer.append(read_buf.data(), n);

      size_t newline;
      while ((newline = buffer.find('\n')) != std::string::npos) {
        std::string line = buffer.substr(0, newline);
        buffer.erase(0, newline + 1);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        auto msg = json::parse(line, nullptr, false);
        if (msg.is_discarded()) {
          spdlog::debug("[MCP] Ignoring non-JSON output from '{}': {}", spec_.command, line);
          continue;
        }
        handle_incoming(msg);
      }
    }

    if (!stopped_) {
      spdlog::warn("[MCP] Server process '{}' closed its output", spec_.command);
      state_ = TransportState::Failed;
      pending_.fail_all("MCP server process exited");
    }
  }

  void handle_incoming(const json &msg) {
    if (is_response(msg)) {
      auto resp = JsonRpcResponse::from_json(msg);
      if (!pending_.resolve(std::move(resp))) {
        spdlog::debug("[MCP] Dropping response with no waiting request: {}", msg.dump());
      }
      return;
    }
    notifications_.dispatch(msg);
  }

  StdioTransportSpec spec_;

  std::atomic<pid_t> pid_{-1};
  int write_fd_ = -1;
  int read_fd_ = -1;

  std::atomic<TransportState> state_{TransportState::Disconnected};
  std::atomic<bool> stopped_{false};

  std::thread reader_thread_;

  std::mutex write_mutex_;
  std::mutex process_mutex_;

  PendingRequests pending_;
  NotificationSlot notifications_;
};

StdioTransport::StdioTransport(StdioTransportSpec spec) : impl_(std::make_unique<Impl>(std::move(spec))) {}

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

std::future<bool> StdioTransport::connect() {
  return impl_->connect();
}

void StdioTransport::disconnect() {
  impl_->disconnect();
}

TransportState StdioTransport::state() const {
  return impl_->state();
}

int StdioTransport::pid() const {
  return impl_->pid();
}

// ============================================================
// SseTransport::Impl — GET event stream + POST endpoint
// ============================================================

class SseTransport::Impl {
 public:
  Impl(UrlTransportSpec spec, double connect_timeout, double sse_read_timeout)
      : spec_(std::move(spec)), connect_timeout_(to_millis(connect_timeout)), read_timeout_(to_millis(sse_read_timeout)) {}

  ~Impl() {
    disconnect();
  }

  std::future<bool> connect() {
    return std::async(std::launch::async, [this]() -> bool {
      if (state_ == TransportState::Connected) return true;

      bool stale = false;
      {
        std::lock_guard<std::mutex> guard(mutex_);
        stale = reader_thread_.joinable();
      }
      if (stale) {
        disconnect();
      }

      std::unique_lock<std::mutex> lock(mutex_);

      auto base = net::ParsedUrl::parse(spec_.url);
      if (!base) {
        spdlog::error("[MCP] Invalid SSE url: {}", spec_.url);
        state_ = TransportState::Failed;
        return false;
      }

      state_ = TransportState::Connecting;
      stopped_ = false;
      stream_done_ = false;
      endpoint_.clear();
      stream_client_ = std::make_shared<net::HttpClient>();

      reader_thread_ = std::thread([this, client = stream_client_, base = *base]() {
        reader_loop(*client, base);
      });

      bool ready = endpoint_cv_.wait_for(lock, connect_timeout_, [this] {
        return !endpoint_.empty() || stream_done_ || stopped_;
      });

      if (!ready || endpoint_.empty()) {
        spdlog::warn("[MCP] No endpoint event from {} within {}ms", spec_.url, connect_timeout_.count());
        state_ = TransportState::Failed;
        return false;
      }

      state_ = TransportState::Connected;
      spdlog::debug("[MCP] SSE endpoint for {}: {}", spec_.url, endpoint_);
      return true;
    });
  }

  void disconnect() {
    std::thread reader;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stopped_ = true;
      if (stream_client_) {
        stream_client_->cancel();
      }
      reader = std::move(reader_thread_);
    }
    endpoint_cv_.notify_all();

    if (reader.joinable()) {
      reader.join();
    }
    workers_.cancel_all_and_wait();
    pending_.fail_all("Transport disconnected");
    state_ = TransportState::Disconnected;
  }

  std::future<JsonRpcResponse> send_request(const JsonRpcRequest &request) {
    if (state_ != TransportState::Connected) {
      return ready_failure(request.id, "Transport not connected");
    }

    auto future = pending_.add(request.id);
    auto body = request.to_json().dump();
    auto id = request.id;
    workers_.launch(id, [this, id, body, endpoint = current_endpoint()](net::HttpClient &client) {
      auto resp = client.request(endpoint, post_options(body));
      if (!resp.error.empty()) {
        pending_.fail(id, "POST failed: " + resp.error);
        return;
      }
      if (!resp.ok()) {
        pending_.fail(id, "HTTP " + std::to_string(resp.status_code) + ": " + resp.body);
        return;
      }
      // Responses normally arrive on the event stream; accept an inline one too
      if (!resp.body.empty()) {
        auto msg = json::parse(resp.body, nullptr, false);
        if (!msg.is_discarded() && is_response(msg)) {
          pending_.resolve(JsonRpcResponse::from_json(msg));
        }
      }
    });
    return future;
  }

  void cancel_request(int64_t id) {
    workers_.cancel(id);
    pending_.fail(id, "Request cancelled");
  }

  void send_notification(const JsonRpcNotification &notification) {
    if (state_ != TransportState::Connected) return;

    net::HttpClient client;
    auto options = post_options(notification.to_json().dump());
    options.timeout = connect_timeout_;
    auto resp = client.request(current_endpoint(), options);
    if (!resp.error.empty() || !resp.ok()) {
      spdlog::warn("[MCP] Notification {} to {} failed: {}", notification.method, spec_.url,
                   resp.error.empty() ? "HTTP " + std::to_string(resp.status_code) : resp.error);
    }
  }

  void set_notification_handler(Transport::NotificationHandler handler) {
    notifications_.set(std::move(handler));
  }

  TransportState state() const {
    return state_;
  }

 private:
  net::HttpOptions post_options(std::string body) const {
    net::HttpOptions options;
    options.method = "POST";
    options.headers = spec_.headers;
    options.headers["Content-Type"] = "application/json";
    options.body = std::move(body);
    options.connect_timeout = connect_timeout_;
    options.timeout = read_timeout_;
    return options;
  }

  std::string current_endpoint() {
    std::lock_guard<std::mutex> lock(mutex_);
    return endpoint_;
  }

  void reader_loop(net::HttpClient &client, const net::ParsedUrl &base) {
    net::HttpOptions options;
    options.headers = spec_.headers;
    options.headers["Accept"] = "text/event-stream";
    options.headers["Cache-Control"] = "no-cache";
    options.connect_timeout = connect_timeout_;
    options.timeout = read_timeout_;

    net::SseParser parser([this, &base](const net::SseEvent &event) {
      if (event.event == "endpoint") {
        {
          std::lock_guard<std::mutex> lock(mutex_);
          endpoint_ = base.resolve(event.data);
        }
        endpoint_cv_.notify_all();
      } else if (event.event == "message") {
        auto msg = json::parse(event.data, nullptr, false);
        if (msg.is_discarded()) {
          spdlog::debug("[MCP] Ignoring non-JSON SSE message: {}", event.data);
        } else if (is_response(msg)) {
          pending_.resolve(JsonRpcResponse::from_json(msg));
        } else {
          notifications_.dispatch(msg);
        }
      }
      return !stopped_.load();
    });

    auto resp = client.stream(spec_.url, options, [&parser](const net::HttpResponse &, std::string_view data) {
      return parser.feed(data);
    });

    {
      std::lock_guard<std::mutex> lock(mutex_);
      stream_done_ = true;
    }
    endpoint_cv_.notify_all();

    if (!stopped_) {
      std::string reason = !resp.error.empty() ? resp.error
                           : !resp.ok()        ? "HTTP " + std::to_string(resp.status_code)
                                               : "stream ended";
      spdlog::warn("[MCP] SSE stream {} closed: {}", spec_.url, reason);
      state_ = TransportState::Failed;
      pending_.fail_all("SSE stream closed: " + reason);
    }
  }

  UrlTransportSpec spec_;
  std::chrono::milliseconds connect_timeout_;
  std::chrono::milliseconds read_timeout_;

  std::atomic<TransportState> state_{TransportState::Disconnected};
  std::atomic<bool> stopped_{false};

  std::mutex mutex_;
  std::condition_variable endpoint_cv_;
  std::string endpoint_;
  bool stream_done_ = false;
  std::shared_ptr<net::HttpClient> stream_client_;
  std::thread reader_thread_;

  PendingRequests pending_;
  NotificationSlot notifications_;
  HttpWorkers workers_;
};

SseTransport::SseTransport(UrlTransportSpec spec, double connect_timeout, double sse_read_timeout)
    : impl_(std::make_unique<Impl>(std::move(spec), connect_timeout, sse_read_timeout)) {}

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

void SseTransport::disconnect() {
  impl_->disconnect();
}

TransportState SseTransport::state() const {
  return impl_->state();
}

// ============================================================
// StreamableHttpTransport::Impl — one POST per message
// ============================================================

class StreamableHttpTransport::Impl {
 public:
  Impl(UrlTransportSpec spec, double connect_timeout, double sse_read_timeout)
      : spec_(std::move(spec)), connect_timeout_(to_millis(connect_timeout)), read_timeout_(to_millis(sse_read_timeout)) {}

  ~Impl() {
    disconnect();
  }

  // The session opens with the first POST (initialize)
  std::future<bool> connect() {
    if (!net::ParsedUrl::parse(spec_.url)) {
      spdlog::error("[MCP] Invalid url: {}", spec_.url);
      state_ = TransportState::Failed;
      return ready_bool(false);
    }
    stopped_ = false;
    state_ = TransportState::Connected;
    return ready_bool(true);
  }

  void disconnect() {
    if (stopped_.exchange(true) && state_ == TransportState::Disconnected) {
      return;
    }

    workers_.cancel_all_and_wait();
    pending_.fail_all("Transport disconnected");

    auto session = session_id();
    if (!session.empty()) {
      net::HttpClient client;
      net::HttpOptions options;
      options.method = "DELETE";
      options.headers = spec_.headers;
      options.headers["Mcp-Session-Id"] = session;
      options.connect_timeout = connect_timeout_;
      options.timeout = connect_timeout_;
      auto resp = client.request(spec_.url, options);
      if (!resp.error.empty()) {
        spdlog::debug("[MCP] Session close for {} failed: {}", spec_.url, resp.error);
      }
      std::lock_guard<std::mutex> lock(session_mutex_);
      session_id_.clear();
    }

    state_ = TransportState::Disconnected;
  }

  std::future<JsonRpcResponse> send_request(const JsonRpcRequest &request) {
    if (state_ != TransportState::Connected) {
      return ready_failure(request.id, "Transport not connected");
    }

    auto future = pending_.add(request.id);
    auto body = request.to_json().dump();
    auto id = request.id;
    workers_.launch(id, [this, id, body](net::HttpClient &client) {
      post_and_dispatch(client, id, body);
    });
    return future;
  }

  void cancel_request(int64_t id) {
    workers_.cancel(id);
    pending_.fail(id, "Request cancelled");
  }

  void send_notification(const JsonRpcNotification &notification) {
    if (state_ != TransportState::Connected) return;

    net::HttpClient client;
    auto options = post_options(notification.to_json().dump());
    options.timeout = connect_timeout_;
    auto resp = client.request(spec_.url, options);
    if (!resp.error.empty() || !resp.ok()) {
      spdlog::warn("[MCP] Notification {} to {} failed: {}", notification.method, spec_.url,
                   resp.error.empty() ? "HTTP " + std::to_string(resp.status_code) : resp.error);
    }
  }

  void set_notification_handler(Transport::NotificationHandler handler) {
    notifications_.set(std::move(handler));
  }

  TransportState state() const {
    return state_;
  }

  std::string session_id() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return session_id_;
  }

 private:
  net::HttpOptions post_options(std::string body) const {
    net::HttpOptions options;
    options.method = "POST";
    options.headers = spec_.headers;
    options.headers["Content-Type"] = "application/json";
    options.headers["Accept"] = "application/json, text/event-stream";
    auto session = session_id();
    if (!session.empty()) {
      options.headers["Mcp-Session-Id"] = session;
    }
    options.body = std::move(body);
    options.connect_timeout = connect_timeout_;
    options.timeout = read_timeout_;
    return options;
  }

  void remember_session(const net::HttpResponse &resp) {
    auto session = resp.header("mcp-session-id");
    if (session.empty()) return;
    std::lock_guard<std::mutex> lock(session_mutex_);
    session_id_ = session;
  }

  // Routes one incoming JSON value (object or batch); true once `id` is answered
  bool dispatch(const json &msg, int64_t id) {
    if (msg.is_array()) {
      bool answered = false;
      for (const auto &item : msg) {
        answered = dispatch(item, id) || answered;
      }
      return answered;
    }
    if (is_response(msg)) {
      auto resp = JsonRpcResponse::from_json(msg);
      bool mine = resp.id == id;
      pending_.resolve(std::move(resp));
      return mine;
    }
    notifications_.dispatch(msg);
    return false;
  }

  void post_and_dispatch(net::HttpClient &client, int64_t id, const std::string &body) {
    bool answered = false;
    bool event_stream = false;
    std::string json_body;

    net::SseParser parser([&](const net::SseEvent &event) {
      if (event.event != "message") return true;
      auto msg = json::parse(event.data, nullptr, false);
      if (msg.is_discarded()) {
        spdlog::debug("[MCP] Ignoring non-JSON SSE message: {}", event.data);
        return true;
      }
      answered = dispatch(msg, id) || answered;
      return !answered;
    });

    auto resp = client.stream(spec_.url, post_options(body), [&](const net::HttpResponse &head, std::string_view data) {
      event_stream = head.header("content-type").find("text/event-stream") != std::string::npos;
      if (event_stream) {
        return parser.feed(data);
      }
      json_body.append(data);
      return true;
    });

    remember_session(resp);

    if (answered) {
      return;
    }
    if (!resp.error.empty()) {
      pending_.fail(id, "POST failed: " + resp.error);
      return;
    }
    if (!resp.ok()) {
      pending_.fail(id, "HTTP " + std::to_string(resp.status_code) + ": " + resp.body);
      return;
    }
    if (event_stream) {
      pending_.fail(id, "Event stream ended without a response");
      return;
    }

    auto msg = json::parse(json_body, nullptr, false);
    if (msg.is_discarded()) {
      pending_.fail(id, "Invalid JSON response");
      return;
    }
    if (!dispatch(msg, id)) {
      pending_.fail(id, "No response for request " + std::to_string(id));
    }
  }

  UrlTransportSpec spec_;
  std::chrono::milliseconds connect_timeout_;
  std::chrono::milliseconds read_timeout_;

  std::atomic<TransportState> state_{TransportState::Disconnected};
  std::atomic<bool> stopped_{false};

  mutable std::mutex session_mutex_;
  std::string session_id_;

  PendingRequests pending_;
  NotificationSlot notifications_;
  HttpWorkers workers_;
};

StreamableHttpTransport::StreamableHttpTransport(UrlTransportSpec spec, double connect_timeout, double sse_read_timeout)
    : impl_(std::make_unique<Impl>(std::move(spec), connect_timeout, sse_read_timeout)) {}

StreamableHttpTransport::~StreamableHttpTransport() = default;

std::future<JsonRpcResponse> StreamableHttpTransport::send_request(const JsonRpcRequest &request) {
  return impl_->send_request(request);
}

void StreamableHttpTransport::cancel_request(int64_t id) {
  impl_->cancel_request(id);
}

void StreamableHttpTransport::send_notification(const JsonRpcNotification &notification) {
  impl_->send_notification(notification);
}

void StreamableHttpTransport::set_notification_handler(NotificationHandler handler) {
  impl_->set_notification_handler(std::move(handler));
}

std::future<bool> StreamableHttpTransport::connect() {
  return impl_->connect();
}

void StreamableHttpTransport::disconnect() {
  impl_->disconnect();
}

TransportState StreamableHttpTransport::state() const {
  return impl_->state();
}

std::string StreamableHttpTransport::session_id() const {
  return impl_->session_id();
}

// ============================================================
// Factory
// ============================================================

std::unique_ptr<Transport> make_transport(const McpServerConfig &config) {
  if (auto *stdio = std::get_if<StdioTransportSpec>(&config.transport)) {
    return std::make_unique<StdioTransport>(*stdio);
  }

  const auto &url = std::get<UrlTransportSpec>(config.transport);
  if (url.kind == TransportKind::Sse) {
    return std::make_unique<SseTransport>(url, config.connect_timeout(), config.sse_read_timeout());
  }
  return std::make_unique<StreamableHttpTransport>(url, config.connect_timeout(), config.sse_read_timeout());
}

}  // namespace stepagent::mcp
