#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace stepagent::net {

// One Server-Sent Event
struct SseEvent {
  std::string event = "message";
  std::string data;
  std::string id;
};

// Incremental text/event-stream parser. Bytes may arrive split at any point;
// each complete event is passed to the handler.
class SseParser {
 public:
  // Return false to stop parsing the rest of the current feed
  using EventHandler = std::function<bool(const SseEvent &)>;

  explicit SseParser(EventHandler handler) : handler_(std::move(handler)) {}

  // Returns false once the handler has asked to stop
  bool feed(std::string_view data);

  void reset();

 private:
  bool process_line(std::string_view line);
  bool dispatch();

  EventHandler handler_;
  std::string line_buffer_;
  SseEvent current_;
  bool has_data_ = false;
};

}  // namespace stepagent::net
