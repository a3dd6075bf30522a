#include "net/sse_parser.hpp"

namespace stepagent::net {

bool SseParser::feed(std::string_view data) {
  for (char c : data) {
    if (c != '\n') {
      line_buffer_ += c;
      continue;
    }
    if (!line_buffer_.empty() && line_buffer_.back() == '\r') {
      line_buffer_.pop_back();
    }
    std::string line = std::move(line_buffer_);
    line_buffer_.clear();
    if (!process_line(line)) {
      return false;
    }
  }
  return true;
}

void SseParser::reset() {
  line_buffer_.clear();
  current_ = SseEvent{};
  has_data_ = false;
}

bool SseParser::process_line(std::string_view line) {
  if (line.empty()) {
    return dispatch();
  }
  if (line.front() == ':') {
    return true;  // comment / keep-alive
  }

  std::string_view field = line;
  std::string_view value;
  auto colon = line.find(':');
  if (colon != std::string_view::npos) {
    field = line.substr(0, colon);
    value = line.substr(colon + 1);
    if (!value.empty() && value.front() == ' ') {
      value.remove_prefix(1);
    }
  }

  if (field == "event") {
    current_.event = std::string(value);
  } else if (field == "data") {
    if (has_data_) {
      current_.data += '\n';
    }
    current_.data += value;
    has_data_ = true;
  } else if (field == "id") {
    current_.id = std::string(value);
  }
  return true;
}

bool SseParser::dispatch() {
  if (!has_data_) {
    current_ = SseEvent{};
    return true;
  }
  SseEvent event = std::move(current_);
  current_ = SseEvent{};
  has_data_ = false;
  return !handler_ || handler_(event);
}

}  // namespace stepagent::net
