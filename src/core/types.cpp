#include "core/types.hpp"

namespace stepagent {

std::string to_string(FinishReason reason) {
  switch (reason) {
    case FinishReason::Stop:
      return "stop";
    case FinishReason::ToolCalls:
      return "tool_calls";
    case FinishReason::Length:
      return "length";
    case FinishReason::Refusal:
      return "refusal";
    case FinishReason::Error:
      return "error";
  }
  return "unknown";
}

FinishReason finish_reason_from_string(const std::string &str) {
  if (str == "stop") return FinishReason::Stop;
  if (str == "tool_calls" || str == "tool" || str == "tool_use") return FinishReason::ToolCalls;
  if (str == "length") return FinishReason::Length;
  if (str == "refusal") return FinishReason::Refusal;
  return FinishReason::Error;
}

}  // namespace stepagent
