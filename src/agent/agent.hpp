#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/message.hpp"
#include "core/types.hpp"
#include "llm/provider.hpp"
#include "tool/tool.hpp"

namespace stepagent {

// Agent run status
enum class AgentStatus {
  Running,            // More steps to go
  Completed,          // Model answered without tool calls
  Cancelled,          // cancel() observed at a step boundary
  StepLimitExceeded,  // max_steps reached
  Failed              // Model request failed for good
};

std::string to_string(AgentStatus status);

struct AgentResult {
  AgentStatus status = AgentStatus::Running;
  std::string content;  // Final (or last partial) assistant content
  int steps = 0;
  TokenUsage usage;
  std::string error;  // Set for Failed
};

struct AgentOptions {
  std::string system_prompt;
  int max_steps = 50;
  std::string workspace_dir;  // Appended to the system prompt when set
};

// Drives one conversation: model call, tool dispatch, repeat.
class Agent {
 public:
  // Called after each step with the step number (1-based) and the model output
  using StepObserver = std::function<void(int step, const LlmResponse &response)>;

  Agent(std::shared_ptr<llm::LlmClient> llm, AgentOptions options, std::vector<ToolPtr> tools);

  void add_user_message(const std::string &content);

  // One model call plus dispatch of its tool calls. The step that reaches
  // max_steps with tool calls still pending ends in StepLimitExceeded; later
  // calls return it without contacting the model.
  AgentStatus step();

  // Steps until a terminal status. Cancellation is not cleared here.
  AgentResult run();

  // Polled at the start of each step; in-flight work finishes
  void cancel() {
    cancelled_ = true;
  }

  bool is_cancelled() const {
    return cancelled_.load();
  }

  void clear_cancel() {
    cancelled_ = false;
  }

  // Drops the conversation back to the system prompt
  void reset();

  void on_step(StepObserver observer) {
    observer_ = std::move(observer);
  }

  const std::vector<Message> &history() const {
    return history_;
  }

  const std::string &system_prompt() const {
    return system_prompt_;
  }

  const std::vector<ToolPtr> &tools() const {
    return tools_;
  }

  int step_count() const {
    return step_count_;
  }

  int max_steps() const {
    return max_steps_;
  }

  AgentStatus status() const {
    return status_;
  }

  const TokenUsage &total_usage() const {
    return total_usage_;
  }

 private:
  // Launches every call, then collects results in call order
  std::vector<Message> dispatch_tool_calls(const std::vector<ToolCall> &calls);

  std::string last_assistant_content() const;

  std::shared_ptr<llm::LlmClient> llm_;
  std::vector<ToolPtr> tools_;
  std::string system_prompt_;
  int max_steps_;

  std::vector<Message> history_;
  int step_count_ = 0;
  AgentStatus status_ = AgentStatus::Running;
  std::string error_;
  TokenUsage total_usage_;
  std::atomic<bool> cancelled_{false};
  StepObserver observer_;
};

}  // namespace stepagent
