#include "agent/agent.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <future>

namespace stepagent {

namespace {

constexpr size_t kLogPreview = 200;

std::string preview(const std::string &text) {
  if (text.size() <= kLogPreview) return text;
  return text.substr(0, kLogPreview) + "...";
}

std::string with_workspace(std::string prompt, const std::string &workspace_dir) {
  if (workspace_dir.empty() || prompt.find("Current Workspace") != std::string::npos) {
    return prompt;
  }

  std::error_code ec;
  auto absolute = std::filesystem::absolute(workspace_dir, ec);
  std::string path = ec ? workspace_dir : absolute.lexically_normal().string();

  prompt += "\n\n## Current Workspace\n";
  prompt += "You are currently working in: `" + path + "`\n";
  prompt += "All relative paths will be resolved relative to this directory.";
  return prompt;
}

}  // namespace

std::string to_string(AgentStatus status) {
  switch (status) {
    case AgentStatus::Running:
      return "running";
    case AgentStatus::Completed:
      return "completed";
    case AgentStatus::Cancelled:
      return "cancelled";
    case AgentStatus::StepLimitExceeded:
      return "step_limit_exceeded";
    case AgentStatus::Failed:
      return "failed";
  }
  return "unknown";
}

Agent::Agent(std::shared_ptr<llm::LlmClient> llm, AgentOptions options, std::vector<ToolPtr> tools)
    : llm_(std::move(llm)),
      tools_(std::move(tools)),
      system_prompt_(with_workspace(std::move(options.system_prompt), options.workspace_dir)),
      max_steps_(options.max_steps) {
  history_.push_back(Message::system(system_prompt_));
}

void Agent::add_user_message(const std::string &content) {
  history_.push_back(Message::user(content));
}

void Agent::reset() {
  history_.clear();
  history_.push_back(Message::system(system_prompt_));
  step_count_ = 0;
  status_ = AgentStatus::Running;
  error_.clear();
  total_usage_ = TokenUsage{};
  cancelled_ = false;
}

AgentStatus Agent::step() {
  if (cancelled_) {
    spdlog::info("[Agent] Cancelled before step {}", step_count_ + 1);
    status_ = AgentStatus::Cancelled;
    return status_;
  }
  if (step_count_ >= max_steps_) {
    spdlog::warn("[Agent] Task couldn't be completed after {} steps", max_steps_);
    status_ = AgentStatus::StepLimitExceeded;
    return status_;
  }

  int step_number = step_count_ + 1;
  spdlog::info("[Agent] Step {}/{}", step_number, max_steps_);

  LlmResponse response;
  try {
    response = llm_->generate(history_, tools_).get();
  } catch (const std::exception &e) {
    spdlog::error("[Agent] Model request failed: {}", e.what());
    error_ = e.what();
    status_ = AgentStatus::Failed;
    return status_;
  }

  if (response.usage) {
    total_usage_ += *response.usage;
  }
  history_.push_back(response.to_message());
  step_count_ = step_number;

  if (response.thinking && !response.thinking->empty()) {
    spdlog::debug("[Agent] Thinking: {}", preview(*response.thinking));
  }
  if (!response.content.empty()) {
    spdlog::debug("[Agent] Assistant: {}", preview(response.content));
  }

  if (!response.has_tool_calls()) {
    status_ = AgentStatus::Completed;
  } else {
    auto results = dispatch_tool_calls(response.tool_calls);
    for (auto &msg : results) {
      history_.push_back(std::move(msg));
    }
    if (step_count_ < max_steps_) {
      status_ = AgentStatus::Running;
    } else if (cancelled_) {
      status_ = AgentStatus::Cancelled;
    } else {
      spdlog::warn("[Agent] Task couldn't be completed after {} steps", max_steps_);
      status_ = AgentStatus::StepLimitExceeded;
    }
  }

  if (observer_) {
    observer_(step_number, response);
  }
  return status_;
}

std::vector<Message> Agent::dispatch_tool_calls(const std::vector<ToolCall> &calls) {
  std::vector<std::future<ToolResult>> pending;
  pending.reserve(calls.size());

  for (const auto &call : calls) {
    spdlog::info("[Agent] Tool call: {}({})", call.name, preview(call.arguments.dump()));

    auto tool = find_tool(tools_, call.name);
    if (!tool) {
      std::promise<ToolResult> unknown;
      unknown.set_value(ToolResult::failure("Unknown tool: " + call.name));
      pending.push_back(unknown.get_future());
      continue;
    }

    try {
      pending.push_back(tool->execute(call.arguments));
    } catch (const std::exception &e) {
      std::promise<ToolResult> failed;
      failed.set_value(ToolResult::failure(std::string("Tool execution failed: ") + e.what()));
      pending.push_back(failed.get_future());
    } catch (...) {
      std::promise<ToolResult> failed;
      failed.set_value(ToolResult::failure("Tool execution failed: unknown error"));
      pending.push_back(failed.get_future());
    }
  }

  std::vector<Message> messages;
  messages.reserve(calls.size());
  for (size_t i = 0; i < calls.size(); ++i) {
    ToolResult result;
    try {
      result = pending[i].get();
    } catch (const std::exception &e) {
      result = ToolResult::failure(std::string("Tool execution failed: ") + e.what());
    } catch (...) {
      result = ToolResult::failure("Tool execution failed: unknown error");
    }

    if (result.success) {
      spdlog::info("[Agent] Tool {} succeeded: {}", calls[i].name, preview(result.content));
    } else {
      spdlog::warn("[Agent] Tool {} failed: {}", calls[i].name, preview(result.error));
    }
    messages.push_back(Message::tool(calls[i].id, calls[i].name, result.to_message_content()));
  }
  return messages;
}

std::string Agent::last_assistant_content() const {
  for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
    if (it->role == Role::Assistant) {
      return it->content;
    }
  }
  return "";
}

AgentResult Agent::run() {
  step_count_ = 0;
  status_ = AgentStatus::Running;
  error_.clear();

  while (status_ == AgentStatus::Running) {
    step();
  }

  AgentResult result;
  result.status = status_;
  result.steps = step_count_;
  result.usage = total_usage_;
  result.error = error_;
  result.content = status_ == AgentStatus::Failed ? error_ : last_assistant_content();

  spdlog::info("[Agent] Finished: {} after {} steps ({} tokens)", to_string(status_), step_count_,
               total_usage_.total());
  return result;
}

}  // namespace stepagent
