#include "session/session_manager.hpp"

#include <spdlog/spdlog.h>

#include <iomanip>
#include <random>
#include <sstream>

namespace stepagent {

std::string to_string(StopReason reason) {
  switch (reason) {
    case StopReason::EndTurn:
      return "end_turn";
    case StopReason::MaxTurnRequests:
      return "max_turn_requests";
    case StopReason::Cancelled:
      return "cancelled";
    case StopReason::Refusal:
      return "refusal";
  }
  return "refusal";
}

SessionManager::SessionManager(AgentFactory factory) : factory_(std::move(factory)) {}

std::string SessionManager::next_id() {
  static thread_local std::mt19937 rng{std::random_device{}()};
  std::uniform_int_distribution<uint32_t> dist;

  std::ostringstream oss;
  oss << "sess-" << counter_++ << "-" << std::hex << std::setw(8) << std::setfill('0') << dist(rng);
  return oss.str();
}

std::string SessionManager::new_session(const std::string &cwd) {
  auto agent = factory_ ? factory_(cwd) : nullptr;
  if (!agent) {
    spdlog::error("[Session] Agent factory returned no agent for cwd '{}'", cwd);
    return "";
  }

  auto session = std::make_shared<Session>();
  session->cwd = cwd;
  session->agent = std::move(agent);

  std::lock_guard<std::mutex> lock(mutex_);
  session->id = next_id();
  sessions_[session->id] = session;
  spdlog::info("[Session] Created {}", session->id);
  return session->id;
}

std::shared_ptr<SessionManager::Session> SessionManager::find(const std::string &session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  return it == sessions_.end() ? nullptr : it->second;
}

PromptResult SessionManager::prompt(const std::string &session_id, const std::string &text) {
  auto session = find(session_id);
  if (!session) {
    spdlog::warn("[Session] Prompt for unknown session '{}'", session_id);
    return {StopReason::Refusal, "Unknown session: " + session_id};
  }

  std::lock_guard<std::mutex> turn(session->turn_mutex);
  auto &agent = *session->agent;

  agent.clear_cancel();
  agent.add_user_message(text);
  auto result = agent.run();

  switch (result.status) {
    case AgentStatus::Completed:
      return {StopReason::EndTurn, result.content};
    case AgentStatus::StepLimitExceeded:
      return {StopReason::MaxTurnRequests, result.content};
    case AgentStatus::Cancelled:
      return {StopReason::Cancelled, result.content};
    case AgentStatus::Failed:
    case AgentStatus::Running:
      break;
  }
  return {StopReason::Refusal, result.error.empty() ? result.content : result.error};
}

bool SessionManager::cancel(const std::string &session_id) {
  auto session = find(session_id);
  if (!session) {
    return false;
  }
  session->agent->cancel();
  spdlog::info("[Session] Cancel requested for {}", session_id);
  return true;
}

bool SessionManager::is_cancelled(const std::string &session_id) const {
  auto session = find(session_id);
  return session && session->agent->is_cancelled();
}

bool SessionManager::close(const std::string &session_id) {
  std::shared_ptr<Session> session;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
      return false;
    }
    session = std::move(it->second);
    sessions_.erase(it);
  }
  session->agent->cancel();
  spdlog::info("[Session] Closed {}", session_id);
  return true;
}

bool SessionManager::has_session(const std::string &session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.count(session_id) > 0;
}

size_t SessionManager::session_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

}  // namespace stepagent
