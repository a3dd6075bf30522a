#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "agent/agent.hpp"

namespace stepagent {

// Why a prompt turn ended
enum class StopReason { EndTurn, MaxTurnRequests, Cancelled, Refusal };

// "end_turn", "max_turn_requests", "cancelled", "refusal"
std::string to_string(StopReason reason);

struct PromptResult {
  StopReason stop_reason = StopReason::EndTurn;
  std::string content;
};

// Addressable conversations keyed by session id
class SessionManager {
 public:
  // Builds the Agent for a new session rooted at `cwd`
  using AgentFactory = std::function<std::unique_ptr<Agent>(const std::string &cwd)>;

  explicit SessionManager(AgentFactory factory);

  // Returns the new session id ("sess-<n>-<hex>"), or "" if the factory gave no agent
  std::string new_session(const std::string &cwd = "");

  // Runs one user turn. Unknown ids are refused, never thrown.
  PromptResult prompt(const std::string &session_id, const std::string &text);

  // Requests cancellation of the session's running turn. False for unknown ids.
  bool cancel(const std::string &session_id);

  bool is_cancelled(const std::string &session_id) const;

  bool close(const std::string &session_id);

  bool has_session(const std::string &session_id) const;
  size_t session_count() const;

 private:
  struct Session {
    std::string id;
    std::string cwd;
    std::unique_ptr<Agent> agent;
    std::mutex turn_mutex;  // One prompt at a time per session
  };

  std::shared_ptr<Session> find(const std::string &session_id) const;
  std::string next_id();

  AgentFactory factory_;
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<Session>> sessions_;
  uint64_t counter_ = 0;
};

}  // namespace stepagent
