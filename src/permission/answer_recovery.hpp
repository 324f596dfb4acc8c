#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "acp/protocol.hpp"
#include "core/config.hpp"
#include "core/scheduler.hpp"
#include "permission/session_ops.hpp"
#include "permission/types.hpp"

namespace conductor {

// What gets persisted and resubmitted for one answered question tool
struct RecoveryPlan {
  std::vector<QuestionAnswer> pairs;
  std::string body;
};

// ACP only tells the agent that a question tool was "answered". This makes the
// answer itself visible: persist it as a pending answer, cancel the turn, wait
// for the connection to unwind, and resubmit the answer as an internal prompt.
class AnswerRecovery {
 public:
  AnswerRecovery(Scheduler& scheduler, SessionOps& ops, const TimingConfig& timing);
  ~AnswerRecovery();

  AnswerRecovery(const AnswerRecovery&) = delete;
  AnswerRecovery& operator=(const AnswerRecovery&) = delete;

  // Persists synchronously, then runs the cancel/poll/resubmit tail in the
  // background. Returns false when there was nothing to recover.
  bool handle(const std::string& protocol_session_id, const acp::ToolCall& tool_call, const PermissionResponseData& data);

  static std::optional<RecoveryPlan> plan(const acp::ToolCall& tool_call, const PermissionResponseData& data);

 private:
  void resubmit(const SessionId& session_id, const std::string& body);
  void poll_until_idle(const SessionId& session_id, const std::string& body, Scheduler::Clock::time_point started,
                       Scheduler::Clock::time_point deadline);
  void send_after_settle(const SessionId& session_id, const std::string& body);

  Scheduler& scheduler_;
  SessionOps& ops_;
  TimingConfig timing_;

  std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

}  // namespace conductor
