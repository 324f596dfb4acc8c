#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "acp/protocol.hpp"
#include "core/config.hpp"
#include "core/scheduler.hpp"
#include "permission/answer_recovery.hpp"
#include "permission/question_tool_guard.hpp"
#include "permission/session_ops.hpp"
#include "permission/settlement.hpp"
#include "permission/types.hpp"

namespace conductor {

// Correlates agent permission requests with operator decisions that arrive
// later, out of band. Each request settles exactly once: by a decision, or by
// the timeout picking the deny option (else the first option).
class PermissionManager {
 public:
  using OutcomeCallback = std::function<void(const PermissionOutcome&)>;

  PermissionManager(Scheduler& scheduler, SessionOps& ops, const TimingConfig& timing);
  ~PermissionManager();

  PermissionManager(const PermissionManager&) = delete;
  PermissionManager& operator=(const PermissionManager&) = delete;

  // Parks the request and publishes events::PermissionRequested. Returns the
  // generated request ID.
  std::string handle_permission_request(const acp::RequestPermissionParams& params, OutcomeCallback on_outcome);

  // Returns false for unknown, late or duplicate request IDs
  bool handle_permission_response(const PermissionDecision& decision);

  // Raw session/update stream; feeds the question-tool hang guard
  void handle_session_update(const acp::SessionNotification& notification);

  size_t pending_count() const;
  bool is_pending(const std::string& request_id) const;

  QuestionToolGuard& question_guard() {
    return question_guard_;
  }

  // First option tagged "deny", else the first option, else ""
  static std::string default_option_id(const std::vector<acp::PermissionOption>& options);

 private:
  struct PendingRequest {
    acp::RequestPermissionParams params;
    std::shared_ptr<Settlement<PermissionOutcome>> settlement;
    Scheduler::TimerId timer = 0;
  };

  void on_timeout(const std::string& request_id);

  Scheduler& scheduler_;
  SessionOps& ops_;
  TimingConfig timing_;

  QuestionToolGuard question_guard_;
  AnswerRecovery answer_recovery_;

  mutable std::mutex mutex_;
  std::map<std::string, PendingRequest> pending_;

  std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

}  // namespace conductor
