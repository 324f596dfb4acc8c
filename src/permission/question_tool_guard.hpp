#pragma once

#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "core/config.hpp"
#include "core/scheduler.hpp"
#include "permission/session_ops.hpp"

namespace conductor {

using json = nlohmann::json;

// Guards against a question tool that never completes under ACP: the agent
// waits on a side channel the client cannot see. On the first in-progress
// update for such a tool call the current turn is cancelled and the agent is
// told, through an internal prompt, to ask in plain text instead.
//
// Per tool-call ID: unseen -> handled -> (retention elapsed) -> unseen.
class QuestionToolGuard {
 public:
  QuestionToolGuard(Scheduler& scheduler, SessionOps& ops, const TimingConfig& timing);
  ~QuestionToolGuard();

  QuestionToolGuard(const QuestionToolGuard&) = delete;
  QuestionToolGuard& operator=(const QuestionToolGuard&) = delete;

  // Returns true when this update scheduled the cancel/re-prompt sequence
  bool handle_tool_update(const std::string& protocol_session_id, const json& update);

  bool is_handled(const std::string& tool_call_id) const;
  size_t handled_count() const;

  // "1. question\n   Options: a, b" per entry of raw_input.questions
  static std::string format_questions(const json& raw_input);
  static std::string build_prompt(const std::string& question_texts);

 private:
  void mark_handled(const std::string& tool_call_id);
  void sweep_expired();
  void run_workaround(const SessionId& session_id, const std::string& prompt);
  void notify_agent(const SessionId& session_id, const std::string& prompt);

  Scheduler& scheduler_;
  SessionOps& ops_;
  TimingConfig timing_;

  // tool_call_id -> expiry
  std::map<std::string, Scheduler::Clock::time_point> handled_;
  std::map<std::string, Scheduler::TimerId> cleanup_timers_;

  std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

}  // namespace conductor
