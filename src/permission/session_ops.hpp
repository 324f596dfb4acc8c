#pragma once

#include <functional>
#include <optional>
#include <string>

#include "acp/protocol.hpp"
#include "core/types.hpp"
#include "permission/types.hpp"

namespace conductor {

struct PromptOptions {
  // Delivered to the agent but hidden from the user-facing transcript
  bool internal = false;
};

// Session-scoped operations the permission correlator and the workarounds
// need from the orchestrator. All calls happen on the scheduler thread.
class SessionOps {
 public:
  virtual ~SessionOps() = default;

  using DoneCallback = std::function<void(Result<void>)>;
  using PromptCallback = std::function<void(Result<std::string>)>;  // stop reason

  virtual std::optional<SessionId> resolve_session_id(const std::string& protocol_session_id) const = 0;

  virtual void cancel_request(const SessionId& session_id, DoneCallback done) = 0;

  virtual void send_prompt(const SessionId& session_id, const acp::MessageContent& content, PromptOptions options,
                           PromptCallback done) = 0;

  virtual bool is_session_processing(const SessionId& session_id) const = 0;

  virtual void add_pending_answer(const SessionId& session_id, const std::string& question, const std::string& answer) = 0;

  // Records the completed question so a restarted UI can restore it
  virtual void store_question_response(const SessionId& session_id, const std::string& tool_call_id,
                                       const PermissionResponseData& response) = 0;
};

}  // namespace conductor
