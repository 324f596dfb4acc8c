#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "acp/connection.hpp"
#include "acp/protocol.hpp"
#include "core/config.hpp"
#include "core/scheduler.hpp"
#include "core/types.hpp"
#include "permission/pending_answers.hpp"
#include "permission/permission_manager.hpp"
#include "permission/session_map.hpp"
#include "permission/session_ops.hpp"
#include "session/session_store.hpp"

namespace conductor {

// Central orchestrator: one agent connection per running session, prompt
// delivery, session lifecycle and the permission pipeline.
//
// Every method must be called on the scheduler thread. Asynchronous
// operations report through Result callbacks, also on that thread.
class Conductor : public SessionOps {
 public:
  using MetaCallback = std::function<void(Result<SessionMeta>)>;

  Conductor(Scheduler& scheduler, Config config, std::shared_ptr<SessionStore> store,
            acp::ConnectionFactory connection_factory);
  ~Conductor() override;

  Conductor(const Conductor&) = delete;
  Conductor& operator=(const Conductor&) = delete;

  // ------------------------------------------------------------
  // Session lifecycle
  // ------------------------------------------------------------

  // New session record plus a freshly started agent (no history replay).
  // An empty agent_id selects the configured default agent.
  void create_session(const std::string& cwd, const std::string& agent_id, MetaCallback cb);

  // Metadata only; the agent is started lazily by the first prompt.
  // Throws std::runtime_error for unknown sessions.
  SessionMeta load_session(const SessionId& session_id);

  // Start an agent for an existing session; the next prompt replays history
  void resume_session(const SessionId& session_id, MetaCallback cb);
  void start_agent(const SessionId& session_id, MetaCallback cb);

  // Stop the current agent, switch the session's agent and restart with replay
  void switch_agent(const SessionId& session_id, const std::string& agent_id, MetaCallback cb);

  // Title or status changes; publishes SessionMetaUpdated.
  // Throws std::runtime_error for unknown sessions.
  SessionMeta update_session_meta(const SessionId& session_id, const SessionMetaUpdate& update);

  void stop_session(const SessionId& session_id);
  void stop_all_sessions();
  void delete_session(const SessionId& session_id);

  std::vector<SessionMeta> list_sessions(const ListSessionsOptions& options = {}) const;
  std::optional<SessionData> get_session_data(const SessionId& session_id);

  std::vector<SessionId> running_session_ids() const;
  std::vector<SessionId> processing_session_ids() const;
  bool is_session_running(const SessionId& session_id) const;

  // ------------------------------------------------------------
  // SessionOps
  // ------------------------------------------------------------

  std::optional<SessionId> resolve_session_id(const std::string& protocol_session_id) const override;
  void cancel_request(const SessionId& session_id, DoneCallback done) override;
  void send_prompt(const SessionId& session_id, const acp::MessageContent& content, PromptOptions options,
                   PromptCallback done) override;
  bool is_session_processing(const SessionId& session_id) const override;
  void add_pending_answer(const SessionId& session_id, const std::string& question, const std::string& answer) override;
  void store_question_response(const SessionId& session_id, const std::string& tool_call_id,
                               const PermissionResponseData& response) override;

  // Operator decisions from the UI
  bool handle_permission_response(const PermissionDecision& decision);

  std::vector<PendingAnswer> pending_answers(const SessionId& session_id) const {
    return pending_answers_.get(session_id);
  }

  PermissionManager& permission_manager() {
    return *permissions_;
  }

  const Config& config() const {
    return config_;
  }

 private:
  struct SessionAgent {
    AgentDefinition agent;
    std::shared_ptr<acp::AgentConnection> connection;
    std::string agent_session_id;
    bool needs_history_replay = false;
    uint64_t generation = 0;
  };

  using StartCallback = std::function<void(Result<std::string>)>;  // protocol session ID
  using EnsureCallback = std::function<void(Result<void>)>;

  // Spawn + initialize + session/new; joins an in-flight start for the same session
  void start_agent_process(const SessionId& session_id, const AgentDefinition& agent, const std::string& cwd,
                           bool replay_history, StartCallback cb);
  void finish_start(const SessionId& session_id, Result<std::string> result);

  // Start the stored session's agent with replay and mark the session active
  void start_for_existing(const SessionId& session_id, MetaCallback cb);
  void ensure_agent(const SessionId& session_id, EnsureCallback cb);

  std::optional<AgentDefinition> find_agent(const std::string& agent_id, std::string& error) const;

  void deliver_prompt(const SessionId& session_id, const acp::MessageContent& content, PromptOptions options,
                      PromptCallback done);
  void publish_error_chunk(const SessionId& session_id, const std::string& agent_session_id,
                           const std::string& message);

  void mark_processing(const SessionId& session_id);
  void unmark_processing(const SessionId& session_id);

  void on_session_update(const SessionId& session_id, const acp::SessionNotification& notification);
  void on_agent_exit(const SessionId& session_id, uint64_t generation);

  // Closes the connection and releases it outside the current call stack
  void release_connection(std::shared_ptr<acp::AgentConnection> connection);

  // Records the new protocol session ID, marks the session active and publishes it
  Result<SessionMeta> activate(const SessionId& session_id, const std::string& agent_session_id);
  void publish_meta(const SessionMeta& meta);

  Scheduler& scheduler_;
  Config config_;
  std::shared_ptr<SessionStore> store_;
  acp::ConnectionFactory connection_factory_;

  std::map<SessionId, SessionAgent> agents_;
  std::map<SessionId, std::vector<StartCallback>> starting_;
  uint64_t next_generation_ = 1;

  mutable std::mutex processing_mutex_;
  std::map<SessionId, int> processing_;  // in-flight prompt count

  SessionIdentityMap identity_;
  PendingAnswerStore pending_answers_;
  std::unique_ptr<PermissionManager> permissions_;

  std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

}  // namespace conductor
