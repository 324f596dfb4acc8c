#include "conductor/conductor.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

#include "acp/errors.hpp"
#include "bus/bus.hpp"
#include "session/history_replay.hpp"

namespace conductor {

namespace {

std::string preview(const std::string& text, size_t max = 100) {
  if (text.size() <= max) return text;
  return text.substr(0, max) + "...";
}

std::string text_of(const json& update) {
  if (!update.contains("content") || !update["content"].is_object()) return "";
  const auto& content = update["content"];
  if (!content.contains("text") || !content["text"].is_string()) return "";
  return content["text"].get<std::string>();
}

std::string string_or(const json& update, const char* key, const std::string& fallback) {
  if (update.contains(key) && update[key].is_string()) return update[key].get<std::string>();
  return fallback;
}

}  // namespace

Conductor::Conductor(Scheduler& scheduler, Config config, std::shared_ptr<SessionStore> store,
                     acp::ConnectionFactory connection_factory)
    : scheduler_(scheduler),
      config_(std::move(config)),
      store_(std::move(store)),
      connection_factory_(std::move(connection_factory)) {
  permissions_ = std::make_unique<PermissionManager>(scheduler_, *this, config_.timing);
}

Conductor::~Conductor() {
  alive_.reset();
  for (auto& [id, session_agent] : agents_) {
    if (session_agent.connection) {
      session_agent.connection->close();
    }
  }
  agents_.clear();
  permissions_.reset();
}

// ============================================================
// Agent start / stop
// ============================================================

std::optional<AgentDefinition> Conductor::find_agent(const std::string& agent_id, std::string& error) const {
  auto agent = config_.get_agent(agent_id);
  if (!agent) {
    error = "Unknown agent: " + agent_id;
    return std::nullopt;
  }
  if (!agent->enabled) {
    error = "Agent is disabled: " + agent_id;
    return std::nullopt;
  }
  return agent;
}

void Conductor::start_agent_process(const SessionId& session_id, const AgentDefinition& agent, const std::string& cwd,
                                    bool replay_history, StartCallback cb) {
  auto starting = starting_.find(session_id);
  if (starting != starting_.end()) {
    spdlog::debug("[Conductor] Agent for session {} is already starting, waiting", session_id);
    starting->second.push_back(std::move(cb));
    return;
  }
  starting_[session_id].push_back(std::move(cb));

  spdlog::info("[Conductor] Starting agent for session {}: {}", session_id, agent.name);

  auto generation = next_generation_++;
  std::weak_ptr<bool> alive = alive_;

  acp::ClientCallbacks callbacks;
  callbacks.on_session_update = [this, alive, session_id](const acp::SessionNotification& notification) {
    if (alive.expired()) return;
    on_session_update(session_id, notification);
  };
  callbacks.on_request_permission = [this, alive](const acp::RequestPermissionParams& params,
                                                  acp::PermissionResponder responder) {
    if (alive.expired()) return;
    permissions_->handle_permission_request(params, [responder = std::move(responder)](const PermissionOutcome& outcome) {
      responder(outcome.to_json());
    });
  };
  callbacks.on_close = [this, alive, session_id, generation]() {
    if (alive.expired()) return;
    on_agent_exit(session_id, generation);
  };

  std::shared_ptr<acp::AgentConnection> connection;
  try {
    connection = connection_factory_(agent, std::move(callbacks));
  } catch (const std::exception& e) {
    spdlog::error("[Conductor] Failed to create connection for {}: {}", agent.id, e.what());
  }
  if (!connection) {
    finish_start(session_id, Result<std::string>::failure("Failed to start agent: " + agent.id));
    return;
  }

  connection->initialize([this, alive, session_id, agent, cwd, replay_history, generation,
                          connection](Result<acp::InitializeResult> init) {
    if (alive.expired()) return;
    if (init.failed()) {
      spdlog::error("[Conductor] Initialize failed for session {}: {}", session_id, *init.error);
      release_connection(connection);
      finish_start(session_id, Result<std::string>::failure(*init.error));
      return;
    }

    connection->new_session(cwd, [this, alive, session_id, agent, replay_history, generation,
                                  connection](Result<std::string> created) {
      if (alive.expired()) return;
      if (created.failed()) {
        spdlog::error("[Conductor] session/new failed for session {}: {}", session_id, *created.error);
        release_connection(connection);
        finish_start(session_id, Result<std::string>::failure(*created.error));
        return;
      }

      const auto& agent_session_id = *created.value;
      SessionAgent session_agent;
      session_agent.agent = agent;
      session_agent.connection = connection;
      session_agent.agent_session_id = agent_session_id;
      session_agent.needs_history_replay = replay_history;
      session_agent.generation = generation;
      agents_[session_id] = std::move(session_agent);
      identity_.bind(session_id, agent_session_id);

      spdlog::info("[Conductor] Agent {} ready for session {} (agent session: {})", agent.id, session_id,
                   agent_session_id);
      Bus::instance().publish(events::AgentStarted{session_id, agent.id, agent_session_id});

      finish_start(session_id, Result<std::string>::success(agent_session_id));
    });
  });
}

void Conductor::finish_start(const SessionId& session_id, Result<std::string> result) {
  auto it = starting_.find(session_id);
  if (it == starting_.end()) return;
  auto waiters = std::move(it->second);
  starting_.erase(it);

  for (auto& waiter : waiters) {
    waiter(result);
  }
}

void Conductor::release_connection(std::shared_ptr<acp::AgentConnection> connection) {
  if (!connection) return;
  connection->close();
  // May be called from inside one of the connection's own callbacks
  scheduler_.post([connection = std::move(connection)]() mutable { connection.reset(); });
}

void Conductor::on_agent_exit(const SessionId& session_id, uint64_t generation) {
  auto it = agents_.find(session_id);
  if (it == agents_.end() || it->second.generation != generation) return;

  auto agent_id = it->second.agent.id;
  auto connection = std::move(it->second.connection);
  agents_.erase(it);
  identity_.unbind(session_id);

  spdlog::warn("[Conductor] Agent {} for session {} exited", agent_id, session_id);
  scheduler_.post([connection = std::move(connection)]() mutable { connection.reset(); });
  Bus::instance().publish(events::AgentExited{session_id, agent_id});
}

void Conductor::stop_session(const SessionId& session_id) {
  auto it = agents_.find(session_id);
  if (it == agents_.end()) return;

  spdlog::info("[Conductor] Stopping session {} agent: {}", session_id, it->second.agent.name);
  auto connection = std::move(it->second.connection);
  agents_.erase(it);
  identity_.unbind(session_id);
  release_connection(std::move(connection));
  spdlog::info("[Conductor] Session {} agent stopped", session_id);
}

void Conductor::stop_all_sessions() {
  for (const auto& id : running_session_ids()) {
    stop_session(id);
  }
}

// ============================================================
// Session lifecycle
// ============================================================

void Conductor::publish_meta(const SessionMeta& meta) {
  Bus::instance().publish(
      events::SessionMetaUpdated{meta.id, meta.agent_session_id, meta.agent_id, to_string(meta.status)});
}

Result<SessionMeta> Conductor::activate(const SessionId& session_id, const std::string& agent_session_id) {
  SessionMeta updated;
  try {
    updated = store_->update_meta(session_id,
                                  SessionMetaUpdate{.status = SessionStatus::Active, .agent_session_id = agent_session_id});
  } catch (const std::exception& e) {
    return Result<SessionMeta>::failure(e.what());
  }
  publish_meta(updated);
  return Result<SessionMeta>::success(std::move(updated));
}

void Conductor::create_session(const std::string& cwd, const std::string& agent_id, MetaCallback cb) {
  auto id = agent_id.empty() ? config_.default_agent : agent_id;

  std::string error;
  auto agent = find_agent(id, error);
  if (!agent) {
    cb(Result<SessionMeta>::failure(error));
    return;
  }

  SessionMeta meta;
  try {
    meta = store_->create(CreateSessionParams{"", agent->id, cwd});
  } catch (const std::exception& e) {
    cb(Result<SessionMeta>::failure(e.what()));
    return;
  }
  Bus::instance().publish(events::SessionCreated{meta.id, agent->id});

  std::weak_ptr<bool> alive = alive_;
  auto session_id = meta.id;
  start_agent_process(session_id, *agent, cwd, false,
                      [this, alive, session_id, cb = std::move(cb)](Result<std::string> started) {
                        if (alive.expired()) return;
                        if (started.failed()) {
                          try {
                            store_->update_meta(session_id, SessionMetaUpdate{.status = SessionStatus::Error});
                          } catch (const std::exception& e) {
                            spdlog::error("[Conductor] Failed to mark session {} as failed: {}", session_id, e.what());
                          }
                          cb(Result<SessionMeta>::failure(*started.error));
                          return;
                        }
                        spdlog::info("[Conductor] Created session: {} (agent: {})", session_id, *started.value);
                        cb(activate(session_id, *started.value));
                      });
}

SessionMeta Conductor::load_session(const SessionId& session_id) {
  auto data = store_->get(session_id);
  if (!data) {
    throw std::runtime_error("Session not found: " + session_id);
  }
  return data->session;
}

void Conductor::start_for_existing(const SessionId& session_id, MetaCallback cb) {
  auto data = store_->get(session_id);
  if (!data) {
    cb(Result<SessionMeta>::failure("Session not found: " + session_id));
    return;
  }

  if (agents_.contains(session_id)) {
    cb(Result<SessionMeta>::success(data->session));
    return;
  }

  std::string error;
  auto agent = find_agent(data->session.agent_id, error);
  if (!agent) {
    cb(Result<SessionMeta>::failure(error));
    return;
  }

  std::weak_ptr<bool> alive = alive_;
  start_agent_process(session_id, *agent, data->session.working_directory, true,
                      [this, alive, session_id, cb = std::move(cb)](Result<std::string> started) {
                        if (alive.expired()) return;
                        if (started.failed()) {
                          cb(Result<SessionMeta>::failure(*started.error));
                          return;
                        }
                        spdlog::info("[Conductor] Started agent for session: {} (agent session: {})", session_id,
                                     *started.value);
                        cb(activate(session_id, *started.value));
                      });
}

void Conductor::resume_session(const SessionId& session_id, MetaCallback cb) {
  spdlog::info("[Conductor] Resuming session {}", session_id);
  start_for_existing(session_id, std::move(cb));
}

void Conductor::start_agent(const SessionId& session_id, MetaCallback cb) {
  start_for_existing(session_id, std::move(cb));
}

void Conductor::ensure_agent(const SessionId& session_id, EnsureCallback cb) {
  if (agents_.contains(session_id)) {
    cb(Result<void>::success());
    return;
  }

  spdlog::info("[Conductor] Lazy-starting agent for session {}", session_id);
  start_for_existing(session_id, [cb = std::move(cb)](Result<SessionMeta> started) {
    if (started.failed()) {
      cb(Result<void>::failure(*started.error));
      return;
    }
    cb(Result<void>::success());
  });
}

void Conductor::switch_agent(const SessionId& session_id, const std::string& agent_id, MetaCallback cb) {
  auto data = store_->get(session_id);
  if (!data) {
    cb(Result<SessionMeta>::failure("Session not found: " + session_id));
    return;
  }

  std::string error;
  if (!find_agent(agent_id, error)) {
    cb(Result<SessionMeta>::failure(error));
    return;
  }

  spdlog::info("[Conductor] Switching session {} from {} to {}", session_id, data->session.agent_id, agent_id);
  stop_session(session_id);

  try {
    store_->update_meta(session_id, SessionMetaUpdate{.agent_id = agent_id});
  } catch (const std::exception& e) {
    cb(Result<SessionMeta>::failure(e.what()));
    return;
  }
  start_for_existing(session_id, std::move(cb));
}

SessionMeta Conductor::update_session_meta(const SessionId& session_id, const SessionMetaUpdate& update) {
  auto meta = store_->update_meta(session_id, update);
  publish_meta(meta);
  return meta;
}

void Conductor::delete_session(const SessionId& session_id) {
  stop_session(session_id);
  pending_answers_.clear(session_id);
  store_->remove(session_id);
  spdlog::info("[Conductor] Deleted session {}", session_id);
  Bus::instance().publish(events::SessionDeleted{session_id});
}

std::vector<SessionMeta> Conductor::list_sessions(const ListSessionsOptions& options) const {
  return store_->list(options);
}

std::optional<SessionData> Conductor::get_session_data(const SessionId& session_id) {
  return store_->get(session_id);
}

std::vector<SessionId> Conductor::running_session_ids() const {
  std::vector<SessionId> ids;
  for (const auto& [id, session_agent] : agents_) {
    ids.push_back(id);
  }
  return ids;
}

std::vector<SessionId> Conductor::processing_session_ids() const {
  std::lock_guard lock(processing_mutex_);
  std::vector<SessionId> ids;
  for (const auto& [id, count] : processing_) {
    ids.push_back(id);
  }
  return ids;
}

bool Conductor::is_session_running(const SessionId& session_id) const {
  return agents_.contains(session_id);
}

// ============================================================
// SessionOps
// ============================================================

std::optional<SessionId> Conductor::resolve_session_id(const std::string& protocol_session_id) const {
  if (auto durable = identity_.durable_for(protocol_session_id)) {
    return durable;
  }
  if (auto meta = store_->find_by_agent_session_id(protocol_session_id)) {
    return meta->id;
  }
  return std::nullopt;
}

void Conductor::cancel_request(const SessionId& session_id, DoneCallback done) {
  auto it = agents_.find(session_id);
  if (it != agents_.end()) {
    spdlog::info("[Conductor] Cancelling request for session {}", it->second.agent_session_id);
    it->second.connection->cancel(it->second.agent_session_id);
  }
  scheduler_.post([done = std::move(done)]() { done(Result<void>::success()); });
}

bool Conductor::is_session_processing(const SessionId& session_id) const {
  std::lock_guard lock(processing_mutex_);
  return processing_.contains(session_id);
}

void Conductor::add_pending_answer(const SessionId& session_id, const std::string& question,
                                   const std::string& answer) {
  pending_answers_.add(session_id, question, answer);
}

void Conductor::store_question_response(const SessionId& session_id, const std::string& tool_call_id,
                                        const PermissionResponseData& response) {
  json update = {
      {"sessionUpdate", "askuserquestion_response"},
      {"toolCallId", tool_call_id},
      {"response", response.to_json()},
  };

  spdlog::info("[Conductor] Storing question response for toolCallId={}", tool_call_id);
  try {
    store_->append_update(session_id, json{{"sessionId", session_id}, {"update", update}});
  } catch (const std::exception& e) {
    spdlog::error("[Conductor] Failed to store question response: {}", e.what());
  }
  Bus::instance().publish(events::SessionUpdated{session_id, session_id, update});
}

bool Conductor::handle_permission_response(const PermissionDecision& decision) {
  return permissions_->handle_permission_response(decision);
}

// ============================================================
// Prompt delivery
// ============================================================

void Conductor::mark_processing(const SessionId& session_id) {
  bool changed = false;
  {
    std::lock_guard lock(processing_mutex_);
    changed = processing_[session_id]++ == 0;
  }
  if (changed) {
    Bus::instance().publish(events::ProcessingChanged{session_id, true});
  }
}

void Conductor::unmark_processing(const SessionId& session_id) {
  bool changed = false;
  {
    std::lock_guard lock(processing_mutex_);
    auto it = processing_.find(session_id);
    if (it == processing_.end()) return;
    if (--it->second <= 0) {
      processing_.erase(it);
      changed = true;
    }
  }
  if (changed) {
    Bus::instance().publish(events::ProcessingChanged{session_id, false});
  }
}

void Conductor::send_prompt(const SessionId& session_id, const acp::MessageContent& content, PromptOptions options,
                            PromptCallback done) {
  // Processing is visible before anything asynchronous happens
  mark_processing(session_id);

  std::weak_ptr<bool> alive = alive_;
  ensure_agent(session_id, [this, alive, session_id, content, options, done = std::move(done)](Result<void> ready) {
    if (alive.expired()) return;
    if (ready.failed()) {
      spdlog::error("[Conductor] Cannot send prompt to session {}: {}", session_id, *ready.error);
      unmark_processing(session_id);
      done(Result<std::string>::failure(*ready.error));
      return;
    }
    deliver_prompt(session_id, content, options, done);
  });
}

void Conductor::deliver_prompt(const SessionId& session_id, const acp::MessageContent& content, PromptOptions options,
                               PromptCallback done) {
  auto it = agents_.find(session_id);
  if (it == agents_.end()) {
    unmark_processing(session_id);
    done(Result<std::string>::failure("Agent is not running for session " + session_id));
    return;
  }
  auto& session_agent = it->second;
  auto agent_session_id = session_agent.agent_session_id;
  auto connection = session_agent.connection;

  acp::MessageContent prompt = content;

  // First prompt after a restart carries the conversation so far
  if (session_agent.needs_history_replay) {
    session_agent.needs_history_replay = false;
    try {
      auto data = store_->get(session_id);
      if (data && has_replayable_history(data->updates)) {
        if (auto history = format_history_for_replay(data->updates)) {
          spdlog::info("[Conductor] Prepending conversation history ({} updates)", data->updates.size());
          prompt.insert(prompt.begin(), acp::ContentBlock::text_block(*history));
        }
      }
    } catch (const std::exception& e) {
      spdlog::error("[Conductor] Failed to load history for replay: {}", e.what());
    }
  }

  auto answers = pending_answers_.take(session_id);
  if (!answers.empty()) {
    std::string context;
    for (size_t i = 0; i < answers.size(); ++i) {
      if (i > 0) context += "\n";
      context += "[User's answer to \"" + answers[i].question + "\"]: " + answers[i].answer;
    }
    spdlog::info("[Conductor] Injecting {} pending answer(s) for session {}", answers.size(), session_id);
    prompt.insert(prompt.begin(), acp::ContentBlock::text_block("---\n" + context + "\n---\n"));
  }

  auto text = acp::first_text(content);
  spdlog::info("[Conductor] Sending prompt to session {}", agent_session_id);
  if (!text.empty()) {
    spdlog::debug("[Conductor]   Text: {}", preview(text));
  }

  json user_update = {
      {"sessionId", agent_session_id},
      {"update",
       {
           {"sessionUpdate", "user_message"},
           {"content", acp::to_json(content)},
           {"_internal", options.internal},
       }},
  };
  try {
    store_->append_update(session_id, user_update);
  } catch (const std::exception& e) {
    spdlog::error("[Conductor] Failed to store user message: {}", e.what());
  }

  std::weak_ptr<bool> alive = alive_;
  connection->prompt(agent_session_id, prompt,
                     [this, alive, session_id, agent_session_id, done = std::move(done)](Result<std::string> result) {
                       if (alive.expired()) return;
                       unmark_processing(session_id);

                       if (result.failed()) {
                         spdlog::error("[Conductor] ACP error for session {}: {}", session_id, *result.error);
                         publish_error_chunk(session_id, agent_session_id, acp::friendly_error_message(*result.error));
                         done(Result<std::string>::success("error"));
                         return;
                       }

                       spdlog::info("[Conductor] Prompt completed with stopReason: {}", *result.value);
                       done(std::move(result));
                     });
}

void Conductor::publish_error_chunk(const SessionId& session_id, const std::string& agent_session_id,
                                    const std::string& message) {
  json update = {
      {"sessionUpdate", "agent_message_chunk"},
      {"content", {{"type", "text"}, {"text", "\n\n**Error:** " + message + "\n"}}},
  };
  Bus::instance().publish(events::SessionUpdated{session_id, agent_session_id, update});
}

// ============================================================
// Session updates
// ============================================================

void Conductor::on_session_update(const SessionId& session_id, const acp::SessionNotification& notification) {
  const auto& update = notification.update;
  auto type = notification.update_type();

  if (type == "agent_message_chunk" || type == "agent_thought_chunk") {
    spdlog::debug("[ACP] {}: \"{}\"", type, preview(text_of(update), 50));
  } else if (type == "tool_call") {
    spdlog::info("[ACP] {}: {} [{}]", type, string_or(update, "title", ""), string_or(update, "status", ""));
  } else if (type == "tool_call_update") {
    spdlog::info("[ACP] {}: {} [{}]", type, string_or(update, "title", string_or(update, "toolCallId", "")),
                 string_or(update, "status", ""));
  } else if (!type.empty()) {
    spdlog::debug("[ACP] {}", type);
  } else {
    spdlog::debug("[ACP] raw update: {}", notification.to_json().dump());
  }

  try {
    store_->append_update(session_id, notification.to_json());
  } catch (const std::exception& e) {
    spdlog::error("[Conductor] Failed to store session update: {}", e.what());
  }

  Bus::instance().publish(events::SessionUpdated{session_id, notification.session_id, update});
  permissions_->handle_session_update(notification);
}

}  // namespace conductor
