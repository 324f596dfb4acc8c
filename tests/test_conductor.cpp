#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "bus/bus.hpp"
#include "conductor/conductor.hpp"
#include "helpers/fake_connection.hpp"
#include "helpers/manual_scheduler.hpp"

using namespace conductor;
using conductor::testing::FakeAgentHost;
using conductor::testing::FakeConnection;
using conductor::testing::ManualScheduler;
using namespace std::chrono_literals;

namespace {

json text_chunk(const std::string& text) {
  return json{{"sessionUpdate", "agent_message_chunk"}, {"content", {{"type", "text"}, {"text", text}}}};
}

// Inner update of the n-th stored update of a given type
std::optional<json> find_stored(const SessionData& data, const std::string& type, size_t nth = 0) {
  for (const auto& u : data.updates) {
    if (!u.update.contains("update")) continue;
    const auto& inner = u.update["update"];
    if (inner.value("sessionUpdate", "") == type && nth-- == 0) return inner;
  }
  return std::nullopt;
}

}  // namespace

class ConductorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    store_ = std::make_shared<MemorySessionStore>();
    conductor_ = std::make_unique<Conductor>(scheduler_, config_, store_, host_.factory());

    auto& bus = Bus::instance();
    subscriptions_.push_back(bus.subscribe<events::SessionUpdated>([this](const events::SessionUpdated& e) {
      session_updates_.push_back(e);
    }));
    subscriptions_.push_back(bus.subscribe<events::ProcessingChanged>([this](const events::ProcessingChanged& e) {
      processing_events_.push_back(e);
    }));
    subscriptions_.push_back(bus.subscribe<events::PermissionRequested>([this](const events::PermissionRequested& e) {
      permission_requests_.push_back(e);
    }));
    subscriptions_.push_back(bus.subscribe<events::AgentExited>([this](const events::AgentExited& e) {
      exits_.push_back(e);
    }));
    subscriptions_.push_back(bus.subscribe<events::SessionDeleted>([this](const events::SessionDeleted& e) {
      deleted_.push_back(e.session_id);
    }));
  }

  void TearDown() override {
    for (auto id : subscriptions_) {
      Bus::instance().unsubscribe(id);
    }
    conductor_.reset();
  }

  Result<SessionMeta> create(const std::string& agent_id = "") {
    std::optional<Result<SessionMeta>> result;
    conductor_->create_session("/work", agent_id, [&](Result<SessionMeta> r) { result = std::move(r); });
    scheduler_.run();
    EXPECT_TRUE(result.has_value());
    return result.value_or(Result<SessionMeta>::failure("no callback"));
  }

  SessionId create_ok(const std::string& agent_id = "") {
    auto result = create(agent_id);
    EXPECT_TRUE(result.ok()) << result.error.value_or("");
    return result.value ? result.value->id : SessionId();
  }

  // Sends a prompt and returns the slot its completion lands in
  std::shared_ptr<std::optional<Result<std::string>>> prompt(const SessionId& id, const std::string& text,
                                                             bool internal = false) {
    auto slot = std::make_shared<std::optional<Result<std::string>>>();
    conductor_->send_prompt(id, acp::text_content(text), PromptOptions{.internal = internal},
                            [slot](Result<std::string> r) { *slot = std::move(r); });
    scheduler_.run();
    return slot;
  }

  acp::RequestPermissionParams question_params(const std::string& protocol_session_id) {
    acp::RequestPermissionParams params;
    params.session_id = protocol_session_id;
    params.tool_call.tool_call_id = "tc-ask";
    params.tool_call.title = "AskUserQuestion";
    params.tool_call.raw_input = {{"questions", {{{"question", "Proceed?"}}}}};
    params.options = {acp::PermissionOption{"allow", "Allow", "allow_once"},
                      acp::PermissionOption{"deny", "Deny", "deny"}};
    return params;
  }

  ManualScheduler scheduler_;
  Config config_;
  std::shared_ptr<MemorySessionStore> store_;
  FakeAgentHost host_{scheduler_};
  std::unique_ptr<Conductor> conductor_;

  std::vector<events::SessionUpdated> session_updates_;
  std::vector<events::ProcessingChanged> processing_events_;
  std::vector<events::PermissionRequested> permission_requests_;
  std::vector<events::AgentExited> exits_;
  std::vector<SessionId> deleted_;
  std::vector<Bus::SubscriptionId> subscriptions_;
};

// ============================================================
// 会话生命周期
// ============================================================

TEST_F(ConductorTest, CreateSessionStartsDefaultAgent) {
  auto result = create();
  ASSERT_TRUE(result.ok());

  const auto& meta = *result.value;
  EXPECT_EQ(meta.agent_id, "opencode");
  EXPECT_EQ(meta.agent_session_id, "agent-sess-1");
  EXPECT_EQ(meta.working_directory, "/work");
  EXPECT_EQ(meta.status, SessionStatus::Active);

  ASSERT_EQ(host_.connections.size(), 1u);
  EXPECT_EQ(host_.last()->agent.command, "opencode");
  EXPECT_EQ(host_.last()->new_session_cwds, std::vector<std::string>{"/work"});

  EXPECT_TRUE(conductor_->is_session_running(meta.id));
  EXPECT_EQ(conductor_->running_session_ids(), std::vector<SessionId>{meta.id});
  EXPECT_EQ(conductor_->resolve_session_id("agent-sess-1"), meta.id);
  EXPECT_EQ(conductor_->list_sessions().size(), 1u);
}

TEST_F(ConductorTest, CreateSessionWithExplicitAgent) {
  auto result = create("codex");
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value->agent_id, "codex");
  EXPECT_EQ(host_.last()->agent.command, "codex-acp");
}

TEST_F(ConductorTest, UnknownAgentFails) {
  auto result = create("nope");
  ASSERT_TRUE(result.failed());
  EXPECT_EQ(*result.error, "Unknown agent: nope");
  EXPECT_TRUE(host_.connections.empty());
  EXPECT_TRUE(conductor_->list_sessions().empty());
}

TEST_F(ConductorTest, DisabledAgentFails) {
  conductor_.reset();
  config_.agents["codex"].enabled = false;
  conductor_ = std::make_unique<Conductor>(scheduler_, config_, store_, host_.factory());

  auto result = create("codex");
  ASSERT_TRUE(result.failed());
  EXPECT_EQ(*result.error, "Agent is disabled: codex");
}

TEST_F(ConductorTest, SpawnFailureMarksSessionFailed) {
  host_.refuse = true;

  auto result = create();
  ASSERT_TRUE(result.failed());
  EXPECT_EQ(*result.error, "Failed to start agent: opencode");

  auto sessions = conductor_->list_sessions();
  ASSERT_EQ(sessions.size(), 1u);
  EXPECT_EQ(sessions[0].status, SessionStatus::Error);
  EXPECT_TRUE(conductor_->running_session_ids().empty());
}

TEST_F(ConductorTest, InitializeFailureReleasesConnection) {
  host_.next_init_error = "handshake refused";

  auto result = create();
  ASSERT_TRUE(result.failed());
  EXPECT_EQ(*result.error, "handshake refused");
  EXPECT_TRUE(host_.last()->closed);
  EXPECT_TRUE(conductor_->running_session_ids().empty());
}

TEST_F(ConductorTest, LoadSession) {
  auto id = create_ok();
  EXPECT_EQ(conductor_->load_session(id).id, id);
  EXPECT_THROW(conductor_->load_session("missing"), std::runtime_error);
}

TEST_F(ConductorTest, StopSession) {
  auto id = create_ok();
  auto connection = host_.last();

  conductor_->stop_session(id);
  scheduler_.run();

  EXPECT_TRUE(connection->closed);
  EXPECT_FALSE(conductor_->is_session_running(id));
  // Identity still resolvable through the stored agent session ID
  EXPECT_EQ(conductor_->resolve_session_id("agent-sess-1"), id);
}

TEST_F(ConductorTest, StopAllSessions) {
  create_ok();
  create_ok();
  EXPECT_EQ(conductor_->running_session_ids().size(), 2u);

  conductor_->stop_all_sessions();
  EXPECT_TRUE(conductor_->running_session_ids().empty());
  EXPECT_TRUE(host_.connections[0]->closed);
  EXPECT_TRUE(host_.connections[1]->closed);
}

TEST_F(ConductorTest, DeleteSession) {
  auto id = create_ok();
  conductor_->add_pending_answer(id, "q", "a");

  conductor_->delete_session(id);

  EXPECT_FALSE(conductor_->get_session_data(id).has_value());
  EXPECT_FALSE(conductor_->is_session_running(id));
  EXPECT_TRUE(conductor_->pending_answers(id).empty());
  EXPECT_EQ(deleted_, std::vector<SessionId>{id});
}

TEST_F(ConductorTest, UpdateSessionMeta) {
  auto id = create_ok();

  std::vector<events::SessionMetaUpdated> updates;
  auto sub = Bus::instance().subscribe<events::SessionMetaUpdated>(
      [&updates](const events::SessionMetaUpdated& e) { updates.push_back(e); });

  auto meta = conductor_->update_session_meta(id, SessionMetaUpdate{.title = "Build fixes"});
  Bus::instance().unsubscribe(sub);

  EXPECT_EQ(meta.title, "Build fixes");
  EXPECT_EQ(conductor_->load_session(id).title, "Build fixes");
  ASSERT_EQ(updates.size(), 1u);
  EXPECT_EQ(updates[0].session_id, id);
  EXPECT_EQ(updates[0].status, "active");

  EXPECT_THROW(conductor_->update_session_meta("missing", SessionMetaUpdate{.title = "x"}), std::runtime_error);
}

TEST_F(ConductorTest, ResumeStartsNewAgentRun) {
  auto id = create_ok();
  conductor_->stop_session(id);

  std::optional<Result<SessionMeta>> resumed;
  conductor_->resume_session(id, [&](Result<SessionMeta> r) { resumed = std::move(r); });
  scheduler_.run();

  ASSERT_TRUE(resumed.has_value() && resumed->ok());
  EXPECT_EQ(resumed->value->agent_session_id, "agent-sess-2");
  EXPECT_EQ(host_.connections.size(), 2u);
  EXPECT_EQ(conductor_->resolve_session_id("agent-sess-2"), id);
}

TEST_F(ConductorTest, ResumeUnknownSessionFails) {
  std::optional<Result<SessionMeta>> resumed;
  conductor_->resume_session("missing", [&](Result<SessionMeta> r) { resumed = std::move(r); });

  ASSERT_TRUE(resumed.has_value());
  EXPECT_EQ(*resumed->error, "Session not found: missing");
}

TEST_F(ConductorTest, ConcurrentStartsShareOneAgent) {
  auto id = create_ok();
  conductor_->stop_session(id);

  int completions = 0;
  conductor_->start_agent(id, [&](Result<SessionMeta> r) {
    EXPECT_TRUE(r.ok());
    ++completions;
  });
  conductor_->start_agent(id, [&](Result<SessionMeta> r) {
    EXPECT_TRUE(r.ok());
    ++completions;
  });
  scheduler_.run();

  EXPECT_EQ(completions, 2);
  EXPECT_EQ(host_.connections.size(), 2u);  // create + one restart
}

TEST_F(ConductorTest, SwitchAgent) {
  auto id = create_ok();
  auto first = host_.last();

  std::optional<Result<SessionMeta>> switched;
  conductor_->switch_agent(id, "claude-code", [&](Result<SessionMeta> r) { switched = std::move(r); });
  scheduler_.run();

  ASSERT_TRUE(switched.has_value() && switched->ok());
  EXPECT_EQ(switched->value->agent_id, "claude-code");
  EXPECT_TRUE(first->closed);
  EXPECT_EQ(host_.last()->agent.command, "claude-code-acp");
  EXPECT_EQ(conductor_->load_session(id).agent_id, "claude-code");
}

TEST_F(ConductorTest, SwitchToUnknownAgentKeepsCurrent) {
  auto id = create_ok();

  std::optional<Result<SessionMeta>> switched;
  conductor_->switch_agent(id, "nope", [&](Result<SessionMeta> r) { switched = std::move(r); });

  ASSERT_TRUE(switched.has_value() && switched->failed());
  EXPECT_TRUE(conductor_->is_session_running(id));
  EXPECT_FALSE(host_.last()->closed);
}

// ============================================================
// 发送提示
// ============================================================

TEST_F(ConductorTest, SendPrompt) {
  auto id = create_ok();
  auto connection = host_.last();

  auto done = prompt(id, "hello");
  EXPECT_TRUE(conductor_->is_session_processing(id));
  EXPECT_EQ(conductor_->processing_session_ids(), std::vector<SessionId>{id});
  ASSERT_EQ(processing_events_.size(), 1u);
  EXPECT_TRUE(processing_events_[0].processing);

  ASSERT_EQ(connection->prompts.size(), 1u);
  EXPECT_EQ(connection->prompts[0].session_id, "agent-sess-1");
  EXPECT_EQ(acp::first_text(connection->prompts[0].content), "hello");
  EXPECT_FALSE(done->has_value());

  connection->finish_prompt("end_turn");
  ASSERT_TRUE(done->has_value());
  EXPECT_EQ(*(*done)->value, "end_turn");
  EXPECT_FALSE(conductor_->is_session_processing(id));
  ASSERT_EQ(processing_events_.size(), 2u);
  EXPECT_FALSE(processing_events_[1].processing);

  auto data = conductor_->get_session_data(id);
  auto user = find_stored(*data, "user_message");
  ASSERT_TRUE(user.has_value());
  EXPECT_EQ((*user)["content"][0]["text"], "hello");
  EXPECT_FALSE((*user)["_internal"].get<bool>());
}

TEST_F(ConductorTest, InternalPromptIsFlagged) {
  auto id = create_ok();
  prompt(id, "system note", true);

  auto user = find_stored(*conductor_->get_session_data(id), "user_message");
  ASSERT_TRUE(user.has_value());
  EXPECT_TRUE((*user)["_internal"].get<bool>());
}

TEST_F(ConductorTest, PendingAnswersAreInjectedOnce) {
  auto id = create_ok();
  auto connection = host_.last();
  conductor_->add_pending_answer(id, "Proceed?", "Yes");
  conductor_->add_pending_answer(id, "Color?", "Blue");

  prompt(id, "next");
  ASSERT_EQ(connection->prompts.size(), 1u);
  const auto& content = connection->prompts[0].content;
  ASSERT_EQ(content.size(), 2u);
  EXPECT_EQ(content[0].text, "---\n[User's answer to \"Proceed?\"]: Yes\n[User's answer to \"Color?\"]: Blue\n---\n");
  EXPECT_EQ(content[1].text, "next");
  EXPECT_TRUE(conductor_->pending_answers(id).empty());

  connection->finish_prompt();
  prompt(id, "again");
  EXPECT_EQ(connection->prompts[1].content.size(), 1u);
}

TEST_F(ConductorTest, PromptErrorBecomesErrorChunk) {
  auto id = create_ok();
  auto connection = host_.last();

  auto done = prompt(id, "hello");
  connection->fail_prompt("Request timeout");

  ASSERT_TRUE(done->has_value());
  ASSERT_TRUE((*done)->ok());
  EXPECT_EQ(*(*done)->value, "error");
  EXPECT_FALSE(conductor_->is_session_processing(id));

  ASSERT_FALSE(session_updates_.empty());
  const auto& update = session_updates_.back().update;
  EXPECT_EQ(update["sessionUpdate"], "agent_message_chunk");
  EXPECT_EQ(update["content"]["text"], "\n\n**Error:** Request timed out. Please try again.\n");
}

TEST_F(ConductorTest, PromptToUnknownSessionFails) {
  auto done = prompt("missing", "hello");

  ASSERT_TRUE(done->has_value());
  EXPECT_TRUE((*done)->failed());
  EXPECT_FALSE(conductor_->is_session_processing("missing"));
}

TEST_F(ConductorTest, LazyStartReplaysHistory) {
  auto id = create_ok();
  auto first = host_.last();

  prompt(id, "Fix the build");
  first->emit_update(text_chunk("Done, it builds now"));
  first->finish_prompt();

  conductor_->stop_session(id);
  scheduler_.run();

  auto done = prompt(id, "What did you change?");
  ASSERT_EQ(host_.connections.size(), 2u);
  auto second = host_.last();
  ASSERT_EQ(second->prompts.size(), 1u);

  const auto& content = second->prompts[0].content;
  ASSERT_EQ(content.size(), 2u);
  EXPECT_EQ(content[0].text.rfind("[Session History - 2 messages]", 0), 0u);
  EXPECT_NE(content[0].text.find("USER: Fix the build"), std::string::npos);
  EXPECT_NE(content[0].text.find("ASSISTANT: Done, it builds now"), std::string::npos);
  EXPECT_EQ(content[1].text, "What did you change?");

  // Only the first prompt after the restart
  second->finish_prompt();
  prompt(id, "thanks");
  EXPECT_EQ(second->prompts[1].content.size(), 1u);
}

TEST_F(ConductorTest, FreshSessionDoesNotReplay) {
  auto id = create_ok();
  prompt(id, "hello");
  EXPECT_EQ(host_.last()->prompts[0].content.size(), 1u);
}

// ============================================================
// 会话更新与代理退出
// ============================================================

TEST_F(ConductorTest, SessionUpdatesAreStoredAndPublished) {
  auto id = create_ok();
  host_.last()->emit_update(text_chunk("Hi"));

  ASSERT_EQ(session_updates_.size(), 1u);
  EXPECT_EQ(session_updates_[0].session_id, id);
  EXPECT_EQ(session_updates_[0].agent_session_id, "agent-sess-1");

  auto chunk = find_stored(*conductor_->get_session_data(id), "agent_message_chunk");
  ASSERT_TRUE(chunk.has_value());
  EXPECT_EQ((*chunk)["content"]["text"], "Hi");
}

TEST_F(ConductorTest, AgentExit) {
  auto id = create_ok();
  auto connection = host_.last();
  auto done = prompt(id, "hello");

  connection->exit();
  scheduler_.run();

  EXPECT_FALSE(conductor_->is_session_running(id));
  ASSERT_EQ(exits_.size(), 1u);
  EXPECT_EQ(exits_[0].session_id, id);
  EXPECT_EQ(exits_[0].agent_id, "opencode");

  // In-flight prompt completes with the friendly error
  ASSERT_TRUE(done->has_value());
  EXPECT_EQ(*(*done)->value, "error");
  EXPECT_FALSE(conductor_->is_session_processing(id));
}

TEST_F(ConductorTest, StaleExitAfterRestartIsIgnored) {
  auto id = create_ok();
  auto first = host_.last();
  conductor_->stop_session(id);

  std::optional<Result<SessionMeta>> started;
  conductor_->start_agent(id, [&](Result<SessionMeta> r) { started = std::move(r); });
  scheduler_.run();
  ASSERT_TRUE(started.has_value() && started->ok());

  // The old run reports its exit late
  first->callbacks.on_close();
  EXPECT_TRUE(conductor_->is_session_running(id));
  EXPECT_TRUE(exits_.empty());
}

// ============================================================
// 权限与两个变通方案
// ============================================================

TEST_F(ConductorTest, PermissionRequestRoundTrip) {
  auto id = create_ok();
  auto connection = host_.last();

  acp::RequestPermissionParams params;
  params.session_id = "agent-sess-1";
  params.tool_call.tool_call_id = "tc-bash";
  params.tool_call.title = "bash";
  params.options = {acp::PermissionOption{"allow", "Allow", "allow_once"}};

  auto response = connection->request_permission(params);
  ASSERT_EQ(permission_requests_.size(), 1u);
  EXPECT_EQ(permission_requests_[0].durable_session_id, id);
  EXPECT_FALSE(response->has_value());

  EXPECT_TRUE(conductor_->handle_permission_response(
      PermissionDecision{permission_requests_[0].request_id, "allow", std::nullopt}));
  ASSERT_TRUE(response->has_value());
  EXPECT_EQ((**response)["outcome"]["optionId"], "allow");
}

TEST_F(ConductorTest, PermissionTimeoutAnswersAgent) {
  create_ok();
  auto response = host_.last()->request_permission(question_params("agent-sess-1"));

  scheduler_.advance(config_.timing.permission_timeout);
  ASSERT_TRUE(response->has_value());
  EXPECT_EQ((**response)["outcome"]["optionId"], "deny");
}

TEST_F(ConductorTest, AnsweredQuestionIsRecovered) {
  auto id = create_ok();
  auto connection = host_.last();
  prompt(id, "Set things up");

  auto response = connection->request_permission(question_params("agent-sess-1"));
  ASSERT_EQ(permission_requests_.size(), 1u);
  EXPECT_TRUE(permission_requests_[0].question);

  PermissionResponseData data;
  data.selected_option = "Yes";
  conductor_->handle_permission_response(PermissionDecision{permission_requests_[0].request_id, "allow", data});

  ASSERT_TRUE(response->has_value());
  EXPECT_EQ((**response)["outcome"]["_meta"]["userAnswer"], "Yes");

  // Response recorded for the transcript
  auto record = find_stored(*conductor_->get_session_data(id), "askuserquestion_response");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ((*record)["toolCallId"], "tc-ask");
  EXPECT_EQ((*record)["response"]["selectedOption"], "Yes");

  // Cancel goes out; the agent unwinds the turn
  scheduler_.run();
  EXPECT_EQ(connection->cancels, std::vector<std::string>{"agent-sess-1"});
  connection->finish_prompt("cancelled");

  scheduler_.advance(1s);
  ASSERT_EQ(connection->prompts.size(), 2u);
  const auto& content = connection->prompts[1].content;
  ASSERT_EQ(content.size(), 2u);
  EXPECT_EQ(content[0].text, "---\n[User's answer to \"Proceed?\"]: Yes\n---\n");
  EXPECT_EQ(content[1].text, "Yes");

  auto internal = find_stored(*conductor_->get_session_data(id), "user_message", 1);
  ASSERT_TRUE(internal.has_value());
  EXPECT_TRUE((*internal)["_internal"].get<bool>());
}

TEST_F(ConductorTest, HangingQuestionToolIsCancelled) {
  auto id = create_ok();
  auto connection = host_.last();
  prompt(id, "Plan the work");

  json update = {
      {"sessionUpdate", "tool_call_update"},
      {"toolCallId", "tc-q"},
      {"title", "question"},
      {"status", "in_progress"},
      {"rawInput", {{"questions", {{{"question", "Which approach?"}}}}}},
  };
  connection->emit_update(update);
  connection->emit_update(update);  // duplicate

  scheduler_.run();
  EXPECT_EQ(connection->cancels.size(), 1u);
  connection->finish_prompt("cancelled");

  scheduler_.advance(config_.timing.question_settle_delay);
  ASSERT_EQ(connection->prompts.size(), 2u);
  auto text = acp::first_text(connection->prompts[1].content);
  EXPECT_NE(text.find("1. Which approach?"), std::string::npos);
  EXPECT_NE(text.find("is not available in this environment"), std::string::npos);
}
