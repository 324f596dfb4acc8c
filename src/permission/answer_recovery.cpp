#include "permission/answer_recovery.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace conductor {

namespace {

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) out += sep;
    out += parts[i];
  }
  return out;
}

std::optional<std::string> first_question(const json& raw_input) {
  if (!raw_input.is_object() || !raw_input.contains("questions")) return std::nullopt;
  const auto& questions = raw_input["questions"];
  if (!questions.is_array() || questions.empty()) return std::nullopt;

  const auto& first = questions[0];
  if (first.is_object() && first.contains("question") && first["question"].is_string()) {
    auto text = first["question"].get<std::string>();
    if (!text.empty()) return text;
  }
  return std::string("Unknown question");
}

}  // namespace

AnswerRecovery::AnswerRecovery(Scheduler& scheduler, SessionOps& ops, const TimingConfig& timing)
    : scheduler_(scheduler), ops_(ops), timing_(timing) {}

AnswerRecovery::~AnswerRecovery() {
  alive_.reset();
}

std::optional<RecoveryPlan> AnswerRecovery::plan(const acp::ToolCall& tool_call, const PermissionResponseData& data) {
  // Multi-question form
  if (data.answers && !data.answers->empty()) {
    RecoveryPlan p;
    p.pairs = *data.answers;
    if (p.pairs.size() == 1) {
      p.body = p.pairs[0].answer;
    } else {
      std::vector<std::string> blocks;
      for (size_t i = 0; i < p.pairs.size(); ++i) {
        auto n = std::to_string(i + 1);
        blocks.push_back("Q" + n + ": " + p.pairs[i].question + "\nA" + n + ": " + p.pairs[i].answer);
      }
      p.body = join(blocks, "\n\n");
    }
    return p;
  }

  // Legacy single-answer form
  auto question = first_question(tool_call.raw_input);
  if (!question) return std::nullopt;

  std::string answer;
  if (data.selected_options && !data.selected_options->empty()) {
    answer = join(*data.selected_options, ", ");
  }
  if (answer.empty() && data.selected_option) answer = *data.selected_option;
  if (answer.empty() && data.custom_text) answer = *data.custom_text;
  if (answer.empty()) return std::nullopt;

  RecoveryPlan p;
  p.pairs.push_back(QuestionAnswer{*question, answer});
  p.body = answer;
  return p;
}

bool AnswerRecovery::handle(const std::string& protocol_session_id, const acp::ToolCall& tool_call,
                            const PermissionResponseData& data) {
  auto session_id = ops_.resolve_session_id(protocol_session_id);
  if (!session_id) {
    spdlog::debug("[AnswerRecovery] No session mapped to {}, skipping", protocol_session_id);
    return false;
  }

  auto p = plan(tool_call, data);
  if (!p) {
    spdlog::debug("[AnswerRecovery] No usable answer for tool call {}", tool_call.tool_call_id);
    return false;
  }

  for (const auto& pair : p->pairs) {
    ops_.add_pending_answer(*session_id, pair.question, pair.answer);
  }
  spdlog::info("[AnswerRecovery] Stored {} pending answer(s) for session {}", p->pairs.size(), *session_id);

  resubmit(*session_id, p->body);
  return true;
}

void AnswerRecovery::resubmit(const SessionId& session_id, const std::string& body) {
  std::weak_ptr<bool> alive = alive_;
  scheduler_.post([this, alive, session_id, body]() {
    if (alive.expired()) return;
    spdlog::info("[AnswerRecovery] Cancelling current turn to resubmit answer");

    try {
      ops_.cancel_request(session_id, [this, alive, session_id, body](Result<void> cancelled) {
        if (alive.expired()) return;
        if (cancelled.failed()) {
          spdlog::error("[AnswerRecovery] Failed to cancel turn for session {}: {}", session_id, *cancelled.error);
          return;
        }
        auto started = scheduler_.now();
        poll_until_idle(session_id, body, started, started + timing_.cancel_poll_max);
      });
    } catch (const std::exception& e) {
      spdlog::error("[AnswerRecovery] Failed to cancel and resubmit: {}", e.what());
    }
  });
}

void AnswerRecovery::poll_until_idle(const SessionId& session_id, const std::string& body,
                                     Scheduler::Clock::time_point started, Scheduler::Clock::time_point deadline) {
  try {
    auto now = scheduler_.now();
    auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(now - started);
    if (!ops_.is_session_processing(session_id)) {
      spdlog::info("[AnswerRecovery] Cancel completed after {}ms", waited.count());
      send_after_settle(session_id, body);
      return;
    }
    if (now >= deadline) {
      spdlog::warn("[AnswerRecovery] Timed out waiting for cancel to complete after {}ms, proceeding anyway",
                   waited.count());
      send_after_settle(session_id, body);
      return;
    }
  } catch (const std::exception& e) {
    spdlog::error("[AnswerRecovery] Failed while waiting for cancel: {}", e.what());
    return;
  }

  // A zero interval would never advance the clock
  auto interval = std::max(timing_.cancel_poll_interval, std::chrono::milliseconds(1));
  std::weak_ptr<bool> alive = alive_;
  scheduler_.schedule(interval, [this, alive, session_id, body, started, deadline]() {
    if (alive.expired()) return;
    poll_until_idle(session_id, body, started, deadline);
  });
}

void AnswerRecovery::send_after_settle(const SessionId& session_id, const std::string& body) {
  std::weak_ptr<bool> alive = alive_;
  scheduler_.schedule(timing_.resubmit_settle_delay, [this, alive, session_id, body]() {
    if (alive.expired()) return;
    try {
      ops_.send_prompt(session_id, acp::text_content(body), PromptOptions{.internal = true},
                       [session_id](Result<std::string> result) {
                         if (result.failed()) {
                           spdlog::error("[AnswerRecovery] Resubmit failed for session {}: {}", session_id,
                                         *result.error);
                           return;
                         }
                         spdlog::info("[AnswerRecovery] Answer resubmitted (stopReason: {})", *result.value);
                       });
    } catch (const std::exception& e) {
      spdlog::error("[AnswerRecovery] Failed to resubmit answer: {}", e.what());
    }
  });
}

}  // namespace conductor
