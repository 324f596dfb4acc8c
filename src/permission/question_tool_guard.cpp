#include "permission/question_tool_guard.hpp"

#include <spdlog/spdlog.h>

namespace conductor {

namespace {

std::string string_field(const json& j, const char* key) {
  if (j.is_object() && j.contains(key) && j[key].is_string()) {
    return j[key].get<std::string>();
  }
  return "";
}

}  // namespace

QuestionToolGuard::QuestionToolGuard(Scheduler& scheduler, SessionOps& ops, const TimingConfig& timing)
    : scheduler_(scheduler), ops_(ops), timing_(timing) {}

QuestionToolGuard::~QuestionToolGuard() {
  alive_.reset();
  for (const auto& [tool_call_id, timer] : cleanup_timers_) {
    scheduler_.cancel(timer);
  }
}

bool QuestionToolGuard::handle_tool_update(const std::string& protocol_session_id, const json& update) {
  if (string_field(update, "sessionUpdate") != "tool_call_update" || string_field(update, "title") != timing_.hang_guard_tool ||
      string_field(update, "status") != "in_progress") {
    return false;
  }

  sweep_expired();

  auto tool_call_id = string_field(update, "toolCallId");
  if (!tool_call_id.empty() && handled_.contains(tool_call_id)) {
    spdlog::debug("[Question] Already handled toolCallId={}, skipping", tool_call_id);
    return false;
  }

  auto session_id = ops_.resolve_session_id(protocol_session_id);
  if (!session_id) {
    spdlog::debug("[Question] No session mapped to {}, ignoring", protocol_session_id);
    return false;
  }

  // Check-and-set happens here, before any asynchronous work
  if (!tool_call_id.empty()) {
    mark_handled(tool_call_id);
  }

  auto question_texts = format_questions(update.contains("rawInput") ? update["rawInput"] : json());
  if (!question_texts.empty()) {
    spdlog::info("[Question] Original questions:\n{}", question_texts);
  }

  run_workaround(*session_id, build_prompt(question_texts));
  return true;
}

bool QuestionToolGuard::is_handled(const std::string& tool_call_id) const {
  auto it = handled_.find(tool_call_id);
  return it != handled_.end() && it->second > scheduler_.now();
}

size_t QuestionToolGuard::handled_count() const {
  return handled_.size();
}

std::string QuestionToolGuard::format_questions(const json& raw_input) {
  if (!raw_input.is_object() || !raw_input.contains("questions") || !raw_input["questions"].is_array()) {
    return "";
  }

  std::string out;
  const auto& questions = raw_input["questions"];
  for (size_t i = 0; i < questions.size(); ++i) {
    const auto& q = questions[i];
    if (i > 0) out += "\n";
    out += std::to_string(i + 1) + ". " + string_field(q, "question");

    if (q.is_object() && q.contains("options") && q["options"].is_array() && !q["options"].empty()) {
      out += "\n   Options: ";
      bool first = true;
      for (const auto& option : q["options"]) {
        if (!first) out += ", ";
        out += string_field(option, "label");
        first = false;
      }
    }
  }
  return out;
}

std::string QuestionToolGuard::build_prompt(const std::string& question_texts) {
  if (question_texts.empty()) {
    return "The \"question\" tool is not available in this environment. Please ask your question directly in the "
           "conversation instead of using the question tool.";
  }
  return "The \"question\" tool is not available in this environment. You tried to ask:\n\n" + question_texts +
         "\n\nPlease ask these questions directly in the conversation (as plain text) so the user can respond.";
}

void QuestionToolGuard::mark_handled(const std::string& tool_call_id) {
  auto existing = cleanup_timers_.find(tool_call_id);
  if (existing != cleanup_timers_.end()) {
    scheduler_.cancel(existing->second);
    cleanup_timers_.erase(existing);
  }

  handled_[tool_call_id] = scheduler_.now() + timing_.handled_retention;

  std::weak_ptr<bool> alive = alive_;
  cleanup_timers_[tool_call_id] = scheduler_.schedule(timing_.handled_retention, [this, alive, tool_call_id]() {
    if (alive.expired()) return;
    handled_.erase(tool_call_id);
    cleanup_timers_.erase(tool_call_id);
  });
}

void QuestionToolGuard::sweep_expired() {
  auto now = scheduler_.now();
  for (auto it = handled_.begin(); it != handled_.end();) {
    if (it->second <= now) {
      auto timer = cleanup_timers_.find(it->first);
      if (timer != cleanup_timers_.end()) {
        scheduler_.cancel(timer->second);
        cleanup_timers_.erase(timer);
      }
      it = handled_.erase(it);
    } else {
      ++it;
    }
  }
}

void QuestionToolGuard::run_workaround(const SessionId& session_id, const std::string& prompt) {
  std::weak_ptr<bool> alive = alive_;
  scheduler_.post([this, alive, session_id, prompt]() {
    if (alive.expired()) return;
    spdlog::info("[Question] Tool detected (will hang forever), cancelling and notifying agent");

    try {
      ops_.cancel_request(session_id, [this, alive, session_id, prompt](Result<void> cancelled) {
        if (alive.expired()) return;
        if (cancelled.failed()) {
          spdlog::error("[Question] Failed to cancel turn for session {}: {}", session_id, *cancelled.error);
          return;
        }
        scheduler_.schedule(timing_.question_settle_delay, [this, alive, session_id, prompt]() {
          if (alive.expired()) return;
          notify_agent(session_id, prompt);
        });
      });
    } catch (const std::exception& e) {
      spdlog::error("[Question] Failed to handle question tool: {}", e.what());
    }
  });
}

void QuestionToolGuard::notify_agent(const SessionId& session_id, const std::string& prompt) {
  try {
    ops_.send_prompt(session_id, acp::text_content(prompt), PromptOptions{.internal = true}, [session_id](Result<std::string> result) {
      if (result.failed()) {
        spdlog::error("[Question] Internal prompt failed for session {}: {}", session_id, *result.error);
        return;
      }
      spdlog::info("[Question] Agent notified internally to ask directly (stopReason: {})", *result.value);
    });
  } catch (const std::exception& e) {
    spdlog::error("[Question] Failed to handle question tool: {}", e.what());
  }
}

}  // namespace conductor
