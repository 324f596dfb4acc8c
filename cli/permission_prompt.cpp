#include "permission_prompt.h"

#include <stdexcept>

namespace conductor_cli {

using conductor::PermissionDecision;
using conductor::PermissionResponseData;
using conductor::QuestionAnswer;

namespace {

std::string allow_option(const std::vector<conductor::acp::PermissionOption>& options) {
  for (const auto& option : options) {
    if (option.kind && option.kind->rfind("allow", 0) == 0) return option.option_id;
  }
  return options.empty() ? "" : options.front().option_id;
}

}  // namespace

PendingPermission make_pending(const conductor::events::PermissionRequested& request) {
  PendingPermission pending;
  pending.request = request;

  const auto& raw = request.tool_call.raw_input;
  if (request.question && raw.is_object() && raw.contains("questions") && raw["questions"].is_array()) {
    for (const auto& q : raw["questions"]) {
      pending.questions.push_back(q.value("question", ""));
      std::vector<std::string> labels;
      if (q.contains("options") && q["options"].is_array()) {
        for (const auto& option : q["options"]) {
          labels.push_back(option.value("label", ""));
        }
      }
      pending.labels.push_back(std::move(labels));
    }
  }
  return pending;
}

std::optional<size_t> parse_choice(const std::string& line, size_t count) {
  if (line.empty() || line[0] < '0' || line[0] > '9') return std::nullopt;
  try {
    size_t pos = 0;
    auto n = std::stoul(line, &pos);
    if (pos == line.size() && n >= 1 && n <= count) return n - 1;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
  return std::nullopt;
}

void PermissionPrompt::add(const conductor::events::PermissionRequested& request) {
  queue_.push_back(make_pending(request));
  if (queue_.size() == 1) show_front();
}

void PermissionPrompt::resolved(const std::string& request_id, bool timed_out) {
  for (auto it = queue_.begin(); it != queue_.end(); ++it) {
    if (it->request.request_id != request_id) continue;

    bool was_front = it == queue_.begin();
    queue_.erase(it);
    if (timed_out) out_ << "\nPermission request timed out.\n";
    if (was_front && !queue_.empty()) show_front();
    return;
  }
}

std::optional<PermissionDecision> PermissionPrompt::answer(const std::string& line) {
  if (queue_.empty()) return std::nullopt;
  auto& pending = queue_.front();
  const auto& request = pending.request;

  if (pending.questions.empty()) {
    auto choice = parse_choice(line, request.options.size());
    if (!choice) {
      out_ << "Enter a number between 1 and " << request.options.size() << "\n";
      return std::nullopt;
    }
    PermissionDecision decision{request.request_id, request.options[*choice].option_id, std::nullopt};
    finish_front();
    return decision;
  }

  auto index = pending.answers.size();
  const auto& labels = pending.labels[index];
  auto choice = parse_choice(line, labels.size());
  auto answer = choice ? labels[*choice] : line;
  pending.answers.push_back(QuestionAnswer{pending.questions[index], answer});

  if (pending.answers.size() < pending.questions.size()) {
    show_front();
    return std::nullopt;
  }

  PermissionResponseData data;
  if (pending.answers.size() > 1) {
    data.answers = pending.answers;
  } else if (choice) {
    data.selected_option = answer;
  } else {
    data.custom_text = answer;
  }
  PermissionDecision decision{request.request_id, allow_option(request.options), data};
  finish_front();
  return decision;
}

void PermissionPrompt::finish_front() {
  queue_.pop_front();
  if (!queue_.empty()) show_front();
}

void PermissionPrompt::show_front() {
  const auto& pending = queue_.front();
  const auto& request = pending.request;

  if (!pending.questions.empty()) {
    auto index = pending.answers.size();
    out_ << "\n? " << pending.questions[index] << "\n";
    const auto& labels = pending.labels[index];
    for (size_t i = 0; i < labels.size(); ++i) {
      out_ << "  " << (i + 1) << ". " << labels[i] << "\n";
    }
    out_ << "Answer with a number or free text:\n";
    return;
  }

  out_ << "\nPermission requested: " << request.tool_call.title.value_or(request.tool_call.tool_call_id) << "\n";
  for (size_t i = 0; i < request.options.size(); ++i) {
    out_ << "  " << (i + 1) << ". " << request.options[i].name << "\n";
  }
  out_ << "Choose an option:\n";
}

}  // namespace conductor_cli
