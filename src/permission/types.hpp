#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace conductor {

using json = nlohmann::json;

struct QuestionAnswer {
  std::string question;
  std::string answer;

  bool operator==(const QuestionAnswer& other) const = default;
};

// Structured answer payload attached to a decision for a question-class tool
struct PermissionResponseData {
  std::optional<std::vector<QuestionAnswer>> answers;  // multi-question form
  std::optional<std::vector<std::string>> selected_options;
  std::optional<std::string> selected_option;
  std::optional<std::string> custom_text;

  // True when any answer field carries content
  bool has_answer() const;

  json to_json() const;
  static PermissionResponseData from_json(const json& j);
};

// Operator's (or the UI's) decision for one outstanding request
struct PermissionDecision {
  std::string request_id;
  std::string option_id;
  std::optional<PermissionResponseData> data;
};

enum class AnswerType { MultiQuestion, MultiSelected, Selected, Custom };

std::string to_string(AnswerType type);

struct OutcomeMeta {
  std::optional<std::string> user_answer;
  std::optional<std::vector<QuestionAnswer>> user_answers;
  AnswerType answer_type = AnswerType::Custom;
};

// Result returned to the agent for session/request_permission
struct PermissionOutcome {
  std::string option_id;
  std::optional<OutcomeMeta> meta;

  // {"outcome": {"outcome": "selected", "optionId": ..., "_meta": {...}}}
  json to_json() const;

  // Echoes the option and summarizes the answer payload, if any
  static PermissionOutcome from_decision(const PermissionDecision& decision);
};

}  // namespace conductor
