#include "permission/types.hpp"

namespace conductor {

namespace {

std::string join(const std::vector<std::string>& items, const std::string& sep) {
  std::string out;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) out += sep;
    out += items[i];
  }
  return out;
}

json answers_to_json(const std::vector<QuestionAnswer>& answers) {
  json arr = json::array();
  for (const auto& a : answers) {
    arr.push_back({{"question", a.question}, {"answer", a.answer}});
  }
  return arr;
}

}  // namespace

bool PermissionResponseData::has_answer() const {
  return (answers && !answers->empty()) || selected_options.has_value() || (selected_option && !selected_option->empty()) ||
         (custom_text && !custom_text->empty());
}

json PermissionResponseData::to_json() const {
  json j = json::object();
  if (answers) j["answers"] = answers_to_json(*answers);
  if (selected_options) j["selectedOptions"] = *selected_options;
  if (selected_option) j["selectedOption"] = *selected_option;
  if (custom_text) j["customText"] = *custom_text;
  return j;
}

PermissionResponseData PermissionResponseData::from_json(const json& j) {
  PermissionResponseData data;
  if (j.contains("answers") && j["answers"].is_array()) {
    std::vector<QuestionAnswer> answers;
    for (const auto& a : j["answers"]) {
      answers.push_back({a.value("question", ""), a.value("answer", "")});
    }
    data.answers = std::move(answers);
  }
  if (j.contains("selectedOptions") && j["selectedOptions"].is_array()) {
    data.selected_options = j["selectedOptions"].get<std::vector<std::string>>();
  }
  if (j.contains("selectedOption") && j["selectedOption"].is_string()) {
    data.selected_option = j["selectedOption"].get<std::string>();
  }
  if (j.contains("customText") && j["customText"].is_string()) {
    data.custom_text = j["customText"].get<std::string>();
  }
  return data;
}

std::string to_string(AnswerType type) {
  switch (type) {
    case AnswerType::MultiQuestion:
      return "multi-question";
    case AnswerType::MultiSelected:
      return "multi-selected";
    case AnswerType::Selected:
      return "selected";
    case AnswerType::Custom:
      return "custom";
  }
  return "custom";
}

json PermissionOutcome::to_json() const {
  json outcome = {{"outcome", "selected"}, {"optionId", option_id}};
  if (meta) {
    json m = json::object();
    if (meta->user_answer) m["userAnswer"] = *meta->user_answer;
    if (meta->user_answers) m["userAnswers"] = answers_to_json(*meta->user_answers);
    m["answerType"] = to_string(meta->answer_type);
    outcome["_meta"] = m;
  }
  return json{{"outcome", outcome}};
}

PermissionOutcome PermissionOutcome::from_decision(const PermissionDecision& decision) {
  PermissionOutcome outcome;
  outcome.option_id = decision.option_id;
  if (!decision.data) {
    return outcome;
  }

  const auto& data = *decision.data;
  OutcomeMeta meta;
  meta.user_answers = data.answers;

  // First non-empty of: answers, selected options, selected option, free text
  std::vector<std::string> answer_texts;
  if (data.answers) {
    for (const auto& a : *data.answers) answer_texts.push_back(a.answer);
  }
  std::string joined_answers = join(answer_texts, ", ");
  std::string joined_options = data.selected_options ? join(*data.selected_options, ", ") : "";
  if (!joined_answers.empty()) {
    meta.user_answer = joined_answers;
  } else if (!joined_options.empty()) {
    meta.user_answer = joined_options;
  } else if (data.selected_option && !data.selected_option->empty()) {
    meta.user_answer = *data.selected_option;
  } else if (data.custom_text && !data.custom_text->empty()) {
    meta.user_answer = *data.custom_text;
  }

  if (data.answers && data.answers->size() > 1) {
    meta.answer_type = AnswerType::MultiQuestion;
  } else if (data.selected_options) {
    meta.answer_type = AnswerType::MultiSelected;
  } else if (data.selected_option && !data.selected_option->empty()) {
    meta.answer_type = AnswerType::Selected;
  } else {
    meta.answer_type = AnswerType::Custom;
  }

  outcome.meta = std::move(meta);
  return outcome;
}

}  // namespace conductor
