#include "permission/tool_names.hpp"

#include <algorithm>
#include <cctype>

namespace conductor::tool_names {

bool is_question_tool(const std::string& title) {
  if (title.empty()) return false;
  if (title == kAskUserQuestion || title == kQuestion) return true;

  std::string lower = title;
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return lower == "askuserquestion" || lower == kQuestion || lower == kConductorAskUserQuestion;
}

bool is_question_tool(const std::optional<std::string>& title) {
  return title.has_value() && is_question_tool(*title);
}

}  // namespace conductor::tool_names
