#pragma once

#include <optional>
#include <string>

namespace conductor::tool_names {

inline constexpr const char* kAskUserQuestion = "AskUserQuestion";
inline constexpr const char* kQuestion = "question";
inline constexpr const char* kConductorAskUserQuestion = "mcp__conductor__askuserquestion";

// Tools that ask the operator for a structured answer rather than allow/deny
bool is_question_tool(const std::optional<std::string>& title);
bool is_question_tool(const std::string& title);

}  // namespace conductor::tool_names
