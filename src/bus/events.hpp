#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "acp/protocol.hpp"

namespace conductor::events {

using json = nlohmann::json;

struct SessionCreated {
  std::string session_id;
  std::string agent_id;
};

struct SessionDeleted {
  std::string session_id;
};

// Session metadata changed (agent restarted, agent switched, ...)
struct SessionMetaUpdated {
  std::string session_id;
  std::string agent_session_id;
  std::string agent_id;
  std::string status;
};

// Raw ACP session update, keyed by the durable session ID
struct SessionUpdated {
  std::string session_id;
  std::string agent_session_id;
  json update;
};

struct ProcessingChanged {
  std::string session_id;
  bool processing = false;
};

struct AgentStarted {
  std::string session_id;
  std::string agent_id;
  std::string agent_session_id;
};

struct AgentExited {
  std::string session_id;
  std::string agent_id;
};

// Display-ready projection of a permission request awaiting an operator decision
struct PermissionRequested {
  std::string request_id;
  std::string session_id;          // protocol session ID
  std::string durable_session_id;  // falls back to the protocol ID when unmapped
  acp::ToolCall tool_call;
  std::vector<acp::PermissionOption> options;
  bool question = false;  // question-class tool
};

struct PermissionResolved {
  std::string request_id;
  std::string option_id;
  bool timed_out = false;
};

}  // namespace conductor::events
