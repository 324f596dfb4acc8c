#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace conductor::acp {

using json = nlohmann::json;

inline constexpr int kProtocolVersion = 1;

namespace methods {
inline constexpr const char* kInitialize = "initialize";
inline constexpr const char* kSessionNew = "session/new";
inline constexpr const char* kSessionPrompt = "session/prompt";
inline constexpr const char* kSessionCancel = "session/cancel";
inline constexpr const char* kSessionUpdate = "session/update";
inline constexpr const char* kRequestPermission = "session/request_permission";
}  // namespace methods

namespace error_codes {
inline constexpr int kInvalidParams = -32602;
inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInternalError = -32603;
inline constexpr int kTransportError = -32000;
}  // namespace error_codes

// ============================================================
// JSON-RPC 2.0 message types
// ============================================================

struct JsonRpcRequest {
  std::string method;
  json params = json::object();
  int64_t id = 0;

  json to_json() const;
};

struct JsonRpcResponse {
  int64_t id = 0;
  std::optional<json> result;
  std::optional<json> error;

  bool ok() const {
    return !error.has_value();
  }

  // error.message, with error.data appended when present
  std::string error_message() const;

  static JsonRpcResponse from_json(const json& j);
};

struct JsonRpcNotification {
  std::string method;
  json params = json::object();

  json to_json() const;
};

// Responses we send back for requests initiated by the agent (id echoed verbatim)
json make_result_response(const json& id, json result);
json make_error_response(const json& id, int code, const std::string& message);

// ============================================================
// ACP content and session types
// ============================================================

struct ContentBlock {
  std::string type = "text";
  std::string text;
  std::string data;  // base64 payload for images
  std::string mime_type;

  static ContentBlock text_block(std::string text);
  static ContentBlock image_block(std::string data, std::string mime_type);

  json to_json() const;
  static ContentBlock from_json(const json& j);
};

using MessageContent = std::vector<ContentBlock>;

json to_json(const MessageContent& content);
MessageContent text_content(std::string text);

// Text of the first text block, or empty
std::string first_text(const MessageContent& content);

struct ToolCall {
  std::string tool_call_id;
  std::optional<std::string> title;
  std::optional<std::string> kind;
  std::optional<std::string> status;
  json raw_input;  // agent-opaque, null when absent

  json to_json() const;
  static ToolCall from_json(const json& j);
};

struct PermissionOption {
  std::string option_id;
  std::string name;
  std::optional<std::string> kind;  // allow_once, allow_always, reject_once, deny, ...

  json to_json() const;
  static PermissionOption from_json(const json& j);
};

struct RequestPermissionParams {
  std::string session_id;  // protocol session ID
  ToolCall tool_call;
  std::vector<PermissionOption> options;

  json to_json() const;
  static RequestPermissionParams from_json(const json& j);
};

struct SessionNotification {
  std::string session_id;  // protocol session ID
  json update = json::object();

  // update.sessionUpdate, or empty when the update carries no type tag
  std::string update_type() const;

  json to_json() const;
  static SessionNotification from_json(const json& j);
};

struct InitializeResult {
  int protocol_version = 0;
  json agent_info;
  json agent_capabilities;

  static InitializeResult from_json(const json& j);
};

}  // namespace conductor::acp
