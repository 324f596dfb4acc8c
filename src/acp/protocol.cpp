#include "acp/protocol.hpp"

namespace conductor::acp {

namespace {

std::optional<std::string> optional_string(const json& j, const char* key) {
  if (j.contains(key) && j[key].is_string()) {
    return j[key].get<std::string>();
  }
  return std::nullopt;
}

}  // namespace

// ============================================================
// JSON-RPC 2.0 serialization
// ============================================================

json JsonRpcRequest::to_json() const {
  json j;
  j["jsonrpc"] = "2.0";
  j["method"] = method;
  j["id"] = id;
  if (!params.empty()) {
    j["params"] = params;
  }
  return j;
}

std::string JsonRpcResponse::error_message() const {
  if (!error.has_value()) return "";
  const auto& err = error.value();
  if (!err.is_object() || !err.contains("message")) {
    return err.dump();
  }

  std::string message = err["message"].is_string() ? err["message"].get<std::string>() : err["message"].dump();
  if (err.contains("data") && !err["data"].is_null()) {
    message += ": ";
    message += err["data"].is_string() ? err["data"].get<std::string>() : err["data"].dump();
  }
  return message;
}

JsonRpcResponse JsonRpcResponse::from_json(const json& j) {
  JsonRpcResponse resp;
  if (j.contains("id") && j["id"].is_number_integer()) {
    resp.id = j["id"].get<int64_t>();
  }
  if (j.contains("result")) {
    resp.result = j["result"];
  }
  if (j.contains("error")) {
    resp.error = j["error"];
  }
  return resp;
}

json JsonRpcNotification::to_json() const {
  json j;
  j["jsonrpc"] = "2.0";
  j["method"] = method;
  if (!params.empty()) {
    j["params"] = params;
  }
  return j;
}

json make_result_response(const json& id, json result) {
  return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

json make_error_response(const json& id, int code, const std::string& message) {
  return json{{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

// ============================================================
// Content blocks
// ============================================================

ContentBlock ContentBlock::text_block(std::string text) {
  ContentBlock block;
  block.type = "text";
  block.text = std::move(text);
  return block;
}

ContentBlock ContentBlock::image_block(std::string data, std::string mime_type) {
  ContentBlock block;
  block.type = "image";
  block.data = std::move(data);
  block.mime_type = std::move(mime_type);
  return block;
}

json ContentBlock::to_json() const {
  if (type == "image") {
    return json{{"type", "image"}, {"data", data}, {"mimeType", mime_type}};
  }
  // Unknown block types degrade to text
  return json{{"type", "text"}, {"text", text}};
}

ContentBlock ContentBlock::from_json(const json& j) {
  ContentBlock block;
  block.type = j.value("type", "text");
  block.text = j.value("text", "");
  block.data = j.value("data", "");
  block.mime_type = j.value("mimeType", "");
  return block;
}

json to_json(const MessageContent& content) {
  json arr = json::array();
  for (const auto& block : content) {
    arr.push_back(block.to_json());
  }
  return arr;
}

MessageContent text_content(std::string text) {
  return {ContentBlock::text_block(std::move(text))};
}

std::string first_text(const MessageContent& content) {
  for (const auto& block : content) {
    if (block.type == "text") return block.text;
  }
  return "";
}

// ============================================================
// Tool calls and permission requests
// ============================================================

json ToolCall::to_json() const {
  json j;
  j["toolCallId"] = tool_call_id;
  if (title) j["title"] = *title;
  if (kind) j["kind"] = *kind;
  if (status) j["status"] = *status;
  if (!raw_input.is_null()) j["rawInput"] = raw_input;
  return j;
}

ToolCall ToolCall::from_json(const json& j) {
  ToolCall tc;
  tc.tool_call_id = j.value("toolCallId", "");
  tc.title = optional_string(j, "title");
  tc.kind = optional_string(j, "kind");
  tc.status = optional_string(j, "status");
  if (j.contains("rawInput")) {
    tc.raw_input = j["rawInput"];
  }
  return tc;
}

json PermissionOption::to_json() const {
  json j;
  j["optionId"] = option_id;
  j["name"] = name;
  if (kind) j["kind"] = *kind;
  return j;
}

PermissionOption PermissionOption::from_json(const json& j) {
  PermissionOption option;
  option.option_id = j.at("optionId").get<std::string>();
  option.name = j.value("name", option.option_id);
  option.kind = optional_string(j, "kind");
  return option;
}

json RequestPermissionParams::to_json() const {
  json options_json = json::array();
  for (const auto& option : options) {
    options_json.push_back(option.to_json());
  }
  return json{{"sessionId", session_id}, {"toolCall", tool_call.to_json()}, {"options", options_json}};
}

RequestPermissionParams RequestPermissionParams::from_json(const json& j) {
  RequestPermissionParams params;
  params.session_id = j.at("sessionId").get<std::string>();
  params.tool_call = ToolCall::from_json(j.at("toolCall"));
  for (const auto& option : j.value("options", json::array())) {
    params.options.push_back(PermissionOption::from_json(option));
  }
  return params;
}

// ============================================================
// Session notifications
// ============================================================

std::string SessionNotification::update_type() const {
  if (update.is_object() && update.contains("sessionUpdate") && update["sessionUpdate"].is_string()) {
    return update["sessionUpdate"].get<std::string>();
  }
  return "";
}

json SessionNotification::to_json() const {
  return json{{"sessionId", session_id}, {"update", update}};
}

SessionNotification SessionNotification::from_json(const json& j) {
  SessionNotification n;
  n.session_id = j.value("sessionId", "");
  if (j.contains("update")) {
    n.update = j["update"];
  }
  return n;
}

InitializeResult InitializeResult::from_json(const json& j) {
  InitializeResult r;
  r.protocol_version = j.value("protocolVersion", 0);
  r.agent_info = j.value("agentInfo", json());
  r.agent_capabilities = j.value("agentCapabilities", json::object());
  return r;
}

}  // namespace conductor::acp
