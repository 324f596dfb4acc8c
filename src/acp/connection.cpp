#include "acp/connection.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace conductor::acp {

JsonRpcConnection::JsonRpcConnection(std::unique_ptr<Transport> transport, Scheduler& scheduler, ClientCallbacks callbacks)
    : transport_(std::move(transport)), scheduler_(scheduler), callbacks_(std::move(callbacks)) {
  // Transport handlers run on the reader thread; hop onto the event stream
  std::weak_ptr<bool> alive = alive_;
  transport_->set_message_handler([this, alive, &scheduler = scheduler_](const json& msg) {
    scheduler.post([this, alive, msg]() {
      if (alive.expired()) return;
      on_message(msg);
    });
  });
  transport_->set_close_handler([this, alive, &scheduler = scheduler_]() {
    scheduler.post([this, alive]() {
      if (alive.expired()) return;
      on_transport_closed();
    });
  });
}

JsonRpcConnection::~JsonRpcConnection() {
  alive_.reset();
  if (!closed_) {
    closed_ = true;
    transport_->disconnect();
  }
}

// ============================================================
// Client -> agent requests
// ============================================================

void JsonRpcConnection::initialize(InitializeCallback cb) {
  if (!closed_ && !transport_->is_connected()) {
    bool connected = false;
    try {
      connected = transport_->connect().get();
    } catch (const std::exception& e) {
      spdlog::error("[ACP] Transport connect failed: {}", e.what());
    }
    if (!connected) {
      scheduler_.post([cb = std::move(cb)]() {
        cb(Result<InitializeResult>::failure("Failed to spawn agent process"));
      });
      return;
    }
  }

  json params = {
      {"protocolVersion", kProtocolVersion},
      {"clientCapabilities",
       {
           {"fs", {{"readTextFile", false}, {"writeTextFile", false}}},
           {"terminal", false},
       }},
  };

  spdlog::info("[ACP] Sending initialize request (protocol v{})", kProtocolVersion);
  send_request(methods::kInitialize, std::move(params), [cb = std::move(cb)](const JsonRpcResponse& resp) {
    if (!resp.ok()) {
      cb(Result<InitializeResult>::failure(resp.error_message()));
      return;
    }
    auto result = InitializeResult::from_json(resp.result.value_or(json::object()));
    spdlog::info("[ACP] Connected (protocol v{}, agent: {})", result.protocol_version,
                 result.agent_info.is_null() ? "unknown" : result.agent_info.dump());
    cb(Result<InitializeResult>::success(std::move(result)));
  });
}

void JsonRpcConnection::new_session(const std::string& cwd, NewSessionCallback cb) {
  json params = {{"cwd", cwd}, {"mcpServers", json::array()}};

  send_request(methods::kSessionNew, std::move(params), [cb = std::move(cb)](const JsonRpcResponse& resp) {
    if (!resp.ok()) {
      cb(Result<std::string>::failure(resp.error_message()));
      return;
    }
    const auto& result = resp.result.value_or(json::object());
    if (!result.is_object() || !result.contains("sessionId") || !result["sessionId"].is_string()) {
      cb(Result<std::string>::failure("session/new returned no sessionId"));
      return;
    }
    cb(Result<std::string>::success(result["sessionId"].get<std::string>()));
  });
}

void JsonRpcConnection::prompt(const std::string& session_id, const MessageContent& content, PromptCallback cb) {
  json params = {{"sessionId", session_id}, {"prompt", to_json(content)}};

  send_request(methods::kSessionPrompt, std::move(params), [cb = std::move(cb)](const JsonRpcResponse& resp) {
    if (!resp.ok()) {
      cb(Result<std::string>::failure(resp.error_message()));
      return;
    }
    std::string stop_reason = "end_turn";
    if (resp.result && resp.result->is_object()) {
      stop_reason = resp.result->value("stopReason", stop_reason);
    }
    cb(Result<std::string>::success(std::move(stop_reason)));
  });
}

void JsonRpcConnection::cancel(const std::string& session_id) {
  JsonRpcNotification notification{methods::kSessionCancel, {{"sessionId", session_id}}};
  if (closed_ || !transport_->send(notification.to_json())) {
    spdlog::warn("[ACP] Could not send cancel for session {}", session_id);
  }
}

void JsonRpcConnection::close() {
  if (closed_) return;
  closed_ = true;
  transport_->disconnect();
  fail_pending("Connection closed");
}

bool JsonRpcConnection::is_open() const {
  return !closed_ && transport_->is_connected();
}

void JsonRpcConnection::send_request(const std::string& method, json params, ResponseHandler handler) {
  JsonRpcRequest request{method, std::move(params), next_request_id_++};

  if (closed_ || !transport_->send(request.to_json())) {
    JsonRpcResponse err_resp;
    err_resp.id = request.id;
    err_resp.error = json{{"code", error_codes::kTransportError}, {"message", "Transport not connected"}};
    scheduler_.post([handler = std::move(handler), err_resp = std::move(err_resp)]() {
      handler(err_resp);
    });
    return;
  }

  pending_[request.id] = std::move(handler);
}

// ============================================================
// Agent -> client traffic (scheduler thread)
// ============================================================

void JsonRpcConnection::on_message(const json& msg) {
  if (!msg.is_object()) {
    spdlog::warn("[ACP] Ignoring non-object message");
    return;
  }

  if (msg.contains("method") && msg["method"].is_string()) {
    if (msg.contains("id") && !msg["id"].is_null()) {
      handle_request(msg);
    } else {
      handle_notification(msg["method"].get<std::string>(), msg.value("params", json::object()));
    }
    return;
  }

  if (msg.contains("id") && (msg.contains("result") || msg.contains("error"))) {
    if (!msg["id"].is_number_integer()) {
      spdlog::warn("[ACP] Response with unexpected id: {}", msg["id"].dump());
      return;
    }
    auto resp = JsonRpcResponse::from_json(msg);
    auto it = pending_.find(resp.id);
    if (it == pending_.end()) {
      spdlog::warn("[ACP] Response for unknown request id {}", resp.id);
      return;
    }
    auto handler = std::move(it->second);
    pending_.erase(it);
    handler(resp);
    return;
  }

  spdlog::warn("[ACP] Ignoring malformed message: {}", msg.dump());
}

void JsonRpcConnection::handle_request(const json& msg) {
  const json& id = msg["id"];
  auto method = msg["method"].get<std::string>();
  auto params_json = msg.value("params", json::object());

  if (method != methods::kRequestPermission) {
    spdlog::debug("[ACP] Unsupported agent request: {}", method);
    send_error(id, error_codes::kMethodNotFound, "Method not found: " + method);
    return;
  }

  RequestPermissionParams params;
  try {
    params = RequestPermissionParams::from_json(params_json);
  } catch (const json::exception& e) {
    spdlog::warn("[ACP] Invalid permission request: {}", e.what());
    send_error(id, error_codes::kInvalidParams, std::string("Invalid params: ") + e.what());
    return;
  }

  if (!callbacks_.on_request_permission) {
    spdlog::info("[ACP] Auto-approving: {}", params.tool_call.title.value_or(params.tool_call.tool_call_id));
    std::string option_id = params.options.empty() ? "" : params.options.front().option_id;
    send_result(id, json{{"outcome", {{"outcome", "selected"}, {"optionId", option_id}}}});
    return;
  }

  std::weak_ptr<bool> alive = alive_;
  callbacks_.on_request_permission(params, [this, alive, id](const json& result) {
    if (alive.expired()) return;
    send_result(id, result);
  });
}

void JsonRpcConnection::handle_notification(const std::string& method, const json& params) {
  if (method != methods::kSessionUpdate) {
    spdlog::debug("[ACP] Ignoring notification: {}", method);
    return;
  }

  if (callbacks_.on_session_update) {
    callbacks_.on_session_update(SessionNotification::from_json(params));
  }
}

void JsonRpcConnection::send_result(const json& id, json result) {
  if (closed_ || !transport_->send(make_result_response(id, std::move(result)))) {
    spdlog::warn("[ACP] Could not deliver response for request {}", id.dump());
  }
}

void JsonRpcConnection::send_error(const json& id, int code, const std::string& message) {
  if (closed_ || !transport_->send(make_error_response(id, code, message))) {
    spdlog::warn("[ACP] Could not deliver error response for request {}", id.dump());
  }
}

void JsonRpcConnection::on_transport_closed() {
  if (closed_) return;
  closed_ = true;
  spdlog::warn("[ACP] Agent connection closed");

  fail_pending("Agent process exited");
  if (callbacks_.on_close) {
    callbacks_.on_close();
  }
}

void JsonRpcConnection::fail_pending(const std::string& message) {
  auto pending = std::move(pending_);
  pending_.clear();

  for (auto& [id, handler] : pending) {
    JsonRpcResponse err_resp;
    err_resp.id = id;
    err_resp.error = json{{"code", error_codes::kTransportError}, {"message", message}};
    handler(err_resp);
  }
}

// ============================================================
// Factory
// ============================================================

ConnectionFactory make_stdio_connection_factory(Scheduler& scheduler) {
  return [&scheduler](const AgentDefinition& agent, ClientCallbacks callbacks) -> std::shared_ptr<AgentConnection> {
    if (agent.command.empty()) {
      spdlog::error("[ACP] Agent {} has no command configured", agent.id);
      return nullptr;
    }
    auto transport = std::make_unique<StdioTransport>(agent.command, agent.args, agent.env);
    return std::make_shared<JsonRpcConnection>(std::move(transport), scheduler, std::move(callbacks));
  };
}

}  // namespace conductor::acp
