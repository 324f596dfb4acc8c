#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

#include "acp/protocol.hpp"
#include "acp/transport.hpp"
#include "core/config.hpp"
#include "core/scheduler.hpp"
#include "core/types.hpp"

namespace conductor::acp {

// Writes the `result` of a session/request_permission call back to the agent
using PermissionResponder = std::function<void(const json& result)>;

// Client-side handlers for traffic initiated by the agent.
// All callbacks run on the scheduler thread.
struct ClientCallbacks {
  std::function<void(const SessionNotification&)> on_session_update;
  std::function<void(const RequestPermissionParams&, PermissionResponder)> on_request_permission;
  std::function<void()> on_close;
};

// Client side of one ACP connection to one agent process
class AgentConnection {
 public:
  virtual ~AgentConnection() = default;

  using InitializeCallback = std::function<void(Result<InitializeResult>)>;
  using NewSessionCallback = std::function<void(Result<std::string>)>;  // protocol session ID
  using PromptCallback = std::function<void(Result<std::string>)>;      // stop reason

  virtual void initialize(InitializeCallback cb) = 0;
  virtual void new_session(const std::string& cwd, NewSessionCallback cb) = 0;
  virtual void prompt(const std::string& session_id, const MessageContent& content, PromptCallback cb) = 0;
  virtual void cancel(const std::string& session_id) = 0;

  // Stops the agent and fails every outstanding request
  virtual void close() = 0;
  virtual bool is_open() const = 0;
};

// JSON-RPC 2.0 implementation of AgentConnection over a Transport
class JsonRpcConnection : public AgentConnection {
 public:
  JsonRpcConnection(std::unique_ptr<Transport> transport, Scheduler& scheduler, ClientCallbacks callbacks);
  ~JsonRpcConnection() override;

  void initialize(InitializeCallback cb) override;
  void new_session(const std::string& cwd, NewSessionCallback cb) override;
  void prompt(const std::string& session_id, const MessageContent& content, PromptCallback cb) override;
  void cancel(const std::string& session_id) override;

  void close() override;
  bool is_open() const override;

  size_t pending_requests() const {
    return pending_.size();
  }

 private:
  using ResponseHandler = std::function<void(const JsonRpcResponse&)>;

  void send_request(const std::string& method, json params, ResponseHandler handler);

  // Scheduler-thread entry points for transport traffic
  void on_message(const json& msg);
  void on_transport_closed();

  void handle_request(const json& msg);
  void handle_notification(const std::string& method, const json& params);
  void send_result(const json& id, json result);
  void send_error(const json& id, int code, const std::string& message);

  void fail_pending(const std::string& message);

  std::unique_ptr<Transport> transport_;
  Scheduler& scheduler_;
  ClientCallbacks callbacks_;

  bool closed_ = false;
  int64_t next_request_id_ = 1;
  std::unordered_map<int64_t, ResponseHandler> pending_;

  // Expires on destruction; queued transport tasks check it before touching `this`
  std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

// Creates a connection for an agent definition; nullptr when it cannot be created
using ConnectionFactory = std::function<std::shared_ptr<AgentConnection>(const AgentDefinition& agent, ClientCallbacks callbacks)>;

// Factory spawning each agent as a stdio subprocess
ConnectionFactory make_stdio_connection_factory(Scheduler& scheduler);

}  // namespace conductor::acp
