#pragma once

#include <functional>
#include <future>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace conductor::acp {

using json = nlohmann::json;

// Transport state
enum class TransportState { Disconnected, Connecting, Connected, Failed };

std::string to_string(TransportState state);

// Bidirectional newline-delimited JSON channel to an agent.
// Handlers are invoked from the transport's reader thread.
class Transport {
 public:
  virtual ~Transport() = default;

  // Returns false when the message could not be written
  virtual bool send(const json& message) = 0;

  using MessageHandler = std::function<void(const json& message)>;
  virtual void set_message_handler(MessageHandler handler) = 0;

  // Invoked once when the peer closes the channel (not on disconnect())
  using CloseHandler = std::function<void()>;
  virtual void set_close_handler(CloseHandler handler) = 0;

  // Lifecycle
  virtual std::future<bool> connect() = 0;
  virtual void disconnect() = 0;

  // State
  virtual TransportState state() const = 0;
  virtual bool is_connected() const {
    return state() == TransportState::Connected;
  }
};

// Stdio transport: spawns the agent and talks over its stdin/stdout.
// The agent's stderr is inherited.
class StdioTransport : public Transport {
 public:
  StdioTransport(std::string command, std::vector<std::string> args, std::map<std::string, std::string> env = {});
  ~StdioTransport() override;

  bool send(const json& message) override;
  void set_message_handler(MessageHandler handler) override;
  void set_close_handler(CloseHandler handler) override;

  std::future<bool> connect() override;
  void disconnect() override;
  TransportState state() const override;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace conductor::acp
