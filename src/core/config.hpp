#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace conductor {

using json = nlohmann::json;

// An ACP agent binary the conductor knows how to launch
struct AgentDefinition {
  std::string id;
  std::string name;
  std::string command;
  std::vector<std::string> args;
  std::map<std::string, std::string> env;
  bool enabled = true;
};

// Timing constants of the permission correlator and the two workarounds
struct TimingConfig {
  std::chrono::milliseconds permission_timeout{5 * 60 * 1000};
  std::chrono::milliseconds question_settle_delay{200};
  std::chrono::milliseconds handled_retention{60 * 1000};
  std::chrono::milliseconds cancel_poll_interval{100};
  std::chrono::milliseconds cancel_poll_max{2000};
  std::chrono::milliseconds resubmit_settle_delay{200};

  // Tool title whose in-progress update hangs the agent forever
  std::string hang_guard_tool = "question";
};

struct Config {
  std::map<std::string, AgentDefinition> agents = default_agents();
  std::string default_agent = "opencode";

  std::string log_level = "info";
  std::optional<std::string> log_file;

  std::optional<std::filesystem::path> storage_dir;
  bool persist_sessions = true;

  TimingConfig timing;

  std::optional<AgentDefinition> get_agent(const std::string& id) const;

  // storage_dir if set, otherwise ~/.config/acp-conductor/sessions
  std::filesystem::path sessions_dir() const;

  static Config load(const std::filesystem::path& path);
  static Config load_default();
  static Config from_json(const json& j);

  json to_json() const;
  void save(const std::filesystem::path& path) const;

  static std::map<std::string, AgentDefinition> default_agents();
};

namespace config_paths {

std::filesystem::path home_dir();
std::filesystem::path config_dir();
std::filesystem::path config_file();

}  // namespace config_paths

}  // namespace conductor
