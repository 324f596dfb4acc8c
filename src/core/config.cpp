#include "core/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace conductor {

namespace fs = std::filesystem;

namespace {

json agent_to_json(const AgentDefinition& agent) {
  json j;
  j["name"] = agent.name;
  j["command"] = agent.command;
  j["args"] = agent.args;
  if (!agent.env.empty()) {
    j["env"] = agent.env;
  }
  j["enabled"] = agent.enabled;
  return j;
}

AgentDefinition agent_from_json(const std::string& id, const json& j) {
  AgentDefinition agent;
  agent.id = id;
  agent.name = j.value("name", id);
  agent.command = j.value("command", "");
  if (j.contains("args") && j["args"].is_array()) {
    agent.args = j["args"].get<std::vector<std::string>>();
  }
  if (j.contains("env") && j["env"].is_object()) {
    agent.env = j["env"].get<std::map<std::string, std::string>>();
  }
  agent.enabled = j.value("enabled", true);
  return agent;
}

std::chrono::milliseconds read_ms(const json& j, const char* key, std::chrono::milliseconds fallback) {
  if (j.contains(key) && j[key].is_number_integer()) {
    auto ms = j[key].get<int64_t>();
    if (ms < 1) {
      spdlog::warn("[Config] timing.{} must be at least 1ms (got {}), using 1ms", key, ms);
      ms = 1;
    }
    return std::chrono::milliseconds(ms);
  }
  return fallback;
}

}  // namespace

std::map<std::string, AgentDefinition> Config::default_agents() {
  std::map<std::string, AgentDefinition> agents;
  agents["claude-code"] = AgentDefinition{
      .id = "claude-code",
      .name = "Claude Code",
      .command = "claude-code-acp",
  };
  agents["opencode"] = AgentDefinition{
      .id = "opencode",
      .name = "OpenCode",
      .command = "opencode",
      .args = {"acp"},
  };
  agents["codex"] = AgentDefinition{
      .id = "codex",
      .name = "Codex",
      .command = "codex-acp",
  };
  return agents;
}

std::optional<AgentDefinition> Config::get_agent(const std::string& id) const {
  auto it = agents.find(id);
  if (it == agents.end()) {
    return std::nullopt;
  }
  return it->second;
}

fs::path Config::sessions_dir() const {
  if (storage_dir) {
    return *storage_dir;
  }
  return config_paths::config_dir() / "sessions";
}

Config Config::from_json(const json& j) {
  Config config;

  if (j.contains("agents") && j["agents"].is_object()) {
    // Configured agents override (or extend) the built-in ones
    for (const auto& [id, agent_json] : j["agents"].items()) {
      config.agents[id] = agent_from_json(id, agent_json);
    }
  }

  config.default_agent = j.value("default_agent", config.default_agent);
  config.log_level = j.value("log_level", config.log_level);
  if (j.contains("log_file") && j["log_file"].is_string()) {
    config.log_file = j["log_file"].get<std::string>();
  }
  if (j.contains("storage_dir") && j["storage_dir"].is_string()) {
    config.storage_dir = fs::path(j["storage_dir"].get<std::string>());
  }
  config.persist_sessions = j.value("persist_sessions", config.persist_sessions);

  if (j.contains("timing") && j["timing"].is_object()) {
    const auto& t = j["timing"];
    auto& timing = config.timing;
    timing.permission_timeout = read_ms(t, "permission_timeout_ms", timing.permission_timeout);
    timing.question_settle_delay = read_ms(t, "question_settle_delay_ms", timing.question_settle_delay);
    timing.handled_retention = read_ms(t, "handled_retention_ms", timing.handled_retention);
    timing.cancel_poll_interval = read_ms(t, "cancel_poll_interval_ms", timing.cancel_poll_interval);
    timing.cancel_poll_max = read_ms(t, "cancel_poll_max_ms", timing.cancel_poll_max);
    timing.resubmit_settle_delay = read_ms(t, "resubmit_settle_delay_ms", timing.resubmit_settle_delay);
    timing.hang_guard_tool = t.value("hang_guard_tool", timing.hang_guard_tool);
  }

  return config;
}

json Config::to_json() const {
  json j;

  json agents_json = json::object();
  for (const auto& [id, agent] : agents) {
    agents_json[id] = agent_to_json(agent);
  }
  j["agents"] = agents_json;
  j["default_agent"] = default_agent;
  j["log_level"] = log_level;
  if (log_file) {
    j["log_file"] = *log_file;
  }
  if (storage_dir) {
    j["storage_dir"] = storage_dir->string();
  }
  j["persist_sessions"] = persist_sessions;

  j["timing"] = {
      {"permission_timeout_ms", timing.permission_timeout.count()},
      {"question_settle_delay_ms", timing.question_settle_delay.count()},
      {"handled_retention_ms", timing.handled_retention.count()},
      {"cancel_poll_interval_ms", timing.cancel_poll_interval.count()},
      {"cancel_poll_max_ms", timing.cancel_poll_max.count()},
      {"resubmit_settle_delay_ms", timing.resubmit_settle_delay.count()},
      {"hang_guard_tool", timing.hang_guard_tool},
  };

  return j;
}

Config Config::load(const fs::path& path) {
  if (!fs::exists(path)) {
    spdlog::debug("[Config] No config file at {}, using defaults", path.string());
    return Config{};
  }

  try {
    std::ifstream ifs(path);
    auto j = json::parse(ifs);
    return from_json(j);
  } catch (const std::exception& e) {
    spdlog::error("[Config] Failed to load {}: {}", path.string(), e.what());
    return Config{};
  }
}

Config Config::load_default() {
  return load(config_paths::config_file());
}

void Config::save(const fs::path& path) const {
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path());
  }

  std::ofstream ofs(path);
  if (!ofs.is_open()) {
    throw std::runtime_error("Cannot write config file: " + path.string());
  }
  ofs << to_json().dump(2);
}

// ============================================================
// config_paths
// ============================================================

namespace config_paths {

fs::path home_dir() {
  if (const char* home = std::getenv("HOME")) {
    return fs::path(home);
  }
  return fs::current_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "acp-conductor";
}

fs::path config_file() {
  return config_dir() / "config.json";
}

}  // namespace config_paths

}  // namespace conductor
