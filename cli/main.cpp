#include <spdlog/spdlog.h>

#include <asio.hpp>
#include <filesystem>
#include <functional>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "acp/connection.hpp"
#include "bus/bus.hpp"
#include "conductor/conductor.hpp"
#include "core/config.hpp"
#include "core/log.hpp"
#include "core/scheduler.hpp"
#include "core/version.hpp"
#include "permission_prompt.h"
#include "session/session_store.hpp"

using namespace conductor;
namespace fs = std::filesystem;

namespace {

struct Options {
  std::optional<fs::path> config_path;
  std::optional<std::string> agent_id;
  std::optional<std::string> resume_id;
  fs::path cwd = fs::current_path();
  bool verbose = false;
};

void print_usage() {
  std::cout << "Usage: acp-conductor [options]\n"
            << "  --config PATH   config file (default: " << config_paths::config_file().string() << ")\n"
            << "  --agent ID      agent for new sessions\n"
            << "  --cwd DIR       working directory for new sessions\n"
            << "  --resume ID     resume a stored session\n"
            << "  --verbose       debug logging\n"
            << "  --version       print version\n";
}

void print_help() {
  std::cout << "Commands:\n"
            << "  /help              show this help\n"
            << "  /sessions          list stored sessions\n"
            << "  /new [agent]       create a session\n"
            << "  /resume <id>       resume a stored session\n"
            << "  /delete <id>       delete a stored session\n"
            << "  /agent <id>        switch the current session's agent\n"
            << "  /title <text>      rename the current session\n"
            << "  /history           show the current session's transcript\n"
            << "  /cancel            cancel the current request\n"
            << "  /status            show status\n"
            << "  /agents            list configured agents\n"
            << "  /quit              exit\n";
}

struct CliState {
  std::mutex mutex;
  std::optional<SessionMeta> current;
  conductor_cli::PermissionPrompt permissions{std::cout};
  std::map<std::string, std::string> tool_titles;  // toolCallId -> title
};

// Run fn on the scheduler thread and wait for its value
template <typename T>
T call(Scheduler& scheduler, std::function<T()> fn) {
  std::promise<T> promise;
  auto future = promise.get_future();
  scheduler.post([&promise, &fn]() {
    try {
      promise.set_value(fn());
    } catch (const std::exception&) {
      promise.set_exception(std::current_exception());
    }
  });
  return future.get();
}

Result<SessionMeta> wait_meta(Scheduler& scheduler, std::function<void(Conductor::MetaCallback)> op) {
  auto promise = std::make_shared<std::promise<Result<SessionMeta>>>();
  auto future = promise->get_future();
  scheduler.post([op = std::move(op), promise]() {
    op([promise](Result<SessionMeta> result) { promise->set_value(std::move(result)); });
  });
  return future.get();
}

std::string short_id(const std::string& id) {
  return id.substr(0, 8);
}

std::string user_text(const json& update) {
  if (!update.contains("content") || !update["content"].is_array()) return "";
  acp::MessageContent content;
  for (const auto& block : update["content"]) {
    content.push_back(acp::ContentBlock::from_json(block));
  }
  return acp::first_text(content);
}

void subscribe_output(CliState& state) {
  auto& bus = Bus::instance();

  bus.subscribe<events::SessionUpdated>([&state](const events::SessionUpdated& e) {
    {
      std::lock_guard lock(state.mutex);
      if (!state.current || state.current->id != e.session_id) return;
    }
    const auto& update = e.update;
    auto type = update.value("sessionUpdate", "");
    if (type == "agent_message_chunk") {
      if (update.contains("content") && update["content"].is_object() && update["content"].value("type", "") == "text") {
        std::cout << update["content"].value("text", "") << std::flush;
      }
    } else if (type == "tool_call") {
      auto title = update.value("title", "tool");
      {
        std::lock_guard lock(state.mutex);
        state.tool_titles[update.value("toolCallId", "")] = title;
      }
      std::cout << "\n[tool] " << title << " [" << update.value("status", "") << "]\n";
    } else if (type == "tool_call_update") {
      std::string title;
      {
        std::lock_guard lock(state.mutex);
        auto id = update.value("toolCallId", "");
        auto it = state.tool_titles.find(id);
        title = it != state.tool_titles.end() ? it->second : id;
      }
      auto status = update.value("status", "");
      if (!status.empty()) std::cout << "[tool] " << title << " [" << status << "]\n";
    }
  });

  bus.subscribe<events::PermissionRequested>([&state](const events::PermissionRequested& e) {
    std::lock_guard lock(state.mutex);
    state.permissions.add(e);
  });

  bus.subscribe<events::PermissionResolved>([&state](const events::PermissionResolved& e) {
    std::lock_guard lock(state.mutex);
    state.permissions.resolved(e.request_id, e.timed_out);
  });

  bus.subscribe<events::AgentExited>([](const events::AgentExited& e) {
    std::cout << "\nAgent " << e.agent_id << " exited (session " << short_id(e.session_id) << ")\n";
  });
}

}  // namespace

int main(int argc, char* argv[]) {
  Options opts;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto next = [&]() -> std::optional<std::string> {
      if (i + 1 < argc) return std::string(argv[++i]);
      std::cerr << "Missing value for " << arg << "\n";
      return std::nullopt;
    };

    if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else if (arg == "--version") {
      std::cout << "acp-conductor " << kVersion << "\n";
      return 0;
    } else if (arg == "--verbose" || arg == "-v") {
      opts.verbose = true;
    } else if (arg == "--config") {
      auto v = next();
      if (!v) return 1;
      opts.config_path = *v;
    } else if (arg == "--agent") {
      auto v = next();
      if (!v) return 1;
      opts.agent_id = *v;
    } else if (arg == "--cwd") {
      auto v = next();
      if (!v) return 1;
      opts.cwd = fs::absolute(*v);
    } else if (arg == "--resume") {
      auto v = next();
      if (!v) return 1;
      opts.resume_id = *v;
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      print_usage();
      return 1;
    }
  }

  // ===== 加载配置 =====
  Config config = opts.config_path ? Config::load(*opts.config_path) : Config::load_default();
  if (opts.verbose) config.log_level = "debug";
  init_logging(config, opts.verbose);

  std::string default_agent = opts.agent_id.value_or(config.default_agent);
  if (!config.get_agent(default_agent)) {
    std::cerr << "Unknown agent: " << default_agent << "\n";
    return 1;
  }

  std::shared_ptr<SessionStore> store;
  if (config.persist_sessions) {
    auto json_store = std::make_shared<JsonSessionStore>(config.sessions_dir());
    try {
      json_store->initialize();
    } catch (const std::exception& e) {
      std::cerr << "Failed to open session store: " << e.what() << "\n";
      return 1;
    }
    store = json_store;
  } else {
    store = std::make_shared<MemorySessionStore>();
  }

  // ===== 事件循环 =====
  asio::io_context io_ctx;
  AsioScheduler scheduler(io_ctx);
  std::thread io_thread([&io_ctx]() {
    auto work = asio::make_work_guard(io_ctx);
    io_ctx.run();
  });

  auto conductor = std::make_unique<Conductor>(scheduler, config, store, acp::make_stdio_connection_factory(scheduler));

  CliState state;
  subscribe_output(state);

  auto set_current = [&state](const SessionMeta& meta) {
    std::lock_guard lock(state.mutex);
    state.current = meta;
  };
  auto current_id = [&state]() -> std::optional<SessionId> {
    std::lock_guard lock(state.mutex);
    if (!state.current) return std::nullopt;
    return state.current->id;
  };

  auto new_session = [&](const std::string& agent_id) {
    std::cout << "Starting " << agent_id << " in " << opts.cwd.string() << "...\n";
    auto result = wait_meta(scheduler, [&conductor, &opts, agent_id](Conductor::MetaCallback cb) {
      conductor->create_session(opts.cwd.string(), agent_id, std::move(cb));
    });
    if (result.failed()) {
      std::cerr << "Failed to create session: " << *result.error << "\n";
      return;
    }
    set_current(*result.value);
    std::cout << "Session " << short_id(result.value->id) << " ready\n";
  };

  auto resume = [&](const std::string& id) {
    auto result = wait_meta(scheduler, [&conductor, id](Conductor::MetaCallback cb) {
      conductor->resume_session(id, std::move(cb));
    });
    if (result.failed()) {
      std::cerr << "Failed to resume session: " << *result.error << "\n";
      return;
    }
    set_current(*result.value);
    std::cout << "Resumed session " << short_id(result.value->id) << " (" << result.value->agent_id << ")\n";
  };

  std::cout << "acp-conductor " << kVersion << " - type /help for commands\n";
  if (opts.resume_id) {
    resume(*opts.resume_id);
  } else {
    new_session(default_agent);
  }

  std::string line;
  bool running = true;
  while (running && std::getline(std::cin, line)) {
    if (line.empty()) continue;

    // Open permission requests take the next line
    std::optional<PermissionDecision> decision;
    bool answering = false;
    {
      std::lock_guard lock(state.mutex);
      if (state.permissions.active() && line[0] != '/') {
        answering = true;
        decision = state.permissions.answer(line);
      }
    }
    if (answering) {
      if (decision) {
        scheduler.post([&conductor, d = *decision]() { conductor->handle_permission_response(d); });
      }
      continue;
    }

    if (line[0] != '/') {
      auto id = current_id();
      if (!id) {
        std::cout << "No active session. Use /new or /resume first.\n";
        continue;
      }
      auto content = acp::text_content(line);
      scheduler.post([&conductor, id = *id, content]() {
        conductor->send_prompt(id, content, PromptOptions{}, [](Result<std::string> result) {
          if (result.failed()) {
            std::cout << "\nError: " << *result.error << "\n";
            return;
          }
          std::cout << "\n[" << *result.value << "]\n";
        });
      });
      continue;
    }

    auto space = line.find(' ');
    auto cmd = line.substr(1, space == std::string::npos ? std::string::npos : space - 1);
    auto arg = space == std::string::npos ? std::string() : line.substr(space + 1);

    try {
      if (cmd == "help" || cmd == "h" || cmd == "?") {
        print_help();
      } else if (cmd == "sessions" || cmd == "ls") {
        auto sessions = call<std::vector<SessionMeta>>(scheduler, [&conductor]() { return conductor->list_sessions(); });
        if (sessions.empty()) std::cout << "No sessions.\n";
        for (const auto& s : sessions) {
          std::cout << "  " << short_id(s.id) << "  " << s.agent_id << "  " << to_string(s.status) << "  "
                    << s.updated_at << "  " << s.working_directory << "  (" << s.id << ")\n";
        }
      } else if (cmd == "new" || cmd == "n") {
        new_session(arg.empty() ? default_agent : arg);
      } else if (cmd == "resume" || cmd == "r") {
        if (arg.empty()) {
          std::cout << "Usage: /resume <id>\n";
        } else {
          resume(arg);
        }
      } else if (cmd == "delete" || cmd == "rm") {
        if (arg.empty()) {
          std::cout << "Usage: /delete <id>\n";
        } else {
          call<bool>(scheduler, [&conductor, arg]() {
            conductor->delete_session(arg);
            return true;
          });
          if (current_id() == arg) {
            std::lock_guard lock(state.mutex);
            state.current.reset();
          }
          std::cout << "Deleted " << arg << "\n";
        }
      } else if (cmd == "agent") {
        auto id = current_id();
        if (!id || arg.empty()) {
          std::cout << "Usage: /agent <id> (requires an active session)\n";
        } else {
          auto result = wait_meta(scheduler, [&conductor, id = *id, arg](Conductor::MetaCallback cb) {
            conductor->switch_agent(id, arg, std::move(cb));
          });
          if (result.failed()) {
            std::cerr << "Failed to switch agent: " << *result.error << "\n";
          } else {
            set_current(*result.value);
            std::cout << "Switched to " << arg << "\n";
          }
        }
      } else if (cmd == "title") {
        auto id = current_id();
        if (!id || arg.empty()) {
          std::cout << "Usage: /title <text> (requires an active session)\n";
        } else {
          try {
            auto meta = call<SessionMeta>(scheduler, [&conductor, id = *id, arg]() {
              return conductor->update_session_meta(id, SessionMetaUpdate{.title = arg});
            });
            set_current(meta);
            std::cout << "Renamed to " << arg << "\n";
          } catch (const std::exception& e) {
            std::cerr << "Failed to rename session: " << e.what() << "\n";
          }
        }
      } else if (cmd == "history") {
        auto id = current_id();
        if (!id) {
          std::cout << "No active session.\n";
        } else {
          auto data =
              call<std::optional<SessionData>>(scheduler, [&conductor, id = *id]() { return conductor->get_session_data(id); });
          if (data) {
            for (const auto& u : data->updates) {
              const auto& inner = u.update.contains("update") ? u.update["update"] : json::object();
              if (inner.value("sessionUpdate", "") != "user_message" || inner.value("_internal", false)) continue;
              auto text = user_text(inner);
              std::cout << "  " << u.timestamp << "  " << text << "\n";
            }
          }
        }
      } else if (cmd == "cancel" || cmd == "c") {
        auto id = current_id();
        if (!id) {
          std::cout << "No active session.\n";
        } else {
          scheduler.post([&conductor, id = *id]() {
            conductor->cancel_request(id, [](Result<void>) { std::cout << "Cancel sent.\n"; });
          });
        }
      } else if (cmd == "status" || cmd == "s") {
        auto running_ids = call<std::vector<SessionId>>(scheduler, [&conductor]() { return conductor->running_session_ids(); });
        auto processing_ids =
            call<std::vector<SessionId>>(scheduler, [&conductor]() { return conductor->processing_session_ids(); });
        std::cout << "Default agent: " << default_agent << "\n"
                  << "Running sessions: " << running_ids.size() << "\n"
                  << "Processing: " << processing_ids.size() << "\n";
        std::lock_guard lock(state.mutex);
        if (state.current) {
          std::cout << "Current session: " << state.current->id << " (" << state.current->agent_id << ", "
                    << state.current->working_directory << ")\n";
        } else {
          std::cout << "Current session: none\n";
        }
      } else if (cmd == "agents") {
        for (const auto& [id, agent] : config.agents) {
          std::cout << "  " << id << "  " << agent.name << "  " << agent.command << (agent.enabled ? "" : "  (disabled)")
                    << (id == default_agent ? "  *" : "") << "\n";
        }
      } else if (cmd == "quit" || cmd == "exit" || cmd == "q") {
        running = false;
      } else {
        std::cout << "Unknown command: /" << cmd << " (try /help)\n";
      }
    } catch (const std::exception& e) {
      std::cerr << "Error: " << e.what() << "\n";
    }
  }

  // ===== 清理 =====
  call<bool>(scheduler, [&conductor]() {
    conductor->stop_all_sessions();
    conductor.reset();
    return true;
  });
  io_ctx.stop();
  if (io_thread.joinable()) io_thread.join();

  spdlog::shutdown();
  return 0;
}
