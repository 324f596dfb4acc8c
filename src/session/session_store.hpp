#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace conductor {

using json = nlohmann::json;

enum class SessionStatus { Active, Completed, Error };

std::string to_string(SessionStatus status);
SessionStatus parse_session_status(const std::string& s);

struct SessionMeta {
  SessionId id;
  std::string agent_session_id;  // protocol session ID of the last agent run
  std::string agent_id;
  std::string working_directory;
  std::string created_at;
  std::string updated_at;
  SessionStatus status = SessionStatus::Active;
  std::optional<std::string> title;
  int message_count = 0;

  json to_json() const;
  static SessionMeta from_json(const json& j);
};

struct StoredUpdate {
  std::string timestamp;
  json update;  // {"sessionId": ..., "update": {"sessionUpdate": ..., ...}}

  json to_json() const;
  static StoredUpdate from_json(const json& j);
};

struct SessionData {
  SessionMeta session;
  std::vector<StoredUpdate> updates;

  json to_json() const;
  static SessionData from_json(const json& j);
};

struct CreateSessionParams {
  std::string agent_session_id;
  std::string agent_id;
  std::string working_directory;
};

// Only the fields that are set get applied
struct SessionMetaUpdate {
  std::optional<std::string> title;
  std::optional<SessionStatus> status;
  std::optional<std::string> agent_session_id;
  std::optional<std::string> agent_id;
};

struct ListSessionsOptions {
  std::optional<std::string> agent_id;
  std::optional<SessionStatus> status;
  size_t offset = 0;
  std::optional<size_t> limit;
};

// Current UTC time as ISO-8601 with milliseconds, e.g. 2024-05-01T12:00:00.123Z
std::string iso_timestamp_now();

// Durable session records: one metadata entry per session plus its ordered
// update log. Mutating calls on an unknown session throw std::runtime_error.
class SessionStore {
 public:
  virtual ~SessionStore() = default;

  virtual SessionMeta create(const CreateSessionParams& params) = 0;
  virtual std::optional<SessionData> get(const SessionId& id) = 0;

  // Sorted by updated_at, most recent first
  virtual std::vector<SessionMeta> list(const ListSessionsOptions& options = {}) const = 0;

  virtual StoredUpdate append_update(const SessionId& id, const json& notification) = 0;
  virtual SessionMeta update_meta(const SessionId& id, const SessionMetaUpdate& update) = 0;
  virtual void remove(const SessionId& id) = 0;

  virtual std::optional<SessionMeta> find_by_agent_session_id(const std::string& agent_session_id) const = 0;
};

// In-memory store, used as is when persistence is disabled
class MemorySessionStore : public SessionStore {
 public:
  using TimestampFn = std::function<std::string()>;

  explicit MemorySessionStore(TimestampFn timestamp = iso_timestamp_now);

  SessionMeta create(const CreateSessionParams& params) override;
  std::optional<SessionData> get(const SessionId& id) override;
  std::vector<SessionMeta> list(const ListSessionsOptions& options = {}) const override;
  StoredUpdate append_update(const SessionId& id, const json& notification) override;
  SessionMeta update_meta(const SessionId& id, const SessionMetaUpdate& update) override;
  void remove(const SessionId& id) override;
  std::optional<SessionMeta> find_by_agent_session_id(const std::string& agent_session_id) const override;

 protected:
  // Persistence hooks, called with mutex_ held
  virtual void save_index() {}
  virtual void save_session(const SessionData&) {}
  virtual std::optional<SessionData> load_session(const SessionId&) {
    return std::nullopt;
  }
  virtual void delete_session_file(const SessionId&) {}

  SessionData* loaded_locked(const SessionId& id);
  static int count_messages(const std::vector<StoredUpdate>& updates);

  mutable std::mutex mutex_;
  TimestampFn timestamp_;
  std::map<SessionId, SessionMeta> index_;
  std::map<SessionId, SessionData> loaded_;
};

// Store persisted as JSON files:
//   <dir>/index.json       session metadata list
//   <dir>/data/<id>.json   full session data
// Every write goes to a temp file first and is renamed into place.
class JsonSessionStore : public MemorySessionStore {
 public:
  explicit JsonSessionStore(std::filesystem::path dir, TimestampFn timestamp = iso_timestamp_now);

  // Creates the directories and loads the index; a corrupt index starts empty
  void initialize();

  const std::filesystem::path& dir() const {
    return dir_;
  }

 protected:
  void save_index() override;
  void save_session(const SessionData& data) override;
  std::optional<SessionData> load_session(const SessionId& id) override;
  void delete_session_file(const SessionId& id) override;

 private:
  std::filesystem::path data_path(const SessionId& id) const;
  static void atomic_write(const std::filesystem::path& path, const std::string& content);

  std::filesystem::path dir_;
};

}  // namespace conductor
