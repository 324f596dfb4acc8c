#include "session/session_store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <stdexcept>

namespace conductor {

namespace fs = std::filesystem;

std::string to_string(SessionStatus status) {
  switch (status) {
    case SessionStatus::Active:
      return "active";
    case SessionStatus::Completed:
      return "completed";
    case SessionStatus::Error:
      return "error";
  }
  return "active";
}

SessionStatus parse_session_status(const std::string& s) {
  if (s == "completed") return SessionStatus::Completed;
  if (s == "error") return SessionStatus::Error;
  return SessionStatus::Active;
}

std::string iso_timestamp_now() {
  auto now = std::chrono::system_clock::now();
  auto secs = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

  std::tm tm{};
  gmtime_r(&secs, &tm);

  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  char out[40];
  std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ms));
  return out;
}

// ============================================================
// JSON shapes
// ============================================================

json SessionMeta::to_json() const {
  json j = {
      {"id", id},
      {"agentSessionId", agent_session_id},
      {"agentId", agent_id},
      {"workingDirectory", working_directory},
      {"createdAt", created_at},
      {"updatedAt", updated_at},
      {"status", conductor::to_string(status)},
      {"messageCount", message_count},
  };
  if (title) j["title"] = *title;
  return j;
}

SessionMeta SessionMeta::from_json(const json& j) {
  SessionMeta m;
  m.id = j.at("id").get<std::string>();
  m.agent_session_id = j.value("agentSessionId", "");
  m.agent_id = j.value("agentId", "");
  m.working_directory = j.value("workingDirectory", "");
  m.created_at = j.value("createdAt", "");
  m.updated_at = j.value("updatedAt", "");
  m.status = parse_session_status(j.value("status", "active"));
  if (j.contains("title") && j["title"].is_string()) {
    m.title = j["title"].get<std::string>();
  }
  m.message_count = j.value("messageCount", 0);
  return m;
}

json StoredUpdate::to_json() const {
  return {{"timestamp", timestamp}, {"update", update}};
}

StoredUpdate StoredUpdate::from_json(const json& j) {
  StoredUpdate u;
  u.timestamp = j.value("timestamp", "");
  u.update = j.contains("update") ? j["update"] : json::object();
  return u;
}

json SessionData::to_json() const {
  json updates_json = json::array();
  for (const auto& u : updates) {
    updates_json.push_back(u.to_json());
  }
  return {{"session", session.to_json()}, {"updates", updates_json}};
}

SessionData SessionData::from_json(const json& j) {
  SessionData data;
  data.session = SessionMeta::from_json(j.at("session"));
  if (j.contains("updates") && j["updates"].is_array()) {
    for (const auto& u : j["updates"]) {
      data.updates.push_back(StoredUpdate::from_json(u));
    }
  }
  return data;
}

// ============================================================
// MemorySessionStore
// ============================================================

MemorySessionStore::MemorySessionStore(TimestampFn timestamp) : timestamp_(std::move(timestamp)) {}

SessionMeta MemorySessionStore::create(const CreateSessionParams& params) {
  std::lock_guard lock(mutex_);

  auto now = timestamp_();
  SessionMeta meta;
  meta.id = UUID::generate();
  meta.agent_session_id = params.agent_session_id;
  meta.agent_id = params.agent_id;
  meta.working_directory = params.working_directory;
  meta.created_at = now;
  meta.updated_at = now;
  meta.status = SessionStatus::Active;
  meta.message_count = 0;

  index_[meta.id] = meta;
  auto& data = loaded_[meta.id];
  data.session = meta;

  save_index();
  save_session(data);
  return meta;
}

SessionData* MemorySessionStore::loaded_locked(const SessionId& id) {
  auto it = loaded_.find(id);
  if (it != loaded_.end()) return &it->second;

  if (!index_.contains(id)) return nullptr;

  auto data = load_session(id);
  if (!data) return nullptr;
  return &(loaded_[id] = std::move(*data));
}

std::optional<SessionData> MemorySessionStore::get(const SessionId& id) {
  std::lock_guard lock(mutex_);
  auto* data = loaded_locked(id);
  if (!data) return std::nullopt;
  return *data;
}

std::vector<SessionMeta> MemorySessionStore::list(const ListSessionsOptions& options) const {
  std::vector<SessionMeta> sessions;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [id, meta] : index_) {
      if (options.agent_id && meta.agent_id != *options.agent_id) continue;
      if (options.status && meta.status != *options.status) continue;
      sessions.push_back(meta);
    }
  }

  // ISO-8601 timestamps sort lexicographically
  std::stable_sort(sessions.begin(), sessions.end(),
                   [](const SessionMeta& a, const SessionMeta& b) { return a.updated_at > b.updated_at; });

  if (options.offset >= sessions.size()) return {};
  auto first = sessions.begin() + static_cast<std::ptrdiff_t>(options.offset);
  auto last = sessions.end();
  if (options.limit && *options.limit < static_cast<size_t>(last - first)) {
    last = first + static_cast<std::ptrdiff_t>(*options.limit);
  }
  return std::vector<SessionMeta>(first, last);
}

StoredUpdate MemorySessionStore::append_update(const SessionId& id, const json& notification) {
  std::lock_guard lock(mutex_);
  auto* data = loaded_locked(id);
  if (!data) {
    throw std::runtime_error("Session not found: " + id);
  }

  StoredUpdate stored;
  stored.timestamp = timestamp_();
  stored.update = notification;
  data->updates.push_back(stored);

  data->session.updated_at = stored.timestamp;
  data->session.message_count = count_messages(data->updates);
  index_[id] = data->session;

  save_session(*data);
  save_index();
  return stored;
}

SessionMeta MemorySessionStore::update_meta(const SessionId& id, const SessionMetaUpdate& update) {
  std::lock_guard lock(mutex_);
  auto* data = loaded_locked(id);
  if (!data) {
    throw std::runtime_error("Session not found: " + id);
  }

  auto& meta = data->session;
  if (update.title) meta.title = *update.title;
  if (update.status) meta.status = *update.status;
  if (update.agent_session_id) meta.agent_session_id = *update.agent_session_id;
  if (update.agent_id) meta.agent_id = *update.agent_id;
  meta.updated_at = timestamp_();
  index_[id] = meta;

  save_session(*data);
  save_index();
  return meta;
}

void MemorySessionStore::remove(const SessionId& id) {
  std::lock_guard lock(mutex_);
  index_.erase(id);
  loaded_.erase(id);
  delete_session_file(id);
  save_index();
}

std::optional<SessionMeta> MemorySessionStore::find_by_agent_session_id(const std::string& agent_session_id) const {
  if (agent_session_id.empty()) return std::nullopt;

  std::lock_guard lock(mutex_);
  for (const auto& [id, meta] : index_) {
    if (meta.agent_session_id == agent_session_id) {
      return meta;
    }
  }
  return std::nullopt;
}

int MemorySessionStore::count_messages(const std::vector<StoredUpdate>& updates) {
  // Rough estimate: ten streamed chunks per message
  int chunks = 0;
  for (const auto& u : updates) {
    if (!u.update.contains("update") || !u.update["update"].is_object()) continue;
    auto type = u.update["update"].value("sessionUpdate", "");
    if (type == "agent_message_chunk" || type == "user_message_chunk") {
      ++chunks;
    }
  }
  return std::max(1, (chunks + 9) / 10);
}

// ============================================================
// JsonSessionStore
// ============================================================

JsonSessionStore::JsonSessionStore(fs::path dir, TimestampFn timestamp)
    : MemorySessionStore(std::move(timestamp)), dir_(std::move(dir)) {}

void JsonSessionStore::initialize() {
  fs::create_directories(dir_ / "data");

  std::lock_guard lock(mutex_);
  index_.clear();
  loaded_.clear();

  auto index_path = dir_ / "index.json";
  if (!fs::exists(index_path)) {
    return;
  }

  try {
    std::ifstream file(index_path);
    json j;
    file >> j;
    for (const auto& entry : j) {
      auto meta = SessionMeta::from_json(entry);
      index_[meta.id] = meta;
    }
    spdlog::info("[SessionStore] Loaded {} sessions from {}", index_.size(), dir_.string());
  } catch (const std::exception& e) {
    spdlog::error("[SessionStore] Failed to load index, starting fresh: {}", e.what());
    index_.clear();
  }
}

fs::path JsonSessionStore::data_path(const SessionId& id) const {
  return dir_ / "data" / (id + ".json");
}

void JsonSessionStore::atomic_write(const fs::path& path, const std::string& content) {
  auto stamp = std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
                   .count();
  fs::path temp = path;
  temp += ".tmp." + std::to_string(stamp);

  {
    std::ofstream file(temp, std::ios::trunc);
    if (!file.is_open()) {
      throw std::runtime_error("Failed to open file for writing: " + temp.string());
    }
    file << content;
    file.close();
    if (file.fail()) {
      std::error_code ec;
      fs::remove(temp, ec);
      throw std::runtime_error("Failed to write file: " + temp.string());
    }
  }

  std::error_code ec;
  fs::rename(temp, path, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(temp, ignored);
    throw std::runtime_error("Failed to replace " + path.string() + ": " + ec.message());
  }
}

void JsonSessionStore::save_index() {
  json j = json::array();
  for (const auto& [id, meta] : index_) {
    j.push_back(meta.to_json());
  }
  atomic_write(dir_ / "index.json", j.dump(2));
}

void JsonSessionStore::save_session(const SessionData& data) {
  atomic_write(data_path(data.session.id), data.to_json().dump(2));
}

std::optional<SessionData> JsonSessionStore::load_session(const SessionId& id) {
  auto path = data_path(id);
  if (!fs::exists(path)) {
    return std::nullopt;
  }

  try {
    std::ifstream file(path);
    json j;
    file >> j;
    return SessionData::from_json(j);
  } catch (const std::exception& e) {
    spdlog::error("[SessionStore] Failed to load session {}: {}", id, e.what());
    return std::nullopt;
  }
}

void JsonSessionStore::delete_session_file(const SessionId& id) {
  std::error_code ec;
  fs::remove(data_path(id), ec);
  if (ec) {
    spdlog::warn("[SessionStore] Failed to delete data file for {}: {}", id, ec.message());
  }
}

}  // namespace conductor
