#include "permission/session_map.hpp"

namespace conductor {

void SessionIdentityMap::bind(const SessionId& durable_id, const std::string& protocol_id) {
  std::lock_guard lock(mutex_);

  auto existing = by_durable_.find(durable_id);
  if (existing != by_durable_.end()) {
    by_protocol_.erase(existing->second);
  }

  // A protocol ID belongs to exactly one durable session
  auto stale = by_protocol_.find(protocol_id);
  if (stale != by_protocol_.end()) {
    by_durable_.erase(stale->second);
  }

  by_durable_[durable_id] = protocol_id;
  by_protocol_[protocol_id] = durable_id;
}

bool SessionIdentityMap::unbind(const SessionId& durable_id) {
  std::lock_guard lock(mutex_);
  auto it = by_durable_.find(durable_id);
  if (it == by_durable_.end()) return false;

  by_protocol_.erase(it->second);
  by_durable_.erase(it);
  return true;
}

std::optional<SessionId> SessionIdentityMap::durable_for(const std::string& protocol_id) const {
  std::lock_guard lock(mutex_);
  auto it = by_protocol_.find(protocol_id);
  if (it == by_protocol_.end()) return std::nullopt;
  return it->second;
}

std::optional<std::string> SessionIdentityMap::protocol_for(const SessionId& durable_id) const {
  std::lock_guard lock(mutex_);
  auto it = by_durable_.find(durable_id);
  if (it == by_durable_.end()) return std::nullopt;
  return it->second;
}

size_t SessionIdentityMap::size() const {
  std::lock_guard lock(mutex_);
  return by_durable_.size();
}

}  // namespace conductor
