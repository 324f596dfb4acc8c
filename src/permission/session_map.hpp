#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "core/types.hpp"

namespace conductor {

// Bidirectional durable <-> protocol session ID lookup.
// A durable session has at most one live protocol session ID.
class SessionIdentityMap {
 public:
  // Replaces any protocol ID previously bound to this durable session
  void bind(const SessionId& durable_id, const std::string& protocol_id);

  // Returns false when the durable session had no binding
  bool unbind(const SessionId& durable_id);

  std::optional<SessionId> durable_for(const std::string& protocol_id) const;
  std::optional<std::string> protocol_for(const SessionId& durable_id) const;

  size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::map<SessionId, std::string> by_durable_;
  std::map<std::string, SessionId> by_protocol_;
};

}  // namespace conductor
