#pragma once

#include <map>
#include <mutex>
#include <vector>

#include "core/types.hpp"
#include "permission/types.hpp"

namespace conductor {

using PendingAnswer = QuestionAnswer;

// Per-session question/answer pairs awaiting delivery on the next prompt
class PendingAnswerStore {
 public:
  void add(const SessionId& session_id, const std::string& question, const std::string& answer);

  std::vector<PendingAnswer> get(const SessionId& session_id) const;
  void clear(const SessionId& session_id);

  // Read and clear in one step
  std::vector<PendingAnswer> take(const SessionId& session_id);

  bool empty(const SessionId& session_id) const;

 private:
  mutable std::mutex mutex_;
  std::map<SessionId, std::vector<PendingAnswer>> answers_;
};

}  // namespace conductor
