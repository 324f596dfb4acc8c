#include "permission/pending_answers.hpp"

namespace conductor {

void PendingAnswerStore::add(const SessionId& session_id, const std::string& question, const std::string& answer) {
  std::lock_guard lock(mutex_);
  answers_[session_id].push_back(PendingAnswer{question, answer});
}

std::vector<PendingAnswer> PendingAnswerStore::get(const SessionId& session_id) const {
  std::lock_guard lock(mutex_);
  auto it = answers_.find(session_id);
  if (it == answers_.end()) return {};
  return it->second;
}

void PendingAnswerStore::clear(const SessionId& session_id) {
  std::lock_guard lock(mutex_);
  answers_.erase(session_id);
}

std::vector<PendingAnswer> PendingAnswerStore::take(const SessionId& session_id) {
  std::lock_guard lock(mutex_);
  auto it = answers_.find(session_id);
  if (it == answers_.end()) return {};
  auto taken = std::move(it->second);
  answers_.erase(it);
  return taken;
}

bool PendingAnswerStore::empty(const SessionId& session_id) const {
  std::lock_guard lock(mutex_);
  auto it = answers_.find(session_id);
  return it == answers_.end() || it->second.empty();
}

}  // namespace conductor
