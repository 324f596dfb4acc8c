#pragma once

// permission_prompt.h: 命令行中的权限请求队列
// 一次只显示队首请求；回答完成后立即出队，迟到的 PermissionResolved 不再影响输入

#include <cstddef>
#include <deque>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "bus/events.hpp"
#include "permission/types.hpp"

namespace conductor_cli {

// An open permission request plus the answers collected so far
struct PendingPermission {
  conductor::events::PermissionRequested request;
  std::vector<std::string> questions;
  std::vector<std::vector<std::string>> labels;
  std::vector<conductor::QuestionAnswer> answers;
};

PendingPermission make_pending(const conductor::events::PermissionRequested& request);

// 1-based number within [1, count], as a 0-based index
std::optional<size_t> parse_choice(const std::string& line, size_t count);

// Not thread-safe; the caller holds its own lock.
class PermissionPrompt {
 public:
  explicit PermissionPrompt(std::ostream& out) : out_(out) {}

  void add(const conductor::events::PermissionRequested& request);

  // Request settled elsewhere (timeout, or our own decision coming back)
  void resolved(const std::string& request_id, bool timed_out);

  // Feeds one input line to the front request. Returns a decision once that
  // request is fully answered; the request leaves the queue at that point.
  std::optional<conductor::PermissionDecision> answer(const std::string& line);

  bool active() const {
    return !queue_.empty();
  }

  size_t size() const {
    return queue_.size();
  }

 private:
  void show_front();
  void finish_front();

  std::ostream& out_;
  std::deque<PendingPermission> queue_;
};

}  // namespace conductor_cli
