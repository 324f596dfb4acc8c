#include "permission/permission_manager.hpp"

#include <spdlog/spdlog.h>

#include "bus/bus.hpp"
#include "core/types.hpp"
#include "permission/tool_names.hpp"

namespace conductor {

PermissionManager::PermissionManager(Scheduler& scheduler, SessionOps& ops, const TimingConfig& timing)
    : scheduler_(scheduler),
      ops_(ops),
      timing_(timing),
      question_guard_(scheduler, ops, timing),
      answer_recovery_(scheduler, ops, timing) {}

PermissionManager::~PermissionManager() {
  alive_.reset();
  std::lock_guard lock(mutex_);
  for (const auto& [id, pending] : pending_) {
    scheduler_.cancel(pending.timer);
  }
}

std::string PermissionManager::default_option_id(const std::vector<acp::PermissionOption>& options) {
  for (const auto& option : options) {
    if (option.kind && *option.kind == "deny") {
      return option.option_id;
    }
  }
  return options.empty() ? "" : options.front().option_id;
}

std::string PermissionManager::handle_permission_request(const acp::RequestPermissionParams& params,
                                                         OutcomeCallback on_outcome) {
  auto request_id = UUID::generate();
  auto title = params.tool_call.title.value_or("");

  spdlog::info("[Permission] Request {} for tool '{}' (toolCallId={}, session={})", request_id, title,
               params.tool_call.tool_call_id, params.session_id);
  for (const auto& option : params.options) {
    spdlog::debug("[Permission]   option {} '{}' kind={}", option.option_id, option.name, option.kind.value_or("-"));
  }

  auto durable = ops_.resolve_session_id(params.session_id).value_or(params.session_id);

  PendingRequest pending;
  pending.params = params;
  pending.settlement = std::make_shared<Settlement<PermissionOutcome>>(std::move(on_outcome));

  std::weak_ptr<bool> alive = alive_;
  pending.timer = scheduler_.schedule(timing_.permission_timeout, [this, alive, request_id]() {
    if (alive.expired()) return;
    on_timeout(request_id);
  });

  {
    std::lock_guard lock(mutex_);
    pending_.emplace(request_id, std::move(pending));
  }

  events::PermissionRequested view;
  view.request_id = request_id;
  view.session_id = params.session_id;
  view.durable_session_id = durable;
  view.tool_call = params.tool_call;
  view.options = params.options;
  view.question = tool_names::is_question_tool(params.tool_call.title);
  Bus::instance().publish(view);

  return request_id;
}

bool PermissionManager::handle_permission_response(const PermissionDecision& decision) {
  PendingRequest pending;
  {
    std::lock_guard lock(mutex_);
    auto it = pending_.find(decision.request_id);
    if (it == pending_.end()) {
      spdlog::warn("[Permission] No pending request for {}", decision.request_id);
      return false;
    }
    pending = std::move(it->second);
    pending_.erase(it);
  }
  scheduler_.cancel(pending.timer);

  spdlog::info("[Permission] Request {} resolved with option {}", decision.request_id, decision.option_id);

  auto outcome = PermissionOutcome::from_decision(decision);

  const auto& tool_call = pending.params.tool_call;
  if (decision.data && decision.data->has_answer() && tool_names::is_question_tool(tool_call.title)) {
    if (outcome.meta && outcome.meta->user_answer) {
      spdlog::info("[Permission] User answered: {}", *outcome.meta->user_answer);
    }
    if (auto durable = ops_.resolve_session_id(pending.params.session_id)) {
      ops_.store_question_response(*durable, tool_call.tool_call_id, *decision.data);
    }
    answer_recovery_.handle(pending.params.session_id, tool_call, *decision.data);
  }

  pending.settlement->settle(outcome);
  Bus::instance().publish(events::PermissionResolved{decision.request_id, decision.option_id, false});
  return true;
}

void PermissionManager::on_timeout(const std::string& request_id) {
  PendingRequest pending;
  {
    std::lock_guard lock(mutex_);
    auto it = pending_.find(request_id);
    if (it == pending_.end()) return;
    pending = std::move(it->second);
    pending_.erase(it);
  }

  PermissionOutcome outcome;
  outcome.option_id = default_option_id(pending.params.options);
  spdlog::warn("[Permission] Request {} timed out, defaulting to option '{}'", request_id, outcome.option_id);

  pending.settlement->settle(outcome);
  Bus::instance().publish(events::PermissionResolved{request_id, outcome.option_id, true});
}

void PermissionManager::handle_session_update(const acp::SessionNotification& notification) {
  question_guard_.handle_tool_update(notification.session_id, notification.update);
}

size_t PermissionManager::pending_count() const {
  std::lock_guard lock(mutex_);
  return pending_.size();
}

bool PermissionManager::is_pending(const std::string& request_id) const {
  std::lock_guard lock(mutex_);
  return pending_.contains(request_id);
}

}  // namespace conductor
