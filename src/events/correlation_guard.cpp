#include "events/correlation_guard.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace agentdeck {

bool should_admit_subagent_event(const CorrelationSignals &signals) {
  return signals.session_owned || signals.pending_task_entry || signals.has_sdk_correlation_match;
}

void CorrelationGuard::start_run(uint64_t run_id, const SessionId &session_id) {
  reset();
  active_run_id_ = run_id;
  add_owned_session(session_id);
}

void CorrelationGuard::reset() {
  active_run_id_ = 0;
  owned_sessions_.clear();
  pending_tasks_.clear();
  correlations_.clear();
  admitted_agents_.clear();
}

void CorrelationGuard::add_owned_session(const SessionId &session_id) {
  if (!session_id.empty()) {
    owned_sessions_.insert(session_id);
  }
}

bool CorrelationGuard::owns_session(const SessionId &session_id) const {
  return owned_sessions_.count(session_id) > 0;
}

void CorrelationGuard::register_task_invocation(const ToolCallId &tool_id) {
  if (tool_id.empty()) return;
  if (std::find(pending_tasks_.begin(), pending_tasks_.end(), tool_id) == pending_tasks_.end()) {
    pending_tasks_.push_back(tool_id);
  }
}

void CorrelationGuard::track_correlation(const ToolCallId &tool_id, const AgentId &agent_id) {
  correlations_[tool_id] = agent_id;
  admitted_agents_.insert(agent_id);
}

std::optional<AgentId> CorrelationGuard::agent_for_correlation(const ToolCallId &tool_id) const {
  auto it = correlations_.find(tool_id);
  if (it == correlations_.end()) return std::nullopt;
  return it->second;
}

bool CorrelationGuard::is_tracked(const std::optional<ToolCallId> &tool_id) const {
  if (!tool_id) return false;
  if (correlations_.count(*tool_id)) return true;
  return std::find(pending_tasks_.begin(), pending_tasks_.end(), *tool_id) != pending_tasks_.end();
}

CorrelationSignals CorrelationGuard::signals_for(const AgentEvent &event) const {
  CorrelationSignals signals;
  signals.session_owned = owns_session(event.session_id);

  if (const auto *start = std::get_if<payload::SubagentStart>(&event.payload)) {
    signals.pending_task_entry = has_pending_task();
    signals.has_sdk_correlation_match = is_tracked(start->correlation_id);
  } else if (const auto *update = std::get_if<payload::SubagentUpdate>(&event.payload)) {
    signals.has_sdk_correlation_match = admitted_agents_.count(update->subagent_id) > 0;
  } else if (const auto *complete = std::get_if<payload::SubagentComplete>(&event.payload)) {
    signals.has_sdk_correlation_match =
        is_tracked(complete->correlation_id) || admitted_agents_.count(complete->subagent_id) > 0;
  }
  return signals;
}

bool CorrelationGuard::admit(AgentEvent &event) {
  bool is_subagent_event = event.type == EventType::SubagentStart || event.type == EventType::SubagentUpdate ||
                           event.type == EventType::SubagentComplete;

  if (!is_subagent_event) {
    // The first session.start of a run names the session when the run did not
    if (event.type == EventType::SessionStart && owned_sessions_.empty()) {
      add_owned_session(event.session_id);
    }
    if (owns_session(event.session_id)) {
      return true;
    }
    spdlog::debug("[CorrelationGuard] dropping {} from foreign session {}", to_string(event.type), event.session_id);
    return false;
  }

  auto signals = signals_for(event);
  if (!should_admit_subagent_event(signals)) {
    spdlog::debug("[CorrelationGuard] dropping {} from session {}: no ownership or correlation", to_string(event.type),
                  event.session_id);
    return false;
  }

  if (auto *start = std::get_if<payload::SubagentStart>(&event.payload)) {
    if (start->correlation_id) {
      auto it = std::find(pending_tasks_.begin(), pending_tasks_.end(), *start->correlation_id);
      if (it != pending_tasks_.end()) {
        pending_tasks_.erase(it);
      }
    } else if (!pending_tasks_.empty()) {
      start->correlation_id = pending_tasks_.front();
      pending_tasks_.pop_front();
    }
    if (start->correlation_id) {
      track_correlation(*start->correlation_id, start->subagent_id);
    } else {
      admitted_agents_.insert(start->subagent_id);
    }
  }
  return true;
}

}  // namespace agentdeck
