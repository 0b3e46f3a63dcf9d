#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <set>
#include <string>

#include "events/sdk_event.hpp"

namespace agentdeck {

struct CorrelationSignals {
  bool session_owned = false;           // event session is the active one
  bool pending_task_entry = false;      // a Task tool call awaits its sub-agent
  bool has_sdk_correlation_match = false;  // event tool-use id is tracked
};

// Any single signal admits the event. Session-owned events are admitted even
// without a Task correlation, for runtimes that spawn built-in sub-agents.
bool should_admit_subagent_event(const CorrelationSignals &signals);

// Decides which inbound events may touch the active session's state
class CorrelationGuard {
 public:
  // Resets tracking and takes ownership of session_id for the new run
  void start_run(uint64_t run_id, const SessionId &session_id);
  void reset();

  uint64_t active_run_id() const {
    return active_run_id_;
  }

  void add_owned_session(const SessionId &session_id);
  bool owns_session(const SessionId &session_id) const;

  // Task tool invocation awaiting its subagent.start
  void register_task_invocation(const ToolCallId &tool_id);
  bool has_pending_task() const {
    return !pending_tasks_.empty();
  }

  void track_correlation(const ToolCallId &tool_id, const AgentId &agent_id);
  std::optional<AgentId> agent_for_correlation(const ToolCallId &tool_id) const;

  CorrelationSignals signals_for(const AgentEvent &event) const;

  // Admits or drops the event. An admitted subagent.start consumes its pending
  // Task entry; when the event carries no correlation id the oldest pending
  // entry is assigned to it.
  bool admit(AgentEvent &event);

 private:
  bool is_tracked(const std::optional<ToolCallId> &tool_id) const;

  uint64_t active_run_id_ = 0;
  std::set<SessionId> owned_sessions_;
  std::deque<ToolCallId> pending_tasks_;
  std::map<ToolCallId, AgentId> correlations_;
  std::set<AgentId> admitted_agents_;
};

}  // namespace agentdeck
