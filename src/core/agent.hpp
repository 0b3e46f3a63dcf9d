#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace agentdeck {

// Sub-agent status
enum class AgentStatus {
  Pending,
  Running,
  Background,  // running detached from the primary stream
  Completed,
  Error,
  Interrupted
};

std::string to_string(AgentStatus status);
std::optional<AgentStatus> agent_status_from_string(const std::string &str);

bool is_terminal_status(AgentStatus status);
bool is_active_status(AgentStatus status);  // pending, running or background

// One sub-agent as tracked by the UI
struct Agent {
  AgentId id;
  std::optional<std::string> correlation_id;  // usually the Task tool call id
  std::string name;
  std::string task;
  AgentStatus status = AgentStatus::Pending;
  bool background = false;
  std::string started_at;  // ISO-8601, may be unparseable
  std::optional<int64_t> duration_ms;
  std::optional<std::string> current_tool;
  std::optional<int> tool_uses;
  std::optional<std::string> result;
  std::optional<std::string> error;
  std::optional<std::string> model;

  json to_json() const;
  static Agent from_json(const json &j);

  bool operator==(const Agent &other) const = default;
};

// Folds the legacy status == Background encoding into the background flag.
// Must be applied to every record entering the system.
Agent normalize_agent(Agent agent);

bool is_background_agent(const Agent &agent);
bool is_active_background_agent(const Agent &agent);
bool is_active_foreground_agent(const Agent &agent);

// Placeholder task text the SDKs use before the real description is known
bool is_generic_task(const std::string &task);

// A record created eagerly from a tool call, before the SDK describes the agent
bool has_eager_placeholder_shape(const Agent &agent);

// now - started_at clamped at zero, or nullopt when either side is unusable
std::optional<int64_t> elapsed_ms(const Agent &agent, EpochMs now);

const Agent *find_agent(const std::vector<Agent> &agents, const AgentId &id);

}  // namespace agentdeck
