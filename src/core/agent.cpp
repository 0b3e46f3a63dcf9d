#include "core/agent.hpp"

#include <algorithm>

namespace agentdeck {

std::string to_string(AgentStatus status) {
  switch (status) {
    case AgentStatus::Pending:
      return "pending";
    case AgentStatus::Running:
      return "running";
    case AgentStatus::Background:
      return "background";
    case AgentStatus::Completed:
      return "completed";
    case AgentStatus::Error:
      return "error";
    case AgentStatus::Interrupted:
      return "interrupted";
  }
  return "pending";
}

std::optional<AgentStatus> agent_status_from_string(const std::string &str) {
  if (str == "pending") return AgentStatus::Pending;
  if (str == "running") return AgentStatus::Running;
  if (str == "background") return AgentStatus::Background;
  if (str == "completed") return AgentStatus::Completed;
  if (str == "error") return AgentStatus::Error;
  if (str == "interrupted") return AgentStatus::Interrupted;
  return std::nullopt;
}

bool is_terminal_status(AgentStatus status) {
  return status == AgentStatus::Completed || status == AgentStatus::Error || status == AgentStatus::Interrupted;
}

bool is_active_status(AgentStatus status) {
  return !is_terminal_status(status);
}

json Agent::to_json() const {
  json j;
  j["id"] = id;
  if (correlation_id) j["correlationId"] = *correlation_id;
  j["name"] = name;
  j["task"] = task;
  j["status"] = agentdeck::to_string(status);
  if (background) j["background"] = true;
  j["startedAt"] = started_at;
  if (duration_ms) j["durationMs"] = *duration_ms;
  if (current_tool) j["currentTool"] = *current_tool;
  if (tool_uses) j["toolUses"] = *tool_uses;
  if (result) j["result"] = *result;
  if (error) j["error"] = *error;
  if (model) j["model"] = *model;
  return j;
}

Agent Agent::from_json(const json &j) {
  Agent agent;
  if (!j.is_object()) {
    return agent;
  }
  agent.id = string_field(j, "id");
  // Older transcripts store it as taskToolCallId
  if (j.contains("correlationId") && j["correlationId"].is_string()) {
    agent.correlation_id = j["correlationId"].get<std::string>();
  } else if (j.contains("taskToolCallId") && j["taskToolCallId"].is_string()) {
    agent.correlation_id = j["taskToolCallId"].get<std::string>();
  }
  agent.name = string_field(j, "name");
  agent.task = string_field(j, "task");
  agent.status = agent_status_from_string(string_field(j, "status", "pending")).value_or(AgentStatus::Pending);
  agent.background = j.contains("background") && j["background"].is_boolean() && j["background"].get<bool>();
  agent.started_at = string_field(j, "startedAt");
  if (j.contains("durationMs") && j["durationMs"].is_number()) {
    agent.duration_ms = j["durationMs"].get<int64_t>();
  }
  if (j.contains("currentTool") && j["currentTool"].is_string()) {
    agent.current_tool = j["currentTool"].get<std::string>();
  }
  if (j.contains("toolUses") && j["toolUses"].is_number()) {
    agent.tool_uses = j["toolUses"].get<int>();
  }
  if (j.contains("result") && !j["result"].is_null()) {
    agent.result = j["result"].is_string() ? j["result"].get<std::string>() : j["result"].dump();
  }
  if (j.contains("error") && j["error"].is_string()) {
    agent.error = j["error"].get<std::string>();
  }
  if (j.contains("model") && j["model"].is_string()) {
    agent.model = j["model"].get<std::string>();
  }
  return normalize_agent(std::move(agent));
}

Agent normalize_agent(Agent agent) {
  if (agent.status == AgentStatus::Background) {
    agent.background = true;
  }
  return agent;
}

bool is_background_agent(const Agent &agent) {
  return agent.background || agent.status == AgentStatus::Background;
}

bool is_active_background_agent(const Agent &agent) {
  return is_background_agent(agent) && is_active_status(agent.status);
}

bool is_active_foreground_agent(const Agent &agent) {
  return !is_background_agent(agent) && (agent.status == AgentStatus::Running || agent.status == AgentStatus::Pending);
}

bool is_generic_task(const std::string &task) {
  auto normalized = to_lower(trim(task));
  return normalized.empty() || normalized == "sub-agent task" || normalized == "subagent task";
}

bool has_eager_placeholder_shape(const Agent &agent) {
  if (!is_generic_task(agent.task)) return false;
  return !agent.correlation_id || agent.id == *agent.correlation_id;
}

std::optional<int64_t> elapsed_ms(const Agent &agent, EpochMs now) {
  auto started = parse_timestamp_ms(agent.started_at);
  if (!started || now < 0) return std::nullopt;
  return std::max<int64_t>(0, now - *started);
}

const Agent *find_agent(const std::vector<Agent> &agents, const AgentId &id) {
  auto it = std::find_if(agents.begin(), agents.end(), [&id](const Agent &a) {
    return a.id == id;
  });
  return it == agents.end() ? nullptr : &*it;
}

}  // namespace agentdeck
