#include "agents/lifecycle.hpp"

#include <algorithm>
#include <iterator>

#include "agents/agent_dedup.hpp"

namespace agentdeck {

namespace {

bool matches(const Agent &agent, const std::string &id_or_correlation) {
  return agent.id == id_or_correlation || (agent.correlation_id && *agent.correlation_id == id_or_correlation);
}

Agent finish_agent(Agent agent, AgentStatus status, EpochMs now) {
  agent.status = status;
  agent.current_tool.reset();
  if (auto elapsed = elapsed_ms(agent, now)) {
    agent.duration_ms = elapsed;
  }
  return agent;
}

std::string running_label(const std::string &name) {
  return "Running " + name + "...";
}

bool shares_correlation(const Agent &a, const Agent &b) {
  if (a.correlation_id && b.correlation_id && *a.correlation_id == *b.correlation_id) return true;
  if (a.correlation_id && *a.correlation_id == b.id) return true;
  if (b.correlation_id && *b.correlation_id == a.id) return true;
  return false;
}

}  // namespace

StreamControlState start_stream(const StreamControlState &current, const StreamStartOptions &options) {
  StreamControlState next = current;
  next.is_streaming = true;
  next.streaming_message_id = options.message_id;
  next.streaming_start = options.started_at;
  next.has_streaming_meta = false;
  next.has_running_tool = false;
  next.is_agent_only_stream = options.is_agent_only_stream;
  next.has_pending_completion = false;
  return next;
}

StreamControlState stop_stream(const StreamControlState &current, bool preserve_streaming_start) {
  StreamControlState next = current;
  next.is_streaming = false;
  next.streaming_message_id.reset();
  if (!preserve_streaming_start) {
    next.streaming_start.reset();
  }
  next.has_streaming_meta = false;
  next.has_running_tool = false;
  next.is_agent_only_stream = false;
  next.has_pending_completion = false;
  return next;
}

StreamGeneration invalidate_stream_generation(StreamGeneration current) {
  return current + 1;
}

bool is_current_stream_callback(StreamGeneration active, StreamGeneration tagged) {
  return active == tagged;
}

std::vector<Agent> apply_agent_start(std::vector<Agent> agents, const AgentStartParams &params) {
  auto it = std::find_if(agents.begin(), agents.end(), [&](const Agent &a) {
    return a.id == params.id;
  });
  if (it == agents.end() && params.correlation_id) {
    it = std::find_if(agents.begin(), agents.end(), [&](const Agent &a) {
      return matches(a, *params.correlation_id);
    });
  }

  if (it != agents.end()) {
    Agent &agent = *it;
    if (is_terminal_status(agent.status)) {
      return agents;
    }
    agent.id = params.id;
    if (!params.name.empty()) agent.name = params.name;
    if (!is_generic_task(params.task) || agent.task.empty()) agent.task = params.task;
    if (params.correlation_id) agent.correlation_id = params.correlation_id;
    if (params.model) agent.model = params.model;
    agent.background = agent.background || params.background;
    agent.status = agent.background ? AgentStatus::Background : AgentStatus::Running;
    agent.current_tool = running_label(agent.name);
    return agents;
  }

  Agent agent;
  agent.id = params.id;
  agent.correlation_id = params.correlation_id;
  agent.name = params.name;
  agent.task = params.task;
  agent.background = params.background;
  if (params.background) {
    agent.status = AgentStatus::Background;
  } else {
    agent.status = params.running ? AgentStatus::Running : AgentStatus::Pending;
  }
  agent.started_at = params.started_at.empty() ? now_timestamp() : params.started_at;
  agent.model = params.model;
  if (agent.status != AgentStatus::Pending) {
    agent.current_tool = running_label(agent.name);
  }
  agents.push_back(normalize_agent(std::move(agent)));
  return agents;
}

std::vector<Agent> apply_agent_progress(std::vector<Agent> agents, const AgentId &id, const AgentProgress &progress) {
  for (auto &agent : agents) {
    if (!matches(agent, id) || is_terminal_status(agent.status)) continue;
    if (progress.current_tool) {
      agent.current_tool = progress.current_tool;
    }
    if (progress.tool_uses) {
      agent.tool_uses = progress.tool_uses;
    } else if (progress.increment_tool_uses) {
      agent.tool_uses = agent.tool_uses.value_or(0) + 1;
    }
  }
  return agents;
}

std::vector<Agent> apply_agent_complete(std::vector<Agent> agents, const AgentCompletion &completion, EpochMs now) {
  for (auto &agent : agents) {
    if (!matches(agent, completion.id) || is_terminal_status(agent.status)) continue;
    agent = finish_agent(std::move(agent), completion.success ? AgentStatus::Completed : AgentStatus::Error, now);
    if (completion.result) agent.result = completion.result;
    if (completion.error) agent.error = completion.error;
  }
  return agents;
}

std::vector<Agent> finalize_foreground_agents(std::vector<Agent> agents, EpochMs now) {
  for (auto &agent : agents) {
    if (is_active_foreground_agent(agent)) {
      agent = finish_agent(std::move(agent), AgentStatus::Completed, now);
    }
  }
  return agents;
}

std::vector<Agent> apply_task_tool_complete(std::vector<Agent> agents, const ToolCallId &tool_id,
                                            const std::optional<std::string> &result, bool success, EpochMs now) {
  for (auto &agent : agents) {
    if (!matches(agent, tool_id)) continue;

    // Background agents outlive their Task call
    if (is_background_agent(agent)) {
      if (result) agent.result = result;
      continue;
    }
    if (result) agent.result = result;
    if (agent.status == AgentStatus::Running || agent.status == AgentStatus::Pending) {
      auto duration = agent.duration_ms;
      agent = finish_agent(std::move(agent), success ? AgentStatus::Completed : AgentStatus::Error, now);
      if (duration) agent.duration_ms = duration;
    }
  }
  return agents;
}

std::vector<Agent> mark_agent_background(std::vector<Agent> agents, const AgentId &id) {
  for (auto &agent : agents) {
    if (!matches(agent, id)) continue;
    agent.background = true;
    if (is_active_status(agent.status)) {
      agent.status = AgentStatus::Background;
    }
  }
  return agents;
}

bool has_active_foreground_agents(const std::vector<Agent> &agents) {
  return std::any_of(agents.begin(), agents.end(), is_active_foreground_agent);
}

bool should_finalize_deferred_stream(const std::vector<Agent> &agents, bool has_running_tool) {
  return !has_running_tool && !has_active_foreground_agents(agents);
}

bool should_track_tool_as_blocking(const std::string &tool_name) {
  auto normalized = to_lower(trim(tool_name));
  if (normalized.empty()) {
    return true;
  }
  return normalized != "skill" && !normalized.ends_with("/skill") && !normalized.ends_with("__skill");
}

bool is_shadow_agent(const Agent &agent, const std::vector<Agent> &agents) {
  if (!is_active_foreground_agent(agent)) {
    return false;
  }
  return std::any_of(agents.begin(), agents.end(), [&](const Agent &other) {
    if (&other == &agent || !is_active_background_agent(other)) return false;
    if (shares_correlation(agent, other)) return true;
    return has_eager_placeholder_shape(agent) && is_placeholder_merge_candidate(agent, other);
  });
}

std::vector<Agent> visible_foreground_agents(const std::vector<Agent> &agents) {
  std::vector<Agent> visible;
  for (const auto &agent : agents) {
    if (is_background_agent(agent) || is_shadow_agent(agent, agents)) continue;
    visible.push_back(agent);
  }
  return visible;
}

std::vector<Agent> get_active_background_agents(const std::vector<Agent> &agents) {
  std::vector<Agent> active;
  std::copy_if(agents.begin(), agents.end(), std::back_inserter(active), is_active_background_agent);
  return active;
}

std::vector<Agent> resolve_background_agents_for_footer(const std::vector<Agent> &live,
                                                        const std::vector<Message> &messages) {
  auto active = get_active_background_agents(live);
  if (!active.empty()) {
    return active;
  }
  for (auto it = messages.rbegin(); it != messages.rend(); ++it) {
    active = get_active_background_agents(it->parallel_agents());
    if (!active.empty()) {
      return active;
    }
  }
  return {};
}

std::string format_background_agent_footer_status(const std::vector<Agent> &agents) {
  auto count = get_active_background_agents(agents).size();
  if (count == 0) {
    return "";
  }
  if (count == 1) {
    return "1 background agent running";
  }
  return std::to_string(count) + " background agents running";
}

}  // namespace agentdeck
