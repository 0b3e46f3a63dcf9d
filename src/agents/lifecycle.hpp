#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/agent.hpp"
#include "core/message.hpp"

namespace agentdeck {

// Control state of the primary streaming response
struct StreamControlState {
  bool is_streaming = false;
  std::optional<MessageId> streaming_message_id;
  std::optional<EpochMs> streaming_start;
  bool has_streaming_meta = false;  // set by the first content delta of the turn
  bool has_running_tool = false;
  bool is_agent_only_stream = false;
  bool has_pending_completion = false;

  bool operator==(const StreamControlState &other) const = default;
};

struct StreamStartOptions {
  MessageId message_id;
  EpochMs started_at = 0;
  bool is_agent_only_stream = false;
};

StreamControlState start_stream(const StreamControlState &current, const StreamStartOptions &options);

// Clears every transient flag. Calling it on a stopped state returns the same state.
StreamControlState stop_stream(const StreamControlState &current, bool preserve_streaming_start = false);

// Stream generations: async completions are tagged at scheduling time and honored
// only while the tag is still the active generation
using StreamGeneration = int64_t;

StreamGeneration invalidate_stream_generation(StreamGeneration current);
bool is_current_stream_callback(StreamGeneration active, StreamGeneration tagged);

// ---------------------------------------------------------------------------
// Agent status transitions. All functions are pure: they take the current
// snapshot by value and return the next one.
// ---------------------------------------------------------------------------

struct AgentStartParams {
  AgentId id;
  std::string name;
  std::string task;
  std::optional<ToolCallId> correlation_id;
  bool background = false;
  bool running = true;  // false creates the record in pending
  std::string started_at;
  std::optional<std::string> model;
};

// Creates the record, or updates the one already known by id or correlation id
std::vector<Agent> apply_agent_start(std::vector<Agent> agents, const AgentStartParams &params);

struct AgentProgress {
  std::optional<std::string> current_tool;
  std::optional<int> tool_uses;
  bool increment_tool_uses = false;
};

// Never changes the status
std::vector<Agent> apply_agent_progress(std::vector<Agent> agents, const AgentId &id, const AgentProgress &progress);

struct AgentCompletion {
  AgentId id;  // agent id or correlation id
  bool success = true;
  std::optional<std::string> result;
  std::optional<std::string> error;
};

// Completes an active record; terminal records are left untouched
std::vector<Agent> apply_agent_complete(std::vector<Agent> agents, const AgentCompletion &completion, EpochMs now);

// Primary stream completion: active foreground agents become completed,
// background agents keep running
std::vector<Agent> finalize_foreground_agents(std::vector<Agent> agents, EpochMs now);

// The Task tool that spawned an agent finished
std::vector<Agent> apply_task_tool_complete(std::vector<Agent> agents, const ToolCallId &tool_id,
                                            const std::optional<std::string> &result, bool success, EpochMs now);

// Late "runs in background" signal for an agent first reported as foreground
std::vector<Agent> mark_agent_background(std::vector<Agent> agents, const AgentId &id);

bool has_active_foreground_agents(const std::vector<Agent> &agents);

// A queued stream completion may fire once no foreground agent is running or
// pending and no blocking tool runs
bool should_finalize_deferred_stream(const std::vector<Agent> &agents, bool has_running_tool);

// Skill loaders may never report completion, so they do not block finalization
bool should_track_tool_as_blocking(const std::string &tool_name);

// A running/pending foreground record duplicating an active background agent
bool is_shadow_agent(const Agent &agent, const std::vector<Agent> &agents);

// Foreground records without shadows. Shadows stay in the store.
std::vector<Agent> visible_foreground_agents(const std::vector<Agent> &agents);

// Footer

std::vector<Agent> get_active_background_agents(const std::vector<Agent> &agents);

// Live state first, otherwise the newest message snapshot with active background agents
std::vector<Agent> resolve_background_agents_for_footer(const std::vector<Agent> &live,
                                                        const std::vector<Message> &messages);

std::string format_background_agent_footer_status(const std::vector<Agent> &agents);

}  // namespace agentdeck
