#pragma once

#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

#include "core/types.hpp"

namespace agentdeck {

// Event types emitted by the SDK clients
enum class EventType {
  SessionStart,
  SessionIdle,
  SessionError,
  MessageDelta,
  MessageComplete,
  ToolStart,
  ToolComplete,
  SubagentStart,
  SubagentUpdate,
  SubagentComplete,
  PermissionRequested
};

std::string to_string(EventType type);
std::optional<EventType> event_type_from_string(const std::string &str);

// Raw event as delivered by a client: { type, sessionId, timestamp, data }
struct SdkEvent {
  EventType type = EventType::SessionStart;
  SessionId session_id;
  std::string timestamp;
  json data = json::object();

  json to_json() const;
  // nullopt for unknown types or a missing "type"
  static std::optional<SdkEvent> from_json(const json &j);
};

// Normalized payloads; vendor field spellings do not survive past normalize_event()
namespace payload {

struct SessionStart {};

struct SessionIdle {};

struct SessionError {
  std::string error;
};

struct MessageDelta {
  std::string delta;
};

struct MessageComplete {
  std::optional<std::string> content;
};

struct ToolStart {
  ToolCallId tool_id;
  std::string tool_name;
  json input = json::object();
  std::optional<AgentId> parent_agent_id;  // set when a sub-agent runs the tool
};

struct ToolComplete {
  ToolCallId tool_id;
  std::string tool_name;
  std::optional<std::string> result;
  bool success = true;
  std::optional<std::string> error;
  std::optional<AgentId> parent_agent_id;
};

struct SubagentStart {
  AgentId subagent_id;
  std::string subagent_type;
  std::string task;
  std::optional<ToolCallId> correlation_id;
  bool background = false;
  std::optional<std::string> model;
};

struct SubagentUpdate {
  AgentId subagent_id;
  std::optional<std::string> current_tool;
  std::optional<int> tool_uses;
};

struct SubagentComplete {
  AgentId subagent_id;
  std::optional<ToolCallId> correlation_id;
  bool success = true;
  std::optional<std::string> result;
  std::optional<std::string> error;
};

struct PermissionRequested {
  std::string tool_name;
  std::string description;
};

}  // namespace payload

using EventPayload = std::variant<payload::SessionStart, payload::SessionIdle, payload::SessionError, payload::MessageDelta,
                                  payload::MessageComplete, payload::ToolStart, payload::ToolComplete, payload::SubagentStart,
                                  payload::SubagentUpdate, payload::SubagentComplete, payload::PermissionRequested>;

struct AgentEvent {
  EventType type = EventType::SessionStart;
  SessionId session_id;
  std::string timestamp;
  EventPayload payload;
};

// Collapses every known spelling of a tool-call correlation field into one value
std::optional<ToolCallId> extract_correlation_id(const json &data);

AgentEvent normalize_event(const SdkEvent &event);

}  // namespace agentdeck
