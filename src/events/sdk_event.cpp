#include "events/sdk_event.hpp"

#include <array>
#include <initializer_list>
#include <utility>

namespace agentdeck {

namespace {

constexpr std::array<std::pair<EventType, const char *>, 11> kEventNames = {{
    {EventType::SessionStart, "session.start"},
    {EventType::SessionIdle, "session.idle"},
    {EventType::SessionError, "session.error"},
    {EventType::MessageDelta, "message.delta"},
    {EventType::MessageComplete, "message.complete"},
    {EventType::ToolStart, "tool.start"},
    {EventType::ToolComplete, "tool.complete"},
    {EventType::SubagentStart, "subagent.start"},
    {EventType::SubagentUpdate, "subagent.update"},
    {EventType::SubagentComplete, "subagent.complete"},
    {EventType::PermissionRequested, "permission.requested"},
}};

// Claude, OpenCode and Copilot disagree on the spelling
constexpr std::array<const char *, 7> kCorrelationKeys = {
    "tool_use_id", "toolUseId", "toolUseID", "tool_call_id", "toolCallId", "sdkCorrelationId", "parentToolUseId",
};

std::optional<std::string> optional_string_field(const json &data, const char *key) {
  if (!data.is_object() || !data.contains(key)) return std::nullopt;
  const auto &value = data[key];
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_null()) return std::nullopt;
  return value.dump();
}

std::string string_or(const json &data, const char *key, const std::string &fallback = "") {
  return optional_string_field(data, key).value_or(fallback);
}

bool bool_or(const json &data, const char *key, bool fallback) {
  if (!data.is_object() || !data.contains(key) || !data[key].is_boolean()) return fallback;
  return data[key].get<bool>();
}

std::optional<std::string> first_string(const json &data, std::initializer_list<const char *> keys) {
  for (const char *key : keys) {
    auto value = optional_string_field(data, key);
    if (value && !value->empty()) return value;
  }
  return std::nullopt;
}

ToolCallId tool_id_of(const json &data) {
  if (auto id = first_string(data, {"toolId", "id"})) return *id;
  return extract_correlation_id(data).value_or("");
}

}  // namespace

std::string to_string(EventType type) {
  for (const auto &[value, name] : kEventNames) {
    if (value == type) return name;
  }
  return "session.start";
}

std::optional<EventType> event_type_from_string(const std::string &str) {
  for (const auto &[value, name] : kEventNames) {
    if (str == name) return value;
  }
  return std::nullopt;
}

json SdkEvent::to_json() const {
  return json{{"type", agentdeck::to_string(type)}, {"sessionId", session_id}, {"timestamp", timestamp}, {"data", data}};
}

std::optional<SdkEvent> SdkEvent::from_json(const json &j) {
  if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) {
    return std::nullopt;
  }
  auto type = event_type_from_string(j["type"].get<std::string>());
  if (!type) {
    return std::nullopt;
  }

  SdkEvent event;
  event.type = *type;
  event.session_id = string_or(j, "sessionId");
  event.timestamp = string_or(j, "timestamp");
  if (j.contains("data") && j["data"].is_object()) {
    event.data = j["data"];
  }
  return event;
}

std::optional<ToolCallId> extract_correlation_id(const json &data) {
  for (const char *key : kCorrelationKeys) {
    auto value = optional_string_field(data, key);
    if (value && !value->empty()) return value;
  }
  return std::nullopt;
}

AgentEvent normalize_event(const SdkEvent &event) {
  AgentEvent out;
  out.type = event.type;
  out.session_id = event.session_id;
  out.timestamp = event.timestamp;

  const auto &data = event.data;
  switch (event.type) {
    case EventType::SessionStart:
      out.payload = payload::SessionStart{};
      break;
    case EventType::SessionIdle:
      out.payload = payload::SessionIdle{};
      break;
    case EventType::SessionError:
      out.payload = payload::SessionError{first_string(data, {"error", "message"}).value_or("unknown error")};
      break;
    case EventType::MessageDelta:
      out.payload = payload::MessageDelta{first_string(data, {"delta", "text", "content"}).value_or("")};
      break;
    case EventType::MessageComplete:
      out.payload = payload::MessageComplete{optional_string_field(data, "content")};
      break;
    case EventType::ToolStart: {
      payload::ToolStart p;
      p.tool_id = tool_id_of(data);
      p.tool_name = string_or(data, "toolName");
      if (data.contains("toolInput") && data["toolInput"].is_object()) {
        p.input = data["toolInput"];
      }
      p.parent_agent_id = first_string(data, {"parentAgentId", "agentId", "subagentId"});
      out.payload = std::move(p);
      break;
    }
    case EventType::ToolComplete: {
      payload::ToolComplete p;
      p.tool_id = tool_id_of(data);
      p.tool_name = string_or(data, "toolName");
      p.result = first_string(data, {"toolResult", "result"});
      p.success = bool_or(data, "success", true);
      p.error = optional_string_field(data, "error");
      p.parent_agent_id = first_string(data, {"parentAgentId", "agentId", "subagentId"});
      out.payload = std::move(p);
      break;
    }
    case EventType::SubagentStart: {
      payload::SubagentStart p;
      p.subagent_id = first_string(data, {"subagentId", "agentId"}).value_or("");
      p.subagent_type = first_string(data, {"subagentType", "agentType", "name"}).value_or("agent");
      p.task = first_string(data, {"task", "description"}).value_or("");
      p.correlation_id = extract_correlation_id(data);
      p.background = bool_or(data, "isBackground", false) || bool_or(data, "background", false) ||
                     bool_or(data, "runInBackground", false) || bool_or(data, "isAsync", false);
      p.model = optional_string_field(data, "model");
      out.payload = std::move(p);
      break;
    }
    case EventType::SubagentUpdate: {
      payload::SubagentUpdate p;
      p.subagent_id = first_string(data, {"subagentId", "agentId"}).value_or("");
      p.current_tool = optional_string_field(data, "currentTool");
      if (data.contains("toolUses") && data["toolUses"].is_number_integer()) {
        p.tool_uses = data["toolUses"].get<int>();
      }
      out.payload = std::move(p);
      break;
    }
    case EventType::SubagentComplete: {
      payload::SubagentComplete p;
      p.subagent_id = first_string(data, {"subagentId", "agentId"}).value_or("");
      p.correlation_id = extract_correlation_id(data);
      p.success = bool_or(data, "success", true);
      p.result = optional_string_field(data, "result");
      p.error = optional_string_field(data, "error");
      out.payload = std::move(p);
      break;
    }
    case EventType::PermissionRequested:
      out.payload = payload::PermissionRequested{string_or(data, "toolName"), string_or(data, "description")};
      break;
  }
  return out;
}

}  // namespace agentdeck
