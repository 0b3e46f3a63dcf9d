#include "core/message.hpp"

namespace agentdeck {

std::string to_string(Role role) {
  switch (role) {
    case Role::System:
      return "system";
    case Role::User:
      return "user";
    case Role::Assistant:
      return "assistant";
  }
  return "user";
}

Role role_from_string(const std::string &str) {
  if (str == "system") return Role::System;
  if (str == "user") return Role::User;
  if (str == "assistant") return Role::Assistant;
  return Role::User;
}

Message::Message(Role role, const std::string &content) : role_(role), content_(content) {}

Message Message::system(const std::string &content) {
  return Message(Role::System, content);
}

Message Message::user(const std::string &content) {
  return Message(Role::User, content);
}

Message Message::assistant(const std::string &content) {
  return Message(Role::Assistant, content);
}

json Message::to_json() const {
  json j = extra_.is_object() ? extra_ : json::object();
  j["id"] = id_;
  j["role"] = to_string(role_);
  j["content"] = content_;
  j["timestamp"] = timestamp_;
  if (streaming_) {
    j["streaming"] = true;
  }
  if (!parallel_agents_.empty()) {
    json agents = json::array();
    for (const auto &agent : parallel_agents_) {
      agents.push_back(agent.to_json());
    }
    j["parallelAgents"] = agents;
  }
  return j;
}

Message Message::from_json(const json &j) {
  Message msg;
  if (!j.is_object()) {
    return msg;
  }

  msg.id_ = string_field(j, "id", msg.id_);
  msg.role_ = role_from_string(string_field(j, "role", "user"));
  if (j.contains("content")) {
    msg.content_ = j["content"].is_string() ? j["content"].get<std::string>() : j["content"].dump();
  }
  msg.timestamp_ = string_field(j, "timestamp", msg.timestamp_);
  msg.streaming_ = j.contains("streaming") && j["streaming"].is_boolean() && j["streaming"].get<bool>();

  if (j.contains("parallelAgents") && j["parallelAgents"].is_array()) {
    for (const auto &agent_json : j["parallelAgents"]) {
      msg.parallel_agents_.push_back(Agent::from_json(agent_json));
    }
  }

  for (auto it = j.begin(); it != j.end(); ++it) {
    const auto &key = it.key();
    if (key == "id" || key == "role" || key == "content" || key == "timestamp" || key == "streaming" || key == "parallelAgents") {
      continue;
    }
    msg.extra_[key] = it.value();
  }

  return msg;
}

}  // namespace agentdeck
