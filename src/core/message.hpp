#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/agent.hpp"
#include "core/types.hpp"

namespace agentdeck {

// Message role
enum class Role {
  System,
  User,
  Assistant
};

std::string to_string(Role role);
Role role_from_string(const std::string &str);

// One chat transcript entry
class Message {
 public:
  Message() = default;
  Message(Role role, const std::string &content);

  // Factory methods
  static Message system(const std::string &content);
  static Message user(const std::string &content);
  static Message assistant(const std::string &content);

  const MessageId &id() const {
    return id_;
  }
  void set_id(const MessageId &id) {
    id_ = id;
  }

  Role role() const {
    return role_;
  }

  const std::string &content() const {
    return content_;
  }
  void set_content(const std::string &content) {
    content_ = content;
  }
  void append_content(const std::string &delta) {
    content_ += delta;
  }

  const std::string &timestamp() const {
    return timestamp_;
  }

  bool is_streaming() const {
    return streaming_;
  }
  void set_streaming(bool streaming) {
    streaming_ = streaming;
  }

  // Agent snapshot baked in when the turn finished; owned by this message
  const std::vector<Agent> &parallel_agents() const {
    return parallel_agents_;
  }
  std::vector<Agent> &parallel_agents() {
    return parallel_agents_;
  }
  void set_parallel_agents(std::vector<Agent> agents) {
    parallel_agents_ = std::move(agents);
  }

  // Fields this client does not model, kept for round-tripping
  const json &extra() const {
    return extra_;
  }

  json to_json() const;
  static Message from_json(const json &j);

 private:
  MessageId id_ = make_id("msg");
  Role role_ = Role::User;
  std::string content_;
  std::string timestamp_ = now_timestamp();
  bool streaming_ = false;
  std::vector<Agent> parallel_agents_;
  json extra_ = json::object();
};

}  // namespace agentdeck
