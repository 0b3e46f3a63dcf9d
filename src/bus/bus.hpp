#pragma once

#include <any>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <typeindex>
#include <vector>

#include "core/agent.hpp"

namespace agentdeck {

// Type-safe event bus for notifying the UI layer
class Bus {
 public:
  using SubscriptionId = uint64_t;

  static Bus &instance();

  // Subscribe to events of type T
  template <typename T>
  SubscriptionId subscribe(std::function<void(const T &)> handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = next_id_++;
    handlers_[std::type_index(typeid(T))].push_back({id, [handler](const std::any &event) {
                                                       handler(std::any_cast<const T &>(event));
                                                     }});
    return id;
  }

  void unsubscribe(SubscriptionId id);

  template <typename T>
  void publish(const T &event) {
    std::vector<std::function<void(const std::any &)>> to_call;

    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = handlers_.find(std::type_index(typeid(T)));
      if (it != handlers_.end()) {
        for (const auto &entry : it->second) {
          to_call.push_back(entry.handler);
        }
      }
    }

    // Handlers may publish or unsubscribe themselves
    std::any wrapped = event;
    for (const auto &handler : to_call) {
      handler(wrapped);
    }
  }

 private:
  Bus() = default;

  struct HandlerEntry {
    SubscriptionId id;
    std::function<void(const std::any &)> handler;
  };

  std::mutex mutex_;
  SubscriptionId next_id_ = 1;
  std::map<std::type_index, std::vector<HandlerEntry>> handlers_;
};

// Notifications published by ChatSession
namespace events {

struct AgentsChanged {
  std::string session_id;
  std::vector<Agent> agents;
};

struct StreamStateChanged {
  std::string session_id;
  bool is_streaming;
  std::string message_id;
};

struct MessagesEvicted {
  std::string session_id;
  size_t evicted_count;
  size_t hidden_count;
};

// One-line status text for the footer (termination warnings, errors)
struct Notice {
  std::string session_id;
  std::string text;
};

struct PermissionRequested {
  std::string session_id;
  std::string tool_name;
  std::string description;
};

}  // namespace events

}  // namespace agentdeck
