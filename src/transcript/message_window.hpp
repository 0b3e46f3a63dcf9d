#pragma once

#include <vector>

#include "core/message.hpp"

namespace agentdeck {

constexpr size_t kDefaultMessageWindow = 50;

struct MessageWindowResult {
  std::vector<Message> in_memory_messages;  // the most recent `limit` messages
  std::vector<Message> evicted;             // older ones, oldest first
  size_t evicted_count = 0;
};

MessageWindowResult apply_message_window(std::vector<Message> messages, size_t limit);

struct VisibleWindow {
  std::vector<Message> visible_messages;
  size_t hidden_message_count = 0;  // trimmed_count plus in-memory overflow
};

VisibleWindow compute_message_window(const std::vector<Message> &messages, size_t trimmed_count, size_t limit);

// Live message list with a monotonic count of messages moved out of memory
class MessageWindow {
 public:
  explicit MessageWindow(size_t limit = kDefaultMessageWindow);

  size_t limit() const {
    return limit_;
  }

  const std::vector<Message> &messages() const {
    return messages_;
  }
  std::vector<Message> &messages() {
    return messages_;
  }

  void push(Message message);

  // Enforces the limit; returns what fell out
  std::vector<Message> trim();

  Message *find(const MessageId &id);

  size_t trimmed_count() const {
    return trimmed_count_;
  }

  size_t hidden_message_count() const;
  VisibleWindow visible() const;

  // Only explicit resets (/clear) lower the trimmed count
  void reset();

 private:
  size_t limit_;
  std::vector<Message> messages_;
  size_t trimmed_count_ = 0;
};

}  // namespace agentdeck
