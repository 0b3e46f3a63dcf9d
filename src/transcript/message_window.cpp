#include "transcript/message_window.hpp"

#include <algorithm>
#include <iterator>

namespace agentdeck {

MessageWindowResult apply_message_window(std::vector<Message> messages, size_t limit) {
  MessageWindowResult result;
  if (messages.size() <= limit) {
    result.in_memory_messages = std::move(messages);
    return result;
  }

  auto split = messages.begin() + static_cast<std::ptrdiff_t>(messages.size() - limit);
  result.evicted.assign(std::make_move_iterator(messages.begin()), std::make_move_iterator(split));
  result.in_memory_messages.assign(std::make_move_iterator(split), std::make_move_iterator(messages.end()));
  result.evicted_count = result.evicted.size();
  return result;
}

VisibleWindow compute_message_window(const std::vector<Message> &messages, size_t trimmed_count, size_t limit) {
  VisibleWindow window;
  size_t overflow = messages.size() > limit ? messages.size() - limit : 0;
  window.visible_messages.assign(messages.begin() + static_cast<std::ptrdiff_t>(overflow), messages.end());
  window.hidden_message_count = trimmed_count + overflow;
  return window;
}

MessageWindow::MessageWindow(size_t limit) : limit_(std::max<size_t>(limit, 1)) {}

void MessageWindow::push(Message message) {
  messages_.push_back(std::move(message));
}

std::vector<Message> MessageWindow::trim() {
  auto result = apply_message_window(std::move(messages_), limit_);
  messages_ = std::move(result.in_memory_messages);
  trimmed_count_ += result.evicted_count;
  return std::move(result.evicted);
}

Message *MessageWindow::find(const MessageId &id) {
  auto it = std::find_if(messages_.begin(), messages_.end(), [&id](const Message &m) {
    return m.id() == id;
  });
  return it == messages_.end() ? nullptr : &*it;
}

size_t MessageWindow::hidden_message_count() const {
  return visible().hidden_message_count;
}

VisibleWindow MessageWindow::visible() const {
  return compute_message_window(messages_, trimmed_count_, limit_);
}

void MessageWindow::reset() {
  messages_.clear();
  trimmed_count_ = 0;
}

}  // namespace agentdeck
