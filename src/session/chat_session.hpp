#pragma once

#include <asio.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "agents/lifecycle_store.hpp"
#include "agents/termination.hpp"
#include "core/config.hpp"
#include "core/message.hpp"
#include "core/types.hpp"
#include "events/correlation_guard.hpp"
#include "events/event_source.hpp"
#include "transcript/history_buffer.hpp"
#include "transcript/message_window.hpp"

namespace agentdeck {

// Chat session: the single reducer between an event source and the UI.
// All methods must be called on the io_context thread.
class ChatSession : public std::enable_shared_from_this<ChatSession> {
 public:
  static std::shared_ptr<ChatSession> create(asio::io_context& io_ctx, const Config& config,
                                             std::shared_ptr<EventSource> source);

  ~ChatSession();

  const SessionId& id() const {
    return id_;
  }

  // Appends the user message and a streaming assistant message, then asks the
  // source for the turn. Returns false while a turn is streaming.
  bool start_turn(const std::string& prompt);

  // Applies one inbound event
  void dispatch(const SdkEvent& event);

  // Stops the stream locally right away, then waits for the source's abort.
  // Returns false when nothing is streaming.
  bool cancel_stream();

  // Ctrl+F handling. Returns true when the key was the termination key.
  bool handle_key(const KeyEvent& key);

  // /clear
  void clear();

  // /compact: history collapses into one summary entry, live messages are dropped
  bool compact(const std::string& summary);

  // History buffer followed by the live messages (Ctrl+O)
  std::vector<Message> transcript() const;

  const std::vector<Message>& messages() const {
    return window_.messages();
  }

  size_t hidden_message_count() const {
    return window_.hidden_message_count();
  }

  const std::vector<Agent>& live_agents() const {
    return store_->agents();
  }

  // Agents rendered under the streaming message: foreground without shadows,
  // then background
  std::vector<Agent> visible_agents() const;

  std::vector<Agent> footer_agents() const;
  std::string footer_status() const;

  const StreamControlState& stream() const {
    return store_->stream();
  }

  bool is_streaming() const {
    return store_->stream().is_streaming;
  }

  StreamGeneration generation() const {
    return store_->generation();
  }

  std::atomic<int>& termination_press_count() {
    return termination_press_count_;
  }

  HistoryBuffer& history() {
    return history_;
  }

  // Called after every state change, on the io_context thread
  using OnChangeCallback = std::function<void()>;

  void on_change(OnChangeCallback cb) {
    on_change_ = std::move(cb);
  }

 private:
  ChatSession(asio::io_context& io_ctx, const Config& config, std::shared_ptr<EventSource> source);

  void handle_tool_start(const AgentEvent& event, const payload::ToolStart& tool);
  void handle_tool_complete(const payload::ToolComplete& tool);
  void handle_subagent_start(const AgentEvent& event, const payload::SubagentStart& start);
  void handle_subagent_complete(const payload::SubagentComplete& complete);

  Message* streaming_message();

  void request_stream_completion();
  void complete_stream();
  void bake_snapshot(Message& message);

  // Copies newer versions of agents into the message snapshots holding them
  void sync_snapshots(const std::vector<Agent>& updated);

  // Live store keeps only active background agents once no turn streams
  void prune_live_agents();

  void enforce_window();
  void start_background_termination();

  void notify(const std::string& text);
  void publish_agents();
  void publish_stream_state();
  void changed();

  bool is_known_agent(const AgentId& id) const;

  asio::io_context& io_ctx_;
  Config config_;
  std::shared_ptr<EventSource> source_;
  SessionId id_;

  std::shared_ptr<AgentLifecycleStore> store_;
  CorrelationGuard guard_;
  MessageWindow window_;
  HistoryBuffer history_;

  std::atomic<int> termination_press_count_{0};
  uint64_t run_id_ = 0;
  std::optional<MessageId> streaming_message_id_;
  std::set<ToolCallId> blocking_tools_;
  std::set<ToolCallId> task_tools_;

  OnChangeCallback on_change_;
};

// Task tool names across SDKs
bool is_task_tool_name(const std::string& tool_name);

}  // namespace agentdeck
