#pragma once

#include <asio.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <vector>

#include "agents/lifecycle.hpp"
#include "core/agent.hpp"

namespace agentdeck {

// Live sub-agent records and primary stream state of one session.
// Single owner: every mutation happens on the io_context thread.
class AgentLifecycleStore : public std::enable_shared_from_this<AgentLifecycleStore> {
 public:
  using Continuation = std::function<void()>;

  static std::shared_ptr<AgentLifecycleStore> create(asio::io_context &io_ctx);

  const std::vector<Agent> &agents() const {
    return agents_;
  }

  // Normalizes and deduplicates
  void set_agents(std::vector<Agent> agents);

  const StreamControlState &stream() const {
    return stream_;
  }

  StreamGeneration generation() const {
    return generation_.load();
  }

  // Returns the generation the new stream's callbacks must be tagged with
  StreamGeneration begin_stream(const StreamStartOptions &options);
  void end_stream(bool preserve_streaming_start = false);

  // Stops the stream and invalidates every callback scheduled for it
  StreamGeneration cancel_stream();

  void set_running_tool(bool running);
  void set_streaming_meta(bool has_meta);

  void on_agent_start(const AgentStartParams &params);
  void on_agent_progress(const AgentId &id, const AgentProgress &progress);
  void on_agent_complete(const AgentCompletion &completion, EpochMs now);
  void on_task_tool_complete(const ToolCallId &tool_id, const std::optional<std::string> &result, bool success,
                             EpochMs now);
  void mark_background(const AgentId &id);
  void finalize_foreground(EpochMs now);

  // Interrupts active foreground agents (stream cancellation)
  std::vector<AgentId> interrupt_foreground(EpochMs now);

  // Runs on_complete once foreground work has drained. If nothing blocks, it is
  // posted right away. Dropped when the stream generation changes first.
  void defer_completion(Continuation on_complete);

  bool has_pending_completion() const {
    return stream_.has_pending_completion;
  }

 private:
  explicit AgentLifecycleStore(asio::io_context &io_ctx);

  void post_tagged(Continuation continuation);
  void maybe_release_deferred_completion();

  asio::io_context &io_ctx_;
  std::vector<Agent> agents_;
  StreamControlState stream_;
  std::atomic<StreamGeneration> generation_{0};
  Continuation pending_completion_;
};

}  // namespace agentdeck
