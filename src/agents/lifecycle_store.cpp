#include "agents/lifecycle_store.hpp"

#include <spdlog/spdlog.h>

#include "agents/agent_dedup.hpp"

namespace agentdeck {

AgentLifecycleStore::AgentLifecycleStore(asio::io_context &io_ctx) : io_ctx_(io_ctx) {}

std::shared_ptr<AgentLifecycleStore> AgentLifecycleStore::create(asio::io_context &io_ctx) {
  return std::shared_ptr<AgentLifecycleStore>(new AgentLifecycleStore(io_ctx));
}

void AgentLifecycleStore::set_agents(std::vector<Agent> agents) {
  for (auto &agent : agents) {
    agent = normalize_agent(std::move(agent));
  }
  agents_ = deduplicate_agents(std::move(agents));
}

StreamGeneration AgentLifecycleStore::begin_stream(const StreamStartOptions &options) {
  stream_ = start_stream(stream_, options);
  pending_completion_ = nullptr;
  return generation_.load();
}

void AgentLifecycleStore::end_stream(bool preserve_streaming_start) {
  stream_ = stop_stream(stream_, preserve_streaming_start);
  pending_completion_ = nullptr;
}

StreamGeneration AgentLifecycleStore::cancel_stream() {
  stream_ = stop_stream(stream_, true);
  pending_completion_ = nullptr;
  auto next = invalidate_stream_generation(generation_.load());
  generation_.store(next);
  spdlog::debug("[AgentLifecycleStore] stream cancelled, generation now {}", next);
  return next;
}

void AgentLifecycleStore::set_running_tool(bool running) {
  stream_.has_running_tool = running;
  if (!running) {
    maybe_release_deferred_completion();
  }
}

void AgentLifecycleStore::set_streaming_meta(bool has_meta) {
  stream_.has_streaming_meta = has_meta;
}

void AgentLifecycleStore::on_agent_start(const AgentStartParams &params) {
  set_agents(apply_agent_start(std::move(agents_), params));
}

void AgentLifecycleStore::on_agent_progress(const AgentId &id, const AgentProgress &progress) {
  agents_ = apply_agent_progress(std::move(agents_), id, progress);
}

void AgentLifecycleStore::on_agent_complete(const AgentCompletion &completion, EpochMs now) {
  agents_ = apply_agent_complete(std::move(agents_), completion, now);
  maybe_release_deferred_completion();
}

void AgentLifecycleStore::on_task_tool_complete(const ToolCallId &tool_id, const std::optional<std::string> &result,
                                                bool success, EpochMs now) {
  agents_ = apply_task_tool_complete(std::move(agents_), tool_id, result, success, now);
  maybe_release_deferred_completion();
}

void AgentLifecycleStore::mark_background(const AgentId &id) {
  agents_ = mark_agent_background(std::move(agents_), id);
  maybe_release_deferred_completion();
}

void AgentLifecycleStore::finalize_foreground(EpochMs now) {
  agents_ = finalize_foreground_agents(std::move(agents_), now);
}

std::vector<AgentId> AgentLifecycleStore::interrupt_foreground(EpochMs now) {
  std::vector<AgentId> ids;
  for (auto &agent : agents_) {
    if (!is_active_foreground_agent(agent)) continue;
    agent.status = AgentStatus::Interrupted;
    agent.current_tool.reset();
    if (auto elapsed = elapsed_ms(agent, now)) {
      agent.duration_ms = elapsed;
    }
    ids.push_back(agent.id);
  }
  return ids;
}

void AgentLifecycleStore::defer_completion(Continuation on_complete) {
  if (should_finalize_deferred_stream(agents_, stream_.has_running_tool)) {
    stream_.has_pending_completion = false;
    post_tagged(std::move(on_complete));
    return;
  }
  spdlog::debug("[AgentLifecycleStore] stream completion deferred until foreground agents finish");
  stream_.has_pending_completion = true;
  pending_completion_ = std::move(on_complete);
}

void AgentLifecycleStore::post_tagged(Continuation continuation) {
  auto tagged = generation_.load();
  std::weak_ptr<AgentLifecycleStore> weak = weak_from_this();
  asio::post(io_ctx_, [weak, tagged, continuation = std::move(continuation)]() {
    auto self = weak.lock();
    if (!self) return;
    if (!is_current_stream_callback(self->generation_.load(), tagged)) {
      spdlog::debug("[AgentLifecycleStore] dropping stale completion (generation {} != {})", tagged,
                    self->generation_.load());
      return;
    }
    continuation();
  });
}

void AgentLifecycleStore::maybe_release_deferred_completion() {
  if (!stream_.has_pending_completion || !pending_completion_) {
    return;
  }
  if (!should_finalize_deferred_stream(agents_, stream_.has_running_tool)) {
    return;
  }
  stream_.has_pending_completion = false;
  auto continuation = std::move(pending_completion_);
  pending_completion_ = nullptr;
  post_tagged(std::move(continuation));
}

}  // namespace agentdeck
