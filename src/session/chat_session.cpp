#include "session/chat_session.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "agents/agent_dedup.hpp"
#include "bus/bus.hpp"

namespace agentdeck {

namespace fs = std::filesystem;

namespace {

fs::path prepare_history_path(const fs::path& dir) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    spdlog::warn("Failed to create history directory {}: {}", dir.string(), ec.message());
  }
  return HistoryBuffer::path_for_process(dir);
}

std::string timestamp_or_now(const std::string& timestamp) {
  return parse_timestamp_ms(timestamp) ? timestamp : now_timestamp();
}

// Task results of agents the runtime moved to the background carry isAsync
bool reports_async_launch(const std::optional<std::string>& result) {
  if (!result || result->empty() || result->front() != '{') {
    return false;
  }
  try {
    json j = json::parse(*result);
    return j.is_object() && j.contains("isAsync") && j["isAsync"].is_boolean() && j["isAsync"].get<bool>();
  } catch (const std::exception& e) {
    spdlog::trace("Task result is not JSON: {}", e.what());
    return false;
  }
}

std::string input_string(const json& input, const char* key) {
  if (input.contains(key) && input[key].is_string()) {
    return input[key].get<std::string>();
  }
  return "";
}

bool input_flag(const json& input, const char* key) {
  return input.contains(key) && input[key].is_boolean() && input[key].get<bool>();
}

}  // namespace

bool is_task_tool_name(const std::string& tool_name) {
  auto normalized = to_lower(trim(tool_name));
  return normalized == "task" || normalized == "agent" || normalized.ends_with("__task");
}

ChatSession::ChatSession(asio::io_context& io_ctx, const Config& config, std::shared_ptr<EventSource> source)
    : io_ctx_(io_ctx),
      config_(config),
      source_(std::move(source)),
      id_(source_ ? source_->session_id() : make_id("session")),
      store_(AgentLifecycleStore::create(io_ctx)),
      window_(config.message_window),
      history_(prepare_history_path(config.history_dir)) {}

std::shared_ptr<ChatSession> ChatSession::create(asio::io_context& io_ctx, const Config& config,
                                                 std::shared_ptr<EventSource> source) {
  auto session = std::shared_ptr<ChatSession>(new ChatSession(io_ctx, config, std::move(source)));
  spdlog::info("[ChatSession {}] created (window {}, history {})", session->id_, config.message_window,
               session->history_.path().string());
  return session;
}

ChatSession::~ChatSession() {
  spdlog::debug("[ChatSession {}] destroyed", id_);
}

Message* ChatSession::streaming_message() {
  if (!streaming_message_id_) return nullptr;
  return window_.find(*streaming_message_id_);
}

bool ChatSession::start_turn(const std::string& prompt) {
  if (is_streaming()) {
    spdlog::warn("[ChatSession {}] turn already streaming, prompt ignored", id_);
    return false;
  }

  window_.push(Message::user(prompt));
  auto assistant = Message::assistant("");
  assistant.set_streaming(true);
  streaming_message_id_ = assistant.id();
  window_.push(std::move(assistant));

  blocking_tools_.clear();
  prune_live_agents();
  // Every turn here starts from a user prompt, so never agent-only
  store_->begin_stream({*streaming_message_id_, now_ms(), false});
  guard_.start_run(++run_id_, id_);

  spdlog::info("[ChatSession {}] turn {} started", id_, run_id_);
  spdlog::debug("[ChatSession {}] User input: {}", id_, prompt);

  enforce_window();
  publish_stream_state();
  changed();

  if (!source_) {
    spdlog::warn("[ChatSession {}] no event source attached", id_);
    return true;
  }

  std::weak_ptr<ChatSession> weak = weak_from_this();
  source_->send(prompt, [weak](const SdkEvent& event) {
    if (auto self = weak.lock()) {
      self->dispatch(event);
    }
  });
  return true;
}

void ChatSession::dispatch(const SdkEvent& raw) {
  AgentEvent event = normalize_event(raw);
  if (!guard_.admit(event)) {
    return;
  }

  spdlog::trace("[ChatSession {}] event {}", id_, to_string(event.type));

  switch (event.type) {
    case EventType::SessionStart:
      spdlog::debug("[ChatSession {}] runtime session {} started", id_, event.session_id);
      break;

    case EventType::SessionIdle:
      request_stream_completion();
      break;

    case EventType::SessionError: {
      const auto& error = std::get<payload::SessionError>(event.payload);
      spdlog::error("[ChatSession {}] session error: {}", id_, error.error);
      notify("Error: " + error.error);
      if (is_streaming()) {
        if (auto* msg = streaming_message()) {
          msg->append_content(msg->content().empty() ? "Error: " + error.error : "\n\nError: " + error.error);
        }
        store_->interrupt_foreground(now_ms());
        complete_stream();
      }
      break;
    }

    case EventType::MessageDelta: {
      const auto& delta = std::get<payload::MessageDelta>(event.payload);
      auto* msg = streaming_message();
      if (!is_streaming() || !msg) {
        spdlog::debug("[ChatSession {}] delta after stream end dropped", id_);
        return;
      }
      msg->append_content(delta.delta);
      if (!store_->stream().has_streaming_meta) {
        store_->set_streaming_meta(true);
      }
      break;
    }

    case EventType::MessageComplete: {
      const auto& complete = std::get<payload::MessageComplete>(event.payload);
      auto* msg = streaming_message();
      if (is_streaming() && msg && complete.content && msg->content().empty()) {
        msg->set_content(*complete.content);
      }
      request_stream_completion();
      break;
    }

    case EventType::ToolStart:
      handle_tool_start(event, std::get<payload::ToolStart>(event.payload));
      break;

    case EventType::ToolComplete:
      handle_tool_complete(std::get<payload::ToolComplete>(event.payload));
      break;

    case EventType::SubagentStart:
      handle_subagent_start(event, std::get<payload::SubagentStart>(event.payload));
      break;

    case EventType::SubagentUpdate: {
      const auto& update = std::get<payload::SubagentUpdate>(event.payload);
      store_->on_agent_progress(update.subagent_id, {update.current_tool, update.tool_uses, false});
      sync_snapshots(store_->agents());
      publish_agents();
      break;
    }

    case EventType::SubagentComplete:
      handle_subagent_complete(std::get<payload::SubagentComplete>(event.payload));
      break;

    case EventType::PermissionRequested: {
      const auto& request = std::get<payload::PermissionRequested>(event.payload);
      spdlog::info("[ChatSession {}] permission requested for {}", id_, request.tool_name);
      Bus::instance().publish(events::PermissionRequested{id_, request.tool_name, request.description});
      break;
    }
  }

  changed();
}

void ChatSession::handle_tool_start(const AgentEvent& event, const payload::ToolStart& tool) {
  // Tools run by a sub-agent only feed its progress
  if (tool.parent_agent_id && is_known_agent(*tool.parent_agent_id)) {
    store_->on_agent_progress(*tool.parent_agent_id, {tool.tool_name, std::nullopt, true});
    sync_snapshots(store_->agents());
    publish_agents();
    return;
  }

  if (is_task_tool_name(tool.tool_name)) {
    guard_.register_task_invocation(tool.tool_id);
    task_tools_.insert(tool.tool_id);

    // Eager placeholder until the SDK describes the sub-agent
    AgentStartParams params;
    params.id = tool.tool_id;
    params.correlation_id = tool.tool_id;
    params.name = input_string(tool.input, "subagent_type");
    if (params.name.empty()) params.name = "agent";
    params.task = input_string(tool.input, "description");
    if (params.task.empty()) params.task = "sub-agent task";
    params.background = input_flag(tool.input, "run_in_background");
    params.running = false;
    params.started_at = timestamp_or_now(event.timestamp);
    store_->on_agent_start(params);

    spdlog::debug("[ChatSession {}] Task {} queued ({}, background={})", id_, tool.tool_id, params.name,
                  params.background);
    publish_agents();
    return;
  }

  if (should_track_tool_as_blocking(tool.tool_name)) {
    blocking_tools_.insert(tool.tool_id);
    store_->set_running_tool(true);
  }
}

void ChatSession::handle_tool_complete(const payload::ToolComplete& tool) {
  if (tool.parent_agent_id && is_known_agent(*tool.parent_agent_id)) {
    return;
  }

  if (task_tools_.erase(tool.tool_id) > 0) {
    if (reports_async_launch(tool.result)) {
      spdlog::debug("[ChatSession {}] Task {} continues in the background", id_, tool.tool_id);
      store_->mark_background(tool.tool_id);
    }
    store_->on_task_tool_complete(tool.tool_id, tool.result, tool.success, now_ms());
    sync_snapshots(store_->agents());
    publish_agents();
    return;
  }

  blocking_tools_.erase(tool.tool_id);
  store_->set_running_tool(!blocking_tools_.empty());
}

void ChatSession::handle_subagent_start(const AgentEvent& event, const payload::SubagentStart& start) {
  AgentStartParams params;
  params.id = start.subagent_id.empty() ? make_id("agent") : start.subagent_id;
  params.name = start.subagent_type;
  params.task = start.task;
  params.correlation_id = start.correlation_id;
  params.background = start.background;
  params.running = true;
  params.started_at = timestamp_or_now(event.timestamp);
  params.model = start.model;
  store_->on_agent_start(params);

  spdlog::info("[ChatSession {}] sub-agent {} ({}) started{}", id_, params.id, params.name,
               params.background ? " in background" : "");
  publish_agents();
}

void ChatSession::handle_subagent_complete(const payload::SubagentComplete& complete) {
  AgentId id = complete.subagent_id;
  if (id.empty() && complete.correlation_id) {
    id = guard_.agent_for_correlation(*complete.correlation_id).value_or(*complete.correlation_id);
  }

  store_->on_agent_complete({id, complete.success, complete.result, complete.error}, now_ms());
  sync_snapshots(store_->agents());

  spdlog::info("[ChatSession {}] sub-agent {} {}", id_, id, complete.success ? "completed" : "failed");
  if (!is_streaming()) {
    prune_live_agents();
  }
  publish_agents();
}

void ChatSession::request_stream_completion() {
  if (!is_streaming()) {
    return;
  }
  std::weak_ptr<ChatSession> weak = weak_from_this();
  store_->defer_completion([weak]() {
    if (auto self = weak.lock()) {
      self->complete_stream();
    }
  });
}

void ChatSession::complete_stream() {
  if (!is_streaming()) {
    return;
  }

  store_->finalize_foreground(now_ms());
  if (auto* msg = streaming_message()) {
    msg->set_streaming(false);
    bake_snapshot(*msg);
  }

  store_->end_stream();
  streaming_message_id_.reset();
  blocking_tools_.clear();
  prune_live_agents();

  spdlog::info("[ChatSession {}] turn {} complete, {} background agent(s) running", id_, run_id_,
               store_->agents().size());

  enforce_window();
  publish_stream_state();
  publish_agents();
  changed();
}

void ChatSession::bake_snapshot(Message& message) {
  auto snapshot = deduplicate_agents(store_->agents());
  if (!snapshot.empty()) {
    message.set_parallel_agents(std::move(snapshot));
  }
}

bool ChatSession::cancel_stream() {
  if (!is_streaming()) {
    return false;
  }

  // Local state flips first; the runtime's abort is awaited below
  auto generation = store_->cancel_stream();
  auto interrupted = store_->interrupt_foreground(now_ms());
  if (auto* msg = streaming_message()) {
    msg->set_streaming(false);
    bake_snapshot(*msg);
  }
  streaming_message_id_.reset();
  blocking_tools_.clear();
  prune_live_agents();

  spdlog::info("[ChatSession {}] stream cancelled (generation {}, {} agent(s) interrupted)", id_, generation,
               interrupted.size());
  publish_stream_state();
  publish_agents();
  changed();

  if (!source_) {
    return true;
  }

  std::weak_ptr<ChatSession> weak = weak_from_this();
  source_->abort_stream([weak](std::exception_ptr error) {
    auto self = weak.lock();
    if (!self) return;
    asio::post(self->io_ctx_, [weak, error]() {
      auto self = weak.lock();
      if (!self) return;
      if (error) {
        try {
          std::rethrow_exception(error);
        } catch (const std::exception& e) {
          spdlog::warn("[ChatSession {}] stream abort failed: {}", self->id_, e.what());
          self->notify(std::string("Failed to stop the agent: ") + e.what());
        } catch (...) {
          spdlog::warn("[ChatSession {}] stream abort failed", self->id_);
          self->notify("Failed to stop the agent");
        }
      }
      // Events may have landed while the abort was in flight
      self->sync_snapshots(self->store_->agents());
      self->publish_agents();
      self->changed();
    });
  });
  return true;
}

bool ChatSession::handle_key(const KeyEvent& key) {
  if (!is_background_termination_key(key)) {
    return false;
  }

  auto active = resolve_background_agents_for_footer(store_->agents(), window_.messages()).size();
  auto evaluation = evaluate_background_termination_press(termination_press_count_, active);

  switch (evaluation.decision.action) {
    case TerminationAction::None:
      break;
    case TerminationAction::Warn:
      notify(evaluation.decision.message);
      break;
    case TerminationAction::Terminate:
      start_background_termination();
      break;
  }
  changed();
  return true;
}

void ChatSession::start_background_termination() {
  std::weak_ptr<ChatSession> weak = weak_from_this();

  TerminationOptions options;
  options.get_agents = [weak]() -> std::vector<Agent> {
    auto self = weak.lock();
    if (!self) return {};
    auto live = self->store_->agents();
    if (!get_active_background_agents(live).empty()) {
      return live;
    }
    return resolve_background_agents_for_footer(live, self->window_.messages());
  };
  if (source_) {
    std::weak_ptr<EventSource> weak_source = source_;
    options.on_terminate_background_agents = [weak_source](AbortCompletion done) {
      if (auto source = weak_source.lock()) {
        source->abort_background_agents(std::move(done));
      } else {
        done(nullptr);
      }
    };
  }

  execute_background_termination(io_ctx_, std::move(options), [weak](TerminationResult result) {
    auto self = weak.lock();
    if (!self) return;

    switch (result.status) {
      case TerminationStatus::Noop:
        spdlog::debug("[ChatSession {}] no background agents to terminate", self->id_);
        break;
      case TerminationStatus::Failed: {
        std::string reason = "unknown error";
        try {
          std::rethrow_exception(result.error);
        } catch (const std::exception& e) {
          reason = e.what();
        } catch (...) {
          spdlog::warn("[ChatSession {}] background termination failed with a non-standard exception", self->id_);
        }
        self->notify("Failed to terminate background agents: " + reason);
        break;
      }
      case TerminationStatus::Terminated:
        self->store_->set_agents(result.agents);
        self->sync_snapshots(result.agents);
        if (!self->is_streaming()) {
          self->prune_live_agents();
        }
        self->notify(kTerminationDoneMessage);
        self->publish_agents();
        break;
    }
    self->changed();
  });
}

void ChatSession::clear() {
  if (is_streaming()) {
    cancel_stream();
  }
  window_.reset();
  termination_press_count_.store(0);
  try {
    history_.clear();
  } catch (const std::exception& e) {
    spdlog::error("[ChatSession {}] history buffer clear failed: {}", id_, e.what());
    notify(std::string("History buffer clear failed: ") + e.what());
  }

  spdlog::info("[ChatSession {}] transcript cleared", id_);
  Bus::instance().publish(events::MessagesEvicted{id_, 0, 0});
  changed();
}

bool ChatSession::compact(const std::string& summary) {
  if (is_streaming()) {
    spdlog::warn("[ChatSession {}] cannot compact while streaming", id_);
    notify("Cannot compact while a response is streaming");
    return false;
  }

  try {
    history_.append_compaction_summary(summary);
  } catch (const std::exception& e) {
    spdlog::error("[ChatSession {}] compaction failed: {}", id_, e.what());
    notify(std::string("Compaction failed: ") + e.what());
    return false;
  }
  window_.reset();

  Bus::instance().publish(events::MessagesEvicted{id_, 0, 0});
  notify("Conversation compacted");
  changed();
  return true;
}

std::vector<Message> ChatSession::transcript() const {
  auto all = history_.read();
  const auto& live = window_.messages();
  all.insert(all.end(), live.begin(), live.end());
  return all;
}

std::vector<Agent> ChatSession::visible_agents() const {
  auto agents = visible_foreground_agents(store_->agents());
  auto background = get_active_background_agents(store_->agents());
  agents.insert(agents.end(), background.begin(), background.end());
  return agents;
}

std::vector<Agent> ChatSession::footer_agents() const {
  return resolve_background_agents_for_footer(store_->agents(), window_.messages());
}

std::string ChatSession::footer_status() const {
  return format_background_agent_footer_status(footer_agents());
}

void ChatSession::sync_snapshots(const std::vector<Agent>& updated) {
  for (auto& message : window_.messages()) {
    for (auto& agent : message.parallel_agents()) {
      auto it = std::find_if(updated.begin(), updated.end(), [&agent](const Agent& a) {
        return a.id == agent.id;
      });
      if (it != updated.end()) {
        agent = *it;
      }
    }
  }
}

void ChatSession::prune_live_agents() {
  if (is_streaming()) {
    return;
  }
  store_->set_agents(get_active_background_agents(store_->agents()));
}

void ChatSession::enforce_window() {
  auto evicted = window_.trim();
  if (evicted.empty()) {
    return;
  }

  try {
    auto written = history_.append(evicted);
    spdlog::debug("[ChatSession {}] {} message(s) moved to history ({} written)", id_, evicted.size(), written);
  } catch (const std::exception& e) {
    spdlog::error("[ChatSession {}] history buffer write failed: {}", id_, e.what());
    notify(std::string("History buffer write failed: ") + e.what());
  }

  Bus::instance().publish(events::MessagesEvicted{id_, evicted.size(), window_.hidden_message_count()});
}

bool ChatSession::is_known_agent(const AgentId& id) const {
  return std::any_of(store_->agents().begin(), store_->agents().end(), [&id](const Agent& agent) {
    return agent.id == id;
  });
}

void ChatSession::notify(const std::string& text) {
  Bus::instance().publish(events::Notice{id_, text});
}

void ChatSession::publish_agents() {
  Bus::instance().publish(events::AgentsChanged{id_, store_->agents()});
}

void ChatSession::publish_stream_state() {
  const auto& stream = store_->stream();
  Bus::instance().publish(events::StreamStateChanged{id_, stream.is_streaming, stream.streaming_message_id.value_or("")});
}

void ChatSession::changed() {
  if (on_change_) {
    on_change_();
  }
}

}  // namespace agentdeck
