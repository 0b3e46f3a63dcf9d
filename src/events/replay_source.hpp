#pragma once

#include <asio.hpp>
#include <chrono>
#include <deque>
#include <filesystem>
#include <memory>
#include <set>
#include <vector>

#include "core/config.hpp"
#include "events/event_source.hpp"

namespace agentdeck {

// One scripted event and the pause before it
struct ReplayStep {
  SdkEvent event;
  std::optional<int64_t> delay_ms;
};

using ReplayTurn = std::vector<ReplayStep>;

// Replays recorded SDK events as if a live client produced them.
//
// Script format: NDJSON, one event per line ({type, sessionId?, timestamp?,
// data, delayMs?}). A line {"type": "turn.break"} ends a turn; each send()
// plays the next turn.
class ReplayEventSource : public EventSource, public std::enable_shared_from_this<ReplayEventSource> {
 public:
  static std::shared_ptr<ReplayEventSource> create(asio::io_context &io_ctx, const Config::ReplaySettings &settings,
                                                   std::vector<ReplayTurn> turns);

  // Unknown or malformed lines are skipped with a warning
  static std::vector<ReplayTurn> load_script(const std::filesystem::path &path);
  static std::vector<ReplayTurn> parse_script(const std::string &content);

  SessionId session_id() const override {
    return settings_.session_id;
  }

  void send(const std::string &prompt, EventSink sink) override;
  void abort_stream(AbortCompletion done) override;
  void abort_background_agents(AbortCompletion done) override;

  size_t remaining_turns() const {
    return turns_.size();
  }

  size_t pending_events() const;

 private:
  ReplayEventSource(asio::io_context &io_ctx, const Config::ReplaySettings &settings, std::vector<ReplayTurn> turns);

  struct Scheduled {
    SdkEvent event;
    std::chrono::steady_clock::time_point due;
    bool background = false;
    bool fired = false;  // delivered or cancelled
  };

  // One turn's events, delivered in order through a single timer
  struct Playback {
    Playback(asio::io_context &io_ctx, EventSink sink) : timer(io_ctx), sink(std::move(sink)) {}

    asio::steady_timer timer;
    EventSink sink;
    std::deque<std::shared_ptr<Scheduled>> queue;
  };

  void play_next(std::shared_ptr<Playback> playback);
  bool is_background_event(const SdkEvent &event);
  void cancel_where(bool background);
  ReplayTurn fallback_turn(const std::string &prompt) const;

  asio::io_context &io_ctx_;
  Config::ReplaySettings settings_;
  std::deque<ReplayTurn> turns_;
  std::vector<std::shared_ptr<Scheduled>> scheduled_;
  std::set<AgentId> background_agents_;
};

}  // namespace agentdeck
