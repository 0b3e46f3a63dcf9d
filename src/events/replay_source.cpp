#include "events/replay_source.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <sstream>

namespace agentdeck {

namespace fs = std::filesystem;

ReplayEventSource::ReplayEventSource(asio::io_context &io_ctx, const Config::ReplaySettings &settings,
                                     std::vector<ReplayTurn> turns)
    : io_ctx_(io_ctx), settings_(settings), turns_(std::make_move_iterator(turns.begin()), std::make_move_iterator(turns.end())) {}

std::shared_ptr<ReplayEventSource> ReplayEventSource::create(asio::io_context &io_ctx,
                                                             const Config::ReplaySettings &settings,
                                                             std::vector<ReplayTurn> turns) {
  return std::shared_ptr<ReplayEventSource>(new ReplayEventSource(io_ctx, settings, std::move(turns)));
}

std::vector<ReplayTurn> ReplayEventSource::parse_script(const std::string &content) {
  std::vector<ReplayTurn> turns(1);
  std::istringstream lines(content);
  std::string line;
  size_t line_number = 0;

  while (std::getline(lines, line)) {
    ++line_number;
    if (line.find_first_not_of(" \t\r\n") == std::string::npos) continue;

    try {
      json j = json::parse(line);
      if (j.is_object() && j.value("type", "") == "turn.break") {
        if (!turns.back().empty()) turns.emplace_back();
        continue;
      }
      auto event = SdkEvent::from_json(j);
      if (!event) {
        spdlog::warn("Replay script line {}: unknown event type", line_number);
        continue;
      }
      ReplayStep step{std::move(*event), std::nullopt};
      if (j.contains("delayMs") && j["delayMs"].is_number_integer()) {
        step.delay_ms = j["delayMs"].get<int64_t>();
      }
      turns.back().push_back(std::move(step));
    } catch (const std::exception &e) {
      spdlog::warn("Replay script line {}: {}", line_number, e.what());
    }
  }

  if (turns.back().empty()) turns.pop_back();
  return turns;
}

std::vector<ReplayTurn> ReplayEventSource::load_script(const fs::path &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    spdlog::warn("Failed to open replay script: {}", path.string());
    return {};
  }
  std::ostringstream ss;
  ss << file.rdbuf();
  return parse_script(ss.str());
}

size_t ReplayEventSource::pending_events() const {
  size_t count = 0;
  for (const auto &entry : scheduled_) {
    if (!entry->fired) ++count;
  }
  return count;
}

bool ReplayEventSource::is_background_event(const SdkEvent &event) {
  auto normalized = normalize_event(event);
  if (const auto *start = std::get_if<payload::SubagentStart>(&normalized.payload)) {
    if (start->background) {
      background_agents_.insert(start->subagent_id);
      return true;
    }
    return false;
  }
  if (const auto *update = std::get_if<payload::SubagentUpdate>(&normalized.payload)) {
    return background_agents_.count(update->subagent_id) > 0;
  }
  if (const auto *complete = std::get_if<payload::SubagentComplete>(&normalized.payload)) {
    return background_agents_.count(complete->subagent_id) > 0;
  }
  if (const auto *tool = std::get_if<payload::ToolStart>(&normalized.payload)) {
    return tool->parent_agent_id && background_agents_.count(*tool->parent_agent_id) > 0;
  }
  if (const auto *tool = std::get_if<payload::ToolComplete>(&normalized.payload)) {
    return tool->parent_agent_id && background_agents_.count(*tool->parent_agent_id) > 0;
  }
  return false;
}

ReplayTurn ReplayEventSource::fallback_turn(const std::string &prompt) const {
  auto make = [this](EventType type, json data) {
    SdkEvent event;
    event.type = type;
    event.session_id = settings_.session_id;
    event.data = std::move(data);
    return ReplayStep{std::move(event), std::nullopt};
  };
  return {
      make(EventType::MessageDelta, {{"delta", "Replay finished; nothing recorded for: " + prompt}}),
      make(EventType::MessageComplete, json::object()),
      make(EventType::SessionIdle, json::object()),
  };
}

void ReplayEventSource::send(const std::string &prompt, EventSink sink) {
  ReplayTurn turn;
  if (turns_.empty()) {
    turn = fallback_turn(prompt);
  } else {
    turn = std::move(turns_.front());
    turns_.pop_front();
  }

  spdlog::debug("[Replay {}] playing {} event(s)", settings_.session_id, turn.size());

  // Drop bookkeeping of events that already fired
  scheduled_.erase(std::remove_if(scheduled_.begin(), scheduled_.end(),
                                  [](const std::shared_ptr<Scheduled> &entry) {
                                    return entry->fired;
                                  }),
                   scheduled_.end());

  auto playback = std::make_shared<Playback>(io_ctx_, std::move(sink));
  auto due = std::chrono::steady_clock::now();

  for (auto &step : turn) {
    due += std::chrono::milliseconds(step.delay_ms.value_or(settings_.event_delay_ms));

    auto entry = std::make_shared<Scheduled>();
    entry->event = std::move(step.event);
    if (entry->event.session_id.empty()) entry->event.session_id = settings_.session_id;
    entry->due = due;
    entry->background = is_background_event(entry->event);
    playback->queue.push_back(entry);
    scheduled_.push_back(entry);
  }

  play_next(std::move(playback));
}

void ReplayEventSource::play_next(std::shared_ptr<Playback> playback) {
  while (!playback->queue.empty() && playback->queue.front()->fired) {
    playback->queue.pop_front();
  }
  if (playback->queue.empty()) {
    return;
  }

  playback->timer.expires_at(playback->queue.front()->due);
  std::weak_ptr<ReplayEventSource> weak = weak_from_this();
  playback->timer.async_wait([weak, playback](const asio::error_code &ec) {
    if (ec) {
      return;
    }
    auto self = weak.lock();
    if (!self) {
      return;
    }
    auto entry = playback->queue.front();
    playback->queue.pop_front();
    if (!entry->fired) {
      entry->fired = true;
      if (entry->event.timestamp.empty()) entry->event.timestamp = now_timestamp();
      playback->sink(entry->event);
    }
    self->play_next(playback);
  });
}

void ReplayEventSource::cancel_where(bool background) {
  size_t cancelled = 0;
  for (auto &entry : scheduled_) {
    if (entry->fired || entry->background != background) continue;
    entry->fired = true;
    ++cancelled;
  }
  spdlog::debug("[Replay {}] cancelled {} pending {} event(s)", settings_.session_id, cancelled,
                background ? "background" : "stream");
}

void ReplayEventSource::abort_stream(AbortCompletion done) {
  cancel_where(false);
  asio::post(io_ctx_, [done = std::move(done)]() {
    done(nullptr);
  });
}

void ReplayEventSource::abort_background_agents(AbortCompletion done) {
  cancel_where(true);
  asio::post(io_ctx_, [done = std::move(done)]() {
    done(nullptr);
  });
}

}  // namespace agentdeck
