#include "agents/termination.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <unordered_set>

#include "agents/lifecycle.hpp"

namespace agentdeck {

std::string to_string(TerminationAction action) {
  switch (action) {
    case TerminationAction::None:
      return "none";
    case TerminationAction::Warn:
      return "warn";
    case TerminationAction::Terminate:
      return "terminate";
  }
  return "none";
}

std::string to_string(TerminationStatus status) {
  switch (status) {
    case TerminationStatus::Noop:
      return "noop";
    case TerminationStatus::Terminated:
      return "terminated";
    case TerminationStatus::Failed:
      return "failed";
  }
  return "noop";
}

TerminationDecision get_background_termination_decision(int press_count, size_t active_background_count) {
  if (active_background_count == 0) {
    return {TerminationAction::None, ""};
  }
  if (press_count >= 1) {
    return {TerminationAction::Terminate, kTerminationDoneMessage};
  }
  return {TerminationAction::Warn, kTerminationWarnMessage};
}

TerminationPressEvaluation evaluate_background_termination_press(std::atomic<int> &press_count,
                                                                 size_t active_background_count) {
  TerminationPressEvaluation evaluation;
  evaluation.press_count = press_count.load();
  evaluation.decision = get_background_termination_decision(evaluation.press_count, active_background_count);
  evaluation.next_press_count =
      evaluation.decision.action == TerminationAction::Warn ? evaluation.press_count + 1 : 0;
  press_count.store(evaluation.next_press_count);
  return evaluation;
}

bool is_background_termination_key(const KeyEvent &event) {
  return event.ctrl && !event.shift && !event.meta && event.name == "f";
}

InterruptResult interrupt_active_background_agents(const std::vector<Agent> &agents, EpochMs now) {
  InterruptResult result;
  result.agents = agents;
  for (auto &agent : result.agents) {
    if (!is_active_background_agent(agent)) continue;
    agent.status = AgentStatus::Interrupted;
    agent.current_tool.reset();
    if (auto elapsed = elapsed_ms(agent, now)) {
      agent.duration_ms = elapsed;
    }
    result.interrupted_ids.push_back(agent.id);
  }
  return result;
}

void execute_background_termination(asio::io_context &io_ctx, TerminationOptions options,
                                    std::function<void(TerminationResult)> on_done) {
  auto initial = options.get_agents();
  if (get_active_background_agents(initial).empty()) {
    TerminationResult result;
    result.status = TerminationStatus::Noop;
    result.agents = std::move(initial);
    asio::post(io_ctx, [on_done = std::move(on_done), result = std::move(result)]() mutable {
      on_done(std::move(result));
    });
    return;
  }

  auto shared_options = std::make_shared<TerminationOptions>(std::move(options));
  auto snapshot = std::make_shared<std::vector<Agent>>(std::move(initial));
  auto done = std::make_shared<std::function<void(TerminationResult)>>(std::move(on_done));
  auto completed = std::make_shared<bool>(false);

  AbortCompletion finish = [&io_ctx, shared_options, snapshot, done, completed](std::exception_ptr error) {
    // Continue on the event loop even when the handler completes inline
    asio::post(io_ctx, [shared_options, snapshot, done, completed, error]() {
      if (*completed) {
        spdlog::warn("[Termination] abort handler completed more than once");
        return;
      }
      *completed = true;

      TerminationResult result;
      if (error) {
        try {
          std::rethrow_exception(error);
        } catch (const std::exception &e) {
          spdlog::warn("[Termination] background abort failed: {}", e.what());
        } catch (...) {
          spdlog::warn("[Termination] background abort failed with a non-standard exception");
        }
        result.status = TerminationStatus::Failed;
        result.agents = *snapshot;
        result.error = error;
        (*done)(std::move(result));
        return;
      }

      auto interrupted = interrupt_active_background_agents(shared_options->get_agents(), shared_options->now());
      result.status = TerminationStatus::Terminated;
      result.agents = std::move(interrupted.agents);
      result.interrupted_ids = std::move(interrupted.interrupted_ids);
      spdlog::info("[Termination] interrupted {} background agent(s)", result.interrupted_ids.size());
      (*done)(std::move(result));
    });
  };

  if (!shared_options->on_terminate_background_agents) {
    finish(nullptr);
    return;
  }

  try {
    shared_options->on_terminate_background_agents(finish);
  } catch (const std::exception &e) {
    spdlog::warn("[Termination] abort handler threw: {}", e.what());
    finish(std::current_exception());
  }
}

}  // namespace agentdeck
