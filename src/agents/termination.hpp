#pragma once

#include <asio.hpp>
#include <atomic>
#include <exception>
#include <functional>
#include <string>
#include <vector>

#include "core/agent.hpp"

namespace agentdeck {

enum class TerminationAction { None, Warn, Terminate };

std::string to_string(TerminationAction action);

struct TerminationDecision {
  TerminationAction action = TerminationAction::None;
  std::string message;

  bool operator==(const TerminationDecision &other) const = default;
};

inline constexpr const char *kTerminationWarnMessage = "Press Ctrl-F again to terminate background agents";
inline constexpr const char *kTerminationDoneMessage = "All background agents killed";

TerminationDecision get_background_termination_decision(int press_count, size_t active_background_count);

struct TerminationPressEvaluation {
  int press_count = 0;
  int next_press_count = 0;
  TerminationDecision decision;
};

// Reads and writes the caller-owned counter in the same call, so two presses
// delivered in one input tick see each other
TerminationPressEvaluation evaluate_background_termination_press(std::atomic<int> &press_count,
                                                                 size_t active_background_count);

struct KeyEvent {
  std::string name;  // lower-case key name, e.g. "f"
  bool ctrl = false;
  bool shift = false;
  bool meta = false;
};

// Ctrl+F only; Ctrl+Shift+F and Ctrl+Meta+F belong to other bindings
bool is_background_termination_key(const KeyEvent &event);

struct InterruptResult {
  std::vector<Agent> agents;
  std::vector<AgentId> interrupted_ids;
};

// Idempotent: a second pass interrupts nothing and returns the same agents
InterruptResult interrupt_active_background_agents(const std::vector<Agent> &agents, EpochMs now);

enum class TerminationStatus { Noop, Terminated, Failed };

std::string to_string(TerminationStatus status);

struct TerminationResult {
  TerminationStatus status = TerminationStatus::Noop;
  std::vector<Agent> agents;
  std::vector<AgentId> interrupted_ids;
  std::exception_ptr error;  // set for Failed
};

// Abort of the runtime's background agents. The handler must call the
// completion exactly once, with nullptr on success.
using AbortCompletion = std::function<void(std::exception_ptr)>;
using AbortHandler = std::function<void(AbortCompletion)>;

struct TerminationOptions {
  std::function<std::vector<Agent>()> get_agents;
  AbortHandler on_terminate_background_agents;  // may be empty
  std::function<EpochMs()> now = now_ms;
};

// 1. no active background agent: Noop, abort handler untouched
// 2. abort failed: Failed with the snapshot taken before the abort
// 3. otherwise interrupt what is still active in a fresh snapshot: Terminated
// on_done always runs on io_ctx.
void execute_background_termination(asio::io_context &io_ctx, TerminationOptions options,
                                    std::function<void(TerminationResult)> on_done);

}  // namespace agentdeck
