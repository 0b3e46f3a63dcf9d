#include <gtest/gtest.h>

#include <asio.hpp>
#include <climits>
#include <stdexcept>

#include "agents/termination.hpp"

using namespace agentdeck;

namespace {

constexpr EpochMs kBase = 1700000000000;

Agent make_agent(const std::string& id, AgentStatus status, bool background) {
  Agent agent;
  agent.id = id;
  agent.name = "explore";
  agent.status = status;
  agent.background = background;
  agent.started_at = format_timestamp(kBase);
  agent.current_tool = "Read";
  return agent;
}

}  // namespace

// --- TerminationDecisionTest ---

TEST(TerminationDecisionTest, WarnThenTerminate) {
  auto first = get_background_termination_decision(0, 2);
  EXPECT_EQ(first.action, TerminationAction::Warn);
  EXPECT_EQ(first.message, "Press Ctrl-F again to terminate background agents");

  auto second = get_background_termination_decision(1, 2);
  EXPECT_EQ(second.action, TerminationAction::Terminate);
  EXPECT_EQ(second.message, "All background agents killed");
}

TEST(TerminationDecisionTest, NoActiveAgentsMeansNone) {
  for (int presses = 0; presses < 5; ++presses) {
    EXPECT_EQ(get_background_termination_decision(presses, 0).action, TerminationAction::None) << presses;
  }
}

TEST(TerminationDecisionTest, PressCounterAdvancesSynchronously) {
  std::atomic<int> presses{0};

  // 同一输入周期内的两次按键
  auto first = evaluate_background_termination_press(presses, 1);
  auto second = evaluate_background_termination_press(presses, 1);

  EXPECT_EQ(first.decision.action, TerminationAction::Warn);
  EXPECT_EQ(first.next_press_count, 1);
  EXPECT_EQ(second.press_count, 1);
  EXPECT_EQ(second.decision.action, TerminationAction::Terminate);
  EXPECT_EQ(presses.load(), 0);
}

TEST(TerminationDecisionTest, StaleCounterResetsWithoutAgents) {
  for (int stale : {1, 2, 7, INT_MAX}) {
    std::atomic<int> presses{stale};
    auto evaluation = evaluate_background_termination_press(presses, 0);

    EXPECT_EQ(evaluation.decision.action, TerminationAction::None) << "stale count " << stale;
    EXPECT_EQ(evaluation.next_press_count, 0) << "stale count " << stale;
    EXPECT_EQ(presses.load(), 0) << "stale count " << stale;
  }
}

TEST(TerminationKeyTest, OnlyPlainCtrlF) {
  EXPECT_TRUE(is_background_termination_key({"f", true, false, false}));
  EXPECT_FALSE(is_background_termination_key({"f", true, true, false}));
  EXPECT_FALSE(is_background_termination_key({"f", true, false, true}));
  EXPECT_FALSE(is_background_termination_key({"f", false, false, false}));
  EXPECT_FALSE(is_background_termination_key({"o", true, false, false}));
}

// --- InterruptTest ---

TEST(InterruptTest, InterruptsOnlyActiveBackground) {
  std::vector<Agent> agents{make_agent("fg", AgentStatus::Running, false), make_agent("bg1", AgentStatus::Background, true),
                            make_agent("bg2", AgentStatus::Completed, true)};

  auto result = interrupt_active_background_agents(agents, kBase + 2000);
  ASSERT_EQ(result.interrupted_ids.size(), 1u);
  EXPECT_EQ(result.interrupted_ids[0], "bg1");
  EXPECT_EQ(result.agents[0].status, AgentStatus::Running);
  EXPECT_EQ(result.agents[1].status, AgentStatus::Interrupted);
  EXPECT_EQ(result.agents[1].duration_ms, 2000);
  EXPECT_FALSE(result.agents[1].current_tool.has_value());
  EXPECT_EQ(result.agents[2].status, AgentStatus::Completed);
}

TEST(InterruptTest, Idempotent) {
  auto unparseable = make_agent("bg2", AgentStatus::Background, true);
  unparseable.started_at = "?";
  unparseable.duration_ms = 42;
  std::vector<Agent> agents{make_agent("bg1", AgentStatus::Background, true), unparseable,
                            make_agent("fg", AgentStatus::Pending, false)};

  auto once = interrupt_active_background_agents(agents, kBase + 10);
  auto twice = interrupt_active_background_agents(once.agents, kBase + 99);

  EXPECT_EQ(once.interrupted_ids.size(), 2u);
  EXPECT_EQ(once.agents[1].duration_ms, 42);
  EXPECT_TRUE(twice.interrupted_ids.empty());
  EXPECT_EQ(twice.agents, once.agents);
}

// --- ExecuteTerminationTest ---

class ExecuteTerminationTest : public ::testing::Test {
 protected:
  std::vector<Agent> live_{make_agent("bg1", AgentStatus::Background, true), make_agent("bg2", AgentStatus::Running, true)};

  TerminationOptions options() {
    TerminationOptions opts;
    opts.get_agents = [this]() {
      return live_;
    };
    opts.now = []() {
      return kBase + 1000;
    };
    return opts;
  }

  TerminationResult run(TerminationOptions opts) {
    TerminationResult out;
    int calls = 0;
    execute_background_termination(io_ctx_, std::move(opts), [&](TerminationResult result) {
      out = std::move(result);
      ++calls;
    });
    io_ctx_.run();
    EXPECT_EQ(calls, 1);
    return out;
  }

  asio::io_context io_ctx_;
};

TEST_F(ExecuteTerminationTest, NoopSkipsAbortHandler) {
  live_ = {make_agent("fg", AgentStatus::Running, false)};
  bool invoked = false;
  auto opts = options();
  opts.on_terminate_background_agents = [&invoked](AbortCompletion done) {
    invoked = true;
    done(nullptr);
  };

  auto result = run(std::move(opts));
  EXPECT_EQ(result.status, TerminationStatus::Noop);
  EXPECT_FALSE(invoked);
}

TEST_F(ExecuteTerminationTest, TerminatesAfterAbort) {
  AbortCompletion pending;
  auto opts = options();
  opts.on_terminate_background_agents = [&pending](AbortCompletion done) {
    pending = std::move(done);
  };

  TerminationResult out;
  bool finished = false;
  execute_background_termination(io_ctx_, std::move(opts), [&](TerminationResult result) {
    out = std::move(result);
    finished = true;
  });
  io_ctx_.poll();
  EXPECT_FALSE(finished);
  ASSERT_TRUE(pending);

  // bg2 finished on its own while the abort was in flight
  live_[1].status = AgentStatus::Completed;
  pending(nullptr);
  io_ctx_.restart();
  io_ctx_.run();

  ASSERT_TRUE(finished);
  EXPECT_EQ(out.status, TerminationStatus::Terminated);
  ASSERT_EQ(out.interrupted_ids.size(), 1u);
  EXPECT_EQ(out.interrupted_ids[0], "bg1");
  EXPECT_EQ(out.agents[0].status, AgentStatus::Interrupted);
  EXPECT_EQ(out.agents[1].status, AgentStatus::Completed);
}

TEST_F(ExecuteTerminationTest, FailureKeepsOriginalSnapshot) {
  auto original = live_;
  auto opts = options();
  opts.on_terminate_background_agents = [this](AbortCompletion done) {
    live_[0].status = AgentStatus::Completed;
    done(std::make_exception_ptr(std::runtime_error("runtime unreachable")));
  };

  auto result = run(std::move(opts));
  EXPECT_EQ(result.status, TerminationStatus::Failed);
  EXPECT_EQ(result.agents, original);
  EXPECT_TRUE(result.interrupted_ids.empty());
  ASSERT_TRUE(result.error);
  try {
    std::rethrow_exception(result.error);
  } catch (const std::runtime_error& e) {
    EXPECT_STREQ(e.what(), "runtime unreachable");
  }
}

TEST_F(ExecuteTerminationTest, ThrowingHandlerFails) {
  auto opts = options();
  opts.on_terminate_background_agents = [](AbortCompletion) {
    throw std::runtime_error("no client");
  };

  auto result = run(std::move(opts));
  EXPECT_EQ(result.status, TerminationStatus::Failed);
  EXPECT_EQ(result.agents, live_);
}

TEST_F(ExecuteTerminationTest, MissingHandlerTerminatesLocally) {
  auto result = run(options());
  EXPECT_EQ(result.status, TerminationStatus::Terminated);
  EXPECT_EQ(result.interrupted_ids.size(), 2u);
}

TEST_F(ExecuteTerminationTest, SecondCompletionIgnored) {
  auto opts = options();
  opts.on_terminate_background_agents = [](AbortCompletion done) {
    done(nullptr);
    done(std::make_exception_ptr(std::runtime_error("late")));
  };

  auto result = run(std::move(opts));
  EXPECT_EQ(result.status, TerminationStatus::Terminated);
}
