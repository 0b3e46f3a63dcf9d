#include <gtest/gtest.h>

#include "agents/agent_dedup.hpp"

using namespace agentdeck;

namespace {

constexpr EpochMs kBase = 1700000000000;

Agent make_agent(const std::string& id, const std::optional<std::string>& correlation_id, const std::string& name,
                 const std::string& task, AgentStatus status, EpochMs started) {
  Agent agent;
  agent.id = id;
  agent.correlation_id = correlation_id;
  agent.name = name;
  agent.task = task;
  agent.status = status;
  agent.started_at = format_timestamp(started);
  return agent;
}

Agent placeholder(const std::string& tool_id, const std::string& name, EpochMs started) {
  return make_agent(tool_id, tool_id, name, "sub-agent task", AgentStatus::Pending, started);
}

}  // namespace

// --- DedupIdentityTest ---

TEST(DedupIdentityTest, EmptyAndSingleAreReturnedAsIs) {
  std::vector<Agent> empty;
  EXPECT_TRUE(deduplicate_agents(std::move(empty)).empty());

  std::vector<Agent> single{placeholder("toolu_01", "explore", kBase)};
  const Agent* storage = single.data();
  auto result = deduplicate_agents(std::move(single));
  EXPECT_EQ(result.data(), storage);
}

TEST(DedupIdentityTest, NothingToMergeKeepsStorageAndOrder) {
  std::vector<Agent> agents{
      make_agent("a1", "toolu_01", "explore", "Map the loader", AgentStatus::Running, kBase),
      make_agent("a2", "toolu_02", "explore", "Audit the writer", AgentStatus::Running, kBase),
      make_agent("a3", std::nullopt, "reviewer", "Review", AgentStatus::Completed, kBase),
  };
  const Agent* storage = agents.data();

  auto result = deduplicate_agents(std::move(agents));
  EXPECT_EQ(result.data(), storage);
  ASSERT_EQ(result.size(), 3u);
  EXPECT_EQ(result[0].id, "a1");
  EXPECT_EQ(result[1].id, "a2");
  EXPECT_EQ(result[2].id, "a3");
}

// --- DedupCorrelationTest ---

TEST(DedupCorrelationTest, PlaceholderMergesIntoSdkRow) {
  auto sdk_row = make_agent("a1", "toolu_01", "explore", "Map the loader", AgentStatus::Running, kBase + 1000);
  sdk_row.tool_uses = 3;
  sdk_row.current_tool = "Read";

  auto result = deduplicate_agents({placeholder("toolu_01", "explore", kBase), sdk_row});

  ASSERT_EQ(result.size(), 1u);
  const auto& merged = result[0];
  EXPECT_EQ(merged.id, "a1");
  EXPECT_EQ(merged.task, "Map the loader");
  EXPECT_EQ(merged.status, AgentStatus::Running);
  EXPECT_EQ(merged.tool_uses, 3);
  EXPECT_EQ(merged.current_tool, "Read");
  // 最早的开始时间
  EXPECT_EQ(merged.started_at, format_timestamp(kBase));
}

TEST(DedupCorrelationTest, DescriptiveTaskReplacesGenericOne) {
  auto described = placeholder("toolu_01", "explore", kBase);
  described.task = "Map the loader";
  auto sdk_row = make_agent("a1", "toolu_01", "explore", "", AgentStatus::Running, kBase);

  auto result = deduplicate_agents({described, sdk_row});
  ASSERT_EQ(result.size(), 1u);
  EXPECT_EQ(result[0].id, "a1");
  EXPECT_EQ(result[0].task, "Map the loader");
}

TEST(DedupCorrelationTest, TerminalStateWins) {
  auto finished = placeholder("toolu_01", "explore", kBase);
  finished.status = AgentStatus::Completed;
  finished.result = "found it";
  finished.duration_ms = 4200;
  auto sdk_row = make_agent("a1", "toolu_01", "explore", "Map the loader", AgentStatus::Running, kBase);
  sdk_row.current_tool = "Grep";

  auto result = deduplicate_agents({sdk_row, finished});
  ASSERT_EQ(result.size(), 1u);
  EXPECT_EQ(result[0].id, "a1");
  EXPECT_EQ(result[0].status, AgentStatus::Completed);
  EXPECT_EQ(result[0].result, "found it");
  EXPECT_EQ(result[0].duration_ms, 4200);
  EXPECT_FALSE(result[0].current_tool.has_value());
}

TEST(DedupCorrelationTest, LargerToolUsesWins) {
  auto a = make_agent("a1", "toolu_01", "explore", "Map", AgentStatus::Running, kBase);
  a.tool_uses = 5;
  auto b = placeholder("toolu_01", "explore", kBase);
  b.tool_uses = 2;

  auto result = deduplicate_agents({a, b});
  ASSERT_EQ(result.size(), 1u);
  EXPECT_EQ(result[0].tool_uses, 5);
}

TEST(DedupCorrelationTest, PendingBecomesRunningWhenAnyMemberRuns) {
  auto sdk_row = make_agent("a1", "toolu_01", "explore", "Map", AgentStatus::Pending, kBase);
  auto running = placeholder("toolu_01", "explore", kBase);
  running.status = AgentStatus::Running;

  auto result = deduplicate_agents({sdk_row, running});
  ASSERT_EQ(result.size(), 1u);
  EXPECT_EQ(result[0].status, AgentStatus::Running);
}

TEST(DedupCorrelationTest, BackgroundFlagSticks) {
  auto bg = placeholder("toolu_01", "explore", kBase);
  bg.status = AgentStatus::Background;
  bg.background = true;
  auto sdk_row = make_agent("a1", "toolu_01", "explore", "Map", AgentStatus::Running, kBase);

  auto result = deduplicate_agents({bg, sdk_row});
  ASSERT_EQ(result.size(), 1u);
  EXPECT_TRUE(result[0].background);
  EXPECT_TRUE(is_active_background_agent(result[0]));
}

TEST(DedupCorrelationTest, LatestRecordWinsTies) {
  auto first = make_agent("a1", "toolu_01", "explore", "Map", AgentStatus::Running, kBase);
  auto second = make_agent("a1-retry", "toolu_01", "explore", "Map again", AgentStatus::Running, kBase + 10);

  auto result = deduplicate_agents({first, second});
  ASSERT_EQ(result.size(), 1u);
  EXPECT_EQ(result[0].id, "a1-retry");
  EXPECT_EQ(result[0].task, "Map again");
}

TEST(DedupCorrelationTest, GroupKeepsFirstPosition) {
  auto other = make_agent("b1", "toolu_09", "reviewer", "Review", AgentStatus::Running, kBase);
  auto tail = make_agent("c1", std::nullopt, "planner", "Plan", AgentStatus::Running, kBase);
  auto sdk_row = make_agent("a1", "toolu_01", "explore", "Map", AgentStatus::Running, kBase);

  auto result = deduplicate_agents({other, placeholder("toolu_01", "explore", kBase), tail, sdk_row});
  ASSERT_EQ(result.size(), 3u);
  EXPECT_EQ(result[0].id, "b1");
  EXPECT_EQ(result[1].id, "a1");
  EXPECT_EQ(result[2].id, "c1");
}

// --- DedupHeuristicTest ---

TEST(DedupHeuristicTest, PlaceholderMergesIntoUncorrelatedRow) {
  auto row = make_agent("a1", std::nullopt, "explore", "Map the loader", AgentStatus::Running, kBase + 30000);

  auto result = deduplicate_agents({placeholder("toolu_01", "explore", kBase), row});
  ASSERT_EQ(result.size(), 1u);
  EXPECT_EQ(result[0].id, "a1");
  EXPECT_EQ(result[0].correlation_id, "toolu_01");
  EXPECT_EQ(result[0].task, "Map the loader");
}

TEST(DedupHeuristicTest, WindowBoundary) {
  auto p = placeholder("toolu_01", "explore", kBase);

  auto at_limit = make_agent("a1", std::nullopt, "explore", "Map", AgentStatus::Running, kBase + kPlaceholderMergeWindowMs);
  EXPECT_TRUE(is_placeholder_merge_candidate(p, at_limit));

  auto past_limit = at_limit;
  past_limit.started_at = format_timestamp(kBase + kPlaceholderMergeWindowMs + 1);
  EXPECT_FALSE(is_placeholder_merge_candidate(p, past_limit));
  EXPECT_EQ(deduplicate_agents({p, past_limit}).size(), 2u);
}

TEST(DedupHeuristicTest, DistinctDescriptiveTasksStaySeparate) {
  auto a = make_agent("a1", std::nullopt, "explore", "Map the loader", AgentStatus::Running, kBase);
  auto b = make_agent("a2", std::nullopt, "explore", "Audit the writer", AgentStatus::Running, kBase + 10);

  EXPECT_FALSE(is_placeholder_merge_candidate(a, b));
  EXPECT_EQ(deduplicate_agents({a, b}).size(), 2u);
}

TEST(DedupHeuristicTest, DifferentNamesStaySeparate) {
  auto row = make_agent("a1", std::nullopt, "reviewer", "Review", AgentStatus::Running, kBase);
  EXPECT_EQ(deduplicate_agents({placeholder("toolu_01", "explore", kBase), row}).size(), 2u);
}

TEST(DedupHeuristicTest, ConflictingCorrelationIdsStaySeparate) {
  auto row = make_agent("a2", "toolu_02", "explore", "Audit", AgentStatus::Running, kBase);
  EXPECT_EQ(deduplicate_agents({placeholder("toolu_01", "explore", kBase), row}).size(), 2u);
}

TEST(DedupHeuristicTest, UnparseableTimestampsNeverMerge) {
  auto p = placeholder("toolu_01", "explore", kBase);
  auto row = make_agent("a1", std::nullopt, "explore", "Map", AgentStatus::Running, kBase);
  row.started_at = "soon";

  EXPECT_FALSE(is_placeholder_merge_candidate(p, row));
}

TEST(DedupHeuristicTest, PlaceholderAbsorbedOnlyOnce) {
  auto p = placeholder("toolu_01", "explore", kBase);
  auto a = make_agent("a1", std::nullopt, "explore", "Map", AgentStatus::Running, kBase + 5);
  auto b = make_agent("a2", std::nullopt, "explore", "Audit", AgentStatus::Running, kBase + 10);

  auto result = deduplicate_agents({p, a, b});
  ASSERT_EQ(result.size(), 2u);
  EXPECT_EQ(result[0].id, "a1");
  EXPECT_EQ(result[1].id, "a2");
}
