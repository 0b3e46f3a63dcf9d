#include <gtest/gtest.h>

#include "core/agent.hpp"

using namespace agentdeck;

namespace {

constexpr EpochMs kBase = 1700000000000;

}  // namespace

// --- AgentStatusTest ---

TEST(AgentStatusTest, StringConversion) {
  EXPECT_EQ(to_string(AgentStatus::Background), "background");
  EXPECT_EQ(agent_status_from_string("interrupted"), AgentStatus::Interrupted);
  EXPECT_FALSE(agent_status_from_string("cancelled").has_value());
}

TEST(AgentStatusTest, TerminalAndActive) {
  EXPECT_TRUE(is_terminal_status(AgentStatus::Completed));
  EXPECT_TRUE(is_terminal_status(AgentStatus::Error));
  EXPECT_TRUE(is_terminal_status(AgentStatus::Interrupted));
  EXPECT_TRUE(is_active_status(AgentStatus::Pending));
  EXPECT_TRUE(is_active_status(AgentStatus::Running));
  EXPECT_TRUE(is_active_status(AgentStatus::Background));
}

// --- AgentTest ---

TEST(AgentTest, BackgroundStatusImpliesFlag) {
  Agent agent;
  agent.status = AgentStatus::Background;
  agent = normalize_agent(agent);

  EXPECT_TRUE(agent.background);
  EXPECT_TRUE(is_active_background_agent(agent));
  EXPECT_FALSE(is_active_foreground_agent(agent));
}

TEST(AgentTest, CompletedBackgroundAgentIsNotActive) {
  Agent agent;
  agent.background = true;
  agent.status = AgentStatus::Completed;

  EXPECT_TRUE(is_background_agent(agent));
  EXPECT_FALSE(is_active_background_agent(agent));
}

TEST(AgentTest, GenericTasks) {
  EXPECT_TRUE(is_generic_task(""));
  EXPECT_TRUE(is_generic_task("  Sub-agent task "));
  EXPECT_TRUE(is_generic_task("subagent task"));
  EXPECT_FALSE(is_generic_task("Find the config loader"));
}

TEST(AgentTest, EagerPlaceholderShape) {
  Agent placeholder;
  placeholder.id = "toolu_01";
  placeholder.correlation_id = "toolu_01";
  placeholder.task = "sub-agent task";
  EXPECT_TRUE(has_eager_placeholder_shape(placeholder));

  Agent described = placeholder;
  described.task = "Map the config loader";
  EXPECT_FALSE(has_eager_placeholder_shape(described));

  Agent sdk_row = placeholder;
  sdk_row.id = "agent-1";
  EXPECT_FALSE(has_eager_placeholder_shape(sdk_row));
}

TEST(AgentTest, ElapsedNeedsParseableStart) {
  Agent agent;
  agent.started_at = format_timestamp(kBase);
  EXPECT_EQ(elapsed_ms(agent, kBase + 1500), 1500);

  // 时钟回拨不产生负数
  EXPECT_EQ(elapsed_ms(agent, kBase - 10), 0);

  agent.started_at = "yesterday";
  EXPECT_FALSE(elapsed_ms(agent, kBase).has_value());
}

TEST(AgentTest, JsonUsesCamelCase) {
  Agent agent;
  agent.id = "agent-1";
  agent.correlation_id = "toolu_01";
  agent.name = "explore";
  agent.task = "Map the config loader";
  agent.status = AgentStatus::Running;
  agent.started_at = format_timestamp(kBase);
  agent.tool_uses = 2;
  agent.current_tool = "Read";

  auto j = agent.to_json();
  EXPECT_EQ(j["correlationId"], "toolu_01");
  EXPECT_EQ(j["startedAt"], format_timestamp(kBase));
  EXPECT_EQ(j["toolUses"], 2);
  EXPECT_EQ(j["status"], "running");
  EXPECT_FALSE(j.contains("durationMs"));

  EXPECT_EQ(Agent::from_json(j), agent);
}

TEST(AgentTest, FromJsonAcceptsLegacyFields) {
  json j = {{"id", "agent-1"},
            {"name", "explore"},
            {"status", "background"},
            {"taskToolCallId", "toolu_07"},
            {"result", {{"summary", "ok"}}}};

  auto agent = Agent::from_json(j);
  ASSERT_TRUE(agent.correlation_id.has_value());
  EXPECT_EQ(*agent.correlation_id, "toolu_07");
  EXPECT_TRUE(agent.background);
  ASSERT_TRUE(agent.result.has_value());
  EXPECT_EQ(json::parse(*agent.result)["summary"], "ok");
}

TEST(AgentTest, FromJsonUnknownStatusFallsBackToPending) {
  auto agent = Agent::from_json({{"id", "a"}, {"status", "exploded"}});
  EXPECT_EQ(agent.status, AgentStatus::Pending);
}

TEST(AgentTest, FromJsonToleratesWrongFieldTypes) {
  Agent agent;
  ASSERT_NO_THROW(agent = Agent::from_json({{"id", 1}, {"name", nullptr}, {"task", json::array()},
                                            {"status", 2}, {"startedAt", 1700000000}}));
  EXPECT_EQ(agent.id, "");
  EXPECT_EQ(agent.task, "");
  EXPECT_EQ(agent.status, AgentStatus::Pending);
  EXPECT_EQ(agent.started_at, "");

  ASSERT_NO_THROW(agent = Agent::from_json("explore"));
  EXPECT_EQ(agent.id, "");
}

TEST(AgentTest, FindAgent) {
  std::vector<Agent> agents(2);
  agents[0].id = "a";
  agents[1].id = "b";

  ASSERT_NE(find_agent(agents, "b"), nullptr);
  EXPECT_EQ(find_agent(agents, "b"), &agents[1]);
  EXPECT_EQ(find_agent(agents, "c"), nullptr);
}

// --- TimestampTest ---

TEST(TimestampTest, ParsesUtcAndOffsets) {
  EXPECT_EQ(parse_timestamp_ms(format_timestamp(kBase)), kBase);
  EXPECT_EQ(parse_timestamp_ms("1970-01-01T00:00:01Z"), 1000);
  EXPECT_EQ(parse_timestamp_ms("1970-01-01T01:00:00+01:00"), 0);
  EXPECT_EQ(parse_timestamp_ms("1970-01-01T00:00:00.25Z"), 250);
}

TEST(TimestampTest, RejectsGarbage) {
  EXPECT_FALSE(parse_timestamp_ms("").has_value());
  EXPECT_FALSE(parse_timestamp_ms("not a date").has_value());
  EXPECT_FALSE(parse_timestamp_ms("2024-13-01T00:00:00Z").has_value());
  // 无时区的本地时间不明确
  EXPECT_FALSE(parse_timestamp_ms("2024-01-01T00:00:00").has_value());
}

TEST(IdTest, MakeIdUsesPrefix) {
  auto a = make_id("compact");
  auto b = make_id("compact");
  EXPECT_EQ(a.rfind("compact_", 0), 0u);
  EXPECT_NE(a, b);
}
