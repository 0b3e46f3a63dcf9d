#include <gtest/gtest.h>

#include <algorithm>
#include <asio.hpp>
#include <filesystem>

#include "bus/bus.hpp"
#include "events/replay_source.hpp"
#include "session/chat_session.hpp"

using namespace agentdeck;

namespace fs = std::filesystem;

class ChatSessionTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_dir_ = fs::temp_directory_path() / ("agentdeck_session_" + random_suffix());
    config_.history_dir = test_dir_;

    notice_sub_ = Bus::instance().subscribe<events::Notice>([this](const events::Notice& notice) {
      if (session_ && notice.session_id == session_->id()) {
        notices_.push_back(notice.text);
      }
    });
  }

  void TearDown() override {
    Bus::instance().unsubscribe(notice_sub_);
    session_.reset();
    std::error_code ec;
    fs::remove_all(test_dir_, ec);
  }

  void make_session(size_t window = 50, std::shared_ptr<EventSource> source = nullptr) {
    config_.message_window = window;
    session_ = ChatSession::create(io_ctx_, config_, std::move(source));
  }

  void send(EventType type, json data, const std::string& session_id = "") {
    SdkEvent event;
    event.type = type;
    event.session_id = session_id.empty() ? session_->id() : session_id;
    event.timestamp = now_timestamp();
    event.data = std::move(data);
    session_->dispatch(event);
  }

  void drain() {
    io_ctx_.restart();
    io_ctx_.run();
  }

  void finish_turn() {
    send(EventType::SessionIdle, json::object());
    drain();
  }

  void start_task(const std::string& tool_id, const std::string& type, const std::string& description,
                  bool background = false) {
    json input = {{"subagent_type", type}, {"description", description}};
    if (background) input["run_in_background"] = true;
    send(EventType::ToolStart, {{"toolId", tool_id}, {"toolName", "Task"}, {"toolInput", input}});
  }

  bool noticed(const std::string& text) const {
    return std::find(notices_.begin(), notices_.end(), text) != notices_.end();
  }

  asio::io_context io_ctx_;
  Config config_;
  fs::path test_dir_;
  std::shared_ptr<ChatSession> session_;
  std::vector<std::string> notices_;
  Bus::SubscriptionId notice_sub_ = 0;
};

// --- Turns ---

TEST_F(ChatSessionTest, TurnStreamsUntilIdle) {
  make_session();
  int changes = 0;
  session_->on_change([&changes]() {
    ++changes;
  });

  ASSERT_TRUE(session_->start_turn("hello"));
  EXPECT_FALSE(session_->start_turn("again"));
  ASSERT_EQ(session_->messages().size(), 2u);
  EXPECT_EQ(session_->messages()[0].role(), Role::User);
  EXPECT_TRUE(session_->messages()[1].is_streaming());

  send(EventType::MessageDelta, {{"delta", "Hi "}});
  send(EventType::MessageDelta, {{"delta", "there"}});
  send(EventType::SessionIdle, json::object());
  // 完成是异步的
  EXPECT_TRUE(session_->is_streaming());

  drain();
  EXPECT_FALSE(session_->is_streaming());
  EXPECT_FALSE(session_->messages()[1].is_streaming());
  EXPECT_EQ(session_->messages()[1].content(), "Hi there");
  EXPECT_GT(changes, 0);
}

TEST_F(ChatSessionTest, FirstDeltaMarksStreamingMeta) {
  make_session();
  ASSERT_TRUE(session_->start_turn("hello"));
  EXPECT_FALSE(session_->stream().has_streaming_meta);
  EXPECT_FALSE(session_->stream().is_agent_only_stream);

  send(EventType::MessageDelta, {{"delta", "Hi"}});
  EXPECT_TRUE(session_->stream().has_streaming_meta);
  send(EventType::MessageDelta, {{"delta", " there"}});
  EXPECT_TRUE(session_->stream().has_streaming_meta);

  finish_turn();
  EXPECT_FALSE(session_->stream().has_streaming_meta);

  // 新回合重新开始计
  ASSERT_TRUE(session_->start_turn("again"));
  EXPECT_FALSE(session_->stream().has_streaming_meta);
}

TEST_F(ChatSessionTest, MessageCompleteFillsEmptyContent) {
  make_session();
  session_->start_turn("hello");
  send(EventType::MessageComplete, {{"content", "full reply"}});
  drain();

  EXPECT_FALSE(session_->is_streaming());
  EXPECT_EQ(session_->messages()[1].content(), "full reply");
}

TEST_F(ChatSessionTest, ForeignSessionEventsDropped) {
  make_session();
  session_->start_turn("hello");
  send(EventType::MessageDelta, {{"delta", "not ours"}}, "other-session");
  send(EventType::SessionIdle, json::object(), "other-session");
  drain();

  EXPECT_TRUE(session_->is_streaming());
  EXPECT_EQ(session_->messages()[1].content(), "");
}

TEST_F(ChatSessionTest, SessionErrorEndsTurn) {
  make_session();
  session_->start_turn("hello");
  send(EventType::MessageDelta, {{"delta", "partial"}});
  send(EventType::SessionError, {{"error", "overloaded"}});

  EXPECT_FALSE(session_->is_streaming());
  EXPECT_EQ(session_->messages()[1].content(), "partial\n\nError: overloaded");
  EXPECT_TRUE(noticed("Error: overloaded"));
}

// --- Sub-agents ---

TEST_F(ChatSessionTest, TaskPlaceholderBecomesSubagent) {
  make_session();
  session_->start_turn("look around");

  start_task("toolu_01", "explore", "Map the loader");
  ASSERT_EQ(session_->live_agents().size(), 1u);
  EXPECT_EQ(session_->live_agents()[0].status, AgentStatus::Pending);

  send(EventType::SubagentStart,
       {{"subagentId", "agent-1"}, {"subagentType", "explore"}, {"task", "Map the loader"}, {"toolUseId", "toolu_01"}});
  ASSERT_EQ(session_->live_agents().size(), 1u);
  const auto& agent = session_->live_agents()[0];
  EXPECT_EQ(agent.id, "agent-1");
  EXPECT_EQ(agent.status, AgentStatus::Running);
  EXPECT_EQ(agent.correlation_id, "toolu_01");

  send(EventType::ToolStart, {{"toolId", "toolu_03"}, {"toolName", "Read"}, {"agentId", "agent-1"}});
  EXPECT_EQ(session_->live_agents()[0].current_tool, "Read");
  EXPECT_EQ(session_->live_agents()[0].tool_uses, 1);
  EXPECT_EQ(session_->visible_agents().size(), 1u);
}

TEST_F(ChatSessionTest, CompletionWaitsForForegroundAgent) {
  make_session();
  session_->start_turn("look around");
  start_task("toolu_01", "explore", "Map the loader");
  send(EventType::SubagentStart, {{"subagentId", "agent-1"}, {"subagentType", "explore"}, {"toolUseId", "toolu_01"}});

  send(EventType::MessageComplete, json::object());
  send(EventType::SessionIdle, json::object());
  drain();
  EXPECT_TRUE(session_->is_streaming());
  EXPECT_TRUE(session_->stream().has_pending_completion);

  send(EventType::SubagentComplete, {{"subagentId", "agent-1"}, {"success", true}});
  drain();
  EXPECT_FALSE(session_->is_streaming());

  const auto& snapshot = session_->messages()[1].parallel_agents();
  ASSERT_EQ(snapshot.size(), 1u);
  EXPECT_EQ(snapshot[0].status, AgentStatus::Completed);
  EXPECT_TRUE(session_->live_agents().empty());
}

TEST_F(ChatSessionTest, BlockingToolDelaysCompletion) {
  make_session();
  session_->start_turn("build it");
  send(EventType::ToolStart, {{"toolId", "toolu_05"}, {"toolName", "Bash"}});
  send(EventType::SessionIdle, json::object());
  drain();
  EXPECT_TRUE(session_->is_streaming());

  send(EventType::ToolComplete, {{"toolId", "toolu_05"}, {"toolName", "Bash"}, {"success", true}});
  drain();
  EXPECT_FALSE(session_->is_streaming());
}

TEST_F(ChatSessionTest, BackgroundAgentOutlivesTurn) {
  make_session();
  session_->start_turn("review in background");
  send(EventType::SubagentStart,
       {{"subagentId", "bg-1"}, {"subagentType", "reviewer"}, {"task", "Audit"}, {"isBackground", true}});
  finish_turn();

  EXPECT_FALSE(session_->is_streaming());
  ASSERT_EQ(session_->live_agents().size(), 1u);
  EXPECT_EQ(session_->live_agents()[0].status, AgentStatus::Background);
  EXPECT_EQ(session_->footer_status(), "1 background agent running");
  ASSERT_EQ(session_->messages()[1].parallel_agents().size(), 1u);

  send(EventType::SubagentComplete, {{"subagentId", "bg-1"}, {"success", true}, {"result", "no issues"}});
  EXPECT_TRUE(session_->live_agents().empty());
  EXPECT_EQ(session_->footer_status(), "");
  EXPECT_EQ(session_->messages()[1].parallel_agents()[0].status, AgentStatus::Completed);
  EXPECT_EQ(session_->messages()[1].parallel_agents()[0].result, "no issues");
}

TEST_F(ChatSessionTest, AsyncTaskResultMovesAgentToBackground) {
  make_session();
  session_->start_turn("look around");
  start_task("toolu_01", "explore", "Map the loader");
  send(EventType::SubagentStart, {{"subagentId", "agent-1"}, {"subagentType", "explore"}, {"toolUseId", "toolu_01"}});
  send(EventType::ToolComplete,
       {{"toolId", "toolu_01"}, {"toolName", "Task"}, {"result", R"({"isAsync":true,"agentId":"agent-1"})"}});
  finish_turn();

  EXPECT_FALSE(session_->is_streaming());
  ASSERT_EQ(session_->live_agents().size(), 1u);
  EXPECT_TRUE(is_active_background_agent(session_->live_agents()[0]));
}

// --- Cancellation ---

TEST_F(ChatSessionTest, CancelInterruptsForegroundAgents) {
  make_session();
  EXPECT_FALSE(session_->cancel_stream());

  session_->start_turn("look around");
  send(EventType::SubagentStart, {{"subagentId", "agent-1"}, {"subagentType", "explore"}});
  auto generation = session_->generation();

  ASSERT_TRUE(session_->cancel_stream());
  EXPECT_FALSE(session_->is_streaming());
  EXPECT_EQ(session_->generation(), generation + 1);
  EXPECT_FALSE(session_->messages()[1].is_streaming());
  ASSERT_EQ(session_->messages()[1].parallel_agents().size(), 1u);
  EXPECT_EQ(session_->messages()[1].parallel_agents()[0].status, AgentStatus::Interrupted);
  EXPECT_TRUE(session_->live_agents().empty());

  send(EventType::MessageDelta, {{"delta", "late"}});
  EXPECT_EQ(session_->messages()[1].content(), "");
  EXPECT_FALSE(session_->cancel_stream());
}

TEST_F(ChatSessionTest, StaleCompletionDoesNotEndNextTurn) {
  make_session();
  session_->start_turn("one");
  send(EventType::SessionIdle, json::object());
  session_->cancel_stream();

  session_->start_turn("two");
  drain();
  EXPECT_TRUE(session_->is_streaming());
  EXPECT_TRUE(session_->messages().back().is_streaming());

  finish_turn();
  EXPECT_FALSE(session_->is_streaming());
}

// --- Termination ---

TEST_F(ChatSessionTest, CtrlFWarnsThenTerminates) {
  make_session();
  session_->start_turn("review in background");
  send(EventType::SubagentStart,
       {{"subagentId", "bg-1"}, {"subagentType", "reviewer"}, {"task", "Audit"}, {"isBackground", true}});
  finish_turn();

  KeyEvent ctrl_f{"f", true, false, false};
  EXPECT_TRUE(session_->handle_key(ctrl_f));
  EXPECT_TRUE(noticed(kTerminationWarnMessage));
  EXPECT_EQ(session_->termination_press_count().load(), 1);

  EXPECT_TRUE(session_->handle_key(ctrl_f));
  EXPECT_EQ(session_->termination_press_count().load(), 0);
  drain();

  EXPECT_TRUE(noticed(kTerminationDoneMessage));
  EXPECT_TRUE(session_->live_agents().empty());
  EXPECT_EQ(session_->messages()[1].parallel_agents()[0].status, AgentStatus::Interrupted);
  EXPECT_EQ(session_->footer_status(), "");
}

TEST_F(ChatSessionTest, OtherKeysAreNotConsumed) {
  make_session();
  EXPECT_FALSE(session_->handle_key({"o", true, false, false}));
  EXPECT_FALSE(session_->handle_key({"f", true, true, false}));

  // 没有后台 agent 时按键被吃掉但什么都不做
  EXPECT_TRUE(session_->handle_key({"f", true, false, false}));
  drain();
  EXPECT_TRUE(notices_.empty());
  EXPECT_EQ(session_->termination_press_count().load(), 0);
}

// --- Window and history ---

TEST_F(ChatSessionTest, WindowEvictsIntoHistory) {
  make_session(2);
  session_->start_turn("one");
  send(EventType::MessageDelta, {{"delta", "first answer"}});
  finish_turn();

  session_->start_turn("two");
  EXPECT_EQ(session_->messages().size(), 2u);
  EXPECT_EQ(session_->hidden_message_count(), 2u);
  EXPECT_EQ(session_->history().written_count(), 2u);

  auto transcript = session_->transcript();
  ASSERT_EQ(transcript.size(), 4u);
  EXPECT_EQ(transcript[0].content(), "one");
  EXPECT_EQ(transcript[1].content(), "first answer");
  EXPECT_EQ(transcript[2].content(), "two");

  finish_turn();
  session_->clear();
  EXPECT_TRUE(session_->messages().empty());
  EXPECT_EQ(session_->hidden_message_count(), 0u);
  EXPECT_TRUE(session_->transcript().empty());
}

TEST_F(ChatSessionTest, CompactCollapsesHistory) {
  make_session(2);
  session_->start_turn("one");
  finish_turn();
  session_->start_turn("two");

  EXPECT_FALSE(session_->compact("Summary"));
  EXPECT_TRUE(noticed("Cannot compact while a response is streaming"));

  finish_turn();
  ASSERT_TRUE(session_->compact("Summary"));
  EXPECT_TRUE(session_->messages().empty());
  EXPECT_EQ(session_->hidden_message_count(), 0u);
  EXPECT_TRUE(noticed("Conversation compacted"));

  auto transcript = session_->transcript();
  ASSERT_EQ(transcript.size(), 1u);
  EXPECT_EQ(transcript[0].content(), "Summary");
  EXPECT_EQ(transcript[0].id().rfind("compact_", 0), 0u);
}

// --- Bus ---

TEST_F(ChatSessionTest, PermissionRequestPublished) {
  make_session();
  std::vector<events::PermissionRequested> requests;
  auto sub = Bus::instance().subscribe<events::PermissionRequested>([&requests](const events::PermissionRequested& e) {
    requests.push_back(e);
  });

  session_->start_turn("clean up");
  send(EventType::PermissionRequested, {{"toolName", "Bash"}, {"description", "rm -rf build"}});
  Bus::instance().unsubscribe(sub);

  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].session_id, session_->id());
  EXPECT_EQ(requests[0].tool_name, "Bash");
  EXPECT_EQ(requests[0].description, "rm -rf build");
}

// --- Replay ---

TEST_F(ChatSessionTest, ReplaysRecordedTurn) {
  const char* script = R"({"type":"session.start","data":{}}
{"type":"message.delta","data":{"delta":"Looking."}}
{"type":"tool.start","data":{"toolId":"toolu_01","toolName":"Task","toolInput":{"subagent_type":"explore","description":"Map the loader"}}}
{"type":"subagent.start","data":{"subagentId":"agent-1","subagentType":"explore","task":"Map the loader","toolUseId":"toolu_01"}}
{"type":"tool.start","data":{"toolId":"toolu_02","toolName":"Read","agentId":"agent-1"}}
{"type":"tool.complete","data":{"toolId":"toolu_02","toolName":"Read","agentId":"agent-1","success":true}}
{"type":"message.complete","data":{}}
{"type":"session.idle","data":{}}
{"type":"subagent.complete","data":{"subagentId":"agent-1","success":true,"result":"mapped"}}
)";
  Config::ReplaySettings settings;
  settings.event_delay_ms = 0;
  settings.session_id = "replay-1";
  auto source = ReplayEventSource::create(io_ctx_, settings, ReplayEventSource::parse_script(script));
  make_session(50, source);
  EXPECT_EQ(session_->id(), "replay-1");

  ASSERT_TRUE(session_->start_turn("go"));
  io_ctx_.run();

  EXPECT_FALSE(session_->is_streaming());
  EXPECT_EQ(session_->messages()[1].content(), "Looking.");
  const auto& snapshot = session_->messages()[1].parallel_agents();
  ASSERT_EQ(snapshot.size(), 1u);
  EXPECT_EQ(snapshot[0].id, "agent-1");
  EXPECT_EQ(snapshot[0].status, AgentStatus::Completed);
  EXPECT_EQ(snapshot[0].result, "mapped");
}
