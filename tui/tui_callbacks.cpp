#include "tui_callbacks.h"

#include <string>

#include "agents/lifecycle.hpp"
#include "bus/bus.hpp"
#include "tui_components.h"
#include "tui_state.h"

namespace agentdeck_cli {

using namespace agentdeck;

void setup_tui_callbacks(AppState& state, AppContext& ctx) {
  auto session_id = ctx.session->id();
  auto refresh_fn = ctx.refresh_fn;
  auto& bus = Bus::instance();

  std::weak_ptr<ChatSession> weak_session = ctx.session;

  ctx.session->on_change([refresh_fn]() {
    refresh_fn();
  });

  state.hidden_count = ctx.session->hidden_message_count();
  state.footer_status = ctx.session->footer_status();

  state.subscriptions.push_back(
      bus.subscribe<events::AgentsChanged>([&state, session_id, weak_session, refresh_fn](const events::AgentsChanged& e) {
        if (e.session_id != session_id) return;
        auto session = weak_session.lock();
        if (!session) return;
        // 实时列表为空时回退到最近一条消息的快照
        state.footer_status =
            format_background_agent_footer_status(resolve_background_agents_for_footer(e.agents, session->messages()));
        refresh_fn();
      }));

  state.subscriptions.push_back(bus.subscribe<events::MessagesEvicted>(
      [&state, session_id, weak_session, refresh_fn](const events::MessagesEvicted& e) {
        if (e.session_id != session_id) return;
        state.hidden_count = e.hidden_count;
        if (auto session = weak_session.lock()) {
          state.footer_status = session->footer_status();
        }
        refresh_fn();
      }));

  state.subscriptions.push_back(bus.subscribe<events::Notice>([&state, session_id, refresh_fn](const events::Notice& e) {
    if (e.session_id != session_id) return;
    state.notice = e.text;
    refresh_fn();
  }));

  state.subscriptions.push_back(
      bus.subscribe<events::StreamStateChanged>([&state, session_id, refresh_fn](const events::StreamStateChanged& e) {
        if (e.session_id != session_id) return;
        // 新的回合开始时自动滚到底
        if (e.is_streaming) {
          state.reset_view();
        }
        refresh_fn();
      }));

  state.subscriptions.push_back(
      bus.subscribe<events::PermissionRequested>([&state, session_id, refresh_fn](const events::PermissionRequested& e) {
        if (e.session_id != session_id) return;
        std::string line = "⚠ Permission requested: " + e.tool_name;
        if (!e.description.empty()) {
          line += " · " + truncate_text(e.description, 80);
        }
        state.info_lines.push_back(line);
        refresh_fn();
      }));
}

void teardown_tui_callbacks(AppState& state) {
  for (auto id : state.subscriptions) {
    Bus::instance().unsubscribe(id);
  }
  state.subscriptions.clear();
}

}  // namespace agentdeck_cli
