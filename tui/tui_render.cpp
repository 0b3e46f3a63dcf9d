#include "tui_render.h"

#include <filesystem>
#include <ftxui/screen/color.hpp>
#include <string>
#include <vector>

namespace agentdeck_cli {

using namespace ftxui;
using agentdeck::Agent;
using agentdeck::AgentStatus;
using agentdeck::Message;
using agentdeck::Role;

// ============================================================
// 消息渲染
// ============================================================

static Color agent_color(AgentStatus status) {
  switch (status) {
    case AgentStatus::Completed:
      return Color::Green;
    case AgentStatus::Error:
      return Color::Red;
    case AgentStatus::Interrupted:
      return Color::Yellow;
    case AgentStatus::Background:
      return Color::Blue;
    default:
      return Color::Magenta;
  }
}

Element render_agent_tree(const std::vector<Agent>& agents, int64_t now_ms) {
  if (agents.empty()) return text("");

  Elements rows;
  auto lines = agent_tree_lines(agents, now_ms);
  size_t agent_index = 0;
  for (const auto& line : lines) {
    // 详情行以 "│  " 或 "   " 开头，继承上一个 Agent 的颜色
    bool detail = line.rfind("│", 0) == 0 || line.rfind("   ", 0) == 0;
    if (!detail && agent_index < agents.size()) {
      rows.push_back(hbox({text("    "), text(line) | color(agent_color(agents[agent_index].status))}));
      ++agent_index;
    } else {
      rows.push_back(hbox({text("    "), text(line) | dim}));
    }
  }
  return vbox(rows);
}

Element render_message(const Message& message, const std::vector<Agent>& agents, int64_t now_ms) {
  switch (message.role()) {
    case Role::User:
      return vbox({
          hbox({text("  ❯ ") | color(Color::Green), text("You") | bold | color(Color::Green)}),
          hbox({text("    "), paragraph(message.content())}),
          text(""),
      });

    case Role::Assistant: {
      Elements content;
      if (message.content().empty() && message.is_streaming()) {
        content.push_back(text("Thinking...") | dim | color(Color::Cyan));
      } else {
        for (const auto& line : split_lines(message.content())) {
          content.push_back(paragraph(line));
        }
      }
      return vbox({
          hbox({text("  ✦ ") | color(Color::Cyan), text("AI") | bold | color(Color::Cyan)}),
          hbox({text("    "), vbox(content) | flex}) | flex,
          render_agent_tree(agents, now_ms),
          text(""),
      });
    }

    case Role::System: {
      Elements elems;
      for (const auto& line : split_lines(message.content())) {
        elems.push_back(hbox({text("  "), text(line) | dim}));
      }
      return vbox(elems);
    }
  }
  return text("");
}

// ============================================================
// 聊天视图
// ============================================================

static Element scrollable(Elements elements, AppState& state, size_t content_size, bool streaming) {
  // 检测内容变化，自动滚动到底部
  bool content_changed = content_size != state.last_content_size || streaming;
  state.last_content_size = content_size;
  if (state.auto_scroll && content_changed) {
    state.scroll_y = 1.0f;
  }

  return vbox(elements)                                //
         | focusPositionRelative(0.f, state.scroll_y)  //
         | vscroll_indicator                           //
         | yframe                                      //
         | flex;
}

Element build_chat_view(AppState& state, const AppContext& ctx) {
  const auto& session = *ctx.session;
  auto now = agentdeck::now_ms();

  Elements chat_elements;
  chat_elements.push_back(text(""));

  auto hidden = hidden_messages_label(state.hidden_count);
  if (!hidden.empty()) {
    chat_elements.push_back(hbox({text("  "), text(hidden) | dim}));
    chat_elements.push_back(text(""));
  }

  const auto& messages = session.messages();
  for (const auto& message : messages) {
    // 流式消息显示实时 Agent，结束的消息显示快照
    if (message.is_streaming()) {
      chat_elements.push_back(render_message(message, session.visible_agents(), now));
    } else {
      chat_elements.push_back(render_message(message, message.parallel_agents(), now));
    }
  }

  for (const auto& line : state.info_lines) {
    for (const auto& l : split_lines(line)) {
      chat_elements.push_back(hbox({text("  "), text(l) | dim}));
    }
  }
  chat_elements.push_back(text(""));

  return scrollable(std::move(chat_elements), state, messages.size() + state.info_lines.size(), session.is_streaming());
}

Element build_transcript_view(AppState& state, const AppContext& ctx) {
  auto now = agentdeck::now_ms();
  auto transcript = ctx.session->transcript();

  Elements elements;
  elements.push_back(hbox({text("  Transcript · " + std::to_string(transcript.size()) + " messages") | bold,
                           filler(), text("Ctrl+O to return  ") | dim}));
  elements.push_back(separator() | dim);
  for (const auto& message : transcript) {
    elements.push_back(render_message(message, message.parallel_agents(), now));
  }

  return scrollable(std::move(elements), state, transcript.size(), false);
}

// ============================================================
// 状态栏
// ============================================================

Element build_status_bar(const AppContext& ctx) {
  const auto& session = *ctx.session;
  bool streaming = session.is_streaming();

  return hbox({
      text(" " + std::filesystem::current_path().filename().string() + " ") | bold | color(Color::White) |
          bgcolor(Color::Blue),
      text(" "),
      text(session.id()) | dim,
      filler(),
      text(std::to_string(session.messages().size()) + " msgs") | dim,
      text("  "),
      text(streaming ? " ● Streaming " : " ● Ready ") | color(Color::White) |
          bgcolor(streaming ? Color::Yellow : Color::Green),
  });
}

Element build_footer(const AppState& state) {
  const auto& status = state.footer_status;

  Elements parts;
  if (!status.empty()) {
    parts.push_back(text(" ◐ " + status) | color(Color::Blue));
  }
  parts.push_back(filler());
  if (!state.notice.empty()) {
    parts.push_back(text(state.notice + " ") | color(Color::Yellow));
  } else {
    parts.push_back(text("esc interrupt · ctrl+f stop agents · ctrl+o transcript ") | dim);
  }
  return hbox(parts);
}

// ============================================================
// 命令提示菜单
// ============================================================

Element build_cmd_menu(const AppState& state) {
  if (!state.show_cmd_menu || state.input_text.empty()) return text("");

  auto matches = match_commands(state.input_text);
  if (matches.empty()) return text("");

  Elements menu_items;
  for (int j = 0; j < static_cast<int>(matches.size()); ++j) {
    auto& def = matches[j];
    bool selected = (j == state.cmd_menu_selected);
    auto item = hbox({
        text("  "),
        text(def.name) | bold,
        text(def.shortcut.empty() ? "" : " (" + def.shortcut + ")") | dim,
        text("  "),
        text(def.description) | dim,
    });
    if (selected) {
      item = item | bgcolor(Color::GrayDark) | color(Color::White);
    }
    menu_items.push_back(item);
  }
  return vbox(menu_items) | borderRounded | color(Color::GrayLight);
}

}  // namespace agentdeck_cli
