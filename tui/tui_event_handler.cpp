#include "tui_event_handler.h"

#include <algorithm>
#include <chrono>
#include <ftxui/component/component.hpp>
#include <spdlog/spdlog.h>
#include <string>

#include "tui_components.h"
#include "tui_state.h"

namespace agentdeck_cli {

using namespace ftxui;

static const std::string kDefaultCompactSummary = "Conversation compacted.";

// ============================================================
// 命令提交处理
// ============================================================

void handle_submit(AppState& state, AppContext& ctx, ScreenInteractive& screen) {
  // 命令菜单补全
  if (state.show_cmd_menu) {
    auto matches = match_commands(state.input_text);
    bool exact = std::any_of(matches.begin(), matches.end(), [&state](const CommandDef& def) {
      return def.name == state.input_text || def.shortcut == state.input_text;
    });
    if (!exact && !matches.empty() && state.cmd_menu_selected < static_cast<int>(matches.size())) {
      state.input_text = matches[state.cmd_menu_selected].name;
      state.input_cursor_pos = static_cast<int>(state.input_text.size());
      state.show_cmd_menu = false;
      return;
    }
  }

  if (state.input_text.empty()) return;
  state.show_cmd_menu = false;
  state.notice.clear();

  auto input = state.input_text;
  state.input_text.clear();
  state.input_cursor_pos = 0;

  auto cmd = parse_command(input);
  switch (cmd.type) {
    case CommandType::Quit:
      screen.Exit();
      return;

    case CommandType::Clear:
      ctx.session->clear();
      state.clear_all();
      return;

    case CommandType::Help: {
      std::string h = "Commands:";
      for (const auto& def : command_defs()) {
        h += "\n  " + def.name;
        if (!def.shortcut.empty()) h += " (" + def.shortcut + ")";
        h += "  " + def.description;
      }
      h += "\nKeys:\n  Esc 中断当前回复\n  Ctrl+F 两次终止后台 Agent\n  Ctrl+O 完整记录\n  Ctrl+C 两次退出";
      state.info_lines.push_back(h);
      return;
    }

    case CommandType::Compact: {
      auto summary = agentdeck::trim(cmd.arg);
      if (summary.empty()) summary = kDefaultCompactSummary;
      if (!ctx.session->compact(summary)) {
        // 具体原因已经通过 Notice 显示在底栏
        state.info_lines.push_back(ctx.session->is_streaming() ? "✗ Cannot compact while a response is streaming"
                                                               : "✗ Compaction failed");
        return;
      }
      state.info_lines.clear();
      state.reset_view();
      return;
    }

    case CommandType::Transcript:
      state.show_transcript = !state.show_transcript;
      state.reset_view();
      return;

    case CommandType::Unknown:
      state.info_lines.push_back("✗ Unknown command: " + cmd.arg);
      return;

    case CommandType::None:
      break;
  }

  if (!ctx.session->start_turn(input)) {
    state.info_lines.push_back("✗ A response is still streaming. Press Esc to interrupt it.");
    state.input_text = input;
    state.input_cursor_pos = static_cast<int>(input.size());
    return;
  }
  state.show_transcript = false;
  state.reset_view();
}

// ============================================================
// 主事件处理
// ============================================================

bool handle_main_event(AppState& state, AppContext& ctx, ScreenInteractive& screen, Event event) {
  // 非 Ctrl+C 重置
  if (event != Event::Special("\x03")) {
    state.ctrl_c_pending = false;
  }

  // Esc: 关闭菜单 / 中断当前回复 / 退出完整记录视图
  if (event == Event::Escape) {
    if (state.show_cmd_menu) {
      state.show_cmd_menu = false;
      return true;
    }
    if (ctx.session->cancel_stream()) {
      state.info_lines.push_back("Interrupted");
      return true;
    }
    if (state.show_transcript) {
      state.show_transcript = false;
      state.reset_view();
    }
    return true;
  }

  // Ctrl+C: 中断 / 清空输入框 / 1秒内两次退出
  if (event == Event::Special("\x03")) {
    if (ctx.session->cancel_stream()) {
      state.info_lines.push_back("Interrupted");
      state.ctrl_c_pending = false;
      return true;
    }

    if (!state.input_text.empty()) {
      state.input_text.clear();
      state.input_cursor_pos = 0;
      state.show_cmd_menu = false;
      state.ctrl_c_pending = false;
      return true;
    }

    auto now = std::chrono::steady_clock::now();
    if (state.ctrl_c_pending && (now - state.ctrl_c_time) < std::chrono::seconds(1)) {
      screen.Exit();
      return true;
    }
    state.ctrl_c_pending = true;
    state.ctrl_c_time = now;
    state.notice = "Press Ctrl+C again to exit";
    return true;
  }

  // Ctrl+O: 切换完整记录视图
  if (event == Event::Special("\x0f")) {
    state.show_transcript = !state.show_transcript;
    state.reset_view();
    return true;
  }

  // 其余控制键交给会话（Ctrl+F 终止后台 Agent）
  if (!event.is_character() && !event.is_mouse()) {
    auto key = parse_key_sequence(event.input());
    if (key && ctx.session->handle_key(*key)) {
      spdlog::debug("[TUI] termination key handled");
      return true;
    }
  }

  // Enter
  if (event == Event::Return) {
    handle_submit(state, ctx, screen);
    return true;
  }

  // 命令菜单导航
  if (state.show_cmd_menu) {
    auto matches = match_commands(state.input_text);
    int count = static_cast<int>(matches.size());
    if (count > 0) {
      if (event == Event::ArrowUp) {
        state.cmd_menu_selected = (state.cmd_menu_selected - 1 + count) % count;
        return true;
      }
      if (event == Event::ArrowDown) {
        state.cmd_menu_selected = (state.cmd_menu_selected + 1) % count;
        return true;
      }
      if (event == Event::Tab) {
        if (state.cmd_menu_selected < count) {
          state.input_text = matches[state.cmd_menu_selected].name;
          state.input_cursor_pos = static_cast<int>(state.input_text.size());
          state.show_cmd_menu = false;
        }
        return true;
      }
    }
  }

  // 滚动
  if (event == Event::PageUp || (event.is_mouse() && event.mouse().button == Mouse::WheelUp)) {
    state.auto_scroll = false;
    state.scroll_y = std::max(0.0f, state.scroll_y - (event == Event::PageUp ? 0.2f : 0.05f));
    return true;
  }
  if (event == Event::PageDown || (event.is_mouse() && event.mouse().button == Mouse::WheelDown)) {
    state.scroll_y = std::min(1.0f, state.scroll_y + (event == Event::PageDown ? 0.2f : 0.05f));
    if (state.scroll_y >= 1.0f) state.auto_scroll = true;
    return true;
  }

  return false;
}

}  // namespace agentdeck_cli
