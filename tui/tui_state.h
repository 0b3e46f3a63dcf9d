#pragma once

// tui_state.h: TUI 应用的全局状态和上下文
// 包含所有 UI 状态变量，由 main 持有，各模块通过引用访问

#include <asio.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "bus/bus.hpp"
#include "core/config.hpp"
#include "session/chat_session.hpp"
#include "tui_components.h"

namespace agentdeck_cli {

// TUI 应用的全部可变状态，集中管理
struct AppState {
  // ----- 输入 -----
  std::string input_text;
  int input_cursor_pos = 0;

  // ----- 命令菜单 -----
  int cmd_menu_selected = 0;
  bool show_cmd_menu = false;

  // ----- 滚动控制 -----
  float scroll_y = 1.0f;          // 0.0=顶部, 1.0=底部
  bool auto_scroll = true;        // 新消息自动滚到底，用户上滚后暂停
  size_t last_content_size = 0;   // 检测内容变化以触发自动滚动

  // ----- Ctrl+C 两次退出 -----
  bool ctrl_c_pending = false;
  std::chrono::steady_clock::time_point ctrl_c_time;

  // ----- 完整记录视图 (Ctrl+O) -----
  bool show_transcript = false;

  // ----- 提示信息 -----
  std::vector<std::string> info_lines;  // 聊天区域末尾的系统提示（帮助、错误等）
  std::string notice;                   // 底栏单行提示（终止确认等）

  // ----- Bus 推送的会话状态 -----
  size_t hidden_count = 0;    // MessagesEvicted
  std::string footer_status;  // AgentsChanged / MessagesEvicted 时重新计算

  // ----- Bus 订阅 -----
  std::vector<agentdeck::Bus::SubscriptionId> subscriptions;

  // ----- 便捷方法 -----
  void reset_view() {
    scroll_y = 1.0f;
    auto_scroll = true;
  }

  void clear_all() {
    info_lines.clear();
    notice.clear();
    input_text.clear();
    input_cursor_pos = 0;
    show_cmd_menu = false;
    reset_view();
  }
};

// TUI 应用的外部依赖/上下文（生命周期由 main 管理）
struct AppContext {
  asio::io_context& io_ctx;
  agentdeck::Config& config;
  std::shared_ptr<agentdeck::ChatSession> session;
  std::function<void()> refresh_fn;
};

}  // namespace agentdeck_cli
