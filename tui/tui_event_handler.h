#pragma once

// tui_event_handler.h: 键盘事件和命令提交处理

#include <ftxui/component/event.hpp>
#include <ftxui/component/screen_interactive.hpp>

#include "tui_state.h"

namespace agentdeck_cli {

// 回车提交：命令或新一轮对话
void handle_submit(AppState& state, AppContext& ctx, ftxui::ScreenInteractive& screen);

// 主界面事件处理，返回 true 表示事件已消费
bool handle_main_event(AppState& state, AppContext& ctx, ftxui::ScreenInteractive& screen, ftxui::Event event);

}  // namespace agentdeck_cli
