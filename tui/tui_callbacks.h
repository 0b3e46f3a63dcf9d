#pragma once

// tui_callbacks.h: 把会话和 Bus 通知接到 UI 状态上

#include "tui_state.h"

namespace agentdeck_cli {

void setup_tui_callbacks(AppState& state, AppContext& ctx);

// 退出前取消 Bus 订阅
void teardown_tui_callbacks(AppState& state);

}  // namespace agentdeck_cli
