#pragma once

// tui_render.h: FTXUI 渲染函数
// 消息、Agent 树、状态栏、底栏、命令菜单、完整记录视图

#include <ftxui/dom/elements.hpp>

#include "core/message.hpp"
#include "tui_components.h"
#include "tui_state.h"

namespace agentdeck_cli {

// 渲染单条消息；agents 为空时不显示 Agent 树
ftxui::Element render_message(const agentdeck::Message& message, const std::vector<agentdeck::Agent>& agents,
                              int64_t now_ms);

// 渲染 Agent 树
ftxui::Element render_agent_tree(const std::vector<agentdeck::Agent>& agents, int64_t now_ms);

// 构建聊天视图（含滚动逻辑）
ftxui::Element build_chat_view(AppState& state, const AppContext& ctx);

// 构建完整记录视图（历史缓冲 + 内存中的消息）
ftxui::Element build_transcript_view(AppState& state, const AppContext& ctx);

// 构建状态栏
ftxui::Element build_status_bar(const AppContext& ctx);

// 构建底栏：后台 Agent 状态和提示信息
ftxui::Element build_footer(const AppState& state);

// 构建命令提示菜单
ftxui::Element build_cmd_menu(const AppState& state);

}  // namespace agentdeck_cli
