#pragma once

// tui_components.h: agentdeck_cli 的可测试核心组件
// 命令解析、按键解析、Agent 树和状态文本
// 独立于 FTXUI 渲染层，可以单独进行单元测试

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "agents/termination.hpp"
#include "core/agent.hpp"

namespace agentdeck_cli {

// ============================================================
// 命令解析
// ============================================================

enum class CommandType {
  None,        // 不是命令，是普通消息
  Quit,        // /q, /quit
  Clear,       // /clear
  Help,        // /h, /help
  Compact,     // /compact <summary>
  Transcript,  // /t, /transcript，同 Ctrl+O
  Unknown,     // 无法识别的 / 命令
};

struct CommandDef {
  std::string name;
  std::string shortcut;
  std::string description;
  CommandType type;
};

const std::vector<CommandDef>& command_defs();
std::vector<CommandDef> match_commands(const std::string& prefix);

struct ParsedCommand {
  CommandType type = CommandType::None;
  std::string arg;
};

ParsedCommand parse_command(const std::string& input);

// ============================================================
// 按键解析
// ============================================================

// 终端输入序列 -> 按键。支持传统控制字符 (0x01-0x1a)、
// ESC 前缀的 Meta 组合以及 CSI u 编码 (ESC [ code ; mod u)
std::optional<agentdeck::KeyEvent> parse_key_sequence(const std::string& input);

// ============================================================
// Agent 展示
// ============================================================

std::string status_icon(agentdeck::AgentStatus status);
std::string format_duration(std::optional<int64_t> ms);

// "● explore · Find the config loader · 3 tool uses · 4.2s"
std::string format_agent_line(const agentdeck::Agent& agent, int64_t now_ms);

// 带树形前缀的多行展示
std::vector<std::string> agent_tree_lines(const std::vector<agentdeck::Agent>& agents, int64_t now_ms);

// "↑ 12 hidden messages · Ctrl+O for full transcript"，无隐藏消息时为空
std::string hidden_messages_label(size_t hidden_count);

// ============================================================
// 文本工具函数
// ============================================================

std::string truncate_text(const std::string& s, size_t max_len);
std::vector<std::string> split_lines(const std::string& text);

}  // namespace agentdeck_cli
