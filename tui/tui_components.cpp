#include "tui_components.h"

#include <cctype>
#include <cstdio>
#include <sstream>

namespace agentdeck_cli {

using agentdeck::Agent;
using agentdeck::AgentStatus;

// ============================================================
// 命令解析
// ============================================================

const std::vector<CommandDef>& command_defs() {
  static const std::vector<CommandDef> defs = {
      {"/quit", "/q", "退出程序", CommandType::Quit},
      {"/clear", "", "清空聊天记录和历史缓冲", CommandType::Clear},
      {"/help", "/h", "显示帮助信息", CommandType::Help},
      {"/compact", "", "用摘要替换历史记录", CommandType::Compact},
      {"/transcript", "/t", "显示完整记录 (Ctrl+O)", CommandType::Transcript},
  };
  return defs;
}

std::vector<CommandDef> match_commands(const std::string& prefix) {
  std::vector<CommandDef> result;
  if (prefix.empty() || prefix[0] != '/') return result;

  std::string lower_prefix = prefix;
  for (auto& c : lower_prefix) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

  for (const auto& def : command_defs()) {
    if (def.name.compare(0, lower_prefix.size(), lower_prefix) == 0 ||
        (!def.shortcut.empty() && def.shortcut.compare(0, lower_prefix.size(), lower_prefix) == 0)) {
      result.push_back(def);
    }
  }
  return result;
}

ParsedCommand parse_command(const std::string& input) {
  if (input.empty() || input[0] != '/') return {CommandType::None, ""};

  auto space_pos = input.find(' ');
  std::string cmd = (space_pos != std::string::npos) ? input.substr(0, space_pos) : input;
  std::string arg = (space_pos != std::string::npos) ? input.substr(space_pos + 1) : "";

  if (cmd == "/q" || cmd == "/quit") return {CommandType::Quit, arg};
  if (cmd == "/clear") return {CommandType::Clear, arg};
  if (cmd == "/h" || cmd == "/help") return {CommandType::Help, arg};
  if (cmd == "/compact") return {CommandType::Compact, arg};
  if (cmd == "/t" || cmd == "/transcript") return {CommandType::Transcript, arg};
  return {CommandType::Unknown, cmd};
}

// ============================================================
// 按键解析
// ============================================================

std::optional<agentdeck::KeyEvent> parse_key_sequence(const std::string& input) {
  if (input.empty()) return std::nullopt;

  // 传统控制字符：Ctrl+A = 0x01 ... Ctrl+Z = 0x1a
  auto control_key = [](unsigned char c) -> std::optional<std::string> {
    if (c >= 0x01 && c <= 0x1a) return std::string(1, static_cast<char>('a' + c - 1));
    return std::nullopt;
  };

  if (input.size() == 1) {
    auto name = control_key(static_cast<unsigned char>(input[0]));
    if (!name) return std::nullopt;
    return agentdeck::KeyEvent{*name, true, false, false};
  }

  // ESC + 控制字符 = Meta+Ctrl
  if (input.size() == 2 && input[0] == '\x1b') {
    auto name = control_key(static_cast<unsigned char>(input[1]));
    if (!name) return std::nullopt;
    return agentdeck::KeyEvent{*name, true, false, true};
  }

  // CSI u: ESC [ <codepoint> ; <modifiers> u，modifiers = 1 + 位掩码 (1 shift, 2 alt, 4 ctrl, 8 meta)
  if (input.size() > 3 && input.compare(0, 2, "\x1b[") == 0 && input.back() == 'u') {
    int code = 0;
    int modifiers = 1;
    if (std::sscanf(input.c_str() + 2, "%d;%du", &code, &modifiers) < 1) return std::nullopt;
    if (code <= 0 || code > 0x7f) return std::nullopt;

    int mask = modifiers - 1;
    agentdeck::KeyEvent key;
    key.name = std::string(1, static_cast<char>(std::tolower(code)));
    key.shift = (mask & 1) != 0 || std::isupper(code);
    key.meta = (mask & 2) != 0 || (mask & 8) != 0;
    key.ctrl = (mask & 4) != 0;
    return key;
  }

  return std::nullopt;
}

// ============================================================
// Agent 展示
// ============================================================

std::string status_icon(AgentStatus status) {
  switch (status) {
    case AgentStatus::Pending:
      return "○";
    case AgentStatus::Running:
      return "●";
    case AgentStatus::Background:
      return "◐";
    case AgentStatus::Completed:
      return "✓";
    case AgentStatus::Error:
      return "✗";
    case AgentStatus::Interrupted:
      return "■";
  }
  return "○";
}

std::string format_duration(std::optional<int64_t> ms) {
  if (!ms || *ms < 0) return "";
  if (*ms < 1000) return std::to_string(*ms) + "ms";

  char buf[32];
  if (*ms < 60000) {
    std::snprintf(buf, sizeof(buf), "%.1fs", static_cast<double>(*ms) / 1000.0);
    return buf;
  }
  auto total_seconds = *ms / 1000;
  std::snprintf(buf, sizeof(buf), "%lldm %02llds", static_cast<long long>(total_seconds / 60),
                static_cast<long long>(total_seconds % 60));
  return buf;
}

std::string format_agent_line(const Agent& agent, int64_t now_ms) {
  std::string line = status_icon(agent.status) + " " + agent.name;
  if (!agentdeck::is_generic_task(agent.task)) {
    line += " · " + truncate_text(agent.task, 60);
  }
  if (agent.tool_uses && *agent.tool_uses > 0) {
    line += " · " + std::to_string(*agent.tool_uses) + (*agent.tool_uses == 1 ? " tool use" : " tool uses");
  }

  // 活跃的 Agent 显示实时耗时，结束的显示最终耗时
  auto duration = agentdeck::is_active_status(agent.status) ? agentdeck::elapsed_ms(agent, now_ms) : agent.duration_ms;
  auto duration_text = format_duration(duration);
  if (!duration_text.empty()) {
    line += " · " + duration_text;
  }
  return line;
}

std::vector<std::string> agent_tree_lines(const std::vector<Agent>& agents, int64_t now_ms) {
  std::vector<std::string> lines;
  for (size_t i = 0; i < agents.size(); ++i) {
    bool last = i + 1 == agents.size();
    const auto& agent = agents[i];
    lines.push_back(std::string(last ? "└─ " : "├─ ") + format_agent_line(agent, now_ms));

    std::string detail;
    if (agentdeck::is_active_status(agent.status) && agent.current_tool && !agent.current_tool->empty()) {
      detail = *agent.current_tool;
    } else if (agent.status == AgentStatus::Error && agent.error) {
      detail = *agent.error;
    }
    if (!detail.empty()) {
      lines.push_back(std::string(last ? "   " : "│  ") + "⎿ " + truncate_text(detail, 80));
    }
  }
  return lines;
}

std::string hidden_messages_label(size_t hidden_count) {
  if (hidden_count == 0) return "";
  return "↑ " + std::to_string(hidden_count) + (hidden_count == 1 ? " hidden message" : " hidden messages") +
         " · Ctrl+O for full transcript";
}

// ============================================================
// 文本工具函数
// ============================================================

std::string truncate_text(const std::string& s, size_t max_len) {
  if (s.size() <= max_len) return s;
  return s.substr(0, max_len) + "...";
}

std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream iss(text);
  std::string line;
  while (std::getline(iss, line)) {
    lines.push_back(line);
  }
  if (lines.empty()) lines.push_back("");
  return lines;
}

}  // namespace agentdeck_cli
