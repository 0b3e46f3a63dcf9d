#include <termios.h>
#include <unistd.h>

#include <asio.hpp>
#include <chrono>
#include <ftxui/component/component.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/loop.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/color.hpp>
#include <iostream>
#include <string>
#include <thread>

#include "agentdeck/agentdeck.hpp"
#include "core/version.hpp"
#include "tui_callbacks.h"
#include "tui_components.h"
#include "tui_event_handler.h"
#include "tui_render.h"
#include "tui_state.h"

using namespace agentdeck;
using namespace agentdeck_cli;
using namespace ftxui;

static void print_usage(const char* prog) {
  std::cout << "Usage: " << prog << " [replay-script.ndjson]\n"
            << "\n"
            << "Replays recorded SDK events into the chat view. Each message you send\n"
            << "plays the next turn of the script.\n"
            << "\n"
            << "Environment:\n"
            << "  AGENTDECK_HISTORY_DIR     directory for history buffer files\n"
            << "  AGENTDECK_LOG_LEVEL       trace|debug|info|warn|error\n"
            << "  AGENTDECK_MESSAGE_WINDOW  live messages kept in memory (default 50)\n";
}

int main(int argc, char* argv[]) {
  std::string script_path;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    }
    if (arg == "-v" || arg == "--version") {
      std::cout << "agentdeck " << AGENTDECK_VERSION_STRING << "\n";
      return 0;
    }
    script_path = arg;
  }

  // ===== 加载配置 =====
  Config config = Config::from_env();

  // ===== 初始化框架 =====
  asio::io_context io_ctx;
  agentdeck::init(config);

  std::vector<ReplayTurn> turns;
  if (!script_path.empty()) {
    turns = ReplayEventSource::load_script(script_path);
    if (turns.empty()) {
      std::cerr << "Error: no replayable events in " << script_path << "\n";
      return 1;
    }
  }

  auto source = ReplayEventSource::create(io_ctx, config.replay, std::move(turns));
  std::shared_ptr<ChatSession> session;
  try {
    session = ChatSession::create(io_ctx, config, source);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  // ===== FTXUI 屏幕 =====
  auto screen = ScreenInteractive::Fullscreen();
  screen.TrackMouse(true);

  // ===== 状态与上下文 =====
  AppState state;
  AppContext ctx{io_ctx, config, session, [&screen]() {
                   screen.Post(Event::Custom);
                 }};

  setup_tui_callbacks(state, ctx);

  // ===== 输入组件 =====
  auto input_option = InputOption();
  input_option.multiline = false;
  input_option.cursor_position = &state.input_cursor_pos;
  input_option.transform = [](InputState s) {
    if (s.is_placeholder) {
      s.element |= dim | color(Color::GrayDark);
    }
    return s.element;
  };
  input_option.on_change = [&state] {
    if (!state.input_text.empty() && state.input_text[0] == '/') {
      auto matches = match_commands(state.input_text);
      state.show_cmd_menu = !matches.empty();
      state.cmd_menu_selected = 0;
    } else {
      state.show_cmd_menu = false;
    }
  };
  input_option.on_enter = [&] {
    handle_submit(state, ctx, screen);
  };
  auto input_component = Input(&state.input_text, "输入您的消息，/help 查看命令", input_option);

  auto input_with_prompt = Renderer(input_component, [&] {
    return hbox({
        text(" > ") | bold | color(Color::Cyan),
        input_component->Render() | flex,
    });
  });

  // ===== 主渲染器 =====
  auto final_renderer = Renderer(input_with_prompt, [&] {
    auto status_bar = build_status_bar(ctx);
    auto main_view = state.show_transcript ? build_transcript_view(state, ctx) : build_chat_view(state, ctx);
    auto cmd_menu_element = build_cmd_menu(state);

    auto input_area = vbox({
        cmd_menu_element,
        separator() | dim,
        input_with_prompt->Render(),
        separator() | dim,
        build_footer(state),
    });

    return vbox({
        status_bar,
        separator() | dim,
        main_view | flex,
        input_area,
    });
  });

  // ===== 事件处理 =====
  auto component = CatchEvent(final_renderer, [&](Event event) {
    return handle_main_event(state, ctx, screen, event);
  });

  // ===== 欢迎消息 =====
  state.info_lines.push_back(std::string("agentdeck ") + AGENTDECK_VERSION_STRING +
                             " · Type a message to start, /help for commands.");

  // ===== 使用 Loop 手动控制循环 =====
  Loop loop(&screen, component);

  // 在 FTXUI 初始化终端后，禁用 ISIG 让 Ctrl+C 作为字符输入而非信号
  {
    struct termios term;
    tcgetattr(STDIN_FILENO, &term);
    term.c_lflag &= ~ISIG;  // 禁用信号生成（SIGINT, SIGQUIT, SIGTSTP）
    tcsetattr(STDIN_FILENO, TCSANOW, &term);
  }

  // 会话状态只在这个线程上修改：每一帧先处理 io_context 中到期的事件
  auto work = asio::make_work_guard(io_ctx);
  while (!loop.HasQuitted()) {
    io_ctx.poll();
    loop.RunOnce();
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  // ===== 清理 =====
  teardown_tui_callbacks(state);
  session->cancel_stream();
  work.reset();
  io_ctx.poll();
  io_ctx.stop();
  agentdeck::shutdown();

  return 0;
}
