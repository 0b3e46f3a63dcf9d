// Plays a replay script without the terminal UI and prints the transcript
#include <asio.hpp>
#include <iostream>
#include <string>

#include "agentdeck/agentdeck.hpp"

using namespace agentdeck;

static void print_agents(const std::vector<Agent>& agents, const std::string& indent) {
  for (const auto& agent : agents) {
    std::cout << indent << "[" << to_string(agent.status) << "] " << agent.name;
    if (!is_generic_task(agent.task)) std::cout << ": " << agent.task;
    if (agent.tool_uses) std::cout << " (" << *agent.tool_uses << " tool uses)";
    std::cout << "\n";
    if (agent.result) std::cout << indent << "  => " << *agent.result << "\n";
  }
}

static void print_messages(const std::vector<Message>& messages) {
  for (const auto& message : messages) {
    std::cout << (message.role() == Role::User ? "> " : "") << message.content() << "\n";
    print_agents(message.parallel_agents(), "    ");
  }
}

int main(int argc, char* argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <script.ndjson>\n";
    return 1;
  }

  Config config = Config::from_env();
  config.replay.event_delay_ms = 5;
  agentdeck::init(config);

  auto turns = ReplayEventSource::load_script(argv[1]);
  if (turns.empty()) {
    std::cerr << "No events in " << argv[1] << "\n";
    return 1;
  }

  asio::io_context io_ctx;
  auto source = ReplayEventSource::create(io_ctx, config.replay, std::move(turns));
  auto session = ChatSession::create(io_ctx, config, source);

  auto notices = Bus::instance().subscribe<events::Notice>([](const events::Notice& e) {
    std::cout << "  (" << e.text << ")\n";
  });

  int turn = 0;
  while (source->remaining_turns() > 0) {
    session->start_turn("turn " + std::to_string(++turn));
    while (session->is_streaming() && io_ctx.run_one() > 0) {
    }
    std::cout << "-- turn " << turn << " done; footer: " << session->footer_status() << "\n";
  }

  // Let background agents finish
  io_ctx.restart();
  io_ctx.run();

  std::cout << "\n== transcript ==\n";
  print_messages(session->transcript());

  Bus::instance().unsubscribe(notices);
  agentdeck::shutdown();
  return 0;
}
