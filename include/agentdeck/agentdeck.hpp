#pragma once

// Core types
#include "core/agent.hpp"
#include "core/config.hpp"
#include "core/message.hpp"
#include "core/types.hpp"

// Event bus
#include "bus/bus.hpp"

// SDK events
#include "events/correlation_guard.hpp"
#include "events/event_source.hpp"
#include "events/replay_source.hpp"
#include "events/sdk_event.hpp"

// Sub-agent lifecycle
#include "agents/agent_dedup.hpp"
#include "agents/lifecycle.hpp"
#include "agents/lifecycle_store.hpp"
#include "agents/termination.hpp"

// Transcript
#include "transcript/history_buffer.hpp"
#include "transcript/message_window.hpp"

// Session
#include "session/chat_session.hpp"

namespace agentdeck {

// Initialize logging from the configuration
void init(const Config &config);

// Flush and drop the loggers
void shutdown();

// Get version string
std::string version();

}  // namespace agentdeck
