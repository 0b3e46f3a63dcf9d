#pragma once

#include <functional>
#include <string>

#include "agents/termination.hpp"
#include "events/sdk_event.hpp"

namespace agentdeck {

// Producer of SDK events for one agent session (a vendor client, or a replay)
class EventSource {
 public:
  using EventSink = std::function<void(const SdkEvent &)>;

  virtual ~EventSource() = default;

  virtual SessionId session_id() const = 0;

  // Starts a turn. Events are delivered on the io_context thread, in order.
  virtual void send(const std::string &prompt, EventSink sink) = 0;

  // Stops the primary stream; done(nullptr) once the runtime acknowledged
  virtual void abort_stream(AbortCompletion done) = 0;

  // Stops every background sub-agent; done(nullptr) on success
  virtual void abort_background_agents(AbortCompletion done) = 0;
};

}  // namespace agentdeck
