#pragma once
#include "server/event_hub.hpp"

namespace stagelink {

// Abstract interface for the deployment engine running inside a daemon.
// It is the only producer of events; it publishes them into the hub it is
// started with until stop() returns.
class Engine {
public:
  virtual ~Engine() = default;

  // Called once the daemon is registered and about to accept streams
  virtual void start(EventHub &hub) = 0;

  // Called on shutdown, after the hub has been closed
  virtual void stop() = 0;
};

} // namespace stagelink
