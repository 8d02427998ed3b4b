#pragma once
#include "client/client_config.hpp"
#include "client/stream_client.hpp"
#include "launcher/launcher.hpp"
#include "registry/registry.hpp"
#include <stop_token>

namespace stagelink {

// Front door for CLI commands: find or start the stage's daemon and stream
// its events into `on_event`.
//
// A daemon that crashed without deregistering leaves a record whose address
// refuses connections. That record is removed and the whole find-or-start
// flow runs again, at most max_connect_attempts times with doubling backoff.
// A daemon that accepts the connection is never healed: a busy (503) or
// unresponsive daemon, or a stream that fails after it was established, is
// reported as is.
class StageClient {
public:
  StageClient(Registry &registry, const ClientConfig &config);

  Result<void> attach(const StageKey &key, std::stop_token stop,
                      const StreamClient::EventHandler &on_event);

  Launcher &launcher() { return launcher_; }

private:
  bool backoff(int attempt, std::stop_token stop) const;

  Registry &registry_;
  ClientConfig config_;
  Launcher launcher_;
  StreamClient stream_;
};

} // namespace stagelink
