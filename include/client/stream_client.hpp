#pragma once
#include "client/client_config.hpp"
#include "events/events.hpp"
#include "utils/error_codes.hpp"
#include <functional>
#include <stop_token>
#include <string>

namespace stagelink {

// Reads a daemon's /stream endpoint and hands each decoded event to the
// caller, synchronously and in arrival order.
//
// Outcomes: success when the daemon ends the stream, LaunchDaemonUnreachable
// when nothing accepts the connection or a foreign server answers (the
// caller's cue to heal the registry), LaunchDaemonBusy when the daemon
// refuses with 503, StreamIOError for a connected peer that does not answer
// or a fault after the stream was established, StreamOversizedLine, or
// StreamCancelled once `stop` is requested.
class StreamClient {
public:
  using EventHandler = std::function<void(const Event &)>;

  explicit StreamClient(const ClientConfig &config);

  Result<void> read(const std::string &address, std::stop_token stop,
                    const EventHandler &on_event) const;

  static bool splitAddress(const std::string &address, std::string &host,
                           int &port);

private:
  ClientConfig config_;
};

} // namespace stagelink
