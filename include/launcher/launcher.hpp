#pragma once
#include "client/client_config.hpp"
#include "events/events.hpp"
#include "registry/registry.hpp"
#include "utils/error_codes.hpp"
#include <stop_token>
#include <string>
#include <vector>

namespace stagelink {

// Client-side find-or-start. A registered address is handed back without a
// liveness check; the stream attach that follows is what proves it.
class Launcher {
public:
  Launcher(Registry &registry, const ClientConfig &config);

  Result<std::string> connect(const StageKey &key, std::stop_token stop);

  // Command line that starts a daemon for `key`
  std::vector<std::string> daemonCommand(const StageKey &key) const;

private:
  Result<std::string> spawnAndAwait(const StageKey &key, std::stop_token stop);

  Registry &registry_;
  ClientConfig config_;
};

} // namespace stagelink
