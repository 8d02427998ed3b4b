#pragma once
#include "events/events.hpp"
#include "registry/registry.hpp"
#include "server/engine.hpp"
#include "server/event_hub.hpp"
#include "server_config.hpp"
#include "utils/error_codes.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <httplib.h>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace stagelink {

// The daemon for one stage: binds an HTTP listener, registers it, and serves
// the hub's events on GET /stream until stopped.
class StageServer {
public:
  StageServer(Registry &registry, StageKey key,
              const ServerConfig &config = ServerConfig(""));
  ~StageServer();

  void setEngine(std::unique_ptr<Engine> engine);

  // Binds, publishes the registration and serves until stop(). Returns the
  // RegistryCollision error without serving when another daemon already
  // owns the stage.
  Result<void> start();

  // Safe from any thread, including signal and monitor threads
  void stop();

  // Blocks until start() is accepting streams or has failed
  bool waitUntilReady(std::chrono::milliseconds timeout);

  EventHub &hub() { return hub_; }
  const StageKey &key() const { return key_; }
  std::string address() const;

private:
  void setupRoutes();
  void handleEndpointStream(const httplib::Request &, httplib::Response &);
  void handleEndpointHealth(const httplib::Request &, httplib::Response &);
  void idleMonitor();
  void shutdown();
  void markReady(bool ready);

  Registry &registry_;
  StageKey key_;
  ServerConfig config_;
  EventHub hub_;

  httplib::Server svr_;
  std::string address_;
  mutable std::mutex state_mutex_;
  std::condition_variable state_cv_;
  bool ready_ = false;
  bool finished_ = false;
  bool registered_ = false;

  std::unique_ptr<Engine> engine_;
  bool engine_started_ = false;

  // Background thread enforcing idle_timeout_seconds
  std::thread monitor_thread_;
  std::atomic<bool> should_stop_{false};
  // Admitted /stream requests, released when the response is destroyed
  std::atomic<int> active_streams_{0};
};

} // namespace stagelink
