#pragma once
#include "server/engine.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

// Stand-in for the deployment engine: publishes a "heartbeat" event with the
// daemon's uptime every interval so attached terminals see a live stream.
class HeartbeatEngine : public stagelink::Engine {
public:
  explicit HeartbeatEngine(std::chrono::seconds interval);
  ~HeartbeatEngine() override;

  void start(stagelink::EventHub &hub) override;
  void stop() override;

private:
  void run(stagelink::EventHub &hub);

  std::chrono::seconds interval_;
  std::chrono::steady_clock::time_point started_;
  std::thread worker_;
  std::mutex mutex_;
  std::condition_variable wakeup_;
  bool stopping_ = false;
};
