#include "../include/heartbeat_engine.hpp"
#include "utils/logging.hpp"

HeartbeatEngine::HeartbeatEngine(std::chrono::seconds interval)
    : interval_(interval) {}

HeartbeatEngine::~HeartbeatEngine() { stop(); }

void HeartbeatEngine::start(stagelink::EventHub &hub) {
  started_ = std::chrono::steady_clock::now();
  worker_ = std::thread(&HeartbeatEngine::run, this, std::ref(hub));
  DEBUG_INFO("Heartbeat engine publishing every " << interval_.count() << "s");
}

void HeartbeatEngine::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  wakeup_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

void HeartbeatEngine::run(stagelink::EventHub &hub) {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!wakeup_.wait_for(lock, interval_, [this] { return stopping_; })) {
    auto uptime = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_);

    stagelink::Event event;
    event.type = "heartbeat";
    event.payload = {{"uptime_ms", uptime.count()},
                     {"subscribers", hub.subscriberCount()}};
    hub.publish(std::move(event));
  }
}
