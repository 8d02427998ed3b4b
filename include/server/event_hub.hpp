#pragma once
#include "events/events.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace stagelink {

// One attached stream consumer. Holds encoded lines the hub pushed to it
// until the connection's writer pulls them.
class Subscriber {
public:
  enum class State { Line, Idle, Closed, Overflowed };

  struct Pull {
    State state;
    std::string line; // set when state == Line
  };

  Subscriber(uint64_t id, size_t capacity);

  // Blocks up to `timeout` for the next line
  Pull next(std::chrono::milliseconds timeout);

  uint64_t id() const noexcept { return id_; }
  size_t queued() const;

private:
  friend class EventHub;

  // Returns false when the line did not fit and the subscriber overflowed
  bool offer(const std::string &line);
  void close();

  const uint64_t id_;
  const size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable ready_;
  std::deque<std::string> queue_;
  bool closed_ = false;
  bool overflowed_ = false;
};

// Fans events published by the engine out to every attached subscriber.
// publish() is the only writer; it never waits on a subscriber. A subscriber
// whose queue is full is cut off rather than silently losing events.
class EventHub {
public:
  explicit EventHub(size_t subscriber_capacity);

  void publish(Event event);

  // Attached subscribers see only events published after this call
  std::shared_ptr<Subscriber> attach();
  void detach(const std::shared_ptr<Subscriber> &subscriber);

  // Ends every stream cleanly; later attaches are closed immediately
  void close();

  size_t subscriberCount() const;
  uint64_t publishedCount() const noexcept { return published_.load(); }
  uint64_t overflowCount() const noexcept { return overflows_.load(); }
  bool closed() const;

private:
  const size_t subscriber_capacity_;
  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<Subscriber>> subscribers_;
  uint64_t next_subscriber_id_ = 1;
  uint64_t next_seq_ = 1;
  bool closed_ = false;
  std::atomic<uint64_t> published_{0};
  std::atomic<uint64_t> overflows_{0};
};

} // namespace stagelink
