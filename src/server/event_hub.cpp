#include "server/event_hub.hpp"
#include "protocol/parser.hpp"
#include "utils/logging.hpp"
#include <algorithm>

namespace stagelink {

Subscriber::Subscriber(uint64_t id, size_t capacity)
    : id_(id), capacity_(capacity) {}

Subscriber::Pull Subscriber::next(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  ready_.wait_for(lock, timeout, [this] {
    return !queue_.empty() || closed_ || overflowed_;
  });

  if (overflowed_) {
    return {State::Overflowed, {}};
  }
  // Lines queued before a clean close are still delivered
  if (!queue_.empty()) {
    Pull pull{State::Line, std::move(queue_.front())};
    queue_.pop_front();
    return pull;
  }
  if (closed_) {
    return {State::Closed, {}};
  }
  return {State::Idle, {}};
}

size_t Subscriber::queued() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

bool Subscriber::offer(const std::string &line) {
  bool accepted = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (overflowed_) {
      return false;
    }
    if (closed_) {
      return true;
    }
    if (queue_.size() >= capacity_) {
      overflowed_ = true;
      queue_.clear();
    } else {
      queue_.push_back(line);
      accepted = true;
    }
  }
  ready_.notify_one();
  return accepted;
}

void Subscriber::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  ready_.notify_all();
}

EventHub::EventHub(size_t subscriber_capacity)
    : subscriber_capacity_(subscriber_capacity) {}

void EventHub::publish(Event event) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    DEBUG_WARN("Dropping " << event.type << " published after hub close");
    return;
  }

  // Stamped and encoded under the lock so every subscriber sees one order
  event.seq = next_seq_++;
  const std::string line = encodeEvent(event);

  std::vector<std::shared_ptr<Subscriber>> keep;
  keep.reserve(subscribers_.size());
  for (auto &subscriber : subscribers_) {
    if (subscriber->offer(line)) {
      keep.push_back(std::move(subscriber));
    } else {
      LOG_ERROR("Subscriber " << subscriber->id()
                              << " fell behind, closing its stream");
      overflows_.fetch_add(1);
    }
  }
  subscribers_.swap(keep);

  published_.fetch_add(1);
  DEBUG_DEBUG("Published " << event.type << " #" << event.seq << " to "
                           << subscribers_.size() << " subscribers");
}

std::shared_ptr<Subscriber> EventHub::attach() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto subscriber =
      std::make_shared<Subscriber>(next_subscriber_id_++, subscriber_capacity_);
  if (closed_) {
    subscriber->close();
    return subscriber;
  }
  subscribers_.push_back(subscriber);
  DEBUG_INFO("Subscriber " << subscriber->id() << " attached ("
                           << subscribers_.size() << " total)");
  return subscriber;
}

void EventHub::detach(const std::shared_ptr<Subscriber> &subscriber) {
  std::lock_guard<std::mutex> lock(mutex_);
  subscribers_.erase(
      std::remove(subscribers_.begin(), subscribers_.end(), subscriber),
      subscribers_.end());
  subscriber->close();
  DEBUG_INFO("Subscriber " << subscriber->id() << " detached ("
                           << subscribers_.size() << " remaining)");
}

void EventHub::close() {
  std::vector<std::shared_ptr<Subscriber>> subscribers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return;
    }
    closed_ = true;
    subscribers.swap(subscribers_);
  }
  for (auto &subscriber : subscribers) {
    subscriber->close();
  }
  DEBUG_INFO("Hub closed, ended " << subscribers.size() << " streams");
}

size_t EventHub::subscriberCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscribers_.size();
}

bool EventHub::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

} // namespace stagelink
