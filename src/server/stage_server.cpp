#include "server/stage_server.hpp"
#include "utils/logging.hpp"
#include <format>
#include <unistd.h>

namespace stagelink {

namespace {
// How long a stream writer waits on its queue before re-checking the socket
constexpr std::chrono::milliseconds STREAM_POLL_INTERVAL{250};
// Workers beyond max_streams, left for /health and 503 refusals
constexpr size_t SPARE_WORKERS = 4;
} // namespace

StageServer::StageServer(Registry &registry, StageKey key,
                         const ServerConfig &config)
    : registry_(registry), key_(std::move(key)), config_(config),
      hub_(static_cast<size_t>(config.subscriber_queue_capacity)) {
  config_.validate();

  // Every attached stream holds a worker for its whole lifetime; streams are
  // admitted up to max_streams so a request never queues behind them
  const size_t workers =
      static_cast<size_t>(config_.max_streams) + SPARE_WORKERS;
  svr_.new_task_queue = [workers] { return new httplib::ThreadPool(workers); };
  svr_.set_write_timeout(config_.write_timeout_seconds, 0);

  setupRoutes();
  DEBUG_INFO("Server initialized for stage " << key_.stage << " of "
                                             << key_.config_path);
}

StageServer::~StageServer() {
  stop();
  if (monitor_thread_.joinable()) {
    monitor_thread_.join();
  }
}

void StageServer::setEngine(std::unique_ptr<Engine> engine) {
  engine_ = std::move(engine);
  DEBUG_INFO("Engine attached");
}

std::string StageServer::address() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return address_;
}

void StageServer::markReady(bool ready) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    ready_ = ready;
    if (!ready) {
      finished_ = true;
    }
  }
  state_cv_.notify_all();
}

bool StageServer::waitUntilReady(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(state_mutex_);
  state_cv_.wait_for(lock, timeout, [this] { return ready_ || finished_; });
  return ready_;
}

Result<void> StageServer::start() {
  int port = config_.port;
  if (port == 0) {
    port = svr_.bind_to_any_port(config_.host);
  } else if (!svr_.bind_to_port(config_.host, port)) {
    port = -1;
  }
  if (port <= 0) {
    markReady(false);
    return Result<void>(ErrorCode::SystemBindFailed,
                        std::format("{}:{}", config_.host, config_.port));
  }

  std::string address = std::format("{}:{}", config_.host, port);
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    address_ = address;
  }

  // Registered before the accept loop runs; connections made in between
  // wait in the listen backlog
  auto registration = registry_.publish(key_, address, ::getpid());
  if (!registration) {
    LOG("Not serving stage " << key_.stage << ": "
                             << describeError(registration));
    svr_.stop();
    markReady(false);
    return Result<void>(registration.error(), registration.message());
  }
  registered_ = true;

  if (engine_) {
    engine_->start(hub_);
    engine_started_ = true;
  }

  monitor_thread_ = std::thread(&StageServer::idleMonitor, this);
  markReady(true);

  LOG("Serving stage " << key_.stage << " on http://" << address);
  bool served = true;
  if (!should_stop_) {
    served = svr_.listen_after_bind();
  }

  shutdown();
  if (!served) {
    return Result<void>(ErrorCode::SystemBindFailed,
                        "listener on " + address + " failed");
  }
  return Result<void>();
}

void StageServer::stop() {
  should_stop_ = true;
  hub_.close();
  svr_.stop();
  state_cv_.notify_all();
}

void StageServer::shutdown() {
  should_stop_ = true;
  hub_.close();
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    finished_ = true;
  }
  state_cv_.notify_all();
  if (monitor_thread_.joinable()) {
    monitor_thread_.join();
  }

  if (engine_started_) {
    engine_->stop();
    engine_started_ = false;
  }

  if (registered_) {
    // Only our own record; a successor may already have replaced it
    auto removed = registry_.removeIf(key_, address());
    if (!removed) {
      LOG_ERROR("Failed to deregister stage " << key_.stage << ": "
                                              << describeError(removed));
    }
    registered_ = false;
  }
  LOG("Stage " << key_.stage << " server stopped ("
               << hub_.publishedCount() << " events published)");
}

void StageServer::idleMonitor() {
  DEBUG_INFO("Started idle monitor thread");

  auto idle_since = std::chrono::steady_clock::now();
  std::unique_lock<std::mutex> lock(state_mutex_);
  while (!finished_) {
    state_cv_.wait_for(lock, std::chrono::milliseconds(200));
    if (finished_) {
      break;
    }

    // stop() may have run before the accept loop started; keep asking
    if (should_stop_) {
      lock.unlock();
      svr_.stop();
      lock.lock();
      continue;
    }

    if (config_.idle_timeout_seconds == 0) {
      continue;
    }
    auto now = std::chrono::steady_clock::now();
    if (hub_.subscriberCount() > 0) {
      idle_since = now;
      continue;
    }
    if (now - idle_since >= std::chrono::seconds(config_.idle_timeout_seconds)) {
      LOG("No subscribers for " << config_.idle_timeout_seconds
                                << "s, shutting down");
      lock.unlock();
      stop();
      lock.lock();
    }
  }

  DEBUG_INFO("Idle monitor thread stopped");
}

void StageServer::setupRoutes() {
  svr_.Get("/stream",
           [this](const httplib::Request &req, httplib::Response &res) {
             this->handleEndpointStream(req, res);
           });

  svr_.Get("/health",
           [this](const httplib::Request &req, httplib::Response &res) {
             this->handleEndpointHealth(req, res);
           });
}

void StageServer::handleEndpointStream(const httplib::Request &req,
                                       httplib::Response &res) {
  int active = active_streams_.load();
  do {
    if (active >= config_.max_streams) {
      LOG("Refusing stream from " << req.remote_addr << ": " << active
                                  << " streams already attached");
      res.status = 503;
      res.set_header("Retry-After", "1");
      res.set_content(nlohmann::json{{"error", "too many streams"}}.dump(),
                      "application/json");
      return;
    }
  } while (!active_streams_.compare_exchange_weak(active, active + 1));

  auto subscriber = hub_.attach();
  LOG("Stream attached from " << req.remote_addr << " (subscriber "
                              << subscriber->id() << ")");

  const auto keepalive =
      std::chrono::seconds(config_.keepalive_interval_seconds);
  auto last_write =
      std::make_shared<std::chrono::steady_clock::time_point>(
          std::chrono::steady_clock::now());

  res.set_header("Cache-Control", "no-cache");
  res.set_chunked_content_provider(
      "application/x-ndjson",
      [subscriber, keepalive, last_write](size_t /*offset*/,
                                          httplib::DataSink &sink) {
        auto pull = subscriber->next(STREAM_POLL_INTERVAL);
        auto now = std::chrono::steady_clock::now();
        switch (pull.state) {
        case Subscriber::State::Line:
          *last_write = now;
          return sink.write(pull.line.data(), pull.line.size());
        case Subscriber::State::Idle:
          if (!sink.is_writable()) {
            return false;
          }
          if (now - *last_write >= keepalive) {
            *last_write = now;
            return sink.write("\n", 1);
          }
          return true;
        case Subscriber::State::Closed:
          sink.done();
          return true;
        case Subscriber::State::Overflowed:
          // Aborting without the final chunk tells the reader the stream
          // is incomplete
          LOG_ERROR("Aborting stream of subscriber " << subscriber->id()
                                                     << ": queue overflow");
          return false;
        }
        return false;
      },
      [this, subscriber](bool success) {
        // Slot first, so a detached subscriber never still counts as a stream
        active_streams_.fetch_sub(1);
        hub_.detach(subscriber);
        LOG("Stream of subscriber " << subscriber->id() << " ended"
                                    << (success ? "" : " abnormally"));
      });
}

void StageServer::handleEndpointHealth(const httplib::Request &,
                                       httplib::Response &res) {
  nlohmann::json health = {{"stage", key_.stage},
                           {"config_path", key_.config_path},
                           {"pid", static_cast<int64_t>(::getpid())},
                           {"address", address()},
                           {"subscribers", hub_.subscriberCount()},
                           {"streams", active_streams_.load()},
                           {"published", hub_.publishedCount()},
                           {"overflows", hub_.overflowCount()}};
  res.status = 200;
  res.set_content(health.dump(), "application/json");
}

} // namespace stagelink
