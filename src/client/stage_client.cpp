#include "client/stage_client.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace stagelink {

StageClient::StageClient(Registry &registry, const ClientConfig &config)
    : registry_(registry), config_(config), launcher_(registry, config),
      stream_(config) {}

Result<void> StageClient::attach(const StageKey &key, std::stop_token stop,
                                 const StreamClient::EventHandler &on_event) {
  Result<void> last(ErrorCode::LaunchDaemonUnreachable);

  for (int attempt = 1; attempt <= config_.max_connect_attempts; ++attempt) {
    auto address = launcher_.connect(key, stop);
    if (!address) {
      return Result<void>(address.error(), address.message());
    }

    auto streamed = stream_.read(address.value(), stop, on_event);
    if (streamed.error() != ErrorCode::LaunchDaemonUnreachable) {
      return streamed;
    }
    last = streamed;

    LOG("Daemon at " << address.value() << " is gone (attempt " << attempt
                     << "/" << config_.max_connect_attempts
                     << "), restarting it");
    auto removed = registry_.removeIf(key, address.value());
    if (!removed) {
      return Result<void>(removed.error(), removed.message());
    }

    if (attempt < config_.max_connect_attempts && !backoff(attempt, stop)) {
      return Result<void>(ErrorCode::LaunchCancelled);
    }
  }

  LOG_ERROR("Giving up on stage " << key.stage << " after "
                                  << config_.max_connect_attempts
                                  << " attempts");
  return last;
}

bool StageClient::backoff(int attempt, std::stop_token stop) const {
  // Doubles per attempt, capped at 64x the base delay
  const int shift = std::min(attempt - 1, 6);
  const auto delay =
      std::chrono::milliseconds(static_cast<int64_t>(config_.retry_backoff_ms)
                                << shift);
  DEBUG_DEBUG("Backing off " << delay.count() << "ms before reconnecting");

  std::mutex mutex;
  std::condition_variable_any wakeup;
  std::unique_lock<std::mutex> lock(mutex);
  // Nothing notifies: this only ends on timeout or a stop request
  wakeup.wait_for(lock, stop, delay, [] { return false; });
  return !stop.stop_requested();
}

} // namespace stagelink
