#include "launcher/launcher.hpp"
#include "launcher/process.hpp"
#include "utils/logging.hpp"
#include <chrono>
#include <csignal>
#include <filesystem>
#include <unistd.h>

namespace stagelink {

namespace {

std::string currentExecutable() {
  char buf[4096];
  ssize_t n = ::readlink("/proc/self/exe", buf, sizeof(buf) - 1);
  if (n <= 0) {
    return {};
  }
  buf[n] = '\0';
  return std::string(buf);
}

} // namespace

Launcher::Launcher(Registry &registry, const ClientConfig &config)
    : registry_(registry), config_(config) {}

std::vector<std::string> Launcher::daemonCommand(const StageKey &key) const {
  std::string executable = config_.daemon_executable.empty()
                               ? currentExecutable()
                               : config_.daemon_executable;

  std::vector<std::string> argv{executable,
                                "--config=" + key.config_path,
                                "--stage=" + key.stage,
                                "--state-dir=" +
                                    registry_.stateDir().string()};
  argv.insert(argv.end(), config_.daemon_arguments.begin(),
              config_.daemon_arguments.end());
  argv.push_back("server");
  return argv;
}

Result<std::string> Launcher::connect(const StageKey &key,
                                      std::stop_token stop) {
  if (stop.stop_requested()) {
    return Result<std::string>(ErrorCode::LaunchCancelled);
  }

  auto existing = registry_.lookup(key);
  if (existing) {
    DEBUG_INFO("Found daemon for stage " << key.stage << " at "
                                         << existing.value().address);
    return existing.value().address;
  }

  switch (existing.error()) {
  case ErrorCode::RegistryNotFound:
    break;
  case ErrorCode::RegistryCorruptRecord:
    // Cannot be produced by publish(); treat like a stale entry
    LOG("Discarding unreadable registration: " << existing.message());
    if (auto removed = registry_.removeIfCorrupt(key); !removed) {
      return Result<std::string>(removed.error(), removed.message());
    } else if (!removed.value()) {
      // Someone else cleared it first and may already have a daemon up
      if (auto found = registry_.lookup(key)) {
        return found.value().address;
      }
    }
    break;
  default:
    return Result<std::string>(existing.error(), existing.message());
  }

  return spawnAndAwait(key, stop);
}

Result<std::string> Launcher::spawnAndAwait(const StageKey &key,
                                            std::stop_token stop) {
  LOG("No existing server found for stage " << key.stage
                                            << ", starting new one");
  auto spawned = Process::spawn(daemonCommand(key));
  if (!spawned) {
    return Result<std::string>(spawned.error(), spawned.message());
  }
  Process daemon = spawned.moveValue();

  LOG("Waiting for server to start");
  const auto tick = std::chrono::milliseconds(config_.poll_interval_ms);
  const auto deadline =
      std::chrono::steady_clock::now() +
      std::chrono::milliseconds(config_.registration_timeout_ms);

  while (true) {
    if (auto found = registry_.lookup(key)) {
      daemon.release();
      DEBUG_INFO("Daemon pid " << found.value().pid << " registered at "
                               << found.value().address);
      return found.value().address;
    }

    if (stop.stop_requested()) {
      // The daemon may still come up and serve the next invocation
      daemon.release();
      return Result<std::string>(ErrorCode::LaunchCancelled,
                                 "cancelled while waiting for stage " +
                                     key.stage);
    }

    if (std::chrono::steady_clock::now() >= deadline) {
      daemon.terminate(SIGTERM);
      if (!daemon.waitFor(std::chrono::seconds(2))) {
        daemon.terminate(SIGKILL);
        daemon.wait();
      }
      return Result<std::string>(
          ErrorCode::LaunchRegistrationTimeout,
          "no registration after " +
              std::to_string(config_.registration_timeout_ms) + " ms");
    }

    // Races the next tick against the child's exit and cancellation
    if (auto status = daemon.waitFor(tick, stop)) {
      // A daemon that lost the publish race exits after deferring to the
      // winner, whose record is visible by now
      if (auto found = registry_.lookup(key)) {
        return found.value().address;
      }
      return Result<std::string>(ErrorCode::LaunchSpawnFailure,
                                 "daemon exited before registering (" +
                                     status->describe() + ")");
    }
  }
}

} // namespace stagelink
