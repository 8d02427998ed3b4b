#include "client/stage_client.hpp"
#include "include/heartbeat_engine.hpp"
#include "registry/registry.hpp"
#include "server/stage_server.hpp"
#include "utils/logging.hpp"
#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <pthread.h>
#include <stop_token>
#include <string>
#include <thread>

namespace {

struct Options {
  std::string config_path = "stagelink.config";
  std::string stage = "dev";
  std::string state_dir;
  std::string mode = "attach";
  int idle_timeout_seconds = -1; // -1 = take server.json's value
  int heartbeat_seconds = 5;
};

bool startsWith(const std::string &arg, const std::string &prefix,
                std::string &value) {
  if (arg.rfind(prefix, 0) != 0) {
    return false;
  }
  value = arg.substr(prefix.size());
  return true;
}

Options parseOptions(int argc, char *argv[]) {
  Options options;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    std::string value;
    if (startsWith(arg, "--config=", value)) {
      options.config_path = value;
    } else if (startsWith(arg, "--stage=", value)) {
      options.stage = value;
    } else if (startsWith(arg, "--state-dir=", value)) {
      options.state_dir = value;
    } else if (startsWith(arg, "--idle-timeout=", value)) {
      options.idle_timeout_seconds = std::stoi(value);
    } else if (startsWith(arg, "--heartbeat=", value)) {
      options.heartbeat_seconds = std::stoi(value);
    } else if (arg == "server" || arg == "stop" || arg == "attach") {
      options.mode = arg;
    } else {
      LOG_AND_EXIT("Unknown argument: " << arg, 2);
    }
  }
  if (options.stage.empty()) {
    LOG_AND_EXIT("--stage must not be empty", 2);
  }
  return options;
}

// Runs `on_signal` on SIGINT/SIGTERM. The signals must already be blocked
// in every thread so sigwait() is the only receiver.
class SignalWatcher {
public:
  template <typename Func> explicit SignalWatcher(Func &&on_signal) {
    thread_ = std::thread([this, on_signal = std::forward<Func>(on_signal)] {
      sigset_t set = signals();
      int signal = 0;
      while (sigwait(&set, &signal) == 0) {
        if (done_) {
          return;
        }
        LOG("Received signal " << signal);
        on_signal();
      }
    });
  }

  ~SignalWatcher() {
    done_ = true;
    pthread_kill(thread_.native_handle(), SIGTERM);
    thread_.join();
  }

  static sigset_t signals() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    return set;
  }

private:
  std::thread thread_;
  std::atomic<bool> done_{false};
};

int runServer(const Options &options, stagelink::Registry &registry,
              const stagelink::StageKey &key) {
  ServerConfig config((registry.stateDir() / "server.json").string());
  if (options.idle_timeout_seconds >= 0) {
    config.idle_timeout_seconds = options.idle_timeout_seconds;
  }

  stagelink::StageServer server(registry, key, config);
  if (options.heartbeat_seconds > 0) {
    server.setEngine(std::make_unique<HeartbeatEngine>(
        std::chrono::seconds(options.heartbeat_seconds)));
  }

  SignalWatcher watcher([&server] { server.stop(); });
  auto result = server.start();
  if (result.error() == stagelink::ErrorCode::RegistryCollision) {
    // Lost the race to another daemon; the launcher will find the winner
    return 3;
  }
  if (!result) {
    LOG_ERROR("Server failed: " << stagelink::describeError(result));
    return 1;
  }
  return 0;
}

int runStop(stagelink::Registry &registry, const stagelink::StageKey &key) {
  auto registration = registry.lookup(key);
  if (!registration) {
    std::cerr << stagelink::describeError(registration) << std::endl;
    return registration.error() == stagelink::ErrorCode::RegistryNotFound ? 0
                                                                          : 1;
  }

  pid_t pid = registration.value().pid;
  if (pid <= 0 || ::kill(pid, SIGTERM) != 0) {
    // Nobody left to deregister it
    LOG("Daemon pid " << pid << " is gone, removing its registration");
    auto removed = registry.removeIf(key, registration.value().address);
    return removed ? 0 : 1;
  }

  for (int i = 0; i < 100; ++i) {
    if (registry.lookup(key).error() == stagelink::ErrorCode::RegistryNotFound) {
      LOG("Stopped daemon for stage " << key.stage);
      return 0;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  LOG_ERROR("Daemon pid " << pid << " did not shut down");
  return 1;
}

int runAttach(stagelink::Registry &registry, const stagelink::StageKey &key) {
  ClientConfig config((registry.stateDir() / "client.json").string());
  stagelink::StageClient client(registry, config);

  std::stop_source stop;
  SignalWatcher watcher([&stop] { stop.request_stop(); });

  auto result = client.attach(key, stop.get_token(),
                              [](const stagelink::Event &event) {
                                nlohmann::json j = event;
                                std::cout << j.dump() << std::endl;
                              });
  if (result.error() == stagelink::ErrorCode::StreamCancelled ||
      result.error() == stagelink::ErrorCode::LaunchCancelled) {
    return 130;
  }
  if (!result) {
    std::cerr << stagelink::describeError(result) << std::endl;
    return 1;
  }
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  Options options;
  try {
    options = parseOptions(argc, argv);
  } catch (const std::exception &e) {
    LOG_AND_EXIT("Invalid argument: " << e.what(), 2);
  }

  // Blocked before any thread exists so only SignalWatcher receives them
  sigset_t signals = SignalWatcher::signals();
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);

  try {
    auto key = stagelink::Registry::makeKey(options.config_path, options.stage);
    std::filesystem::path state_dir =
        options.state_dir.empty()
            ? stagelink::Registry::defaultStateDir(key.config_path)
            : std::filesystem::path(options.state_dir);
    stagelink::Registry registry(state_dir);

    if (options.mode == "server") {
      return runServer(options, registry, key);
    }
    if (options.mode == "stop") {
      return runStop(registry, key);
    }
    return runAttach(registry, key);
  } catch (const std::exception &e) {
    LOG_AND_EXIT(e.what(), 1);
  }
}
