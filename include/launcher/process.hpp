#pragma once
#include "utils/error_codes.hpp"
#include <chrono>
#include <cstddef>
#include <optional>
#include <stop_token>
#include <string>
#include <sys/types.h>
#include <vector>

namespace stagelink {

// How a child process ended
struct ExitStatus {
  int code = 0;      // valid when !signaled
  int signal = 0;    // valid when signaled
  bool signaled = false;

  std::string describe() const;
};

// Handle to a spawned child. The owner either release()s it (the child keeps
// running on its own and is never killed or waited for; reapReleased()
// collects it after it exits) or collects its exit status with
// wait()/waitFor(). A handle that is destroyed without either is released.
class Process {
public:
  // Starts argv[0] with argv in its own session, stdin on /dev/null and
  // stdout/stderr/environment inherited.
  static Result<Process> spawn(const std::vector<std::string> &argv);

  Process() = default;
  ~Process();

  Process(Process &&other) noexcept;
  Process &operator=(Process &&other) noexcept;
  Process(const Process &) = delete;
  Process &operator=(const Process &) = delete;

  // Suspends until the child exits, `timeout` elapses or `stop` is
  // requested, whichever comes first. Returns the exit status once the child
  // has exited.
  std::optional<ExitStatus> waitFor(std::chrono::milliseconds timeout,
                                    std::stop_token stop = {});

  ExitStatus wait();

  void release();

  // Collects the exit status of released children that have ended, so a
  // long-lived parent does not accumulate zombies. Also runs on every
  // spawn(). Returns how many were reaped.
  static size_t reapReleased();

  // Sends `signal` to a child that has not been reaped or released
  bool terminate(int signal);

  pid_t pid() const noexcept { return pid_; }
  bool running() const noexcept { return pid_ > 0 && !exit_status_; }

private:
  explicit Process(pid_t pid);
  std::optional<ExitStatus> reap(bool block);
  void closePidfd();

  pid_t pid_ = -1;
  int pidfd_ = -1; // becomes readable when the child exits
  std::optional<ExitStatus> exit_status_;
};

} // namespace stagelink
