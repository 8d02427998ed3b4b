#include "launcher/process.hpp"
#include "utils/logging.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <functional>
#include <mutex>
#include <optional>
#include <poll.h>
#include <sys/eventfd.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace stagelink {

namespace {

int openPidfd(pid_t pid) {
#ifdef SYS_pidfd_open
  return static_cast<int>(::syscall(SYS_pidfd_open, pid, 0));
#else
  (void)pid;
  errno = ENOSYS;
  return -1;
#endif
}

// Children handed off by release(); reaped without blocking once they exit
std::mutex released_mutex;
std::vector<pid_t> released_pids;

ExitStatus decodeStatus(int status) {
  ExitStatus exit;
  if (WIFSIGNALED(status)) {
    exit.signaled = true;
    exit.signal = WTERMSIG(status);
  } else if (WIFEXITED(status)) {
    exit.code = WEXITSTATUS(status);
  }
  return exit;
}

} // namespace

std::string ExitStatus::describe() const {
  if (signaled) {
    return std::string("killed by signal ") + std::to_string(signal) + " (" +
           strsignal(signal) + ")";
  }
  return "exit status " + std::to_string(code);
}

Result<Process> Process::spawn(const std::vector<std::string> &argv) {
  if (argv.empty()) {
    return Result<Process>(ErrorCode::LaunchSpawnFailure, "empty command line");
  }

  reapReleased();

  // Everything the child touches is prepared before fork()
  std::vector<char *> args;
  args.reserve(argv.size() + 1);
  for (const auto &arg : argv) {
    args.push_back(const_cast<char *>(arg.c_str()));
  }
  args.push_back(nullptr);

  // Reports an exec failure back to the parent; closed by a successful exec
  int report[2];
  if (::pipe2(report, O_CLOEXEC) != 0) {
    return Result<Process>(ErrorCode::LaunchSpawnFailure,
                           std::string("pipe: ") + std::strerror(errno));
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    int fork_errno = errno;
    ::close(report[0]);
    ::close(report[1]);
    return Result<Process>(ErrorCode::LaunchSpawnFailure,
                           std::string("fork: ") + std::strerror(fork_errno));
  }

  if (pid == 0) {
    // Child: own session so the terminal's job control does not reach it
    ::close(report[0]);
    ::setsid();
    // The parent may block signals for a sigwait() thread; exec keeps masks
    sigset_t unblocked;
    sigemptyset(&unblocked);
    ::sigprocmask(SIG_SETMASK, &unblocked, nullptr);
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      if (devnull != STDIN_FILENO) {
        ::close(devnull);
      }
    }
    ::execv(args[0], args.data());
    int exec_errno = errno;
    ssize_t ignored = ::write(report[1], &exec_errno, sizeof(exec_errno));
    (void)ignored;
    ::_exit(127);
  }

  ::close(report[1]);
  int exec_errno = 0;
  ssize_t n;
  do {
    n = ::read(report[0], &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  ::close(report[0]);

  Process process(pid);
  if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
    process.wait();
    return Result<Process>(ErrorCode::LaunchSpawnFailure,
                           "cannot execute " + argv[0] + ": " +
                               std::strerror(exec_errno));
  }

  DEBUG_INFO("Spawned " << argv[0] << " as pid " << pid);
  return Result<Process>(std::move(process));
}

Process::Process(pid_t pid) : pid_(pid), pidfd_(openPidfd(pid)) {
  if (pidfd_ < 0) {
    DEBUG_DEBUG("pidfd_open unavailable (" << std::strerror(errno)
                                           << "), falling back to polling");
  }
}

Process::~Process() { release(); }

Process::Process(Process &&other) noexcept
    : pid_(other.pid_), pidfd_(other.pidfd_),
      exit_status_(std::move(other.exit_status_)) {
  other.pid_ = -1;
  other.pidfd_ = -1;
  other.exit_status_.reset();
}

Process &Process::operator=(Process &&other) noexcept {
  if (this != &other) {
    release();
    pid_ = other.pid_;
    pidfd_ = other.pidfd_;
    exit_status_ = std::move(other.exit_status_);
    other.pid_ = -1;
    other.pidfd_ = -1;
    other.exit_status_.reset();
  }
  return *this;
}

std::optional<ExitStatus> Process::reap(bool block) {
  if (exit_status_ || pid_ <= 0) {
    return exit_status_;
  }

  int status = 0;
  pid_t result;
  do {
    result = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
  } while (result < 0 && errno == EINTR);

  if (result == pid_) {
    exit_status_ = decodeStatus(status);
    closePidfd();
  } else if (result < 0) {
    // ECHILD: somebody else reaped it
    exit_status_ = ExitStatus{-1, 0, false};
    closePidfd();
  }
  return exit_status_;
}

std::optional<ExitStatus>
Process::waitFor(std::chrono::milliseconds timeout, std::stop_token stop) {
  if (exit_status_ || pid_ <= 0) {
    return exit_status_;
  }
  if (stop.stop_requested()) {
    return reap(false);
  }

  if (pidfd_ >= 0) {
    // A stop request wakes the poll through this eventfd
    int wakeup = stop.stop_possible() ? ::eventfd(0, EFD_CLOEXEC) : -1;
    std::optional<std::stop_callback<std::function<void()>>> on_stop;
    if (wakeup >= 0) {
      on_stop.emplace(stop, std::function<void()>([wakeup] {
                        uint64_t one = 1;
                        ssize_t ignored = ::write(wakeup, &one, sizeof(one));
                        (void)ignored;
                      }));
    }

    struct pollfd fds[2] = {{pidfd_, POLLIN, 0}, {wakeup, POLLIN, 0}};
    int ready;
    do {
      ready = ::poll(fds, wakeup >= 0 ? 2 : 1,
                     static_cast<int>(timeout.count()));
    } while (ready < 0 && errno == EINTR);

    // The callback must be gone before its descriptor is closed
    on_stop.reset();
    if (wakeup >= 0) {
      ::close(wakeup);
    }
    return reap(ready > 0 && (fds[0].revents & POLLIN) != 0);
  }

  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    if (auto status = reap(false)) {
      return status;
    }
    if (stop.stop_requested() ||
        std::chrono::steady_clock::now() >= deadline) {
      return std::nullopt;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}

ExitStatus Process::wait() {
  auto status = reap(true);
  return status ? *status : ExitStatus{-1, 0, false};
}

void Process::release() {
  if (pid_ > 0 && !exit_status_) {
    DEBUG_DEBUG("Released pid " << pid_);
    std::lock_guard<std::mutex> lock(released_mutex);
    released_pids.push_back(pid_);
  }
  closePidfd();
  pid_ = -1;
}

size_t Process::reapReleased() {
  std::lock_guard<std::mutex> lock(released_mutex);
  size_t reaped = 0;
  std::vector<pid_t> running;
  for (pid_t pid : released_pids) {
    int status = 0;
    pid_t result;
    do {
      result = ::waitpid(pid, &status, WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == 0) {
      running.push_back(pid);
    } else if (result == pid) {
      DEBUG_DEBUG("Reaped released pid " << pid << " ("
                                         << decodeStatus(status).describe()
                                         << ")");
      ++reaped;
    }
    // ECHILD: already collected elsewhere
  }
  released_pids.swap(running);
  return reaped;
}

bool Process::terminate(int signal) {
  if (!running()) {
    return false;
  }
  return ::kill(pid_, signal) == 0;
}

void Process::closePidfd() {
  if (pidfd_ >= 0) {
    ::close(pidfd_);
    pidfd_ = -1;
  }
}

} // namespace stagelink
