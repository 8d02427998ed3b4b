#include "registry/registry.hpp"
#include "crypto/stage_digest.hpp"
#include "protocol/parser.hpp"
#include "utils/logging.hpp"
#include <atomic>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <sys/file.h>
#include <unistd.h>

namespace stagelink {

namespace {

// Closes the descriptor (and with it any flock) on scope exit
struct ScopedFd {
  int fd = -1;
  explicit ScopedFd(int f) : fd(f) {}
  ~ScopedFd() {
    if (fd >= 0) {
      ::close(fd);
    }
  }
  ScopedFd(const ScopedFd &) = delete;
  ScopedFd &operator=(const ScopedFd &) = delete;
};

std::atomic<uint64_t> temp_counter{0};

std::string errnoMessage(const std::string &what,
                         const std::filesystem::path &path) {
  return what + " " + path.string() + ": " + std::strerror(errno);
}

Result<void> writeAll(int fd, const std::string &data) {
  size_t written = 0;
  while (written < data.size()) {
    ssize_t n = ::write(fd, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return Result<void>(ErrorCode::RegistryIOFailed, std::strerror(errno));
    }
    written += static_cast<size_t>(n);
  }
  return Result<void>();
}

} // namespace

Registry::Registry(std::filesystem::path state_dir)
    : state_dir_(std::move(state_dir)), servers_dir_(state_dir_ / "servers") {}

StageKey Registry::makeKey(const std::string &config_path,
                           const std::string &stage) {
  std::error_code ec;
  auto normalized = std::filesystem::weakly_canonical(config_path, ec);
  if (ec) {
    normalized = std::filesystem::absolute(config_path, ec);
  }
  return StageKey{ec ? config_path : normalized.string(), stage};
}

std::filesystem::path
Registry::defaultStateDir(const std::string &config_path) {
  std::error_code ec;
  auto absolute = std::filesystem::absolute(config_path, ec);
  if (ec) {
    absolute = config_path;
  }
  return absolute.parent_path() / ".stagelink";
}

std::filesystem::path Registry::recordPath(const StageKey &key) const {
  return servers_dir_ / (StageDigest::compute(key) + ".json");
}

std::filesystem::path Registry::lockPath(const StageKey &key) const {
  return servers_dir_ / (StageDigest::compute(key) + ".lock");
}

Result<void> Registry::ensureDirectory() const {
  std::error_code ec;
  std::filesystem::create_directories(servers_dir_, ec);
  if (ec) {
    return Result<void>(ErrorCode::RegistryIOFailed,
                        "cannot create " + servers_dir_.string() + ": " +
                            ec.message());
  }
  return Result<void>();
}

Result<Registration> Registry::lookup(const StageKey &key) const {
  auto path = recordPath(key);

  std::ifstream file(path);
  if (!file.is_open()) {
    if (errno == ENOENT || !std::filesystem::exists(path)) {
      return Result<Registration>(ErrorCode::RegistryNotFound);
    }
    return Result<Registration>(ErrorCode::RegistryIOFailed,
                                errnoMessage("cannot open", path));
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    return Result<Registration>(ErrorCode::RegistryIOFailed,
                                "cannot read " + path.string());
  }

  auto registration = parseRegistration(buffer.str());
  if (!registration) {
    return Result<Registration>(ErrorCode::RegistryCorruptRecord,
                                path.string());
  }
  if (!(registration->key == key)) {
    // Digest collision or a record copied between projects
    return Result<Registration>(ErrorCode::RegistryCorruptRecord,
                                "record at " + path.string() +
                                    " belongs to stage " +
                                    registration->key.stage);
  }

  DEBUG_DEBUG("Registry lookup " << key.stage << " -> "
                                 << registration->address);
  return *registration;
}

Result<Registration> Registry::publish(const StageKey &key,
                                       const std::string &address, pid_t pid) {
  if (auto dir = ensureDirectory(); !dir) {
    return Result<Registration>(dir.error(), dir.message());
  }

  Registration registration;
  registration.key = key;
  registration.address = address;
  registration.pid = pid;
  registration.created_at = std::chrono::system_clock::now();

  nlohmann::json j = registration;
  std::string body = j.dump(2);
  body += '\n';

  auto final_path = recordPath(key);
  auto temp_path = final_path;
  temp_path += ".tmp." + std::to_string(::getpid()) + "." +
               std::to_string(temp_counter.fetch_add(1));

  {
    ScopedFd temp(::open(temp_path.c_str(),
                         O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644));
    if (temp.fd < 0) {
      return Result<Registration>(ErrorCode::RegistryIOFailed,
                                  errnoMessage("cannot create", temp_path));
    }
    auto written = writeAll(temp.fd, body);
    if (written && ::fsync(temp.fd) != 0) {
      written = Result<void>(ErrorCode::RegistryIOFailed, std::strerror(errno));
    }
    if (!written) {
      ::unlink(temp_path.c_str());
      return Result<Registration>(written.error(), written.message());
    }
  }

  // link(2) fails with EEXIST instead of replacing: first publisher wins
  int linked = ::link(temp_path.c_str(), final_path.c_str());
  int link_errno = errno;
  ::unlink(temp_path.c_str());

  if (linked != 0) {
    if (link_errno == EEXIST) {
      std::string owner = "another daemon";
      if (auto existing = lookup(key)) {
        owner = existing.value().address + " (pid " +
                std::to_string(existing.value().pid) + ")";
      }
      DEBUG_WARN("Registration for stage " << key.stage
                                           << " already held by " << owner);
      return Result<Registration>(ErrorCode::RegistryCollision,
                                  "stage " + key.stage + " is served by " +
                                      owner);
    }
    errno = link_errno;
    return Result<Registration>(ErrorCode::RegistryIOFailed,
                                errnoMessage("cannot publish", final_path));
  }

  LOG("Registered stage " << key.stage << " at " << address);
  return registration;
}

Result<void> Registry::remove(const StageKey &key) {
  auto path = recordPath(key);
  if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
    return Result<void>(ErrorCode::RegistryIOFailed,
                        errnoMessage("cannot remove", path));
  }
  DEBUG_INFO("Removed registration for stage " << key.stage);
  return Result<void>();
}

Result<int> Registry::acquireLock(const StageKey &key) {
  if (auto dir = ensureDirectory(); !dir) {
    return Result<int>(dir.error(), dir.message());
  }

  // Serialises removers; publishers never need it because link(2) cannot
  // replace an existing record.
  auto lock_path = lockPath(key);
  int fd = ::open(lock_path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
  if (fd < 0) {
    return Result<int>(ErrorCode::RegistryIOFailed,
                       errnoMessage("cannot open", lock_path));
  }
  while (::flock(fd, LOCK_EX) != 0) {
    if (errno != EINTR) {
      auto message = errnoMessage("cannot lock", lock_path);
      ::close(fd);
      return Result<int>(ErrorCode::RegistryIOFailed, message);
    }
  }
  return fd;
}

Result<bool> Registry::removeIf(const StageKey &key,
                                const std::string &address) {
  auto locked = acquireLock(key);
  if (!locked) {
    return Result<bool>(locked.error(), locked.message());
  }
  ScopedFd lock(locked.value());

  auto current = lookup(key);
  if (current.error() == ErrorCode::RegistryNotFound) {
    return false;
  }
  if (!current) {
    return Result<bool>(current.error(), current.message());
  }
  if (current.value().address != address) {
    DEBUG_INFO("Registration for stage " << key.stage << " now points at "
                                         << current.value().address
                                         << ", leaving it");
    return false;
  }

  if (auto removed = remove(key); !removed) {
    return Result<bool>(removed.error(), removed.message());
  }
  LOG("Removed stale registration " << address << " for stage " << key.stage);
  return true;
}

Result<bool> Registry::removeIfCorrupt(const StageKey &key) {
  auto locked = acquireLock(key);
  if (!locked) {
    return Result<bool>(locked.error(), locked.message());
  }
  ScopedFd lock(locked.value());

  // Re-read under the lock: another remover may already have replaced it
  auto current = lookup(key);
  if (current.error() != ErrorCode::RegistryCorruptRecord) {
    if (current.error() == ErrorCode::RegistryIOFailed) {
      return Result<bool>(current.error(), current.message());
    }
    return false;
  }

  if (auto removed = remove(key); !removed) {
    return Result<bool>(removed.error(), removed.message());
  }
  LOG("Removed unreadable registration for stage " << key.stage << ": "
                                                   << current.message());
  return true;
}

} // namespace stagelink
