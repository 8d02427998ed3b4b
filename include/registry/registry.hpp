#pragma once
#include "events/events.hpp"
#include "utils/error_codes.hpp"
#include <filesystem>
#include <string>
#include <sys/types.h>

namespace stagelink {

// File-backed discovery store: one JSON record per StageKey under
// <state_dir>/servers/. Shared by every process working on the project.
//
// publish() writes the record to a private temp file and link(2)s it into
// place, so a record is either absent or complete, and of two racing
// publishers exactly one wins.
class Registry {
public:
  explicit Registry(std::filesystem::path state_dir);

  Result<Registration> lookup(const StageKey &key) const;

  Result<Registration> publish(const StageKey &key, const std::string &address,
                               pid_t pid);

  Result<void> remove(const StageKey &key);

  // Removes the record only while it still names `address`. Returns whether
  // a record was removed.
  Result<bool> removeIf(const StageKey &key, const std::string &address);

  // Removes the record only while it is still unreadable or names another
  // key. Returns whether a record was removed.
  Result<bool> removeIfCorrupt(const StageKey &key);

  std::filesystem::path recordPath(const StageKey &key) const;
  const std::filesystem::path &stateDir() const { return state_dir_; }

  // Absolute config path so every invocation derives the same key
  static StageKey makeKey(const std::string &config_path,
                          const std::string &stage);

  // Default per-project state location: <dir of config>/.stagelink
  static std::filesystem::path defaultStateDir(const std::string &config_path);

private:
  Result<void> ensureDirectory() const;
  // Exclusive per-key flock; the caller owns (and closes) the descriptor
  Result<int> acquireLock(const StageKey &key);
  std::filesystem::path lockPath(const StageKey &key) const;

  std::filesystem::path state_dir_;
  std::filesystem::path servers_dir_;
};

} // namespace stagelink
