#ifndef INTENTIONAL_INSTANCE_LOCK_HPP
#define INTENTIONAL_INSTANCE_LOCK_HPP

#include <filesystem>
#include <optional>
#include <string>

namespace intentional {

// PID lock file naming the live primary. Content is the decimal pid.
class InstanceLock {
public:
  explicit InstanceLock(const std::filesystem::path &lockPath);
  ~InstanceLock();

  InstanceLock(const InstanceLock &) = delete;
  InstanceLock &operator=(const InstanceLock &) = delete;

  bool exists() const;

  // Pid recorded in the lock, if the file exists and parses
  std::optional<int> readPid() const;

  // True when the lock exists and names a live process
  bool holderAlive() const;

  // Atomically creates the lock with this process's pid. Fails if a lock
  // file already exists.
  bool acquire();

  // Removes the lock if this process owns it
  void release();

  // Removes whatever lock file is present
  bool remove();

  // Removes the lock only if it is still stale (unreadable or naming a dead
  // pid) once re-checked under the guard file's flock. Concurrent launches
  // that saw the same stale lock cannot remove a lock claimed in between.
  bool removeStale();

  // Decimal pid with optional surrounding whitespace; anything else is
  // unreadable
  static std::optional<int> parsePid(const std::string &content);

  bool owned() const { return owned_; }
  const std::filesystem::path &path() const { return lockPath_; }

  // Registers an atexit hook removing the lock on any exit() path
  void installExitHook();

private:
  std::filesystem::path lockPath_;
  bool owned_ = false;
};

} // namespace intentional

#endif // INTENTIONAL_INSTANCE_LOCK_HPP
