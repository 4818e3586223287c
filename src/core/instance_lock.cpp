#include "intentional/instance_lock.hpp"
#include "intentional/logger.hpp"
#include "intentional/process.hpp"
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iterator>
#include <sys/file.h>
#include <thread>
#include <unistd.h>

namespace intentional {

namespace {

// Read by the atexit hook; filled once by installExitHook()
char g_exitLockPath[PATH_MAX] = {0};
pid_t g_exitLockOwner = -1;
bool g_exitHookRegistered = false;

constexpr int kGuardAttempts = 100;
constexpr auto kGuardDelay = std::chrono::milliseconds(10);

void removeLockAtExit() {
  if (g_exitLockPath[0] == '\0' || ::getpid() != g_exitLockOwner)
    return;
  ::unlink(g_exitLockPath);
}

} // namespace

InstanceLock::InstanceLock(const std::filesystem::path &lockPath)
    : lockPath_(lockPath) {}

InstanceLock::~InstanceLock() { release(); }

bool InstanceLock::exists() const {
  std::error_code ec;
  return std::filesystem::exists(lockPath_, ec);
}

std::optional<int> InstanceLock::parsePid(const std::string &content) {
  const auto first = content.find_first_not_of(" \t\r\n");
  if (first == std::string::npos)
    return std::nullopt;
  const auto last = content.find_last_not_of(" \t\r\n");
  const std::string digits = content.substr(first, last - first + 1);

  try {
    size_t used = 0;
    int pid = std::stoi(digits, &used);
    if (used != digits.size() || pid <= 0)
      return std::nullopt;
    return pid;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

std::optional<int> InstanceLock::readPid() const {
  std::ifstream ifs(lockPath_);
  if (!ifs)
    return std::nullopt;

  std::string content((std::istreambuf_iterator<char>(ifs)),
                      std::istreambuf_iterator<char>());
  auto pid = parsePid(content);
  if (!pid) {
    LOG_WARN("Instance lock " + lockPath_.string() +
             " has unreadable content: '" + content + "'");
  }
  return pid;
}

bool InstanceLock::holderAlive() const {
  auto pid = readPid();
  return pid && Process::isAlive(*pid);
}

bool InstanceLock::acquire() {
  const std::string pidText = std::to_string(::getpid()) + "\n";
  const std::string tmpPath =
      lockPath_.string() + "." + std::to_string(::getpid()) + ".tmp";

  // Write the content first, then link() it into place: link fails if the
  // lock exists, and readers never observe an empty lock file.
  int fd = ::open(tmpPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                  0644);
  if (fd == -1) {
    LOG_ERROR("Failed to create " + tmpPath + " (" + strerror(errno) + ")");
    return false;
  }
  bool written = ::write(fd, pidText.data(), pidText.size()) ==
                 static_cast<ssize_t>(pidText.size());
  ::close(fd);
  if (!written) {
    LOG_ERROR("Failed to write " + tmpPath);
    ::unlink(tmpPath.c_str());
    return false;
  }

  int rc = ::link(tmpPath.c_str(), lockPath_.c_str());
  int err = errno;
  ::unlink(tmpPath.c_str());

  if (rc == -1) {
    if (err != EEXIST) {
      LOG_ERROR("Failed to create instance lock " + lockPath_.string() +
                " (" + strerror(err) + ")");
    }
    return false;
  }

  owned_ = true;
  return true;
}

void InstanceLock::release() {
  if (!owned_)
    return;
  owned_ = false;

  // Only remove the lock if it still names us
  auto pid = readPid();
  if (pid && *pid != ::getpid())
    return;

  std::error_code ec;
  std::filesystem::remove(lockPath_, ec);
}

bool InstanceLock::remove() {
  std::error_code ec;
  bool removed = std::filesystem::remove(lockPath_, ec);
  if (ec) {
    LOG_WARN("Failed to remove instance lock: " + ec.message());
  }
  return removed;
}

bool InstanceLock::removeStale() {
  // Serializes stale-lock removal only. A live primary never holds the
  // guard, and the kernel drops it when a holder dies.
  const std::string guardPath = lockPath_.string() + ".guard";
  int guard = ::open(guardPath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
  if (guard == -1) {
    LOG_ERROR("Failed to open " + guardPath + " (" + strerror(errno) + ")");
    return false;
  }

  bool locked = false;
  for (int i = 0; i < kGuardAttempts; ++i) {
    if (::flock(guard, LOCK_EX | LOCK_NB) == 0) {
      locked = true;
      break;
    }
    if (errno != EWOULDBLOCK && errno != EINTR) {
      LOG_ERROR("Failed to flock " + guardPath + " (" + strerror(errno) + ")");
      break;
    }
    std::this_thread::sleep_for(kGuardDelay);
  }
  if (!locked) {
    ::close(guard);
    return false;
  }

  // Re-check under the guard: another launch may already have replaced
  // the stale lock with a live one
  bool removed = false;
  int fd = ::open(lockPath_.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd != -1) {
    std::string content;
    char buf[64];
    ssize_t n;
    while ((n = ::read(fd, buf, sizeof(buf))) != 0 && content.size() < 256) {
      if (n < 0) {
        if (errno == EINTR)
          continue;
        break;
      }
      content.append(buf, static_cast<size_t>(n));
    }
    ::close(fd);

    auto pid = parsePid(content);
    if (n < 0) {
      LOG_WARN("Failed to read instance lock " + lockPath_.string());
    } else if (!pid || !Process::isAlive(*pid)) {
      removed = remove();
    } else {
      LOG_DEBUG("Instance lock now held by live pid " + std::to_string(*pid));
    }
  } else if (errno != ENOENT) {
    LOG_WARN("Failed to open instance lock " + lockPath_.string() + " (" +
             strerror(errno) + ")");
  }

  // Closing the descriptor drops the flock
  ::close(guard);
  return removed;
}

void InstanceLock::installExitHook() {
  const std::string path = lockPath_.string();
  if (path.size() >= sizeof(g_exitLockPath)) {
    LOG_ERROR("Instance lock path too long for exit hook");
    return;
  }
  std::memcpy(g_exitLockPath, path.c_str(), path.size() + 1);
  g_exitLockOwner = ::getpid();

  if (!g_exitHookRegistered) {
    std::atexit(removeLockAtExit);
    g_exitHookRegistered = true;
  }
}

} // namespace intentional
