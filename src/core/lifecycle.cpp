#include "intentional/lifecycle.hpp"
#include "intentional/logger.hpp"

#include <cerrno>
#include <climits>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace intentional {

namespace {

volatile sig_atomic_t g_role = 0; // 0 = primary, 1 = relay
volatile sig_atomic_t g_devLaunch = 0;
volatile sig_atomic_t g_showRequested = 0;
volatile sig_atomic_t g_quitRequested = 0;

char g_lockPath[PATH_MAX];
char g_socketPath[PATH_MAX];
char g_markerPath[PATH_MAX];
char g_strictPath[PATH_MAX];

bool copyPath(char *dst, const std::filesystem::path &src) {
  const std::string s = src.string();
  if (s.size() >= PATH_MAX) {
    dst[0] = '\0';
    return false;
  }
  std::memcpy(dst, s.c_str(), s.size() + 1);
  return true;
}

// Unlinks the lock only while it still names this process
void removeOwnLock() {
  if (g_lockPath[0] == '\0')
    return;

  int fd = ::open(g_lockPath, O_RDONLY | O_CLOEXEC);
  if (fd < 0)
    return;

  char buf[32];
  ssize_t n = ::read(fd, buf, sizeof(buf) - 1);
  ::close(fd);
  if (n <= 0)
    return;

  long pid = 0;
  for (ssize_t i = 0; i < n; ++i) {
    if (buf[i] < '0' || buf[i] > '9')
      break;
    pid = pid * 10 + (buf[i] - '0');
  }
  if (pid == static_cast<long>(::getpid()))
    ::unlink(g_lockPath);
}

void touchMarker() {
  if (g_markerPath[0] == '\0')
    return;
  int fd = ::open(g_markerPath, O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0)
    return;
  ::futimens(fd, nullptr);
  ::close(fd);
}

void onTerminate(int sig) {
  if (g_role == 1)
    ::_exit(128 + sig);

  bool strict = g_strictPath[0] != '\0' && ::access(g_strictPath, F_OK) == 0;
  if (!strict || g_devLaunch)
    touchMarker();

  removeOwnLock();
  if (g_socketPath[0] != '\0')
    ::unlink(g_socketPath);

  ::_exit(128 + sig);
}

void onShowRequest(int) { g_showRequested = 1; }

void onQuitRequest(int) { g_quitRequested = 1; }

bool setHandler(int sig, void (*handler)(int)) {
  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_handler = handler;
  sigemptyset(&sa.sa_mask);
  // Block the other termination signals so the handler runs once
  sigaddset(&sa.sa_mask, SIGTERM);
  sigaddset(&sa.sa_mask, SIGINT);
  sigaddset(&sa.sa_mask, SIGHUP);
  sa.sa_flags = SA_RESTART;
  if (sigaction(sig, &sa, nullptr) != 0) {
    LOG_ERROR("sigaction(" + std::to_string(sig) +
              ") failed: " + std::string(strerror(errno)));
    return false;
  }
  return true;
}

} // namespace

std::string toString(ProcessRole role) {
  return role == ProcessRole::PRIMARY ? "primary" : "relay";
}

bool Lifecycle::install(ProcessRole role, const LifecyclePaths &paths,
                        bool devLaunch) {
  bool ok = copyPath(g_lockPath, paths.lock);
  ok = copyPath(g_socketPath, paths.socket) && ok;
  ok = copyPath(g_markerPath, paths.marker) && ok;
  ok = copyPath(g_strictPath, paths.strict) && ok;
  if (!ok) {
    LOG_WARN("Lifecycle path exceeds PATH_MAX; it will not be cleaned up");
  }

  g_role = role == ProcessRole::RELAY ? 1 : 0;
  g_devLaunch = devLaunch ? 1 : 0;

  if (::signal(SIGPIPE, SIG_IGN) == SIG_ERR) {
    LOG_ERROR("Failed to ignore SIGPIPE");
    return false;
  }

  for (int sig : {SIGTERM, SIGINT, SIGHUP}) {
    if (!setHandler(sig, onTerminate))
      return false;
  }

  if (role == ProcessRole::PRIMARY) {
    if (!setHandler(SIGUSR1, onShowRequest) ||
        !setHandler(SIGUSR2, onQuitRequest))
      return false;
  }

  LOG_DEBUG("Lifecycle installed for " + toString(role) +
            (devLaunch ? " (dev launch)" : ""));
  return true;
}

bool Lifecycle::consumeShowRequest() {
  if (!g_showRequested)
    return false;
  g_showRequested = 0;
  return true;
}

bool Lifecycle::quitRequested() { return g_quitRequested != 0; }

void Lifecycle::resetRequests() {
  g_showRequested = 0;
  g_quitRequested = 0;
}

} // namespace intentional
