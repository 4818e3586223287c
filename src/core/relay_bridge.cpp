#include "intentional/relay_bridge.hpp"
#include "intentional/frame_codec.hpp"
#include "intentional/launch_classifier.hpp"
#include "intentional/logger.hpp"
#include "intentional/process.hpp"
#include "intentional/socket_server.hpp"

#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <optional>
#include <poll.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

namespace intentional {

namespace {

constexpr size_t kPumpBufferBytes = 64 * 1024;

enum class PumpResult { SOURCE_EOF, SOURCE_ERROR, SINK_ERROR, WOKEN };

// Copies whatever bytes are available from src to dst until src ends, a
// write fails, or wakeFd becomes readable
PumpResult pump(int src, int dst, int wakeFd, std::atomic<uint64_t> &count) {
  std::vector<uint8_t> buf(kPumpBufferBytes);
  pollfd fds[2] = {{src, POLLIN, 0}, {wakeFd, POLLIN, 0}};

  while (true) {
    int ready = ::poll(fds, 2, -1);
    if (ready < 0) {
      if (errno == EINTR)
        continue;
      return PumpResult::SOURCE_ERROR;
    }
    if (fds[1].revents != 0)
      return PumpResult::WOKEN;
    if (fds[0].revents == 0)
      continue;

    ssize_t n = ::read(src, buf.data(), buf.size());
    if (n == 0)
      return PumpResult::SOURCE_EOF;
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN)
        continue;
      return PumpResult::SOURCE_ERROR;
    }

    if (!writeAll(dst, buf.data(), static_cast<size_t>(n)))
      return PumpResult::SINK_ERROR;
    count += static_cast<uint64_t>(n);
  }
}

struct RelayState {
  std::mutex mutex;
  std::condition_variable cv;
  std::optional<RelayEnd> first;

  void finish(RelayEnd end) {
    std::lock_guard<std::mutex> lock(mutex);
    if (!first)
      first = end;
    cv.notify_all();
  }
};

} // namespace

std::string toString(RelayPreflight preflight) {
  switch (preflight) {
  case RelayPreflight::PROCEED:
    return "Proceed";
  case RelayPreflight::AUTO_LAUNCH_DISABLED:
    return "AutoLaunchDisabled";
  case RelayPreflight::MARKER_FRESH:
    return "MarkerFresh";
  default:
    return "Unknown";
  }
}

std::string toString(RelayEnd end) {
  switch (end) {
  case RelayEnd::PEER_CLOSED:
    return "PeerClosed";
  case RelayEnd::SOCKET_CLOSED:
    return "SocketClosed";
  case RelayEnd::PEER_ERROR:
    return "PeerError";
  case RelayEnd::SOCKET_ERROR:
    return "SocketError";
  default:
    return "Unknown";
  }
}

RelayBridge::RelayBridge(InstanceLock &lock, MarkerStore &markers,
                         std::filesystem::path socketPath, RelayConfig policy,
                         Launcher launcher)
    : lock_(lock), markers_(markers), socketPath_(std::move(socketPath)),
      policy_(policy), launcher_(std::move(launcher)) {}

RelayPreflight RelayBridge::preflight(bool autoLaunchAllowed) {
  if (!autoLaunchAllowed) {
    LOG_INFO("Auto-launch disabled after a clean quit; relay exits");
    return RelayPreflight::AUTO_LAUNCH_DISABLED;
  }

  if (auto age = markers_.markerAge()) {
    if (*age < MarkerStore::kMarkerFreshness) {
      LOG_INFO("No-relaunch marker is " + std::to_string(age->count()) +
               "s old; relay exits");
      return RelayPreflight::MARKER_FRESH;
    }
    LOG_INFO("Removing stale no-relaunch marker (" +
             std::to_string(age->count()) + "s old)");
    if (!markers_.removeMarker()) {
      LOG_WARN("Could not remove stale marker " +
               markers_.markerPath().string());
    }
  }

  return RelayPreflight::PROCEED;
}

bool RelayBridge::ensurePrimary() {
  if (lock_.holderAlive())
    return true;

  std::chrono::milliseconds wait(policy_.launchWaitMs);
  LOG_INFO("No live primary, launching one (wait " +
           std::to_string(wait.count()) + "ms)");
  if (!launcher_ || !launcher_(wait)) {
    LOG_ERROR("Primary launch did not succeed within " +
              std::to_string(wait.count()) + "ms");
    return false;
  }
  return true;
}

int RelayBridge::connectWithRetry() {
  for (int attempt = 1; attempt <= policy_.connectAttempts; ++attempt) {
    int fd = connectEndpoint(socketPath_);
    if (fd >= 0) {
      LOG_INFO("Connected to primary on attempt " + std::to_string(attempt));
      return fd;
    }
    LOG_DEBUG("Connect attempt " + std::to_string(attempt) +
              " failed: " + std::string(strerror(errno)));
    if (attempt < policy_.connectAttempts)
      std::this_thread::sleep_for(
          std::chrono::milliseconds(policy_.connectDelayMs));
  }

  LOG_ERROR("Could not connect to " + socketPath_.string() + " after " +
            std::to_string(policy_.connectAttempts) + " attempts");
  return -1;
}

RelayEnd RelayBridge::relay(int inFd, int outFd, int sockFd) {
  int wake[2];
  if (::pipe2(wake, O_CLOEXEC) != 0) {
    LOG_ERROR("pipe2() failed: " + std::string(strerror(errno)));
    return RelayEnd::PEER_ERROR;
  }

  RelayState state;
  std::atomic<uint64_t> in{0};
  std::atomic<uint64_t> out{0};

  std::jthread inbound([&] {
    switch (pump(inFd, sockFd, wake[0], in)) {
    case PumpResult::SOURCE_EOF:
      state.finish(RelayEnd::PEER_CLOSED);
      break;
    case PumpResult::SOURCE_ERROR:
      state.finish(RelayEnd::PEER_ERROR);
      break;
    case PumpResult::SINK_ERROR:
      state.finish(RelayEnd::SOCKET_ERROR);
      break;
    case PumpResult::WOKEN:
      break;
    }
  });

  std::jthread outbound([&] {
    switch (pump(sockFd, outFd, wake[0], out)) {
    case PumpResult::SOURCE_EOF:
      state.finish(RelayEnd::SOCKET_CLOSED);
      break;
    case PumpResult::SOURCE_ERROR:
      state.finish(RelayEnd::SOCKET_ERROR);
      break;
    case PumpResult::SINK_ERROR:
      state.finish(RelayEnd::PEER_ERROR);
      break;
    case PumpResult::WOKEN:
      break;
    }
  });

  RelayEnd end;
  {
    std::unique_lock<std::mutex> lock(state.mutex);
    state.cv.wait(lock, [&] { return state.first.has_value(); });
    end = *state.first;
  }

  // Release the other direction: wake its poll and fail any blocked
  // socket write
  char byte = 1;
  if (!writeAll(wake[1], &byte, 1)) {
    LOG_WARN("Failed to wake relay pumps: " + std::string(strerror(errno)));
  }
  if (::shutdown(sockFd, SHUT_RDWR) != 0 && errno != ENOTCONN) {
    LOG_DEBUG("shutdown(relay socket): " + std::string(strerror(errno)));
  }

  inbound.join();
  outbound.join();
  ::close(wake[0]);
  ::close(wake[1]);

  bytesIn_ = in;
  bytesOut_ = out;
  LOG_INFO("Relay ended: " + toString(end) + " (" + std::to_string(bytesIn_) +
           " bytes to primary, " + std::to_string(bytesOut_) +
           " bytes to browser)");
  return end;
}

int RelayBridge::run(bool autoLaunchAllowed, int inFd, int outFd) {
  if (preflight(autoLaunchAllowed) != RelayPreflight::PROCEED)
    return 0;

  if (!ensurePrimary())
    return 1;

  int sock = connectWithRetry();
  if (sock < 0)
    return 1;

  RelayEnd end = relay(inFd, outFd, sock);
  ::close(sock);

  if (end == RelayEnd::SOCKET_CLOSED || end == RelayEnd::SOCKET_ERROR) {
    // The primary went away mid-session; do not respawn it right away
    if (markers_.writeNoRelaunch())
      LOG_INFO("Primary disconnected; wrote no-relaunch marker");
    else
      LOG_WARN("Primary disconnected; failed to write no-relaunch marker");
  }
  return 0;
}

RelayBridge::Launcher RelayBridge::spawnLauncher(const std::filesystem::path &exe) {
  return [exe](std::chrono::milliseconds timeout) {
    return Process::spawnDetached(exe.string(), {}, timeout,
                                  {{kBackgroundLaunchEnv, "1"}});
  };
}

} // namespace intentional
