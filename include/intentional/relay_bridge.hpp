#ifndef INTENTIONAL_RELAY_BRIDGE_HPP
#define INTENTIONAL_RELAY_BRIDGE_HPP

#include "intentional/config.hpp"
#include "intentional/instance_lock.hpp"
#include "intentional/marker_store.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace intentional {

enum class RelayPreflight { PROCEED, AUTO_LAUNCH_DISABLED, MARKER_FRESH };

// Which side ended the relay first
enum class RelayEnd { PEER_CLOSED, SOCKET_CLOSED, PEER_ERROR, SOCKET_ERROR };

std::string toString(RelayPreflight preflight);
std::string toString(RelayEnd end);

// Extension-initiated process: makes sure a primary exists, then pumps raw
// bytes between the browser's stdio and the primary's socket. Frames are
// never parsed here.
class RelayBridge {
public:
  // Starts an independent primary and waits at most the given time for the
  // launch to report success
  using Launcher = std::function<bool(std::chrono::milliseconds)>;

  RelayBridge(InstanceLock &lock, MarkerStore &markers,
              std::filesystem::path socketPath, RelayConfig policy,
              Launcher launcher);

  RelayPreflight preflight(bool autoLaunchAllowed);

  // True when a live primary holds the lock or one was launched
  bool ensurePrimary();

  // Socket fd, or -1 once every attempt failed
  int connectWithRetry();

  // Blocks until either direction ends
  RelayEnd relay(int inFd, int outFd, int sockFd);

  // Whole relay role. Returns the process exit code.
  int run(bool autoLaunchAllowed, int inFd, int outFd);

  uint64_t bytesToPrimary() const { return bytesIn_; }
  uint64_t bytesToPeer() const { return bytesOut_; }

  static Launcher spawnLauncher(const std::filesystem::path &exe);

private:
  InstanceLock &lock_;
  MarkerStore &markers_;
  std::filesystem::path socketPath_;
  RelayConfig policy_;
  Launcher launcher_;
  uint64_t bytesIn_ = 0;
  uint64_t bytesOut_ = 0;
};

} // namespace intentional

#endif // INTENTIONAL_RELAY_BRIDGE_HPP
