#ifndef INTENTIONAL_LIFECYCLE_HPP
#define INTENTIONAL_LIFECYCLE_HPP

#include <filesystem>
#include <string>

namespace intentional {

enum class ProcessRole { PRIMARY, RELAY };

std::string toString(ProcessRole role);

struct LifecyclePaths {
  std::filesystem::path lock;
  std::filesystem::path socket;
  std::filesystem::path marker;
  std::filesystem::path strict;
};

// Termination-signal behaviour per role. The role, the development-launch
// indicator and every path are captured at install time; the handler only
// touches those fixed buffers and async-signal-safe syscalls.
//
//   RELAY   : SIGTERM/SIGINT/SIGHUP -> _exit
//   PRIMARY : SIGTERM/SIGINT/SIGHUP -> marker (unless strict and not dev),
//             remove lock and socket, _exit
//             SIGUSR1 -> show-window request, SIGUSR2 -> clean quit request
//
// SIGPIPE is ignored in both roles.
class Lifecycle {
public:
  static bool install(ProcessRole role, const LifecyclePaths &paths,
                      bool devLaunch);

  // Returns and clears a pending show-window request
  static bool consumeShowRequest();

  static bool quitRequested();

  // Clears pending requests (used between tests)
  static void resetRequests();
};

} // namespace intentional

#endif // INTENTIONAL_LIFECYCLE_HPP
