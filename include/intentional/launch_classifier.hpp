#ifndef INTENTIONAL_LAUNCH_CLASSIFIER_HPP
#define INTENTIONAL_LAUNCH_CLASSIFIER_HPP

#include <string>
#include <vector>

namespace intentional {

// Set by a relay on the primary it launches; no window is shown
constexpr const char *kBackgroundLaunchEnv = "INTENTIONAL_BACKGROUND_LAUNCH";

enum class Browser { NONE, CHROMIUM, FIREFOX };

struct LaunchContext {
  bool extensionInitiated = false;
  Browser browser = Browser::NONE;
  std::string origin; // chrome-extension://<id>/ or the Firefox add-on id

  // An interactive debugger is driving this launch
  bool debuggerLaunch = false;
  // Debugger launch or a development build
  bool devLaunch = false;
  // Started by a relay rather than by the user
  bool backgroundLaunch = false;
};

class LaunchClassifier {
public:
  // Inspects argv (without argv[0]). Chromium passes the caller origin as
  // the first argument; Firefox passes the host manifest path followed by
  // the add-on id. Whether stdin is a tty says nothing about the caller and
  // is deliberately not consulted.
  static LaunchContext classify(const std::vector<std::string> &args);

  static bool isChromiumOrigin(const std::string &arg);
  static bool isFirefoxAddonId(const std::string &arg);

  // INTENTIONAL_DEBUG_LAUNCH set by the IDE run configuration, or a tracer
  // attached before main()
  static bool detectDebuggerLaunch();

  // INTENTIONAL_DEV_LAUNCH or a local build path
  static bool detectDevLaunch();

  static bool detectBackgroundLaunch();
};

} // namespace intentional

#endif // INTENTIONAL_LAUNCH_CLASSIFIER_HPP
