#include "intentional/launch_classifier.hpp"
#include "intentional/path_manager.hpp"
#include "intentional/process.hpp"
#include "intentional/version.hpp"
#include <cstdlib>
#include <cstring>
#include <regex>

namespace intentional {

namespace {

bool envFlag(const char *name) {
  const char *val = std::getenv(name);
  return val && *val && std::strcmp(val, "0") != 0;
}

bool endsWith(const std::string &s, const std::string &suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

bool LaunchClassifier::isChromiumOrigin(const std::string &arg) {
  return arg.rfind("chrome-extension://", 0) == 0;
}

bool LaunchClassifier::isFirefoxAddonId(const std::string &arg) {
  static const std::regex uuidId(
      R"(^\{[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}\}$)");
  static const std::regex emailId(R"(^[A-Za-z0-9._+-]+@[A-Za-z0-9.-]+$)");
  return std::regex_match(arg, uuidId) || std::regex_match(arg, emailId);
}

LaunchContext LaunchClassifier::classify(const std::vector<std::string> &args) {
  LaunchContext ctx;

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string &arg = args[i];

    if (isChromiumOrigin(arg)) {
      ctx.extensionInitiated = true;
      ctx.browser = Browser::CHROMIUM;
      ctx.origin = arg;
      break;
    }

    if (endsWith(arg, NATIVE_HOST_NAME + ".json") && i + 1 < args.size() &&
        isFirefoxAddonId(args[i + 1])) {
      ctx.extensionInitiated = true;
      ctx.browser = Browser::FIREFOX;
      ctx.origin = args[i + 1];
      break;
    }
  }

  ctx.debuggerLaunch = detectDebuggerLaunch();
  ctx.devLaunch = ctx.debuggerLaunch || detectDevLaunch();
  ctx.backgroundLaunch = detectBackgroundLaunch();
  return ctx;
}

bool LaunchClassifier::detectDebuggerLaunch() {
  return envFlag("INTENTIONAL_DEBUG_LAUNCH") || Process::tracerPid() != 0;
}

bool LaunchClassifier::detectDevLaunch() {
  return envFlag("INTENTIONAL_DEV_LAUNCH") ||
         PathManager::instance().isLocalBuild();
}

bool LaunchClassifier::detectBackgroundLaunch() {
  return envFlag(kBackgroundLaunchEnv);
}

} // namespace intentional
