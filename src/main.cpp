#include "intentional/config.hpp"
#include "intentional/instance_arbiter.hpp"
#include "intentional/instance_lock.hpp"
#include "intentional/launch_classifier.hpp"
#include "intentional/lifecycle.hpp"
#include "intentional/logger.hpp"
#include "intentional/manifest_installer.hpp"
#include "intentional/marker_store.hpp"
#include "intentional/path_manager.hpp"
#include "intentional/primary.hpp"
#include "intentional/process.hpp"
#include "intentional/relay_bridge.hpp"
#include "intentional/usage_ledger.hpp"
#include "intentional/version.hpp"
#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace {

constexpr size_t kLogsPerRole = 20;
constexpr int kQuitWaitPolls = 50;
constexpr auto kQuitPollInterval = std::chrono::milliseconds(100);

void showHelp() {
  std::cout
      << "Intentional - native messaging companion\n\n"
      << "Usage: intentional [command] [args...]\n\n"
      << "Commands:\n"
      << "  (none)                  Start the application (default)\n"
      << "  status                  Show instance, marker and flag state\n"
      << "  quit                    Quit cleanly; browsers will not relaunch it\n"
      << "  strict-mode on|off      Leave relaunch after a kill to a watchdog\n"
      << "  install-manifest <id>   Register an extension and install the host "
         "manifest\n"
      << "  remove-manifests        Remove every installed host manifest\n"
      << "  help                    Show this help message\n\n"
      << "Flags:\n"
      << "  -v, --verbose  Mirror all log output to stderr\n"
      << "  --version      Print the version\n";
}

intentional::LifecyclePaths lifecyclePaths() {
  auto &pm = intentional::PathManager::instance();
  return {pm.lockFile(), pm.socketFile(), pm.noRelaunchMarker(),
          pm.strictModeFlag()};
}

int runRelay(const intentional::LaunchContext &ctx) {
  auto &pm = intentional::PathManager::instance();
  auto &config = intentional::Config::instance();

  LOG_INFO("Extension-initiated launch from " + ctx.origin);
  if (!intentional::Lifecycle::install(intentional::ProcessRole::RELAY,
                                       lifecyclePaths(), ctx.devLaunch)) {
    return 1;
  }

  intentional::InstanceLock lock(pm.lockFile());
  intentional::MarkerStore markers(pm.noRelaunchMarker(), pm.strictModeFlag());

  config.reloadGeneral();
  intentional::RelayBridge bridge(
      lock, markers, pm.socketFile(), config.getRelay(),
      intentional::RelayBridge::spawnLauncher(pm.selfExe()));

  return bridge.run(config.getGeneral().autoLaunch, STDIN_FILENO,
                    STDOUT_FILENO);
}

int runPrimary(const intentional::LaunchContext &ctx) {
  auto &pm = intentional::PathManager::instance();
  auto &config = intentional::Config::instance();

  // A duplicate may signal us before the handlers are in place
  if (std::signal(SIGUSR1, SIG_IGN) == SIG_ERR ||
      std::signal(SIGUSR2, SIG_IGN) == SIG_ERR) {
    LOG_WARN("Failed to defer show/quit requests during arbitration");
  }

  intentional::InstanceLock lock(pm.lockFile());
  intentional::MarkerStore markers(pm.noRelaunchMarker(), pm.strictModeFlag());
  intentional::InstanceArbiter arbiter(lock, markers);

  auto outcome = arbiter.arbitrate(ctx);
  LOG_INFO("Arbitration: " + intentional::toString(outcome));
  if (outcome == intentional::ArbiterOutcome::DUPLICATE)
    return 0;
  if (outcome == intentional::ArbiterOutcome::FAILED)
    return 1;

  if (!intentional::Lifecycle::install(intentional::ProcessRole::PRIMARY,
                                       lifecyclePaths(), ctx.devLaunch)) {
    return 1;
  }

  if (!config.getGeneral().autoLaunch) {
    LOG_INFO("Re-enabling auto-launch after user start");
    config.setAutoLaunch(true);
  }

  intentional::UsageLedger ledger(config.getBudgets());
  intentional::LoggingPresenter presenter;
  intentional::Primary primary(pm.socketFile(), ledger, presenter);

  if (!primary.start()) {
    LOG_ERROR("Socket server failed to start");
    return 1;
  }

  if (!ctx.backgroundLaunch)
    presenter.show();

  primary.runUntilQuit();
  primary.stop();
  lock.release();
  LOG_INFO("Primary exited cleanly");
  return 0;
}

int runStatus() {
  auto &pm = intentional::PathManager::instance();
  intentional::InstanceLock lock(pm.lockFile());
  intentional::MarkerStore markers(pm.noRelaunchMarker(), pm.strictModeFlag());

  auto pid = lock.readPid();
  std::cout << "Instance lock:   " << pm.lockFile().string() << "\n";
  if (pid) {
    std::cout << "Primary pid:     " << *pid
              << (intentional::Process::isAlive(*pid) ? " (alive)"
                                                      : " (stale)")
              << "\n";
  } else {
    std::cout << "Primary pid:     none\n";
  }

  auto age = markers.markerAge();
  std::cout << "No-relaunch:     ";
  if (age) {
    std::cout << age->count() << "s old"
              << (markers.markerFresh() ? " (suppressing relaunch)" : "")
              << "\n";
  } else {
    std::cout << "absent\n";
  }

  std::cout << "Strict mode:     " << (markers.strictMode() ? "on" : "off")
            << "\n";
  std::cout << "Auto-launch:     "
            << (intentional::Config::instance().getGeneral().autoLaunch
                    ? "enabled"
                    : "disabled")
            << "\n";
  std::cout << "Socket:          " << pm.socketFile().string() << "\n";
  return 0;
}

int runQuit() {
  auto &pm = intentional::PathManager::instance();
  intentional::Config::instance().setAutoLaunch(false);

  intentional::InstanceLock lock(pm.lockFile());
  auto pid = lock.readPid();
  if (!pid || !intentional::Process::isAlive(*pid)) {
    std::cout << "Intentional is not running.\n";
    return 0;
  }

  LOG_INFO("Requesting clean quit of primary " + std::to_string(*pid));
  if (!intentional::Process::signal(*pid, SIGUSR2)) {
    std::cerr << "Failed to signal pid " << *pid << "\n";
    return 1;
  }

  for (int i = 0; i < kQuitWaitPolls; ++i) {
    if (!intentional::Process::isAlive(*pid)) {
      std::cout << "Intentional quit.\n";
      return 0;
    }
    std::this_thread::sleep_for(kQuitPollInterval);
  }

  std::cerr << "Primary " << *pid << " did not exit in time\n";
  return 1;
}

int runStrictMode(const std::vector<std::string> &args) {
  if (args.size() < 2 || (args[1] != "on" && args[1] != "off")) {
    std::cerr << "Usage: intentional strict-mode on|off\n";
    return 1;
  }

  auto &pm = intentional::PathManager::instance();
  intentional::MarkerStore markers(pm.noRelaunchMarker(), pm.strictModeFlag());
  bool enable = args[1] == "on";
  if (!markers.setStrictMode(enable)) {
    std::cerr << "Failed to update " << pm.strictModeFlag().string() << "\n";
    return 1;
  }
  std::cout << "Strict mode " << (enable ? "enabled" : "disabled") << ".\n";
  return 0;
}

int runInstallManifest(const std::vector<std::string> &args) {
  if (args.size() < 2) {
    std::cerr << "Usage: intentional install-manifest <extension-id>\n";
    return 1;
  }

  const std::string &id = args[1];
  bool firefox = false;
  if (intentional::ManifestInstaller::validFirefoxId(id)) {
    firefox = true;
  } else if (!intentional::ManifestInstaller::validChromeId(id)) {
    std::cerr << "Invalid extension id: " << id << "\n";
    return 1;
  }

  auto &config = intentional::Config::instance();
  if (config.addExtensionId(id, firefox))
    LOG_INFO("Registered extension id " + id);

  const char *home = std::getenv("HOME");
  if (!home) {
    std::cerr << "HOME is not set\n";
    return 1;
  }

  intentional::ManifestInstaller installer(
      home, intentional::PathManager::instance().selfExe());
  int written = installer.install(config.getExtensions());
  std::cout << "Installed " << written << " manifest(s).\n";
  return written > 0 ? 0 : 1;
}

int runRemoveManifests() {
  const char *home = std::getenv("HOME");
  if (!home) {
    std::cerr << "HOME is not set\n";
    return 1;
  }

  intentional::ManifestInstaller installer(
      home, intentional::PathManager::instance().selfExe());
  std::cout << "Removed " << installer.remove() << " manifest(s).\n";
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (!arg.empty()) {
      args.push_back(arg);
    }
  }

  // Browser launches come first: stdout is the messaging channel and
  // must never carry help or version text
  auto ctx = intentional::LaunchClassifier::classify(args);

  if (!ctx.extensionInitiated && !args.empty() &&
      (args[0] == "help" || args[0] == "--help" || args[0] == "-h")) {
    showHelp();
    return 0;
  }

  if (!ctx.extensionInitiated && !args.empty() && args[0] == "--version") {
    std::cout << "Intentional v" << intentional::INTENTIONAL_VERSION_STRING
              << "\n";
    return 0;
  }

  bool verbose = false;
  auto it = std::find_if(args.begin(), args.end(), [](const std::string &arg) {
    return arg == "-v" || arg == "--verbose";
  });

  if (it != args.end()) {
    verbose = true;
    args.erase(it);
  }

  std::string role = "cli";
  if (ctx.extensionInitiated)
    role = "relay";
  else if (args.empty())
    role = "primary";

  intentional::PathManager::instance().init();
  auto &pathMgr = intentional::PathManager::instance();

  intentional::Logger::pruneLogs(pathMgr.logs(), role + "_", kLogsPerRole - 1);
  intentional::Logger::instance().init(pathMgr.sessionLog(role), verbose, role);

  {
    std::string argStr;
    for (int i = 0; i < argc; ++i) {
      argStr +=
          (i > 0 ? " " : "") + std::string("'") + argv[i] + std::string("'");
    }
    LOG_DEBUG("Raw Command Line: " + argStr);
  }

  intentional::Config::instance().load(pathMgr.configFile());

  if (ctx.extensionInitiated) {
    int code = runRelay(ctx);
    // Disposable process: no exit hooks, no static teardown
    std::cerr.flush();
    ::_exit(code);
  }

  if (args.empty())
    return runPrimary(ctx);

  const std::string &command = args[0];
  LOG_INFO("Intentional v" + intentional::INTENTIONAL_VERSION_STRING +
           " command: " + command);

  if (command == "status")
    return runStatus();
  if (command == "quit")
    return runQuit();
  if (command == "strict-mode")
    return runStrictMode(args);
  if (command == "install-manifest")
    return runInstallManifest(args);
  if (command == "remove-manifests")
    return runRemoveManifests();

  std::cerr << "Unknown command: " << command << "\n\n";
  showHelp();
  return 1;
}
