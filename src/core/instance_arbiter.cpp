#include "intentional/instance_arbiter.hpp"
#include "intentional/logger.hpp"
#include "intentional/process.hpp"
#include <csignal>
#include <thread>

namespace intentional {

namespace {
constexpr int kArbitrationRounds = 4;
}

std::string toString(ArbiterOutcome outcome) {
  switch (outcome) {
  case ArbiterOutcome::BECOME_PRIMARY:
    return "BecomePrimary";
  case ArbiterOutcome::DUPLICATE:
    return "Duplicate";
  case ArbiterOutcome::FAILED:
    return "Failed";
  default:
    return "Unknown";
  }
}

InstanceArbiter::InstanceArbiter(InstanceLock &lock, MarkerStore &markers)
    : lock_(lock), markers_(markers), showSignal_(SIGUSR1) {}

ArbiterOutcome InstanceArbiter::arbitrate(const LaunchContext &ctx) {
  for (int round = 0; round < kArbitrationRounds; ++round) {
    if (!lock_.exists()) {
      if (becomePrimary())
        return ArbiterOutcome::BECOME_PRIMARY;
      // Another launch created the lock between our check and acquire
      LOG_DEBUG("Lost lock creation race, re-checking");
      continue;
    }

    auto pid = lock_.readPid();
    if (!pid || !Process::isAlive(*pid)) {
      LOG_INFO("Removing stale instance lock" +
               (pid ? " (pid " + std::to_string(*pid) + " is gone)"
                    : std::string(" (no readable pid)")));
      lock_.removeStale();
      continue;
    }

    if (!ctx.debuggerLaunch) {
      if (ctx.backgroundLaunch) {
        // Nobody asked for a window; a racing relay launch just steps aside
        LOG_INFO("Primary already running (pid " + std::to_string(*pid) +
                 "). Background launch exits quietly.");
        return ArbiterOutcome::DUPLICATE;
      }
      LOG_INFO("Primary already running (pid " + std::to_string(*pid) +
               "). Asking it to show its window.");
      if (!Process::signal(*pid, showSignal_)) {
        LOG_WARN("Could not signal running primary " + std::to_string(*pid));
      }
      return ArbiterOutcome::DUPLICATE;
    }

    LOG_INFO("Debugger launch: preempting running primary (pid " +
             std::to_string(*pid) + ")");
    if (!preempt(*pid)) {
      LOG_WARN("Preempted primary did not release the lock in time");
    }
  }

  LOG_ERROR("Could not claim the instance lock at " + lock_.path().string());
  return ArbiterOutcome::FAILED;
}

bool InstanceArbiter::becomePrimary() {
  if (!lock_.acquire())
    return false;

  lock_.installExitHook();
  if (markers_.removeMarker()) {
    LOG_INFO("Cleared no-relaunch marker");
  }
  LOG_INFO("Acquired instance lock " + lock_.path().string());
  return true;
}

bool InstanceArbiter::preempt(int pid) {
  if (!Process::kill(pid)) {
    LOG_WARN("Failed to deliver SIGTERM to " + std::to_string(pid));
  }

  for (int i = 0; i < preemptAttempts_; ++i) {
    if (!lock_.exists() || !Process::isAlive(pid))
      return true;
    std::this_thread::sleep_for(preemptDelay_);
  }
  return false;
}

} // namespace intentional
