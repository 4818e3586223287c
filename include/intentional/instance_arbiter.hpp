#ifndef INTENTIONAL_INSTANCE_ARBITER_HPP
#define INTENTIONAL_INSTANCE_ARBITER_HPP

#include "intentional/instance_lock.hpp"
#include "intentional/launch_classifier.hpp"
#include "intentional/marker_store.hpp"

#include <chrono>

namespace intentional {

enum class ArbiterOutcome {
  BECOME_PRIMARY, // lock acquired, exit hook installed
  DUPLICATE,      // a live primary was asked to show itself; exit 0
  FAILED          // could not claim the lock after re-checking
};

std::string toString(ArbiterOutcome outcome);

// Decides whether a user launch becomes the primary. Races between
// concurrent launches are settled by re-checking the lock, never by an
// additional cross-process mutex.
class InstanceArbiter {
public:
  InstanceArbiter(InstanceLock &lock, MarkerStore &markers);

  ArbiterOutcome arbitrate(const LaunchContext &ctx);

  // Bounded wait for a preempted primary to release the lock
  void setPreemptPolicy(int attempts, std::chrono::milliseconds delay) {
    preemptAttempts_ = attempts;
    preemptDelay_ = delay;
  }

  // Signal delivered to a live primary on a duplicate launch
  void setShowSignal(int sig) { showSignal_ = sig; }

private:
  InstanceLock &lock_;
  MarkerStore &markers_;
  int preemptAttempts_ = 20;
  std::chrono::milliseconds preemptDelay_{100};
  int showSignal_;

  bool becomePrimary();
  bool preempt(int pid);
};

} // namespace intentional

#endif // INTENTIONAL_INSTANCE_ARBITER_HPP
