#ifndef __ARCHTUI_PROCESS_REGISTRY__
#define __ARCHTUI_PROCESS_REGISTRY__

#include "Headers.hpp"
#include "SignalSender.hpp"

namespace archtui {
/**
 * @brief Tracks the PIDs of every spawned child so they can be terminated on
 * any exit path.
 *
 * One instance is shared by the whole process (see global()). All access is
 * serialized through a single mutex that is never held while sleeping.
 */
class ProcessRegistry {
 public:
  explicit ProcessRegistry(shared_ptr<SignalSender> _signalSender);

  /**
   * @brief Returns the process-wide registry, creating it on first use.
   *
   * The instance is never destroyed so that exit paths running during static
   * destruction can still reach it.
   */
  static shared_ptr<ProcessRegistry> global();

  /** @brief Starts tracking `pid`. Registering a PID twice is a no-op. */
  void registerPid(pid_t pid);

  /** @brief Stops tracking `pid` (called when it is known to have exited). */
  void unregisterPid(pid_t pid);

  /** @brief Number of tracked PIDs. */
  size_t count();

  /** @brief True once a termination sweep has started. */
  bool cleanupInitiated();

  /**
   * @brief Terminates every tracked child.
   *
   * Sends SIGTERM to each tracked process group, polls every
   * TERMINATION_POLL_INTERVAL_MS until all are gone or `gracePeriod` has
   * elapsed, then sends SIGKILL to the survivors. The tracked set is cleared
   * afterwards. Runs at most once per registry; an empty registry does not
   * consume the one-shot.
   */
  void terminateAll(std::chrono::milliseconds gracePeriod);

 protected:
  /** @brief Guards `pids` and `cleanupStarted`. */
  std::mutex registryMutex;
  /** @brief PIDs believed to be alive. */
  std::set<pid_t> pids;
  /** @brief One-shot flag for terminateAll(). */
  bool cleanupStarted;
  /** @brief Delivery mechanism for TERM/KILL and liveness probes. */
  shared_ptr<SignalSender> signalSender;

  /** @brief Sends `signum` to every pid in `targets`, logging failures. */
  void signalAll(const vector<pid_t>& targets, int signum);
};
}  // namespace archtui

#endif  // __ARCHTUI_PROCESS_REGISTRY__
