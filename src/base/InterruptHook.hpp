#ifndef __ARCHTUI_INTERRUPT_HOOK__
#define __ARCHTUI_INTERRUPT_HOOK__

#include "Headers.hpp"
#include "ProcessRegistry.hpp"

namespace archtui {
/**
 * @brief Routes SIGINT/SIGTERM/SIGHUP/SIGQUIT to the termination sweep.
 *
 * install() blocks those signals in the calling thread (and therefore in
 * every thread created afterwards) and starts a dedicated thread that
 * sigwait()s for them. When one arrives the thread runs the before-exit
 * callback, sweeps the registry with the interrupt grace period and exits
 * the process with 128 + signal number.
 *
 * Must be called from main() before any other thread is started and before
 * any child is spawned.
 */
class InterruptHook {
 public:
  /**
   * @brief Installs the hook. Throws std::runtime_error if the signal mask
   * or the waiter thread cannot be set up, or if called twice.
   */
  static void install(shared_ptr<ProcessRegistry> registry,
                      std::chrono::milliseconds gracePeriod);

  static bool isInstalled();

  /**
   * @brief Sets a callback that runs on the interrupt thread before the
   * sweep (used to restore the console).
   */
  static void setBeforeExitCallback(function<void()> callback);

  /** @brief Changes the grace period used by the sweep. */
  static void setGracePeriod(std::chrono::milliseconds gracePeriod);

  /**
   * @brief Clears the inherited signal mask and dispositions in a freshly
   * forked child. Async-signal-safe.
   */
  static void resetSignalsInChild();

  /** @brief Exit status used for a process stopped by `signum`. */
  static int exitCodeForSignal(int signum) { return 128 + signum; }

 private:
  static void waitForSignals(sigset_t signals,
                             shared_ptr<ProcessRegistry> registry);
};
}  // namespace archtui

#endif  // __ARCHTUI_INTERRUPT_HOOK__
