#ifndef __ARCHTUI_SIGNAL_SENDER__
#define __ARCHTUI_SIGNAL_SENDER__

#include "Headers.hpp"

namespace archtui {
/**
 * @brief Delivers signals to tracked children and probes their liveness.
 *
 * Split out from ProcessRegistry so tests can count deliveries without
 * touching real processes.
 */
class SignalSender {
 public:
  virtual ~SignalSender() {}

  /**
   * @brief Sends `signum` to the process group led by `pid`.
   * @return 0 on success, otherwise the errno of the failed delivery.
   */
  virtual int sendSignal(pid_t pid, int signum) = 0;

  /** @brief Returns true while `pid` still exists and has not been reaped. */
  virtual bool isAlive(pid_t pid) = 0;
};

/**
 * @brief SignalSender backed by kill(2) and waitpid(2).
 */
class PosixSignalSender : public SignalSender {
 public:
  virtual ~PosixSignalSender() {}

  virtual int sendSignal(pid_t pid, int signum);

  /**
   * @brief Reaps `pid` if it is an exited child of ours, then probes it with
   * the null signal.
   */
  virtual bool isAlive(pid_t pid);
};
}  // namespace archtui

#endif  // __ARCHTUI_SIGNAL_SENDER__
