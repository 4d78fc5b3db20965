#ifndef __ARCHTUI_FAKE_SIGNAL_SENDER__
#define __ARCHTUI_FAKE_SIGNAL_SENDER__

#include "SignalSender.hpp"

namespace archtui {
/**
 * @brief Records deliveries instead of signalling real processes.
 *
 * Fake PIDs are alive from the moment they are added until they receive
 * SIGKILL, or SIGTERM unless ignoreTerm is set.
 */
class FakeSignalSender : public SignalSender {
 public:
  FakeSignalSender() : ignoreTerm(false), failDelivery(false), probes(0) {}

  virtual ~FakeSignalSender() {}

  virtual int sendSignal(pid_t pid, int signum) {
    lock_guard<std::mutex> lock(senderMutex);
    sent.push_back(make_pair(pid, signum));
    if (failDelivery) {
      return ESRCH;
    }
    if (signum == SIGKILL || (signum == SIGTERM && !ignoreTerm)) {
      alive.erase(pid);
    }
    return 0;
  }

  virtual bool isAlive(pid_t pid) {
    lock_guard<std::mutex> lock(senderMutex);
    probes++;
    return alive.count(pid) > 0;
  }

  void addAlive(pid_t pid) {
    lock_guard<std::mutex> lock(senderMutex);
    alive.insert(pid);
  }

  void setIgnoreTerm(bool ignore) {
    lock_guard<std::mutex> lock(senderMutex);
    ignoreTerm = ignore;
  }

  void setFailDelivery(bool fail) {
    lock_guard<std::mutex> lock(senderMutex);
    failDelivery = fail;
  }

  vector<pair<pid_t, int>> getSent() {
    lock_guard<std::mutex> lock(senderMutex);
    return sent;
  }

  size_t countSent(int signum) {
    lock_guard<std::mutex> lock(senderMutex);
    size_t total = 0;
    for (const auto& it : sent) {
      if (it.second == signum) {
        total++;
      }
    }
    return total;
  }

  int getProbes() {
    lock_guard<std::mutex> lock(senderMutex);
    return probes;
  }

 protected:
  std::mutex senderMutex;
  vector<pair<pid_t, int>> sent;
  set<pid_t> alive;
  bool ignoreTerm;
  bool failDelivery;
  int probes;
};
}  // namespace archtui

#endif  // __ARCHTUI_FAKE_SIGNAL_SENDER__
