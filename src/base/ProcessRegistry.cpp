#include "ProcessRegistry.hpp"

namespace archtui {
ProcessRegistry::ProcessRegistry(shared_ptr<SignalSender> _signalSender)
    : cleanupStarted(false), signalSender(_signalSender) {}

shared_ptr<ProcessRegistry> ProcessRegistry::global() {
  static shared_ptr<ProcessRegistry>* instance =
      new shared_ptr<ProcessRegistry>(
          new ProcessRegistry(make_shared<PosixSignalSender>()));
  return *instance;
}

void ProcessRegistry::registerPid(pid_t pid) {
  lock_guard<std::mutex> guard(registryMutex);
  pids.insert(pid);
  VLOG(1) << "Registered child process PID " << pid;
}

void ProcessRegistry::unregisterPid(pid_t pid) {
  lock_guard<std::mutex> guard(registryMutex);
  pids.erase(pid);
  VLOG(1) << "Unregistered child process PID " << pid;
}

size_t ProcessRegistry::count() {
  lock_guard<std::mutex> guard(registryMutex);
  return pids.size();
}

bool ProcessRegistry::cleanupInitiated() {
  lock_guard<std::mutex> guard(registryMutex);
  return cleanupStarted;
}

void ProcessRegistry::terminateAll(std::chrono::milliseconds gracePeriod) {
  vector<pid_t> targets;
  {
    lock_guard<std::mutex> guard(registryMutex);
    if (cleanupStarted) {
      VLOG(1) << "Cleanup already initiated, skipping";
      return;
    }
    if (pids.empty()) {
      // The one-shot stays armed for children registered later
      VLOG(1) << "No child processes to terminate";
      return;
    }
    cleanupStarted = true;
    targets.assign(pids.begin(), pids.end());
  }

  LOG(INFO) << "Terminating " << targets.size() << " child process(es)...";
  signalAll(targets, SIGTERM);

  const auto pollInterval =
      std::chrono::milliseconds(TERMINATION_POLL_INTERVAL_MS);
  const auto deadline = std::chrono::steady_clock::now() + gracePeriod;
  vector<pid_t> survivors = targets;
  while (true) {
    survivors.erase(std::remove_if(survivors.begin(), survivors.end(),
                                   [this](pid_t pid) {
                                     return !signalSender->isAlive(pid);
                                   }),
                    survivors.end());
    if (survivors.empty()) {
      LOG(INFO) << "All child processes terminated gracefully";
      break;
    }
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      break;
    }
    auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(std::min(pollInterval, remaining));
  }

  if (!survivors.empty()) {
    for (pid_t pid : survivors) {
      LOG(WARNING) << "Process " << pid
                   << " did not terminate, sending SIGKILL";
    }
    signalAll(survivors, SIGKILL);
  }

  {
    lock_guard<std::mutex> guard(registryMutex);
    pids.clear();
  }
  LOG(INFO) << "Child process cleanup complete";
}

void ProcessRegistry::signalAll(const vector<pid_t>& targets, int signum) {
  for (pid_t pid : targets) {
    int rc = signalSender->sendSignal(pid, signum);
    if (rc != 0) {
      LOG(WARNING) << "Failed to send " << strsignal(signum) << " to PID "
                   << pid << ": " << strerror(rc);
    } else {
      VLOG(1) << "Sent " << strsignal(signum) << " to PID " << pid;
    }
  }
}
}  // namespace archtui
