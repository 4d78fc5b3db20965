#include "InterruptHook.hpp"

namespace archtui {
namespace {
std::mutex hookMutex;
bool installed = false;
function<void()> beforeExitCallback;
std::chrono::milliseconds sweepGracePeriod(INTERRUPT_GRACE_PERIOD_MS);

sigset_t interruptSignals() {
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  sigaddset(&signals, SIGHUP);
  sigaddset(&signals, SIGQUIT);
  return signals;
}
}  // namespace

void InterruptHook::install(shared_ptr<ProcessRegistry> registry,
                            std::chrono::milliseconds gracePeriod) {
  lock_guard<std::mutex> guard(hookMutex);
  if (installed) {
    throw std::runtime_error("Interrupt hook is already installed");
  }
  sigset_t signals = interruptSignals();
  int rc = pthread_sigmask(SIG_BLOCK, &signals, NULL);
  if (rc != 0) {
    throw std::runtime_error(string("Cannot block interrupt signals: ") +
                             strerror(rc));
  }
  try {
    std::thread waiter(&InterruptHook::waitForSignals, signals, registry);
    waiter.detach();
  } catch (const std::system_error& se) {
    pthread_sigmask(SIG_UNBLOCK, &signals, NULL);
    throw std::runtime_error(string("Cannot start interrupt thread: ") +
                             se.what());
  }
  installed = true;
  sweepGracePeriod = gracePeriod;
  VLOG(1) << "Interrupt hook installed";
}

bool InterruptHook::isInstalled() {
  lock_guard<std::mutex> guard(hookMutex);
  return installed;
}

void InterruptHook::setBeforeExitCallback(function<void()> callback) {
  lock_guard<std::mutex> guard(hookMutex);
  beforeExitCallback = callback;
}

void InterruptHook::setGracePeriod(std::chrono::milliseconds gracePeriod) {
  lock_guard<std::mutex> guard(hookMutex);
  sweepGracePeriod = gracePeriod;
}

void InterruptHook::resetSignalsInChild() {
  sigset_t empty;
  sigemptyset(&empty);
  sigprocmask(SIG_SETMASK, &empty, NULL);
  signal(SIGINT, SIG_DFL);
  signal(SIGTERM, SIG_DFL);
  signal(SIGHUP, SIG_DFL);
  signal(SIGQUIT, SIG_DFL);
  signal(SIGPIPE, SIG_DFL);
  signal(SIGCHLD, SIG_DFL);
  signal(SIGTTOU, SIG_DFL);
  signal(SIGTTIN, SIG_DFL);
}

void InterruptHook::waitForSignals(sigset_t signals,
                                   shared_ptr<ProcessRegistry> registry) {
  el::Helpers::setThreadName("interrupt");
  int signum = 0;
  while (true) {
    int rc = sigwait(&signals, &signum);
    if (rc == 0) {
      break;
    }
    if (rc != EINTR) {
      LOG(ERROR) << "sigwait failed: " << strerror(rc);
      return;
    }
  }

  LOG(INFO) << "Received " << strsignal(signum) << ", cleaning up...";
  function<void()> callback;
  std::chrono::milliseconds gracePeriod;
  {
    lock_guard<std::mutex> guard(hookMutex);
    callback = beforeExitCallback;
    gracePeriod = sweepGracePeriod;
  }
  if (callback) {
    callback();
  }
  registry->terminateAll(gracePeriod);
  el::Loggers::flushAll();
  // Other threads are still running, so skip static destructors.
  ::_exit(exitCodeForSignal(signum));
}
}  // namespace archtui
