#include "InterruptHook.hpp"
#include "TestHeaders.hpp"

using namespace archtui;

namespace {
void readAll(int fd, void* buf, size_t count) {
  size_t done = 0;
  while (done < count) {
    ssize_t rc = ::read(fd, (char*)buf + done, count - done);
    if (rc < 0 && GetErrno() == EINTR) {
      continue;
    }
    FATAL_FAIL(rc);
    if (rc == 0) {
      break;
    }
    done += rc;
  }
}

/**
 * @brief Body of the forked "application": installs the hook, starts one
 * tracked grandchild, reports its PID and waits to be interrupted.
 */
void runApplication(int reportFd, int callbackFd) {
  auto registry = make_shared<ProcessRegistry>(make_shared<PosixSignalSender>());
  try {
    InterruptHook::install(registry, std::chrono::milliseconds(200));
  } catch (const std::runtime_error&) {
    _exit(98);
  }
  bool secondInstallFailed = false;
  try {
    InterruptHook::install(registry, std::chrono::milliseconds(200));
  } catch (const std::runtime_error&) {
    secondInstallFailed = true;
  }
  if (!secondInstallFailed) {
    _exit(99);
  }
  InterruptHook::setBeforeExitCallback([callbackFd]() {
    char c = 'c';
    ssize_t ignored = ::write(callbackFd, &c, 1);
    (void)ignored;
  });

  pid_t grandchild = fork();
  if (grandchild == 0) {
    InterruptHook::resetSignalsInChild();
    ::setpgid(0, 0);
    while (true) {
      ::pause();
    }
  }
  ::setpgid(grandchild, grandchild);
  registry->registerPid(grandchild);
  ssize_t ignored = ::write(reportFd, &grandchild, sizeof(grandchild));
  (void)ignored;
  while (true) {
    ::pause();
  }
}
}  // namespace

TEST_CASE("Exit codes for signals", "[InterruptHook]") {
  REQUIRE(InterruptHook::exitCodeForSignal(SIGINT) == 130);
  REQUIRE(InterruptHook::exitCodeForSignal(SIGTERM) == 143);
}

TEST_CASE("An interrupt sweeps tracked children and exits",
          "[InterruptHook]") {
  int reportPipe[2];
  int callbackPipe[2];
  FATAL_FAIL(::pipe(reportPipe));
  FATAL_FAIL(::pipe(callbackPipe));

  pid_t application = fork();
  FATAL_FAIL(application);
  if (application == 0) {
    ::close(reportPipe[0]);
    ::close(callbackPipe[0]);
    runApplication(reportPipe[1], callbackPipe[1]);
  }
  ::close(reportPipe[1]);
  ::close(callbackPipe[1]);

  pid_t grandchild = 0;
  readAll(reportPipe[0], &grandchild, sizeof(grandchild));
  ::close(reportPipe[0]);
  REQUIRE(grandchild > 0);
  REQUIRE(::kill(grandchild, 0) == 0);

  REQUIRE(::kill(application, SIGTERM) == 0);
  int status = 0;
  pid_t rc;
  do {
    rc = ::waitpid(application, &status, 0);
  } while (rc < 0 && GetErrno() == EINTR);
  REQUIRE(rc == application);
  REQUIRE(WIFEXITED(status));
  REQUIRE(WEXITSTATUS(status) == 128 + SIGTERM);

  char callbackRan = 0;
  readAll(callbackPipe[0], &callbackRan, 1);
  ::close(callbackPipe[0]);
  REQUIRE(callbackRan == 'c');

  // The application reaped the grandchild during its sweep
  REQUIRE(::kill(grandchild, 0) == -1);
}
