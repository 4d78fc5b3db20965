#include "FakeSignalSender.hpp"
#include "InterruptHook.hpp"
#include "ProcessRegistry.hpp"
#include "TestHeaders.hpp"

using namespace archtui;

namespace {
long long elapsedMs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start)
      .count();
}

/** @brief Forks a child in its own process group that has signalled it is
 * ready. */
pid_t forkChild(bool ignoreTerm) {
  int readyPipe[2];
  FATAL_FAIL(::pipe(readyPipe));
  pid_t pid = fork();
  FATAL_FAIL(pid);
  if (pid == 0) {
    InterruptHook::resetSignalsInChild();
    ::setpgid(0, 0);
    if (ignoreTerm) {
      signal(SIGTERM, SIG_IGN);
    }
    ::close(readyPipe[0]);
    char ready = 'r';
    ssize_t ignored = ::write(readyPipe[1], &ready, 1);
    (void)ignored;
    while (true) {
      ::pause();
    }
  }
  ::setpgid(pid, pid);
  ::close(readyPipe[1]);
  char ready;
  ssize_t rc;
  do {
    rc = ::read(readyPipe[0], &ready, 1);
  } while (rc < 0 && GetErrno() == EINTR);
  ::close(readyPipe[0]);
  return pid;
}
}  // namespace

TEST_CASE("Register and unregister", "[ProcessRegistry]") {
  ProcessRegistry registry(make_shared<FakeSignalSender>());

  SECTION("Unregister removes") {
    registry.registerPid(7);
    registry.unregisterPid(7);
    REQUIRE(registry.count() == 0);
  }

  SECTION("Set semantics") {
    registry.registerPid(7);
    registry.registerPid(7);
    REQUIRE(registry.count() == 1);
    registry.registerPid(8);
    REQUIRE(registry.count() == 2);
  }

  SECTION("Unregistering an unknown PID is a no-op") {
    registry.registerPid(7);
    registry.unregisterPid(9);
    REQUIRE(registry.count() == 1);
  }
}

TEST_CASE("terminateAll delivers exactly one round", "[ProcessRegistry]") {
  auto sender = make_shared<FakeSignalSender>();
  ProcessRegistry registry(sender);
  sender->addAlive(100);
  sender->addAlive(101);
  registry.registerPid(100);
  registry.registerPid(101);

  registry.terminateAll(std::chrono::milliseconds(1000));
  REQUIRE(sender->countSent(SIGTERM) == 2);
  REQUIRE(sender->countSent(SIGKILL) == 0);
  REQUIRE(registry.count() == 0);
  REQUIRE(registry.cleanupInitiated());

  registry.registerPid(102);
  registry.terminateAll(std::chrono::milliseconds(1000));
  REQUIRE(sender->getSent().size() == 2);
}

TEST_CASE("Concurrent terminateAll delivers once", "[ProcessRegistry]") {
  auto sender = make_shared<FakeSignalSender>();
  ProcessRegistry registry(sender);
  sender->addAlive(100);
  registry.registerPid(100);

  vector<std::thread> threads;
  for (int i = 0; i < 4; i++) {
    threads.emplace_back([&registry]() {
      registry.terminateAll(std::chrono::milliseconds(500));
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  REQUIRE(sender->getSent().size() == 1);
}

TEST_CASE("An empty registry keeps its one-shot", "[ProcessRegistry]") {
  auto sender = make_shared<FakeSignalSender>();
  ProcessRegistry registry(sender);

  registry.terminateAll(std::chrono::milliseconds(100));
  REQUIRE_FALSE(registry.cleanupInitiated());
  REQUIRE(sender->getSent().empty());

  registry.registerPid(5);
  registry.terminateAll(std::chrono::milliseconds(100));
  REQUIRE(sender->countSent(SIGTERM) == 1);
}

TEST_CASE("Survivors are killed after the grace period", "[ProcessRegistry]") {
  auto sender = make_shared<FakeSignalSender>();
  sender->setIgnoreTerm(true);
  sender->addAlive(200);
  ProcessRegistry registry(sender);
  registry.registerPid(200);

  auto start = std::chrono::steady_clock::now();
  registry.terminateAll(std::chrono::milliseconds(300));
  long long elapsed = elapsedMs(start);

  REQUIRE(elapsed >= 300);
  REQUIRE(elapsed < 300 + TERMINATION_POLL_INTERVAL_MS + 400);
  auto sent = sender->getSent();
  REQUIRE(sent.size() == 2);
  REQUIRE(sent[0] == make_pair(pid_t(200), SIGTERM));
  REQUIRE(sent[1] == make_pair(pid_t(200), SIGKILL));
  REQUIRE(registry.count() == 0);
}

TEST_CASE("Failed deliveries do not stop the sweep", "[ProcessRegistry]") {
  auto sender = make_shared<FakeSignalSender>();
  sender->setFailDelivery(true);
  ProcessRegistry registry(sender);
  registry.registerPid(1001);
  registry.registerPid(1002);

  registry.terminateAll(std::chrono::milliseconds(200));
  REQUIRE(sender->countSent(SIGTERM) == 2);
  REQUIRE(registry.count() == 0);
}

TEST_CASE("Real children", "[ProcessRegistry]") {
  ProcessRegistry registry(make_shared<PosixSignalSender>());

  SECTION("A polite child exits within the grace period") {
    pid_t pid = forkChild(false);
    registry.registerPid(pid);
    auto start = std::chrono::steady_clock::now();
    registry.terminateAll(std::chrono::milliseconds(3000));
    REQUIRE(elapsedMs(start) < 3000);
    // Already reaped by the liveness probe
    REQUIRE(::kill(pid, 0) == -1);
  }

  SECTION("A child ignoring SIGTERM is killed") {
    pid_t pid = forkChild(true);
    registry.registerPid(pid);
    auto start = std::chrono::steady_clock::now();
    registry.terminateAll(std::chrono::milliseconds(500));
    long long elapsed = elapsedMs(start);
    REQUIRE(elapsed >= 500);
    REQUIRE(elapsed < 500 + TERMINATION_POLL_INTERVAL_MS + 400);

    int status = 0;
    REQUIRE(::waitpid(pid, &status, 0) == pid);
    REQUIRE(WIFSIGNALED(status));
    REQUIRE(WTERMSIG(status) == SIGKILL);
  }
}
