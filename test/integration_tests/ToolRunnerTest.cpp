#include "FakeConsole.hpp"
#include "TestHeaders.hpp"
#include "ToolRunner.hpp"

using namespace archtui;

namespace {
shared_ptr<ProcessGuard> makeGuard() {
  return make_shared<ProcessGuard>(
      make_shared<ProcessRegistry>(make_shared<PosixSignalSender>()),
      std::chrono::milliseconds(500));
}
}  // namespace

TEST_CASE("Finished titles", "[ToolRunner]") {
  REQUIRE(ToolRunner::finishedTitle("htop", 4) ==
          "htop [exited with 4, press any key]");
  REQUIRE(ToolRunner::finishedTitle("htop", 0) ==
          "htop [exited with 0, press any key]");
  REQUIRE(ToolRunner::finishedTitle("htop", 128 + SIGKILL) ==
          string("htop [killed by ") + strsignal(SIGKILL) + ", press any key]");
  REQUIRE(ToolRunner::finishedTitle("htop", nullopt) ==
          "htop [finished, press any key]");
}

TEST_CASE("Running a tool to completion", "[ToolRunner]") {
  auto console = make_shared<FakeConsole>();
  auto guard = makeGuard();
  ToolRunner runner(console, guard, DashboardConfig());

  console->closeInput();
  int exitCode = runner.run("sh", {"-c", "printf ready; exit 4"}, "tool");
  REQUIRE(exitCode == 4);
  REQUIRE(console->getSetupCount() == 1);
  REQUIRE(console->getTeardownCount() == 1);
  string output = console->getOutput();
  REQUIRE(output.find("ready") != string::npos);
  REQUIRE(output.find("tool [exited with 4, press any key]") != string::npos);
  REQUIRE(guard->childCount() == 0);
}

TEST_CASE("Keys typed on the console reach the tool", "[ToolRunner]") {
  auto console = make_shared<FakeConsole>();
  ToolRunner runner(console, makeGuard(), DashboardConfig());

  console->typeInput("hello\r");
  console->closeInput();
  int exitCode = runner.run("sh", {"-c", "read line; echo got:$line"}, "sh");
  REQUIRE(exitCode == 0);
  REQUIRE(console->getOutput().find("got:hello") != string::npos);
}

TEST_CASE("Console resizes reach the tool", "[ToolRunner]") {
  auto console = make_shared<FakeConsole>(24, 80);
  ToolRunner runner(console, makeGuard(), DashboardConfig());
  console->closeInput();

  std::thread resizer([console]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    console->setTerminalSize(12, 42);
  });
  int exitCode = runner.run("sh", {"-c", "sleep 1; stty size"}, "size");
  resizer.join();
  REQUIRE(exitCode == 0);
  string output = console->getOutput();
  // The border takes one cell on every side
  REQUIRE(output.find("10 40") != string::npos);
  REQUIRE(output.find("\x1b[2J") != string::npos);
}

TEST_CASE("Shutting down kills the tool", "[ToolRunner]") {
  auto console = make_shared<FakeConsole>();
  ToolRunner runner(console, makeGuard(), DashboardConfig());

  std::thread stopper([&runner]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    runner.shutdown();
  });
  // Input stays open: a shutdown must not wait for a key press
  int exitCode = runner.run("sleep", {"30"}, "sleep");
  stopper.join();
  REQUIRE(exitCode == 128 + SIGKILL);
  REQUIRE(console->getTeardownCount() == 1);
}

TEST_CASE("Tools that cannot be started", "[ToolRunner]") {
  auto console = make_shared<FakeConsole>();
  ToolRunner runner(console, makeGuard(), DashboardConfig());
  REQUIRE_THROWS_AS(runner.run("archtui-no-such-command", {}, "missing"),
                    std::runtime_error);
  REQUIRE(console->getSetupCount() == 0);
  REQUIRE(console->getTeardownCount() == 0);
}

TEST_CASE("Headless runs", "[ToolRunner]") {
  auto console = make_shared<FakeConsole>();
  ToolRunner runner(console, makeGuard(), DashboardConfig());
  REQUIRE(runner.runHeadless("true", {}) == 0);
  REQUIRE(runner.runHeadless("sh", {"-c", "exit 5"}) == 5);
  REQUIRE(console->getSetupCount() == 0);
}
