#ifndef __ARCHTUI_TOOL_RUNNER__
#define __ARCHTUI_TOOL_RUNNER__

#include "Console.hpp"
#include "DashboardConfig.hpp"
#include "Headers.hpp"
#include "KeyDecoder.hpp"
#include "ProcessGuard.hpp"
#include "PtySession.hpp"
#include "SubprocessUtils.hpp"

namespace archtui {
/**
 * @brief Hosts one interactive tool: spawns it in a PtySession and runs the
 * input/resize/render loop until it exits.
 */
class ToolRunner {
 public:
  ToolRunner(shared_ptr<Console> _console, shared_ptr<ProcessGuard> _guard,
             const DashboardConfig& _config);

  virtual ~ToolRunner() = default;

  /**
   * @brief Runs `command` embedded in the console. Falls back to running it
   * attached to the real terminal if no PTY session can be started.
   * @return The tool's exit code (128 + signal when killed).
   */
  int run(const string& command, const vector<string>& args,
          const string& title);

  /**
   * @brief Runs `command` without a terminal, echoing its output to stdout.
   * @return The tool's exit code (128 + signal when killed).
   */
  int runHeadless(const string& command, const vector<string>& args);

  /** @brief Asks the loop to kill the tool and return. */
  void shutdown();

  /** @brief Title bar text once the tool has finished. */
  static string finishedTitle(const string& title, optional<int> exitCode);

 protected:
  shared_ptr<Console> console;
  shared_ptr<ProcessGuard> guard;
  DashboardConfig config;
  std::mutex shutdownMutex;
  bool shuttingDown;
  /** @brief Set once the console input reached end of file. */
  bool inputClosed;
  KeyDecoder keyDecoder;

  bool isShuttingDown();
  int runLoop(PtySession* session, const string& title);
  /** @brief Reads console input and forwards decoded keys to the session. */
  void forwardInput(PtySession* session);
  /** @brief Waits for the exit code after the tool stopped running. */
  optional<int> waitForExitStatus(PtySession* session);
  void waitForKey();
  virtual int runAttached(const string& command, const vector<string>& args);
  static Rect consoleArea(const TerminalSize& size) {
    return Rect(0, 0, size.cols, size.rows);
  }
};
}  // namespace archtui

#endif  // __ARCHTUI_TOOL_RUNNER__
