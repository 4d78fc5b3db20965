#ifndef __ARCHTUI_PTY_SESSION__
#define __ARCHTUI_PTY_SESSION__

#include "Console.hpp"
#include "Headers.hpp"
#include "KeyEncoder.hpp"
#include "ProcessGuard.hpp"
#include "PtyError.hpp"
#include "TerminalEmulator.hpp"
#include "TerminalRenderer.hpp"

namespace archtui {
/**
 * @brief One child process attached to a pseudo-terminal, with a background
 * reader thread and a TerminalEmulator that interprets its output.
 *
 * The reader thread is the only writer of the pending output buffer; the
 * thread that calls processOutput()/render() is the only reader. Every
 * other method is meant to be called from that same owning thread.
 */
class PtySession {
 public:
  /**
   * @brief Creates an unspawned session.
   * @param guard If set, the child's PID is registered with it for as long
   * as the child is believed alive.
   * @param environment Variables set in the child in addition to the
   * inherited environment.
   */
  PtySession(int _cols, int _rows,
             size_t scrollbackLines = DEFAULT_SCROLLBACK_LINES,
             shared_ptr<ProcessGuard> _guard = nullptr,
             const vector<pair<string, string>>& _environment =
                 defaultEnvironment());

  /** @brief Kills the child (if any) and joins the reader thread. */
  virtual ~PtySession();

  PtySession(const PtySession&) = delete;
  PtySession& operator=(const PtySession&) = delete;

  /**
   * @brief Starts `path` (resolved against PATH) with `args` on a new PTY.
   *
   * The child gets the PTY as its controlling terminal and stdio and runs as
   * leader of a new session and process group. Nothing is left running if
   * this throws.
   * @throws PtyException DEVICE_ALLOCATION, SPAWN or HANDLE_ACQUISITION.
   */
  void spawnCommand(const string& path, const vector<string>& args);

  /**
   * @brief Feeds everything the reader thread has buffered to the emulator
   * and writes the emulator's answers to terminal queries back to the child.
   * @return true if any bytes were processed.
   */
  bool processOutput();

  /** @throws PtyException NOT_RUNNING without a writer, WRITE on failure. */
  void sendInput(const string& bytes);

  /** @brief Encodes and sends a key. Keys with no encoding are ignored. */
  void sendKey(const KeyEvent& event);

  /**
   * @brief False once the reader hit end-of-stream or the child was reaped.
   * Reaps the child without blocking if it has exited.
   */
  bool isRunning();

  /**
   * @brief Exit code of the child (128 + signal when killed), once it has
   * been reaped. Reaps without blocking if possible.
   */
  optional<int> exitStatus();

  /**
   * @brief Resizes the emulator and, when spawned, the PTY device (which
   * delivers SIGWINCH to the foreground job).
   * @throws PtyException RESIZE if the device rejects the new size.
   */
  void resize(int _cols, int _rows);

  /**
   * @brief Sends SIGKILL to the child's process group. Does not wait. A
   * child that is already gone, including one reaped elsewhere, is left
   * alone.
   */
  void kill();

  /** @brief Drains output and paints the screen into `area` of `console`. */
  void render(Console* console, const Rect& area, const string& title);

  const ScreenBuffer& screen() const { return emulator.screen(); }

  pid_t getPid() const { return childPid; }
  int getCols() const { return cols; }
  int getRows() const { return rows; }

  /** @brief TERM=xterm-256color and COLORTERM=truecolor. */
  static vector<pair<string, string>> defaultEnvironment();

 protected:
  TerminalEmulator emulator;
  int cols;
  int rows;
  shared_ptr<ProcessGuard> guard;
  vector<pair<string, string>> environment;

  /** @brief Controlling side, read by the reader thread. */
  int masterFd;
  /** @brief dup() of masterFd used for input. */
  int writerFd;
  pid_t childPid;

  std::thread readerThread;
  std::atomic<bool> stopReader;

  std::mutex outputMutex;
  string pendingOutput;

  /** @brief Guards running, reaped and exitCode. */
  std::mutex stateMutex;
  bool running;
  bool reaped;
  optional<int> exitCode;

  void readerLoop();
  /** @brief Non-blocking waitpid. Caller holds stateMutex. */
  void reapLocked();
  /** @brief Kills and reaps a child whose spawn could not be completed. */
  void abandonChild(pid_t pid);
};
}  // namespace archtui

#endif  // __ARCHTUI_PTY_SESSION__
