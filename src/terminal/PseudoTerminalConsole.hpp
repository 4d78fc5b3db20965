#ifndef __ARCHTUI_PSEUDO_TERMINAL_CONSOLE__
#define __ARCHTUI_PSEUDO_TERMINAL_CONSOLE__

#include "Console.hpp"

namespace archtui {
/**
 * @brief The process' own terminal: raw mode on stdin, alternate screen on
 * stdout.
 */
class PseudoTerminalConsole : public Console {
 public:
  PseudoTerminalConsole() : active(false) {
    if (tcgetattr(STDIN_FILENO, &terminal_backup) == -1) {
      STFATAL << "stdin is not a terminal: " << strerror(GetErrno());
    }
  }

  virtual ~PseudoTerminalConsole() {}

  /** @brief Switches stdin to raw mode and enters the alternate screen. */
  virtual void setup() {
    std::lock_guard<std::mutex> guard(consoleMutex);
    if (active) {
      return;
    }
    termios terminal_local;
    FATAL_FAIL(tcgetattr(STDIN_FILENO, &terminal_local));
    memcpy(&terminal_backup, &terminal_local, sizeof(struct termios));
    cfmakeraw(&terminal_local);
    FATAL_FAIL(tcsetattr(STDIN_FILENO, TCSANOW, &terminal_local));
    // Alternate screen, clear, hide the cursor until the first paint
    const string enter = "\x1b[?1049h\x1b[2J\x1b[?25l";
    RawFdUtils::writeAll(STDOUT_FILENO, enter.data(), enter.length());
    active = true;
  }

  /**
   * @brief Leaves the alternate screen and restores the saved termios.
   * Safe to call from the interrupt thread.
   */
  virtual void teardown() {
    std::lock_guard<std::mutex> guard(consoleMutex);
    if (!active) {
      return;
    }
    const string leave = "\x1b[0m\x1b[?25h\x1b[?1049l";
    ssize_t ignored = ::write(STDOUT_FILENO, leave.data(), leave.length());
    (void)ignored;
    if (tcsetattr(STDIN_FILENO, TCSANOW, &terminal_backup) == -1) {
      LOG(WARNING) << "Cannot restore terminal settings: "
                   << strerror(GetErrno());
    }
    active = false;
  }

  /** @brief Queries the current terminal window dimensions. */
  virtual TerminalSize getTerminalSize() {
    winsize win;
    TerminalSize size;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &win) == -1 || win.ws_row == 0) {
      // Not a sized terminal, fall back to the classic default
      size.rows = 24;
      size.cols = 80;
      return size;
    }
    size.rows = win.ws_row;
    size.cols = win.ws_col;
    return size;
  }

  virtual int getFd() { return STDOUT_FILENO; }

  virtual int getInputFd() { return STDIN_FILENO; }

 protected:
  std::mutex consoleMutex;
  bool active;
  /** @brief Backup of the terminal's `termios` state for teardown. */
  termios terminal_backup;
};
}  // namespace archtui

#endif  // __ARCHTUI_PSEUDO_TERMINAL_CONSOLE__
