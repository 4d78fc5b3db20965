#ifndef __ARCHTUI_TERMINAL_EMULATOR__
#define __ARCHTUI_TERMINAL_EMULATOR__

#include <vterm.h>

#include "Headers.hpp"
#include "ScreenBuffer.hpp"

namespace archtui {
/**
 * @brief Interprets a VT/xterm byte stream with libvterm and keeps a
 * ScreenBuffer picture of the result.
 *
 * No I/O happens here. Any input is accepted, including malformed or
 * truncated sequences, and a sequence split across process() calls is
 * resumed on the next call. Cells never hold C0 or C1 control characters.
 */
class TerminalEmulator {
 public:
  TerminalEmulator(int rows, int cols,
                   size_t scrollbackLines = DEFAULT_SCROLLBACK_LINES);
  ~TerminalEmulator();

  TerminalEmulator(const TerminalEmulator&) = delete;
  TerminalEmulator& operator=(const TerminalEmulator&) = delete;

  void process(const char* data, size_t length);
  void process(const string& bytes) { process(bytes.data(), bytes.size()); }

  /** @brief The active screen (primary or alternate). */
  const ScreenBuffer& screen() const { return snapshot; }

  /**
   * @brief Resizes the terminal; sizes below 1x1 are clamped. Lines pushed
   * off the top by a shrink go to the scrollback.
   */
  void setSize(int rows, int cols);

  int getRows() const { return snapshot.getRows(); }
  int getCols() const { return snapshot.getCols(); }
  bool isAlternateScreen() const { return alternateActive; }

  /**
   * @brief Answers the terminal produced for queries in the stream (device
   * attributes, cursor position reports), oldest first. They belong on the
   * application's input.
   */
  string takeReplies();

 protected:
  VTerm* term;
  VTermScreen* vtScreen;
  VTermState* vtState;
  ScreenBuffer snapshot;
  bool alternateActive;
  bool cursorVisible;

  /** @brief Copies libvterm's screen and cursor into the snapshot. */
  void refresh();
  void pushScrollback(int cols, const VTermScreenCell* cells);

  static TerminalCell convertCell(const VTermScreenCell& cell);
  static TerminalColor convertColor(const VTermColor& color);
  /** @brief UTF-8 text of a cell with control characters replaced. */
  static string cellText(const uint32_t* chars);

  static int onSetTermProp(VTermProp prop, VTermValue* val, void* user);
  static int onPushLine(int cols, const VTermScreenCell* cells, void* user);
  static int onPopLine(int cols, VTermScreenCell* cells, void* user);
};
}  // namespace archtui

#endif  // __ARCHTUI_TERMINAL_EMULATOR__
