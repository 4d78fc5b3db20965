#ifndef __ARCHTUI_TERMINAL_RENDERER__
#define __ARCHTUI_TERMINAL_RENDERER__

#include "Console.hpp"
#include "Headers.hpp"
#include "ScreenBuffer.hpp"

namespace archtui {
/**
 * @brief A rectangle on the console, 0-based.
 */
struct Rect {
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;

  Rect() {}
  Rect(int _x, int _y, int _width, int _height)
      : x(_x), y(_y), width(_width), height(_height) {}
};

/**
 * @brief Paints a ScreenBuffer into a bordered box on a Console using ANSI
 * escape sequences.
 */
class TerminalRenderer {
 public:
  /**
   * @brief Builds the escape sequence that draws `screen` inside `area`.
   *
   * The outermost ring of `area` is the border, with `title` in bold on the
   * top edge. Cells outside the screen are painted blank, cells beyond the
   * inner area are clipped. The cursor is shown only if it lies inside the
   * inner area.
   */
  static string renderToString(const ScreenBuffer& screen, const Rect& area,
                               const string& title);

  static void render(Console* console, const ScreenBuffer& screen,
                     const Rect& area, const string& title) {
    console->write(renderToString(screen, area, title));
  }

  /** @brief The part of `area` inside the border. */
  static Rect innerArea(const Rect& area);

  /** @brief SGR sequence (starting with a reset) that paints like `cell`. */
  static string sgrFor(const TerminalCell& cell);

 protected:
  static string moveTo(int row, int col);
  static void appendColor(const TerminalColor& color, bool foreground,
                          string* out);
  static string drawBorder(const Rect& area, const string& title);
};
}  // namespace archtui

#endif  // __ARCHTUI_TERMINAL_RENDERER__
