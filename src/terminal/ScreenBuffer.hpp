#ifndef __ARCHTUI_SCREEN_BUFFER__
#define __ARCHTUI_SCREEN_BUFFER__

#include "Headers.hpp"

namespace archtui {
/**
 * @brief A cell color: the terminal default, a palette index or 24-bit RGB.
 */
struct TerminalColor {
  enum Kind : uint8_t { DEFAULT, INDEXED, RGB };

  Kind kind = DEFAULT;
  uint8_t index = 0;
  uint8_t red = 0;
  uint8_t green = 0;
  uint8_t blue = 0;

  static TerminalColor indexed(uint8_t index) {
    TerminalColor color;
    color.kind = INDEXED;
    color.index = index;
    return color;
  }

  static TerminalColor rgb(uint8_t red, uint8_t green, uint8_t blue) {
    TerminalColor color;
    color.kind = RGB;
    color.red = red;
    color.green = green;
    color.blue = blue;
    return color;
  }

  bool isDefault() const { return kind == DEFAULT; }

  bool operator==(const TerminalColor& other) const {
    if (kind != other.kind) return false;
    if (kind == INDEXED) return index == other.index;
    if (kind == RGB)
      return red == other.red && green == other.green && blue == other.blue;
    return true;
  }
  bool operator!=(const TerminalColor& other) const {
    return !(*this == other);
  }
};

/**
 * @brief One grid position. `contents` holds the UTF-8 grapheme; empty means
 * blank. A double-width glyph has width 2 and the cell to its right has
 * width 0.
 */
struct TerminalCell {
  string contents;
  TerminalColor foreground;
  TerminalColor background;
  bool bold = false;
  bool italic = false;
  bool underline = false;
  bool inverse = false;
  int width = 1;

  bool isBlank() const { return contents.empty() || contents == " "; }
  bool isContinuation() const { return width == 0; }

  /** @brief True if both cells would be painted with the same style. */
  bool sameStyle(const TerminalCell& other) const {
    return foreground == other.foreground && background == other.background &&
           bold == other.bold && italic == other.italic &&
           underline == other.underline && inverse == other.inverse;
  }
};

/**
 * @brief Read-only picture of a terminal: rows x cols cells, the cursor and
 * the lines that scrolled off the top.
 *
 * TerminalEmulator fills it after each batch of output; renderers only see
 * it through a const reference. The cursor always stays within
 * [0,rows) x [0,cols) and dimensions are at least 1x1.
 */
class ScreenBuffer {
 public:
  ScreenBuffer(int rows, int cols, size_t scrollbackLimit);

  int getRows() const { return rows; }
  int getCols() const { return cols; }

  /** @brief Cell at (row, col), or nullptr when out of bounds. */
  const TerminalCell* cell(int row, int col) const;

  int getCursorRow() const { return cursorRow; }
  int getCursorCol() const { return cursorCol; }
  pair<int, int> cursorPosition() const { return {cursorRow, cursorCol}; }
  bool isCursorVisible() const { return cursorVisible; }

  /** @brief Text of one row with trailing blanks removed. */
  string rowText(int row) const;
  /** @brief All rows joined by newlines, trailing blanks removed per row. */
  string contents() const;

  size_t scrollbackSize() const { return scrollback.size(); }
  /** @brief Rows that scrolled off the top, oldest first. */
  const deque<vector<TerminalCell>>& getScrollback() const {
    return scrollback;
  }

  /** @brief Changes the dimensions and blanks every cell. */
  void reset(int newRows, int newCols);
  /** @brief Out of bounds positions are ignored. */
  void setCell(int row, int col, const TerminalCell& cell);
  /** @brief Clamped into the grid. */
  void setCursor(int row, int col);
  void setCursorVisible(bool visible) { cursorVisible = visible; }
  /** @brief Appends a line, dropping the oldest past the limit. */
  void pushScrollback(vector<TerminalCell> line);

 protected:
  int rows;
  int cols;
  vector<vector<TerminalCell>> grid;
  int cursorRow;
  int cursorCol;
  bool cursorVisible;
  deque<vector<TerminalCell>> scrollback;
  size_t scrollbackLimit;
};
}  // namespace archtui

#endif  // __ARCHTUI_SCREEN_BUFFER__
