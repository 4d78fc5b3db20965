#include "ScreenBuffer.hpp"

namespace archtui {
ScreenBuffer::ScreenBuffer(int _rows, int _cols, size_t _scrollbackLimit)
    : rows(max(1, _rows)),
      cols(max(1, _cols)),
      grid(rows, vector<TerminalCell>(cols)),
      cursorRow(0),
      cursorCol(0),
      cursorVisible(true),
      scrollbackLimit(_scrollbackLimit) {}

const TerminalCell* ScreenBuffer::cell(int row, int col) const {
  if (row < 0 || row >= rows || col < 0 || col >= cols) {
    return nullptr;
  }
  return &grid[row][col];
}

string ScreenBuffer::rowText(int row) const {
  if (row < 0 || row >= rows) {
    return "";
  }
  string text;
  int lastNonBlank = -1;
  for (int col = 0; col < cols; col++) {
    if (!grid[row][col].isBlank()) {
      lastNonBlank = col;
    }
  }
  for (int col = 0; col <= lastNonBlank; col++) {
    const TerminalCell& c = grid[row][col];
    if (c.isContinuation()) {
      continue;
    }
    text += c.contents.empty() ? string(" ") : c.contents;
  }
  return text;
}

string ScreenBuffer::contents() const {
  string text;
  for (int row = 0; row < rows; row++) {
    if (row) text += "\n";
    text += rowText(row);
  }
  return text;
}

void ScreenBuffer::reset(int newRows, int newCols) {
  rows = max(1, newRows);
  cols = max(1, newCols);
  grid.assign(rows, vector<TerminalCell>(cols));
  setCursor(cursorRow, cursorCol);
}

void ScreenBuffer::setCell(int row, int col, const TerminalCell& cell) {
  if (row < 0 || row >= rows || col < 0 || col >= cols) {
    return;
  }
  grid[row][col] = cell;
}

void ScreenBuffer::setCursor(int row, int col) {
  cursorRow = min(max(row, 0), rows - 1);
  cursorCol = min(max(col, 0), cols - 1);
}

void ScreenBuffer::pushScrollback(vector<TerminalCell> line) {
  if (scrollbackLimit == 0) {
    return;
  }
  scrollback.push_back(std::move(line));
  while (scrollback.size() > scrollbackLimit) {
    scrollback.pop_front();
  }
}
}  // namespace archtui
