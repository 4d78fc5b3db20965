#include "TerminalRenderer.hpp"

namespace archtui {
namespace {
const char* BORDER_HORIZONTAL = "─";
const char* BORDER_VERTICAL = "│";
const char* BORDER_TOP_LEFT = "┌";
const char* BORDER_TOP_RIGHT = "┐";
const char* BORDER_BOTTOM_LEFT = "└";
const char* BORDER_BOTTOM_RIGHT = "┘";

/** @brief Truncates UTF-8 text to at most `maxChars` code points. */
string truncateUtf8(const string& text, int maxChars) {
  string out;
  int chars = 0;
  for (size_t i = 0; i < text.size(); i++) {
    bool continuation = (uint8_t(text[i]) & 0xC0) == 0x80;
    if (!continuation) {
      if (chars == maxChars) {
        break;
      }
      chars++;
    }
    out += text[i];
  }
  return out;
}

/**
 * @brief A cell's text as it may be written to the host terminal. Text
 * carrying a C0 or C1 control (which could move the host cursor or start a
 * sequence) becomes U+FFFD.
 */
string printableContents(const string& contents) {
  for (size_t i = 0; i < contents.size(); i++) {
    uint8_t b = uint8_t(contents[i]);
    if (b < 0x20 || b == 0x7F) {
      return "\xEF\xBF\xBD";
    }
    if (b == 0xC2 && i + 1 < contents.size() &&
        uint8_t(contents[i + 1]) >= 0x80 && uint8_t(contents[i + 1]) <= 0x9F) {
      return "\xEF\xBF\xBD";
    }
  }
  return contents;
}

int utf8Length(const string& text) {
  int chars = 0;
  for (char c : text) {
    if ((uint8_t(c) & 0xC0) != 0x80) {
      chars++;
    }
  }
  return chars;
}
}  // namespace

Rect TerminalRenderer::innerArea(const Rect& area) {
  return Rect(area.x + 1, area.y + 1, max(0, area.width - 2),
              max(0, area.height - 2));
}

string TerminalRenderer::renderToString(const ScreenBuffer& screen,
                                        const Rect& area,
                                        const string& title) {
  string out;
  if (area.width < 2 || area.height < 2) {
    return "\x1b[?25l";
  }
  out += "\x1b[?25l";
  out += drawBorder(area, title);

  Rect inner = innerArea(area);
  TerminalCell blank;
  for (int row = 0; row < inner.height; row++) {
    out += moveTo(inner.y + row, inner.x);
    string lastSgr;
    for (int col = 0; col < inner.width; col++) {
      const TerminalCell* cell = screen.cell(row, col);
      if (cell == nullptr) {
        cell = &blank;
      }
      if (cell->isContinuation()) {
        // Covered by the double-width glyph to the left
        continue;
      }
      string sgr = sgrFor(*cell);
      if (sgr != lastSgr) {
        out += sgr;
        lastSgr = sgr;
      }
      if (cell->contents.empty() ||
          (cell->width == 2 && col + 1 >= inner.width)) {
        out += " ";
      } else {
        out += printableContents(cell->contents);
      }
    }
  }
  out += "\x1b[0m";

  int cursorRow = screen.getCursorRow();
  int cursorCol = screen.getCursorCol();
  if (screen.isCursorVisible() && cursorRow < inner.height &&
      cursorCol < inner.width) {
    out += moveTo(inner.y + cursorRow, inner.x + cursorCol);
    out += "\x1b[?25h";
  }
  return out;
}

string TerminalRenderer::sgrFor(const TerminalCell& cell) {
  string out = "\x1b[0";
  if (cell.bold) out += ";1";
  if (cell.italic) out += ";3";
  if (cell.underline) out += ";4";
  TerminalColor foreground = cell.foreground;
  TerminalColor background = cell.background;
  if (cell.inverse) {
    if (foreground.isDefault() && background.isDefault()) {
      // Both colors belong to the host terminal, let it swap them
      out += ";7";
    } else {
      std::swap(foreground, background);
    }
  }
  appendColor(foreground, true, &out);
  appendColor(background, false, &out);
  out += "m";
  return out;
}

string TerminalRenderer::moveTo(int row, int col) {
  return "\x1b[" + to_string(row + 1) + ";" + to_string(col + 1) + "H";
}

void TerminalRenderer::appendColor(const TerminalColor& color, bool foreground,
                                   string* out) {
  switch (color.kind) {
    case TerminalColor::DEFAULT:
      break;
    case TerminalColor::INDEXED:
      if (color.index < 8) {
        *out += ";" + to_string((foreground ? 30 : 40) + color.index);
      } else if (color.index < 16) {
        *out += ";" + to_string((foreground ? 90 : 100) + color.index - 8);
      } else {
        *out += (foreground ? ";38;5;" : ";48;5;") + to_string(color.index);
      }
      break;
    case TerminalColor::RGB:
      *out += (foreground ? ";38;2;" : ";48;2;") + to_string(color.red) + ";" +
              to_string(color.green) + ";" + to_string(color.blue);
      break;
  }
}

string TerminalRenderer::drawBorder(const Rect& area, const string& title) {
  string out = "\x1b[0m";
  int innerWidth = area.width - 2;

  out += moveTo(area.y, area.x);
  out += BORDER_TOP_LEFT;
  int used = 0;
  if (!title.empty() && innerWidth >= 4) {
    string label = truncateUtf8(title, innerWidth - 3);
    out += BORDER_HORIZONTAL;
    out += "\x1b[1m " + label + " \x1b[0m";
    used = 1 + utf8Length(label) + 2;
  }
  for (int i = used; i < innerWidth; i++) {
    out += BORDER_HORIZONTAL;
  }
  out += BORDER_TOP_RIGHT;

  for (int row = 1; row < area.height - 1; row++) {
    out += moveTo(area.y + row, area.x);
    out += BORDER_VERTICAL;
    out += moveTo(area.y + row, area.x + area.width - 1);
    out += BORDER_VERTICAL;
  }

  out += moveTo(area.y + area.height - 1, area.x);
  out += BORDER_BOTTOM_LEFT;
  for (int i = 0; i < innerWidth; i++) {
    out += BORDER_HORIZONTAL;
  }
  out += BORDER_BOTTOM_RIGHT;
  return out;
}
}  // namespace archtui
