#include "TerminalEmulator.hpp"

namespace archtui {
namespace {
const string REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

bool isPrintable(uint32_t codePoint) {
  if (codePoint < 0x20 || (codePoint >= 0x7F && codePoint <= 0x9F)) {
    return false;
  }
  if (codePoint >= 0xD800 && codePoint <= 0xDFFF) {
    return false;
  }
  return codePoint <= 0x10FFFF;
}

/**
 * @brief The picture is rebuilt after every write, so damage and cursor
 * notifications are not needed.
 */
VTermScreenCallbacks makeCallbacks(
    int (*settermprop)(VTermProp, VTermValue*, void*),
    int (*sbPushline)(int, const VTermScreenCell*, void*),
    int (*sbPopline)(int, VTermScreenCell*, void*)) {
  // Older libvterm releases lack trailing members, so assign by name
  VTermScreenCallbacks callbacks;
  memset(&callbacks, 0, sizeof(callbacks));
  callbacks.settermprop = settermprop;
  callbacks.sb_pushline = sbPushline;
  callbacks.sb_popline = sbPopline;
  return callbacks;
}
}  // namespace

TerminalEmulator::TerminalEmulator(int rows, int cols, size_t scrollbackLines)
    : term(NULL),
      vtScreen(NULL),
      vtState(NULL),
      snapshot(rows, cols, scrollbackLines),
      alternateActive(false),
      cursorVisible(true) {
  term = vterm_new(snapshot.getRows(), snapshot.getCols());
  if (term == NULL) {
    STFATAL << "vterm_new failed for " << snapshot.getCols() << "x"
            << snapshot.getRows();
  }
  vterm_set_utf8(term, 1);
  vtState = vterm_obtain_state(term);
  vtScreen = vterm_obtain_screen(term);

  static const VTermScreenCallbacks callbacks =
      makeCallbacks(&TerminalEmulator::onSetTermProp,
                    &TerminalEmulator::onPushLine, &TerminalEmulator::onPopLine);
  vterm_screen_set_callbacks(vtScreen, &callbacks, this);
  vterm_screen_enable_altscreen(vtScreen, 1);
  vterm_screen_reset(vtScreen, 1);
  refresh();
}

TerminalEmulator::~TerminalEmulator() {
  if (term != NULL) {
    vterm_free(term);
    term = NULL;
  }
}

void TerminalEmulator::process(const char* data, size_t length) {
  if (length == 0) {
    return;
  }
  vterm_input_write(term, data, length);
  vterm_screen_flush_damage(vtScreen);
  refresh();
}

void TerminalEmulator::setSize(int rows, int cols) {
  rows = max(1, rows);
  cols = max(1, cols);
  if (rows == snapshot.getRows() && cols == snapshot.getCols()) {
    return;
  }
  vterm_set_size(term, rows, cols);
  vterm_screen_flush_damage(vtScreen);
  refresh();
}

string TerminalEmulator::takeReplies() {
  string replies;
  char buf[256];
  size_t rc;
  while ((rc = vterm_output_read(term, buf, sizeof(buf))) > 0) {
    replies.append(buf, rc);
  }
  return replies;
}

void TerminalEmulator::refresh() {
  int rows, cols;
  vterm_get_size(term, &rows, &cols);
  snapshot.reset(rows, cols);
  VTermPos pos;
  VTermScreenCell cell;
  for (pos.row = 0; pos.row < rows; pos.row++) {
    for (pos.col = 0; pos.col < cols; pos.col++) {
      if (!vterm_screen_get_cell(vtScreen, pos, &cell)) {
        continue;
      }
      snapshot.setCell(pos.row, pos.col, convertCell(cell));
    }
  }
  VTermPos cursor;
  vterm_state_get_cursorpos(vtState, &cursor);
  snapshot.setCursor(cursor.row, cursor.col);
  snapshot.setCursorVisible(cursorVisible);
}

void TerminalEmulator::pushScrollback(int cols, const VTermScreenCell* cells) {
  vector<TerminalCell> line;
  line.reserve(cols);
  for (int col = 0; col < cols; col++) {
    line.push_back(convertCell(cells[col]));
  }
  snapshot.pushScrollback(std::move(line));
}

TerminalCell TerminalEmulator::convertCell(const VTermScreenCell& cell) {
  TerminalCell out;
  if (cell.chars[0] == uint32_t(-1)) {
    // Right half of a double-width glyph
    out.width = 0;
  } else {
    out.contents = cellText(cell.chars);
    out.width = cell.width == 2 ? 2 : 1;
  }
  out.foreground = convertColor(cell.fg);
  out.background = convertColor(cell.bg);
  out.bold = cell.attrs.bold;
  out.italic = cell.attrs.italic;
  out.underline = cell.attrs.underline != 0;
  out.inverse = cell.attrs.reverse;
  return out;
}

TerminalColor TerminalEmulator::convertColor(const VTermColor& color) {
  if (VTERM_COLOR_IS_DEFAULT_FG(&color) || VTERM_COLOR_IS_DEFAULT_BG(&color)) {
    return TerminalColor();
  }
  if (VTERM_COLOR_IS_INDEXED(&color)) {
    return TerminalColor::indexed(color.indexed.idx);
  }
  return TerminalColor::rgb(color.rgb.red, color.rgb.green, color.rgb.blue);
}

string TerminalEmulator::cellText(const uint32_t* chars) {
  string text;
  for (int i = 0; i < VTERM_MAX_CHARS_PER_CELL && chars[i] != 0; i++) {
    if (isPrintable(chars[i])) {
      text += CodePointToUtf8(char32_t(chars[i]));
    } else if (i == 0) {
      text += REPLACEMENT_CHARACTER;
    }
  }
  return text;
}

int TerminalEmulator::onSetTermProp(VTermProp prop, VTermValue* val,
                                    void* user) {
  TerminalEmulator* emulator = static_cast<TerminalEmulator*>(user);
  switch (prop) {
    case VTERM_PROP_ALTSCREEN:
      emulator->alternateActive = val->boolean != 0;
      return 1;
    case VTERM_PROP_CURSORVISIBLE:
      emulator->cursorVisible = val->boolean != 0;
      return 1;
    default:
      // Titles, mouse modes and the like have no effect on the picture
      return 0;
  }
}

int TerminalEmulator::onPushLine(int cols, const VTermScreenCell* cells,
                                 void* user) {
  TerminalEmulator* emulator = static_cast<TerminalEmulator*>(user);
  if (emulator->alternateActive || cells == NULL || cols <= 0) {
    return 0;
  }
  emulator->pushScrollback(cols, cells);
  return 1;
}

int TerminalEmulator::onPopLine(int cols, VTermScreenCell* cells, void* user) {
  // Scrollback is display-only, never pulled back onto the screen
  return 0;
}
}  // namespace archtui
