#include "KeyEncoder.hpp"

namespace archtui {
string KeyEncoder::encode(const KeyEvent& event) {
  switch (event.code) {
    case KeyCode::CHAR:
      return encodeCharacter(event);
    case KeyCode::ENTER:
      return "\r";
    case KeyCode::BACKSPACE:
      return "\x7f";
    case KeyCode::TAB:
      return "\t";
    case KeyCode::ESC:
      return "\x1b";
    case KeyCode::UP:
      return "\x1b[A";
    case KeyCode::DOWN:
      return "\x1b[B";
    case KeyCode::RIGHT:
      return "\x1b[C";
    case KeyCode::LEFT:
      return "\x1b[D";
    case KeyCode::HOME:
      return "\x1b[H";
    case KeyCode::END:
      return "\x1b[F";
    case KeyCode::PAGE_UP:
      return "\x1b[5~";
    case KeyCode::PAGE_DOWN:
      return "\x1b[6~";
    case KeyCode::INSERT:
      return "\x1b[2~";
    case KeyCode::DELETE:
      return "\x1b[3~";
    case KeyCode::FUNCTION:
      return encodeFunctionKey(event.functionNumber);
    default:
      return "";
  }
}

string KeyEncoder::encodeCharacter(const KeyEvent& event) {
  char32_t c = event.character;
  if (event.hasModifier(KEY_MOD_CONTROL)) {
    if (c >= 'A' && c <= 'Z') {
      c = c - 'A' + 'a';
    }
    if (c >= 'a' && c <= 'z') {
      return string(1, char(c - 'a' + 1));
    }
    // Control with anything but a letter has no encoding
    return "";
  }
  if (event.hasModifier(KEY_MOD_ALT)) {
    return string("\x1b") + CodePointToUtf8(c);
  }
  return CodePointToUtf8(c);
}

string KeyEncoder::encodeFunctionKey(int number) {
  switch (number) {
    case 1:
      return "\x1bOP";
    case 2:
      return "\x1bOQ";
    case 3:
      return "\x1bOR";
    case 4:
      return "\x1bOS";
    case 5:
      return "\x1b[15~";
    case 6:
      return "\x1b[17~";
    case 7:
      return "\x1b[18~";
    case 8:
      return "\x1b[19~";
    case 9:
      return "\x1b[20~";
    case 10:
      return "\x1b[21~";
    case 11:
      return "\x1b[23~";
    case 12:
      return "\x1b[24~";
    default:
      return "";
  }
}
}  // namespace archtui
