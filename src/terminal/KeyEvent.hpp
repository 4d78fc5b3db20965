#ifndef __ARCHTUI_KEY_EVENT__
#define __ARCHTUI_KEY_EVENT__

#include "Headers.hpp"

namespace archtui {
enum class KeyCode {
  CHAR,
  ENTER,
  BACKSPACE,
  TAB,
  BACK_TAB,
  ESC,
  UP,
  DOWN,
  LEFT,
  RIGHT,
  HOME,
  END,
  PAGE_UP,
  PAGE_DOWN,
  INSERT,
  DELETE,
  FUNCTION,
};

enum KeyModifier : uint8_t {
  KEY_MOD_NONE = 0,
  KEY_MOD_SHIFT = 1 << 0,
  KEY_MOD_CONTROL = 1 << 1,
  KEY_MOD_ALT = 1 << 2,
};

/**
 * @brief A structured key press, as produced by KeyDecoder and consumed by
 * KeyEncoder.
 */
struct KeyEvent {
  KeyCode code = KeyCode::CHAR;
  /** @brief Set when code == CHAR. */
  char32_t character = 0;
  /** @brief 1-based function key number, set when code == FUNCTION. */
  int functionNumber = 0;
  uint8_t modifiers = KEY_MOD_NONE;

  static KeyEvent ch(char32_t c, uint8_t mods = KEY_MOD_NONE) {
    KeyEvent event;
    event.code = KeyCode::CHAR;
    event.character = c;
    event.modifiers = mods;
    return event;
  }

  static KeyEvent key(KeyCode code, uint8_t mods = KEY_MOD_NONE) {
    KeyEvent event;
    event.code = code;
    event.modifiers = mods;
    return event;
  }

  static KeyEvent function(int number) {
    KeyEvent event;
    event.code = KeyCode::FUNCTION;
    event.functionNumber = number;
    return event;
  }

  bool hasModifier(KeyModifier modifier) const {
    return (modifiers & modifier) != 0;
  }

  bool operator==(const KeyEvent& other) const {
    return code == other.code && character == other.character &&
           functionNumber == other.functionNumber &&
           modifiers == other.modifiers;
  }
  bool operator!=(const KeyEvent& other) const { return !(*this == other); }
};
}  // namespace archtui

#endif  // __ARCHTUI_KEY_EVENT__
