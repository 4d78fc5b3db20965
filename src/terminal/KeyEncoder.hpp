#ifndef __ARCHTUI_KEY_ENCODER__
#define __ARCHTUI_KEY_ENCODER__

#include "Headers.hpp"
#include "KeyEvent.hpp"

namespace archtui {
/**
 * @brief Maps a key press to the bytes an xterm-compatible program expects.
 *
 * Total and stateless: keys with no encoding produce an empty string.
 */
class KeyEncoder {
 public:
  static string encode(const KeyEvent& event);

 protected:
  static string encodeCharacter(const KeyEvent& event);
  static string encodeFunctionKey(int number);
};
}  // namespace archtui

#endif  // __ARCHTUI_KEY_ENCODER__
