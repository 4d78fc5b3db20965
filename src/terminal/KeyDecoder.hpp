#ifndef __ARCHTUI_KEY_DECODER__
#define __ARCHTUI_KEY_DECODER__

#include "Headers.hpp"
#include "KeyEvent.hpp"

namespace archtui {
/**
 * @brief Turns raw bytes read from the real console (in raw mode) into key
 * events.
 *
 * A UTF-8 character cut off at the end of one read is completed by the next
 * call. Escape sequences are not carried over: an escape byte that ends a
 * read is taken to be the Esc key, and a partial escape sequence is dropped.
 */
class KeyDecoder {
 public:
  vector<KeyEvent> decode(const char* data, size_t length);
  vector<KeyEvent> decode(const string& bytes) {
    return decode(bytes.data(), bytes.size());
  }

 protected:
  /** @brief Decodes an escape sequence at data[0]; returns bytes consumed. */
  static size_t decodeEscape(const char* data, size_t length,
                             vector<KeyEvent>* events);
  static size_t decodeCsi(const char* data, size_t length,
                          vector<KeyEvent>* events);
  static bool decodeSs3(char finalByte, KeyEvent* event);
  /**
   * @brief Decodes one UTF-8 code point.
   * @return Bytes consumed, or 0 if the sequence is invalid or truncated.
   */
  static size_t decodeUtf8(const char* data, size_t length,
                           char32_t* codePoint);
  /**
   * @brief True if data holds the start of a valid multi-byte UTF-8
   * character that needs more bytes.
   */
  static bool isTruncatedUtf8(const char* data, size_t length);
  /** @brief Modifiers from the xterm "1;m" parameter. */
  static uint8_t modifiersFromParam(int param);

  /** @brief Leading bytes of a character split by the previous read. */
  string pending;
};
}  // namespace archtui

#endif  // __ARCHTUI_KEY_DECODER__
