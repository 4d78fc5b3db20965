#include "KeyDecoder.hpp"

namespace archtui {
vector<KeyEvent> KeyDecoder::decode(const char* input, size_t inputLength) {
  string joined;
  const char* data = input;
  size_t length = inputLength;
  if (!pending.empty()) {
    joined = pending;
    joined.append(input, inputLength);
    pending.clear();
    data = joined.data();
    length = joined.size();
  }

  vector<KeyEvent> events;
  size_t i = 0;
  while (i < length) {
    uint8_t b = uint8_t(data[i]);
    if (b == 0x1B) {
      i += decodeEscape(data + i, length - i, &events);
      continue;
    }
    if (b == '\r' || b == '\n') {
      events.push_back(KeyEvent::key(KeyCode::ENTER));
    } else if (b == '\t') {
      events.push_back(KeyEvent::key(KeyCode::TAB));
    } else if (b == 0x7F || b == 0x08) {
      events.push_back(KeyEvent::key(KeyCode::BACKSPACE));
    } else if (b >= 0x01 && b <= 0x1A) {
      events.push_back(KeyEvent::ch(char32_t('a' + b - 1), KEY_MOD_CONTROL));
    } else if (b >= 0x20 && b < 0x7F) {
      events.push_back(KeyEvent::ch(char32_t(b)));
    } else if (b >= 0x80) {
      char32_t codePoint;
      size_t consumed = decodeUtf8(data + i, length - i, &codePoint);
      if (consumed == 0 && isTruncatedUtf8(data + i, length - i)) {
        pending.assign(data + i, length - i);
        break;
      }
      if (consumed == 0) {
        VLOG(1) << "Dropping invalid UTF-8 byte " << int(b);
        i++;
      } else {
        events.push_back(KeyEvent::ch(codePoint));
        i += consumed;
      }
      continue;
    }
    i++;
  }
  return events;
}

size_t KeyDecoder::decodeEscape(const char* data, size_t length,
                                vector<KeyEvent>* events) {
  if (length < 2 || data[1] == 0x1B) {
    events->push_back(KeyEvent::key(KeyCode::ESC));
    return 1;
  }
  char next = data[1];
  if (next == '[') {
    return decodeCsi(data, length, events);
  }
  if (next == 'O' && length >= 3) {
    KeyEvent event;
    if (decodeSs3(data[2], &event)) {
      events->push_back(event);
    }
    return 3;
  }

  // ESC followed by a key is that key with Alt held
  uint8_t b = uint8_t(next);
  if (b == 0x7F) {
    events->push_back(KeyEvent::key(KeyCode::BACKSPACE, KEY_MOD_ALT));
    return 2;
  }
  if (b == '\r') {
    events->push_back(KeyEvent::key(KeyCode::ENTER, KEY_MOD_ALT));
    return 2;
  }
  if (b >= 0x01 && b <= 0x1A) {
    events->push_back(KeyEvent::ch(char32_t('a' + b - 1),
                                   KEY_MOD_CONTROL | KEY_MOD_ALT));
    return 2;
  }
  if (b < 0x20) {
    return 2;
  }
  char32_t codePoint;
  size_t consumed = decodeUtf8(data + 1, length - 1, &codePoint);
  if (consumed == 0) {
    events->push_back(KeyEvent::key(KeyCode::ESC));
    return 1;
  }
  events->push_back(KeyEvent::ch(codePoint, KEY_MOD_ALT));
  return 1 + consumed;
}

size_t KeyDecoder::decodeCsi(const char* data, size_t length,
                             vector<KeyEvent>* events) {
  vector<int> params;
  int current = 0;
  bool hasCurrent = false;
  size_t i = 2;
  for (; i < length; i++) {
    char c = data[i];
    if (c >= '0' && c <= '9') {
      current = min(current * 10 + (c - '0'), 9999);
      hasCurrent = true;
    } else if (c == ';') {
      params.push_back(current);
      current = 0;
      hasCurrent = false;
    } else {
      break;
    }
  }
  if (i >= length) {
    VLOG(1) << "Dropping truncated CSI key sequence";
    return length;
  }
  if (hasCurrent) {
    params.push_back(current);
  }
  char finalByte = data[i];
  size_t consumed = i + 1;
  uint8_t mods = params.size() >= 2 ? modifiersFromParam(params[1])
                                    : uint8_t(KEY_MOD_NONE);

  KeyEvent event;
  switch (finalByte) {
    case 'A':
      event = KeyEvent::key(KeyCode::UP, mods);
      break;
    case 'B':
      event = KeyEvent::key(KeyCode::DOWN, mods);
      break;
    case 'C':
      event = KeyEvent::key(KeyCode::RIGHT, mods);
      break;
    case 'D':
      event = KeyEvent::key(KeyCode::LEFT, mods);
      break;
    case 'H':
      event = KeyEvent::key(KeyCode::HOME, mods);
      break;
    case 'F':
      event = KeyEvent::key(KeyCode::END, mods);
      break;
    case 'Z':
      event = KeyEvent::key(KeyCode::BACK_TAB, KEY_MOD_SHIFT);
      break;
    case 'P':
    case 'Q':
    case 'R':
    case 'S':
      event = KeyEvent::function(finalByte - 'P' + 1);
      event.modifiers = mods;
      break;
    case '~': {
      int code = params.empty() ? 0 : params[0];
      switch (code) {
        case 1:
        case 7:
          event = KeyEvent::key(KeyCode::HOME, mods);
          break;
        case 2:
          event = KeyEvent::key(KeyCode::INSERT, mods);
          break;
        case 3:
          event = KeyEvent::key(KeyCode::DELETE, mods);
          break;
        case 4:
        case 8:
          event = KeyEvent::key(KeyCode::END, mods);
          break;
        case 5:
          event = KeyEvent::key(KeyCode::PAGE_UP, mods);
          break;
        case 6:
          event = KeyEvent::key(KeyCode::PAGE_DOWN, mods);
          break;
        case 11:
        case 12:
        case 13:
        case 14:
        case 15:
          event = KeyEvent::function(code - 10);
          break;
        case 17:
        case 18:
        case 19:
        case 20:
        case 21:
          event = KeyEvent::function(code - 11);
          break;
        case 23:
        case 24:
          event = KeyEvent::function(code - 12);
          break;
        default:
          VLOG(1) << "Unknown CSI key code " << code;
          return consumed;
      }
      if (event.code == KeyCode::FUNCTION) {
        event.modifiers = mods;
      }
      break;
    }
    default:
      VLOG(1) << "Unknown CSI key final byte " << int(finalByte);
      return consumed;
  }
  events->push_back(event);
  return consumed;
}

bool KeyDecoder::decodeSs3(char finalByte, KeyEvent* event) {
  switch (finalByte) {
    case 'P':
    case 'Q':
    case 'R':
    case 'S':
      *event = KeyEvent::function(finalByte - 'P' + 1);
      return true;
    case 'A':
      *event = KeyEvent::key(KeyCode::UP);
      return true;
    case 'B':
      *event = KeyEvent::key(KeyCode::DOWN);
      return true;
    case 'C':
      *event = KeyEvent::key(KeyCode::RIGHT);
      return true;
    case 'D':
      *event = KeyEvent::key(KeyCode::LEFT);
      return true;
    case 'H':
      *event = KeyEvent::key(KeyCode::HOME);
      return true;
    case 'F':
      *event = KeyEvent::key(KeyCode::END);
      return true;
    default:
      return false;
  }
}

size_t KeyDecoder::decodeUtf8(const char* data, size_t length,
                              char32_t* codePoint) {
  uint8_t lead = uint8_t(data[0]);
  size_t needed;
  char32_t value;
  if (lead < 0x80) {
    *codePoint = lead;
    return 1;
  } else if ((lead & 0xE0) == 0xC0) {
    needed = 2;
    value = lead & 0x1F;
  } else if ((lead & 0xF0) == 0xE0) {
    needed = 3;
    value = lead & 0x0F;
  } else if ((lead & 0xF8) == 0xF0) {
    needed = 4;
    value = lead & 0x07;
  } else {
    return 0;
  }
  if (length < needed) {
    return 0;
  }
  for (size_t i = 1; i < needed; i++) {
    uint8_t b = uint8_t(data[i]);
    if ((b & 0xC0) != 0x80) {
      return 0;
    }
    value = (value << 6) | (b & 0x3F);
  }
  *codePoint = value;
  return needed;
}

bool KeyDecoder::isTruncatedUtf8(const char* data, size_t length) {
  uint8_t lead = uint8_t(data[0]);
  size_t needed;
  if ((lead & 0xE0) == 0xC0) {
    needed = 2;
  } else if ((lead & 0xF0) == 0xE0) {
    needed = 3;
  } else if ((lead & 0xF8) == 0xF0) {
    needed = 4;
  } else {
    return false;
  }
  if (length >= needed) {
    return false;
  }
  for (size_t i = 1; i < length; i++) {
    if ((uint8_t(data[i]) & 0xC0) != 0x80) {
      return false;
    }
  }
  return true;
}

uint8_t KeyDecoder::modifiersFromParam(int param) {
  int bits = max(0, param - 1);
  uint8_t mods = KEY_MOD_NONE;
  if (bits & 1) mods |= KEY_MOD_SHIFT;
  if (bits & 2) mods |= KEY_MOD_ALT;
  if (bits & 4) mods |= KEY_MOD_CONTROL;
  return mods;
}
}  // namespace archtui
