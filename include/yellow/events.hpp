#pragma once

#include <string>
#include <utility>
#include <variant>

#include "yellow/storage.hpp"

namespace yellow {

// `key` follows the terminal's naming: "enter", "esc", "tab", "ctrl+c",
// "up", ... for special keys and the typed text itself for runes.
struct KeyEvent {
  std::string key;
  bool rune{false};

  bool is(const char* name) const { return key == name; }
};

struct ResizeEvent {
  int width{0};
  int height{0};
};

struct LoadCompleteEvent {
  LoadResult result;
};

struct SaveCompleteEvent {
  SaveResult result;
};

using Event = std::variant<KeyEvent, ResizeEvent, LoadCompleteEvent, SaveCompleteEvent>;

inline KeyEvent special_key(std::string name) { return KeyEvent{std::move(name), false}; }

inline KeyEvent rune_key(std::string text) { return KeyEvent{std::move(text), true}; }

// Names a plain (non keypad) character the way the key handlers expect.
inline KeyEvent decode_char(char32_t ch) {
  switch (ch) {
    case 3:
      return special_key("ctrl+c");
    case 8:
    case 127:
      return special_key("backspace");
    case 9:
      return special_key("tab");
    case 10:
    case 13:
      return special_key("enter");
    case 27:
      return special_key("esc");
    default:
      break;
  }
  if (ch == 0) {
    return special_key("ctrl+@");
  }
  if (ch < 32) {
    return special_key(std::string("ctrl+") + static_cast<char>('a' + ch - 1));
  }
  return rune_key(encode_utf8(ch));
}

}  // namespace yellow
