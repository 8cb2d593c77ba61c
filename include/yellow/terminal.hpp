#pragma once

#ifndef NCURSES_WIDECHAR
#define NCURSES_WIDECHAR 1
#endif
#ifndef NCURSES_NOMACROS
#define NCURSES_NOMACROS 1
#endif

#include <clocale>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>
#include <utility>

#include <ncurses.h>

#include "yellow/display.hpp"
#include "yellow/events.hpp"

namespace yellow {

inline std::optional<KeyEvent> decode_keypad(int code) {
  switch (code) {
    case KEY_UP:
      return special_key("up");
    case KEY_DOWN:
      return special_key("down");
    case KEY_LEFT:
      return special_key("left");
    case KEY_RIGHT:
      return special_key("right");
    case KEY_HOME:
      return special_key("home");
    case KEY_END:
      return special_key("end");
    case KEY_PPAGE:
      return special_key("pgup");
    case KEY_NPAGE:
      return special_key("pgdown");
    case KEY_BACKSPACE:
      return special_key("backspace");
    case KEY_DC:
      return special_key("delete");
    case KEY_ENTER:
      return special_key("enter");
    case KEY_BTAB:
      return special_key("shift+tab");
    default:
      return std::nullopt;
  }
}

// Owns the curses screen: alternate screen, raw input, colors.
class Terminal {
 public:
  Terminal() = default;
  ~Terminal() { stop(); }

  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;

  bool start(std::string* error = nullptr) {
    if (screen_) {
      return true;
    }
    std::setlocale(LC_ALL, "");
    screen_ = newterm(nullptr, stdout, stdin);
    if (!screen_) {
      if (error) {
        const char* term = std::getenv("TERM");
        *error = std::string("cannot initialise terminal (TERM=") + (term ? term : "") + ")";
      }
      return false;
    }
    set_term(screen_);
    raw();
    noecho();
    keypad(stdscr, TRUE);
    set_escdelay(25);
    curs_set(0);
    if (has_colors()) {
      start_color();
      use_default_colors();
      init_pair(kPrimaryPair, COLORS >= 256 ? 214 : COLOR_YELLOW, -1);
      colors_ = true;
    }
    return true;
  }

  void stop() {
    if (!screen_) {
      return;
    }
    endwin();
    delscreen(screen_);
    screen_ = nullptr;
  }

  std::pair<int, int> size() const {
    return {getmaxx(stdscr), getmaxy(stdscr)};
  }

  std::optional<Event> poll(int timeout_ms) {
    wtimeout(stdscr, timeout_ms);
    wint_t ch = 0;
    const int rc = wget_wch(stdscr, &ch);
    if (rc == ERR) {
      return std::nullopt;
    }
    if (rc == KEY_CODE_YES) {
      if (ch == KEY_RESIZE) {
        const auto [w, h] = size();
        return ResizeEvent{w, h};
      }
      if (auto key = decode_keypad(static_cast<int>(ch))) {
        return *key;
      }
      return std::nullopt;
    }
    return decode_char(static_cast<char32_t>(ch));
  }

  void draw(const Frame& frame) {
    werase(stdscr);
    const auto [w, h] = size();
    int row = kPadTop;
    for (const auto& line : frame.lines) {
      if (row >= h) {
        break;
      }
      wmove(stdscr, row, kPadLeft);
      for (const auto& span : line.spans) {
        const attr_t a = attr_for(span.style);
        wattron(stdscr, static_cast<int>(a));
        waddnstr(stdscr, span.text.c_str(), static_cast<int>(span.text.size()));
        wattroff(stdscr, static_cast<int>(a));
      }
      ++row;
    }

    if (frame.cursor && frame.cursor->first + kPadTop < h && frame.cursor->second + kPadLeft < w) {
      curs_set(1);
      wmove(stdscr, frame.cursor->first + kPadTop, frame.cursor->second + kPadLeft);
    } else {
      curs_set(0);
    }
    wrefresh(stdscr);
  }

 private:
  static constexpr short kPrimaryPair = 1;

  attr_t attr_for(Style style) const {
    const attr_t primary = colors_ ? COLOR_PAIR(kPrimaryPair) : A_NORMAL;
    switch (style) {
      case Style::kTitle:
      case Style::kFilterPrompt:
      case Style::kCursorLineNumber:
        return primary | A_BOLD;
      case Style::kSelected:
        return colors_ ? primary : A_REVERSE;
      case Style::kDescription:
      case Style::kMuted:
      case Style::kLineNumber:
      case Style::kEndOfBuffer:
        return A_DIM;
      case Style::kCursorLine:
      case Style::kNormal:
      default:
        return A_NORMAL;
    }
  }

  SCREEN* screen_{nullptr};
  bool colors_{false};
};

}  // namespace yellow
