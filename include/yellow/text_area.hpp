#pragma once

#include <algorithm>
#include <string>
#include <vector>

#include "yellow/common.hpp"
#include "yellow/events.hpp"

namespace yellow {

// Multi-line text buffer with focus and a viewport size.
class TextEditor {
 public:
  virtual ~TextEditor() = default;

  virtual std::string value() const = 0;
  virtual void set_value(const std::string& text) = 0;

  virtual void focus() = 0;
  virtual void blur() = 0;
  virtual bool focused() const = 0;

  virtual void handle_key(const KeyEvent& key) = 0;

  virtual void set_size(int width, int height) = 0;
  virtual int width() const = 0;
  virtual int height() const = 0;

  virtual const std::vector<std::string>& lines() const = 0;
  virtual std::size_t cursor_row() const = 0;
  virtual std::size_t cursor_col() const = 0;  // byte offset into lines()[cursor_row()]
  virtual std::size_t first_visible_row() const = 0;
};

class TextArea : public TextEditor {
 public:
  static constexpr int kDefaultWidth = 80;
  static constexpr int kDefaultHeight = 6;

  TextArea() : lines_(1) {}

  std::string value() const override {
    std::string out;
    for (std::size_t i = 0; i < lines_.size(); ++i) {
      if (i > 0) {
        out.push_back('\n');
      }
      out += lines_[i];
    }
    return out;
  }

  // Cursor moves to the end of the text.
  void set_value(const std::string& text) override {
    lines_.clear();
    std::size_t start = 0;
    for (;;) {
      const auto nl = text.find('\n', start);
      if (nl == std::string::npos) {
        lines_.push_back(text.substr(start));
        break;
      }
      lines_.push_back(text.substr(start, nl - start));
      start = nl + 1;
    }
    row_ = lines_.size() - 1;
    col_ = lines_[row_].size();
    scroll_to_cursor();
  }

  void focus() override { focused_ = true; }
  void blur() override { focused_ = false; }
  bool focused() const override { return focused_; }

  void handle_key(const KeyEvent& key) override {
    if (!focused_) {
      return;
    }

    if (key.rune) {
      lines_[row_].insert(col_, key.key);
      col_ += key.key.size();
    } else if (key.is("enter")) {
      std::string tail = lines_[row_].substr(col_);
      lines_[row_].erase(col_);
      lines_.insert(lines_.begin() + static_cast<std::ptrdiff_t>(row_) + 1, std::move(tail));
      ++row_;
      col_ = 0;
    } else if (key.is("tab")) {
      lines_[row_].insert(col_, "    ");
      col_ += 4;
    } else if (key.is("backspace")) {
      if (col_ > 0) {
        const std::size_t prev = utf8_prev(lines_[row_], col_);
        lines_[row_].erase(prev, col_ - prev);
        col_ = prev;
      } else if (row_ > 0) {
        col_ = lines_[row_ - 1].size();
        lines_[row_ - 1] += lines_[row_];
        lines_.erase(lines_.begin() + static_cast<std::ptrdiff_t>(row_));
        --row_;
      }
    } else if (key.is("delete")) {
      if (col_ < lines_[row_].size()) {
        lines_[row_].erase(col_, utf8_next(lines_[row_], col_) - col_);
      } else if (row_ + 1 < lines_.size()) {
        lines_[row_] += lines_[row_ + 1];
        lines_.erase(lines_.begin() + static_cast<std::ptrdiff_t>(row_) + 1);
      }
    } else if (key.is("left")) {
      if (col_ > 0) {
        col_ = utf8_prev(lines_[row_], col_);
      } else if (row_ > 0) {
        --row_;
        col_ = lines_[row_].size();
      }
    } else if (key.is("right")) {
      if (col_ < lines_[row_].size()) {
        col_ = utf8_next(lines_[row_], col_);
      } else if (row_ + 1 < lines_.size()) {
        ++row_;
        col_ = 0;
      }
    } else if (key.is("up")) {
      if (row_ > 0) {
        move_to_row(row_ - 1);
      }
    } else if (key.is("down")) {
      if (row_ + 1 < lines_.size()) {
        move_to_row(row_ + 1);
      }
    } else if (key.is("home") || key.is("ctrl+a")) {
      col_ = 0;
    } else if (key.is("end") || key.is("ctrl+e")) {
      col_ = lines_[row_].size();
    }
    scroll_to_cursor();
  }

  void set_size(int width, int height) override {
    width_ = std::max(1, width);
    height_ = std::max(1, height);
    scroll_to_cursor();
  }

  int width() const override { return width_; }
  int height() const override { return height_; }

  const std::vector<std::string>& lines() const override { return lines_; }
  std::size_t cursor_row() const override { return row_; }
  std::size_t cursor_col() const override { return col_; }
  std::size_t first_visible_row() const override { return top_; }

 private:
  // Keeps the column in characters, clamped to the target line.
  void move_to_row(std::size_t row) {
    const std::size_t chars = utf8_length(lines_[row_].substr(0, col_));
    row_ = row;
    col_ = utf8_prefix_bytes(lines_[row_], chars);
  }

  void scroll_to_cursor() {
    const auto h = static_cast<std::size_t>(height_);
    if (row_ < top_) {
      top_ = row_;
    } else if (row_ >= top_ + h) {
      top_ = row_ + 1 - h;
    }
  }

  std::vector<std::string> lines_;
  std::size_t row_{0};
  std::size_t col_{0};
  std::size_t top_{0};
  bool focused_{false};
  int width_{kDefaultWidth};
  int height_{kDefaultHeight};
};

}  // namespace yellow
