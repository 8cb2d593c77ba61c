#pragma once

#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "yellow/common.hpp"
#include "yellow/events.hpp"

namespace yellow {

struct ListItem {
  std::string id;
  std::string title;
  std::string description;
  std::string filter_value;
};

enum class FilterState { kUnfiltered, kFiltering, kFilterApplied };

// Selectable, filterable list display.
class ListDisplay {
 public:
  virtual ~ListDisplay() = default;

  virtual void set_items(std::vector<ListItem> items) = 0;
  virtual const std::vector<ListItem>& items() const = 0;
  virtual const std::vector<ListItem>& visible_items() const = 0;

  virtual FilterState filter_state() const = 0;
  virtual const std::string& filter_text() const = 0;
  virtual void set_filter_text(const std::string& text) = 0;
  virtual void reset_filter() = 0;

  virtual std::optional<ListItem> selected_item() const = 0;
  virtual std::size_t cursor() const = 0;
  virtual std::size_t per_page() const = 0;
  virtual std::size_t page_start() const = 0;
  virtual void handle_key(const KeyEvent& key) = 0;

  virtual void set_size(int width, int height) = 0;
  virtual int width() const = 0;
  virtual int height() const = 0;
};

class FilterList : public ListDisplay {
 public:
  // Title row and the blank row below it.
  static constexpr int kHeaderRows = 2;
  // Title, description, spacer.
  static constexpr int kItemRows = 3;

  void set_items(std::vector<ListItem> items) override {
    items_ = std::move(items);
    refilter();
  }

  const std::vector<ListItem>& items() const override { return items_; }
  const std::vector<ListItem>& visible_items() const override { return visible_; }

  FilterState filter_state() const override { return state_; }
  const std::string& filter_text() const override { return filter_; }

  void set_filter_text(const std::string& text) override {
    filter_ = text;
    state_ = filter_.empty() ? FilterState::kUnfiltered : FilterState::kFilterApplied;
    cursor_ = 0;
    refilter();
  }

  void reset_filter() override {
    filter_.clear();
    state_ = FilterState::kUnfiltered;
    cursor_ = 0;
    refilter();
  }

  std::optional<ListItem> selected_item() const override {
    if (visible_.empty()) {
      return std::nullopt;
    }
    return visible_[cursor_];
  }

  std::size_t cursor() const override { return cursor_; }

  void handle_key(const KeyEvent& key) override {
    if (state_ == FilterState::kFiltering) {
      handle_filter_input(key);
      return;
    }

    if (key.is("up") || key.is("k")) {
      if (cursor_ > 0) {
        --cursor_;
      }
    } else if (key.is("down") || key.is("j")) {
      if (cursor_ + 1 < visible_.size()) {
        ++cursor_;
      }
    } else if (key.is("home") || key.is("g")) {
      cursor_ = 0;
    } else if (key.is("end") || key.is("G")) {
      cursor_ = visible_.empty() ? 0 : visible_.size() - 1;
    } else if (key.is("pgup") || key.is("left") || key.is("h")) {
      const std::size_t n = per_page();
      cursor_ = cursor_ > n ? cursor_ - n : 0;
    } else if (key.is("pgdown") || key.is("right") || key.is("l")) {
      cursor_ = std::min(cursor_ + per_page(), visible_.empty() ? 0 : visible_.size() - 1);
    } else if (key.is("/")) {
      state_ = FilterState::kFiltering;
    }
  }

  void set_size(int width, int height) override {
    width_ = std::max(0, width);
    height_ = std::max(0, height);
  }

  int width() const override { return width_; }
  int height() const override { return height_; }

  std::size_t per_page() const override {
    return static_cast<std::size_t>(std::max(1, (height_ - kHeaderRows) / kItemRows));
  }

  std::size_t page_start() const override { return (cursor_ / per_page()) * per_page(); }

 private:
  void handle_filter_input(const KeyEvent& key) {
    if (key.is("esc")) {
      reset_filter();
    } else if (key.is("enter")) {
      state_ = filter_.empty() ? FilterState::kUnfiltered : FilterState::kFilterApplied;
    } else if (key.is("backspace")) {
      if (!filter_.empty()) {
        filter_.erase(utf8_prev(filter_, filter_.size()));
        cursor_ = 0;
        refilter();
      }
    } else if (key.rune) {
      filter_ += key.key;
      cursor_ = 0;
      refilter();
    }
  }

  void refilter() {
    visible_.clear();
    if (state_ == FilterState::kUnfiltered || filter_.empty()) {
      visible_ = items_;
    } else {
      const std::string needle = to_lower(filter_);
      for (const auto& item : items_) {
        if (to_lower(item.filter_value).find(needle) != std::string::npos) {
          visible_.push_back(item);
        }
      }
    }
    if (visible_.empty()) {
      cursor_ = 0;
    } else if (cursor_ >= visible_.size()) {
      cursor_ = visible_.size() - 1;
    }
  }

  std::vector<ListItem> items_;
  std::vector<ListItem> visible_;
  FilterState state_{FilterState::kUnfiltered};
  std::string filter_;
  std::size_t cursor_{0};
  int width_{0};
  int height_{0};
};

}  // namespace yellow
