#pragma once

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <optional>
#include <string>
#include <vector>

#include "yellow/common.hpp"
#include "yellow/list_view.hpp"
#include "yellow/memo.hpp"
#include "yellow/text_area.hpp"

namespace yellow {

// Fixed chrome around the components.
inline constexpr int kPadTop = 1;
inline constexpr int kPadBottom = 1;
inline constexpr int kPadLeft = 2;
inline constexpr int kPadRight = 2;
inline constexpr int kHelpHeight = 2;       // margin row + text
inline constexpr int kEditTitleHeight = 2;  // text + padding row
inline constexpr int kEditorGutter = 4;     // line numbers

enum class Style {
  kNormal,
  kTitle,
  kFilterPrompt,
  kSelected,
  kDescription,
  kMuted,
  kLineNumber,
  kCursorLineNumber,
  kCursorLine,
  kEndOfBuffer,
};

struct Span {
  std::string text;
  Style style{Style::kNormal};
};

struct ViewLine {
  std::vector<Span> spans;
};

// Rows and columns are relative to the padded content area.
struct Frame {
  std::vector<ViewLine> lines;
  std::optional<std::pair<int, int>> cursor;  // row, column
};

struct Layout {
  int list_width{0};
  int list_height{0};
  int editor_width{0};
  int editor_height{0};
};

inline ListItem to_list_item(const Memo& m) { return ListItem{m.id, m.title(), m.description(), m.filter_value()}; }

inline std::vector<ListItem> to_list_items(const std::vector<Memo>& memos) {
  std::vector<ListItem> out;
  out.reserve(memos.size());
  for (const auto& m : memos) {
    out.push_back(to_list_item(m));
  }
  return out;
}

// std::nullopt until the terminal has reported a real size.
inline std::optional<Layout> compute_layout(int width, int height) {
  if (width <= 0 || height <= 0) {
    return std::nullopt;
  }
  const int hm = kPadLeft + kPadRight;
  const int vm = kPadTop + kPadBottom;
  Layout l;
  l.list_width = std::max(1, width - hm);
  l.list_height = std::max(1, height - vm - kHelpHeight);
  l.editor_width = std::max(1, width - hm - kEditorGutter);
  l.editor_height = std::max(1, height - vm - kEditTitleHeight - kHelpHeight);
  return l;
}

namespace detail {

inline std::string clip(const std::string& s, int width) {
  return utf8_truncate(s, static_cast<std::size_t>(std::max(0, width)));
}

inline ViewLine line(std::string text, Style style = Style::kNormal) { return ViewLine{{Span{std::move(text), style}}}; }

inline void append_help(Frame& f, const std::string& help) {
  f.lines.push_back(ViewLine{});
  f.lines.push_back(line(help, Style::kMuted));
}

}  // namespace detail

inline Frame render_list(const ListDisplay& list, const std::string& title, const std::string& help) {
  Frame f;
  const int w = list.width() > 0 ? list.width() : 80;

  if (list.filter_state() == FilterState::kFiltering) {
    f.lines.push_back(ViewLine{{Span{"Filter: ", Style::kFilterPrompt}, Span{detail::clip(list.filter_text(), w - 8)}}});
    f.cursor = std::make_pair(0, 8 + static_cast<int>(utf8_length(list.filter_text())));
  } else {
    f.lines.push_back(detail::line(detail::clip(title, w), Style::kTitle));
  }
  f.lines.push_back(ViewLine{});

  const auto& visible = list.visible_items();
  if (visible.empty()) {
    f.lines.push_back(detail::line(list.items().empty() ? "  No memos." : "  Nothing matched.", Style::kMuted));
  } else {
    const std::size_t start = list.page_start();
    const std::size_t end = std::min(visible.size(), start + list.per_page());
    for (std::size_t i = start; i < end; ++i) {
      const bool selected = i == list.cursor();
      const std::string bar = selected ? "│ " : "  ";
      f.lines.push_back(
          detail::line(bar + detail::clip(visible[i].title, w - 2), selected ? Style::kSelected : Style::kNormal));
      f.lines.push_back(detail::line(bar + detail::clip(visible[i].description, w - 2),
                                     selected ? Style::kSelected : Style::kDescription));
      f.lines.push_back(ViewLine{});
    }
  }

  const int body_rows = std::max(1, list.height());
  while (static_cast<int>(f.lines.size()) < body_rows) {
    f.lines.push_back(ViewLine{});
  }
  f.lines.resize(static_cast<std::size_t>(body_rows));
  detail::append_help(f, help);
  return f;
}

inline Frame render_editor(const TextEditor& editor, const std::string& title, const std::string& help) {
  Frame f;
  f.lines.push_back(detail::line("  " + title, Style::kTitle));
  f.lines.push_back(ViewLine{});

  const auto& lines = editor.lines();
  const std::size_t top = editor.first_visible_row();
  const bool empty = lines.size() == 1 && lines[0].empty();
  for (int r = 0; r < editor.height(); ++r) {
    const std::size_t row = top + static_cast<std::size_t>(r);
    if (row >= lines.size()) {
      f.lines.push_back(detail::line("  ~", Style::kEndOfBuffer));
      continue;
    }
    const bool current = row == editor.cursor_row();
    std::ostringstream num;
    num << std::setw(kEditorGutter - 1) << (row + 1) << ' ';
    ViewLine vl;
    vl.spans.push_back(Span{num.str(), current ? Style::kCursorLineNumber : Style::kLineNumber});
    if (empty && row == 0) {
      vl.spans.push_back(Span{"Start typing ...", Style::kMuted});
    } else {
      vl.spans.push_back(Span{detail::clip(lines[row], editor.width()), current ? Style::kCursorLine : Style::kNormal});
    }
    f.lines.push_back(std::move(vl));
  }

  if (editor.focused()) {
    const std::string before = lines[editor.cursor_row()].substr(0, editor.cursor_col());
    const int col = std::min(static_cast<int>(utf8_length(before)), editor.width());
    f.cursor = std::make_pair(kEditTitleHeight + static_cast<int>(editor.cursor_row() - top), kEditorGutter + col);
  }
  detail::append_help(f, help);
  return f;
}

}  // namespace yellow
