#pragma once

#include <algorithm>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "yellow/common.hpp"
#include "yellow/display.hpp"
#include "yellow/event_queue.hpp"
#include "yellow/events.hpp"
#include "yellow/list_view.hpp"
#include "yellow/memo.hpp"
#include "yellow/storage.hpp"
#include "yellow/text_area.hpp"

namespace yellow {

enum class Mode { kBrowsing, kEditing };

enum class Action { kNone, kQuit };

// Not persisted. open_memo is a detached copy, so an abandoned edit never
// touches the book.
struct Session {
  Mode mode{Mode::kBrowsing};
  std::optional<Memo> open_memo;
  bool is_new{false};
  bool was_filtered{false};
  std::string saved_filter;
};

class App {
 public:
  App(Storage& storage, EventQueue& queue, Logger& logger, std::string title = "Yellow",
      std::unique_ptr<ListDisplay> list = std::make_unique<FilterList>(),
      std::unique_ptr<TextEditor> editor = std::make_unique<TextArea>())
      : storage_(storage),
        queue_(queue),
        logger_(logger),
        title_(std::move(title)),
        list_(std::move(list)),
        editor_(std::move(editor)) {}

  ~App() { wait_for_tasks(); }

  App(const App&) = delete;
  App& operator=(const App&) = delete;

  void init() { dispatch_load(); }

  Action update(const Event& ev) {
    if (const auto* key = std::get_if<KeyEvent>(&ev)) {
      return session_.mode == Mode::kBrowsing ? handle_list_key(*key) : handle_edit_key(*key);
    }
    if (const auto* resize = std::get_if<ResizeEvent>(&ev)) {
      width_ = resize->width;
      height_ = resize->height;
      resize_components();
      return Action::kNone;
    }
    if (const auto* loaded = std::get_if<LoadCompleteEvent>(&ev)) {
      on_load_complete(loaded->result);
      return Action::kNone;
    }
    if (const auto* saved = std::get_if<SaveCompleteEvent>(&ev)) {
      if (!saved->result.ok) {
        logger_.log(Logger::Level::kError, "Error saving: " + saved->result.error);
      }
      return Action::kNone;
    }
    return Action::kNone;
  }

  Frame view() const {
    if (session_.mode == Mode::kBrowsing) {
      return render_list(*list_, title_, help_text());
    }
    return render_editor(*editor_, session_.is_new ? "New Memo" : "Edit Memo", help_text());
  }

  std::string help_text() const {
    if (session_.mode == Mode::kEditing) {
      return "Esc: save changes";
    }
    switch (list_->filter_state()) {
      case FilterState::kFiltering:
        return "Esc: cancel filter";
      case FilterState::kFilterApplied:
        return "Enter: edit • Esc: return to list view";
      case FilterState::kUnfiltered:
      default:
        if (!book_.empty()) {
          return "Tab: new • Enter: edit • Delete: delete • ↑/k up • ↓/j down • / filter • q quit";
        }
        return "Tab: new • q quit";
    }
  }

  // Blocks until every dispatched load and save has published its result.
  void wait_for_tasks() {
    for (auto& t : tasks_) {
      t.wait();
    }
    tasks_.clear();
  }

  Mode mode() const { return session_.mode; }
  const Session& session() const { return session_; }
  const MemoBook& book() const { return book_; }
  const ListDisplay& list() const { return *list_; }
  const TextEditor& editor() const { return *editor_; }
  bool loaded() const { return loaded_; }
  int width() const { return width_; }
  int height() const { return height_; }

 private:
  Action handle_list_key(const KeyEvent& key) {
    switch (list_->filter_state()) {
      case FilterState::kFiltering:
        list_->handle_key(key);
        if (key.is("esc")) {
          list_->reset_filter();
        }
        return Action::kNone;

      case FilterState::kFilterApplied:
        if (key.is("esc")) {
          list_->reset_filter();
          return Action::kNone;
        }
        if (key.is("enter") && !book_.empty()) {
          edit_selected();
          return Action::kNone;
        }
        list_->handle_key(key);
        return Action::kNone;

      case FilterState::kUnfiltered:
        break;
    }

    if (key.is("ctrl+c") || key.is("q")) {
      return Action::kQuit;
    }
    if (key.is("tab")) {
      create_new();
      return Action::kNone;
    }
    if (key.is("delete") || key.is("backspace")) {
      if (!book_.empty()) {
        delete_selected();
      }
      return Action::kNone;
    }
    if (key.is("enter")) {
      if (!book_.empty()) {
        edit_selected();
      }
      return Action::kNone;
    }

    list_->handle_key(key);
    return Action::kNone;
  }

  // Quitting from the editor discards the edit; only esc commits.
  Action handle_edit_key(const KeyEvent& key) {
    if (key.is("esc")) {
      save_and_exit();
      return Action::kNone;
    }
    if (key.is("ctrl+c")) {
      return Action::kQuit;
    }
    editor_->handle_key(key);
    return Action::kNone;
  }

  void create_new() {
    save_filter_state();
    session_.open_memo = book_.create_draft();
    session_.is_new = true;
    enter_editor("");
  }

  void edit_selected() {
    const auto item = list_->selected_item();
    if (!item) {
      return;
    }
    auto memo = book_.find(item->id);
    if (!memo) {
      return;
    }
    save_filter_state();
    const std::string content = memo->content;
    session_.open_memo = std::move(memo);
    session_.is_new = false;
    enter_editor(content);
  }

  void enter_editor(const std::string& content) {
    session_.mode = Mode::kEditing;
    editor_->set_value(content);
    editor_->focus();
    resize_components();
  }

  void delete_selected() {
    const auto item = list_->selected_item();
    if (!item) {
      return;
    }
    if (!book_.remove(item->id)) {
      logger_.log(Logger::Level::kDebug, "Delete ignored, memo " + item->id + " is not active");
    }
    refresh_list();
    dispatch_save();
  }

  void save_and_exit() {
    const std::string content = editor_->value();
    if (session_.open_memo) {
      if (session_.is_new) {
        book_.commit_new(*session_.open_memo, content);
      } else if (!book_.commit_edit(session_.open_memo->id, content)) {
        logger_.log(Logger::Level::kDebug, "Edit ignored, memo " + session_.open_memo->id + " is not active");
      }
    }

    refresh_list();
    restore_filter_state();

    session_.mode = Mode::kBrowsing;
    editor_->blur();
    session_.open_memo.reset();
    session_.is_new = false;
    resize_components();
    dispatch_save();
  }

  void save_filter_state() {
    if (list_->filter_state() == FilterState::kFilterApplied) {
      session_.was_filtered = true;
      session_.saved_filter = list_->filter_text();
    } else {
      session_.was_filtered = false;
      session_.saved_filter.clear();
    }
  }

  void restore_filter_state() {
    if (session_.was_filtered && !session_.saved_filter.empty()) {
      list_->set_filter_text(session_.saved_filter);
    }
    session_.was_filtered = false;
    session_.saved_filter.clear();
  }

  void refresh_list() { list_->set_items(to_list_items(book_.active())); }

  void resize_components() {
    const auto layout = compute_layout(width_, height_);
    if (!layout) {
      return;
    }
    list_->set_size(layout->list_width, layout->list_height);
    editor_->set_size(layout->editor_width, layout->editor_height);
  }

  void on_load_complete(const LoadResult& result) {
    loaded_ = true;
    if (!result.ok) {
      logger_.log(Logger::Level::kError, "Error loading: " + result.error);
    } else {
      if (result.legacy) {
        logger_.log(Logger::Level::kInfo, "Migrating legacy memo list from " + storage_.path().string());
      }
      book_.merge_loaded(result.data);
      refresh_list();
    }
    if (save_pending_) {
      save_pending_ = false;
      dispatch_save();
    }
  }

  void dispatch_load() {
    prune_tasks();
    tasks_.push_back(std::async(std::launch::async, [this]() {
      LoadResult r;
      try {
        r = storage_.load();
      } catch (const std::exception& e) {
        r.ok = false;
        r.error = e.what();
      }
      queue_.publish(LoadCompleteEvent{std::move(r)});
    }).share());
  }

  // Saves wait for the initial load so an early save cannot clobber the
  // file before it has been read. Each save also waits for the one before
  // it and for any cleanup save, so the newest snapshot lands last.
  void dispatch_save() {
    if (!loaded_) {
      save_pending_ = true;
      return;
    }
    prune_tasks();
    std::shared_future<void> previous = last_save_;
    last_save_ = std::async(std::launch::async, [this, previous, snapshot = book_.snapshot()]() {
      if (previous.valid()) {
        previous.wait();
      }
      SaveResult r;
      try {
        storage_.wait_for_cleanup();
        r = storage_.save(snapshot);
      } catch (const std::exception& e) {
        r.ok = false;
        r.error = e.what();
      }
      queue_.publish(SaveCompleteEvent{std::move(r)});
    }).share();
    tasks_.push_back(last_save_);
  }

  void prune_tasks() {
    tasks_.erase(std::remove_if(tasks_.begin(), tasks_.end(),
                                [](const std::shared_future<void>& f) {
                                  return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
                                }),
                 tasks_.end());
  }

  Storage& storage_;
  EventQueue& queue_;
  Logger& logger_;
  std::string title_;
  std::unique_ptr<ListDisplay> list_;
  std::unique_ptr<TextEditor> editor_;

  MemoBook book_;
  Session session_;
  bool loaded_{false};
  bool save_pending_{false};
  int width_{0};
  int height_{0};
  std::vector<std::shared_future<void>> tasks_;
  std::shared_future<void> last_save_;
};

}  // namespace yellow
