#pragma once

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "yellow/common.hpp"

namespace yellow {

inline constexpr std::size_t kTitleMaxChars = 50;
inline constexpr const char* kEmptyMemoTitle = "(empty memo)";

struct Memo {
  std::string id;
  std::string content;
  TimePoint created_at{};
  TimePoint updated_at{};
  std::optional<TimePoint> deleted_at;  // set only while in the deleted collection

  // First line of content, never stored.
  std::string title() const {
    if (content.empty()) {
      return kEmptyMemoTitle;
    }
    const auto nl = content.find('\n');
    const std::string first = nl == std::string::npos ? content : content.substr(0, nl);
    return utf8_truncate(first, kTitleMaxChars, "...");
  }

  std::string description() const { return format_local(updated_at, "%Y-%m-%d %H:%M:%S"); }

  const std::string& filter_value() const { return content; }

  bool operator==(const Memo&) const = default;
};

struct MemoData {
  std::vector<Memo> active;
  std::vector<Memo> deleted;

  bool operator==(const MemoData&) const = default;
};

// Decimal nanoseconds since the epoch; bumped past the previous value when
// the clock has not advanced.
inline std::string generate_id(TimePoint now = Clock::now()) {
  static std::atomic<int64_t> last{0};
  int64_t candidate = unix_nanos(now);
  int64_t prev = last.load();
  for (;;) {
    if (candidate <= prev) {
      candidate = prev + 1;
    }
    if (last.compare_exchange_weak(prev, candidate)) {
      return std::to_string(candidate);
    }
  }
}

inline void sort_newest_first(std::vector<Memo>& memos) {
  std::stable_sort(memos.begin(), memos.end(),
                   [](const Memo& a, const Memo& b) { return a.updated_at > b.updated_at; });
}

inline json memo_to_json(const Memo& m) {
  json j = {{"id", m.id},
            {"content", m.content},
            {"created_at", format_rfc3339(m.created_at)},
            {"updated_at", format_rfc3339(m.updated_at)}};
  if (m.deleted_at) {
    j["deleted_at"] = format_rfc3339(*m.deleted_at);
  }
  return j;
}

inline json memo_data_to_json(const MemoData& data) {
  json active = json::array();
  for (const auto& m : data.active) {
    active.push_back(memo_to_json(m));
  }
  json deleted = json::array();
  for (const auto& m : data.deleted) {
    deleted.push_back(memo_to_json(m));
  }
  return json{{"active", std::move(active)}, {"deleted", std::move(deleted)}};
}

namespace detail {

inline TimePoint timestamp_field(const json& x, const char* key) {
  if (!x.contains(key) || x[key].is_null()) {
    return TimePoint{};
  }
  const std::string raw = x[key].get<std::string>();
  auto tp = parse_rfc3339(raw);
  if (!tp) {
    throw std::runtime_error(std::string("invalid ") + key + " timestamp: " + raw);
  }
  return *tp;
}

}  // namespace detail

// Throws on a non-object element, a wrongly typed field or a bad timestamp.
inline Memo memo_from_json(const json& x) {
  if (!x.is_object()) {
    throw std::runtime_error("memo is not an object");
  }
  Memo m;
  m.id = x.value("id", std::string{});
  m.content = x.value("content", std::string{});
  m.created_at = detail::timestamp_field(x, "created_at");
  m.updated_at = detail::timestamp_field(x, "updated_at");
  if (x.contains("deleted_at") && !x["deleted_at"].is_null()) {
    m.deleted_at = detail::timestamp_field(x, "deleted_at");
  }
  return m;
}

inline std::vector<Memo> memos_from_json(const json& arr) {
  if (!arr.is_array()) {
    throw std::runtime_error("expected an array of memos");
  }
  std::vector<Memo> out;
  out.reserve(arr.size());
  for (const auto& x : arr) {
    out.push_back(memo_from_json(x));
  }
  return out;
}

// Active and deleted memos of one session. Mutated only from the control
// thread; background work gets a snapshot().
class MemoBook {
 public:
  MemoBook() = default;

  const std::vector<Memo>& active() const { return active_; }
  const std::vector<Memo>& deleted() const { return deleted_; }
  bool empty() const { return active_.empty(); }

  Memo create_draft(TimePoint now = Clock::now()) const {
    Memo m;
    m.id = generate_id(now);
    m.created_at = now;
    m.updated_at = now;
    return m;
  }

  // Blank content discards the draft.
  bool commit_new(Memo draft, const std::string& content, TimePoint now = Clock::now()) {
    if (trim(content).empty()) {
      return false;
    }
    draft.content = content;
    draft.updated_at = now;
    draft.deleted_at.reset();
    active_.push_back(std::move(draft));
    sort_newest_first(active_);
    return true;
  }

  bool commit_edit(const std::string& id, const std::string& content, TimePoint now = Clock::now()) {
    auto it = find_active(id);
    if (it == active_.end()) {
      return false;
    }
    it->content = content;
    it->updated_at = now;
    sort_newest_first(active_);
    return true;
  }

  bool remove(const std::string& id, TimePoint now = Clock::now()) {
    auto it = find_active(id);
    if (it == active_.end()) {
      return false;
    }
    Memo m = std::move(*it);
    active_.erase(it);
    m.deleted_at = now;
    deleted_.push_back(std::move(m));
    sort_newest_first(active_);
    return true;
  }

  std::optional<Memo> find(const std::string& id) const {
    for (const auto& m : active_) {
      if (m.id == id) {
        return m;
      }
    }
    return std::nullopt;
  }

  void replace(MemoData data) {
    active_ = std::move(data.active);
    deleted_ = std::move(data.deleted);
    sort_newest_first(active_);
  }

  // Installs loaded data while keeping memos committed before the load
  // finished. Loaded entries win on ID collisions.
  void merge_loaded(MemoData data) {
    std::unordered_set<std::string> known;
    for (const auto& m : data.active) {
      known.insert(m.id);
    }
    for (const auto& m : data.deleted) {
      known.insert(m.id);
    }
    for (auto& m : active_) {
      if (!known.count(m.id)) {
        data.active.push_back(std::move(m));
      }
    }
    for (auto& m : deleted_) {
      if (!known.count(m.id)) {
        data.deleted.push_back(std::move(m));
      }
    }
    replace(std::move(data));
  }

  MemoData snapshot() const { return MemoData{active_, deleted_}; }

 private:
  std::vector<Memo>::iterator find_active(const std::string& id) {
    return std::find_if(active_.begin(), active_.end(), [&](const Memo& m) { return m.id == id; });
  }

  std::vector<Memo> active_;
  std::vector<Memo> deleted_;
};

}  // namespace yellow
