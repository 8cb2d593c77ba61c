#pragma once

#include <algorithm>
#include <chrono>
#include <future>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "yellow/common.hpp"
#include "yellow/memo.hpp"

namespace yellow {

inline constexpr int kDefaultRetentionDays = 7;
// Keeps now - retention inside the nanosecond clock range.
inline constexpr int kMaxRetentionDays = 36500;

struct LoadResult {
  bool ok{false};
  MemoData data;
  std::string error;
  std::size_t purged{0};
  bool legacy{false};
};

struct SaveResult {
  bool ok{false};
  std::string error;
};

class Storage {
 public:
  Storage(fs::path path, Logger& logger, std::chrono::hours retention = std::chrono::hours(24 * kDefaultRetentionDays))
      : path_(std::move(path)),
        logger_(logger),
        retention_(std::clamp(retention, std::chrono::hours(0), std::chrono::hours(24 * kMaxRetentionDays))) {}

  ~Storage() { wait_for_cleanup(); }

  Storage(const Storage&) = delete;
  Storage& operator=(const Storage&) = delete;

  const fs::path& path() const { return path_; }
  std::chrono::hours retention() const { return retention_; }

  LoadResult load() { return load(Clock::now()); }

  LoadResult load(TimePoint now) {
    LoadResult out;

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
      if (ec) {
        out.error = "cannot stat " + path_.string() + ": " + ec.message();
        return out;
      }
      out.ok = true;
      return out;
    }

    const auto raw = read_text_file(path_);
    if (!raw) {
      out.error = "cannot read " + path_.string();
      return out;
    }

    json root;
    try {
      root = json::parse(*raw);
    } catch (const json::parse_error& e) {
      out.error = "cannot parse " + path_.string() + ": " + e.what();
      return out;
    }

    std::string current_error;
    try {
      out.data = parse_current(root);
    } catch (const std::exception& e) {
      current_error = e.what();
    }

    if (!current_error.empty()) {
      try {
        out.data.active = memos_from_json(root);
        out.data.deleted.clear();
        out.legacy = true;
      } catch (const std::exception& e) {
        out.error = "cannot parse " + path_.string() + ": " + current_error + "; legacy format: " + e.what();
        return out;
      }
    }

    for (auto& m : out.data.active) {
      m.deleted_at.reset();
    }
    sort_newest_first(out.data.active);

    out.purged = purge_expired(out.data.deleted, now, retention_);
    if (out.purged > 0) {
      logger_.log(Logger::Level::kInfo,
                  "Purged " + std::to_string(out.purged) + " deleted memo(s) past the retention window");
      schedule_cleanup_save(out.data);
    }

    out.ok = true;
    return out;
  }

  SaveResult save(const MemoData& data) {
    SaveResult out;
    std::string text;
    try {
      text = memo_data_to_json(data).dump(2);
    } catch (const json::exception& e) {
      out.error = std::string("cannot encode memos: ") + e.what();
      return out;
    }

    std::lock_guard<std::mutex> lock(write_mu_);
    std::string error;
    if (!write_text_file(path_, text, &error)) {
      out.error = error;
      return out;
    }
    out.ok = true;
    return out;
  }

  // Blocks until every cleanup save scheduled by load() has finished.
  void wait_for_cleanup() {
    std::vector<std::future<void>> pending;
    {
      std::lock_guard<std::mutex> lock(tasks_mu_);
      pending.swap(cleanup_tasks_);
    }
    for (auto& f : pending) {
      f.wait();
    }
  }

  // Keeps entries deleted no longer than `retention` ago. Entries without a
  // deletion timestamp are dropped.
  static std::size_t purge_expired(std::vector<Memo>& deleted, TimePoint now, std::chrono::hours retention) {
    const TimePoint cutoff = now - retention;
    const auto old_size = deleted.size();
    deleted.erase(std::remove_if(deleted.begin(), deleted.end(),
                                 [&](const Memo& m) { return !m.deleted_at || *m.deleted_at < cutoff; }),
                  deleted.end());
    return old_size - deleted.size();
  }

 private:
  static MemoData parse_current(const json& root) {
    if (!root.is_object()) {
      throw std::runtime_error("expected an object with active and deleted memos");
    }
    MemoData data;
    if (root.contains("active") && !root["active"].is_null()) {
      data.active = memos_from_json(root["active"]);
    }
    if (root.contains("deleted") && !root["deleted"].is_null()) {
      data.deleted = memos_from_json(root["deleted"]);
    }
    return data;
  }

  // Best effort: the outcome is logged only and never rolls back the purge.
  void schedule_cleanup_save(MemoData data) {
    std::lock_guard<std::mutex> lock(tasks_mu_);
    cleanup_tasks_.erase(std::remove_if(cleanup_tasks_.begin(), cleanup_tasks_.end(),
                                        [](const std::future<void>& f) {
                                          return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
                                        }),
                         cleanup_tasks_.end());
    cleanup_tasks_.push_back(std::async(std::launch::async, [this, data = std::move(data)]() {
      const SaveResult r = save(data);
      if (!r.ok) {
        logger_.log(Logger::Level::kWarn, "Warning: failed to save cleaned deleted memos: " + r.error);
      }
    }));
  }

  fs::path path_;
  Logger& logger_;
  std::chrono::hours retention_;
  std::mutex write_mu_;
  std::mutex tasks_mu_;
  std::vector<std::future<void>> cleanup_tasks_;
};

}  // namespace yellow
