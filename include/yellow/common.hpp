#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <mutex>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

namespace yellow {

using json = nlohmann::json;
namespace fs = std::filesystem;
using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

inline std::string trim(const std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n\v\f");
  if (start == std::string::npos) {
    return "";
  }
  const auto end = s.find_last_not_of(" \t\r\n\v\f");
  return s.substr(start, end - start + 1);
}

inline std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

inline std::string home_dir() {
  const char* p = std::getenv("HOME");
  return p ? std::string(p) : std::string(".");
}

inline fs::path expand_user_path(const std::string& p) {
  if (!p.empty() && p[0] == '~') {
    std::string suffix = p.substr(1);
    while (!suffix.empty() && suffix.front() == '/') {
      suffix.erase(suffix.begin());
    }
    return fs::path(home_dir()) / suffix;
  }
  return fs::path(p);
}

inline std::string random_id(std::size_t n = 8) {
  static constexpr char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
  thread_local std::mt19937_64 rng{std::random_device{}()};
  std::uniform_int_distribution<std::size_t> d(0, sizeof(alphabet) - 2);

  std::string out;
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    out.push_back(alphabet[d(rng)]);
  }
  return out;
}

// Returns std::nullopt when the file cannot be opened.
inline std::optional<std::string> read_text_file(const fs::path& p) {
  std::ifstream in(p, std::ios::in | std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

// Writes to a sibling temp file and renames it over the target, so readers
// never observe a half-written file.
inline bool write_text_file(const fs::path& p, const std::string& content, std::string* error = nullptr) {
  std::error_code ec;
  if (p.has_parent_path()) {
    fs::create_directories(p.parent_path(), ec);
  }

  fs::path tmp = p;
  tmp += ".tmp-" + random_id(6);
  {
    std::ofstream out(tmp, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) {
      if (error) {
        *error = "cannot open " + tmp.string() + " for writing";
      }
      return false;
    }
    out << content;
    out.flush();
    if (!out) {
      if (error) {
        *error = "write to " + tmp.string() + " failed";
      }
      out.close();
      fs::remove(tmp, ec);
      return false;
    }
  }

  fs::rename(tmp, p, ec);
  if (ec) {
    if (error) {
      *error = "cannot replace " + p.string() + ": " + ec.message();
    }
    std::error_code ignored;
    fs::remove(tmp, ignored);
    return false;
  }
  return true;
}

inline std::string format_local(TimePoint tp, const char* fmt) {
  const auto t = Clock::to_time_t(tp);
  std::tm tm{};
  localtime_r(&t, &tm);
  std::ostringstream ss;
  ss << std::put_time(&tm, fmt);
  return ss.str();
}

inline std::string now_iso8601() { return format_local(Clock::now(), "%Y-%m-%dT%H:%M:%S"); }

inline int64_t unix_nanos(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

inline TimePoint from_unix_nanos(int64_t ns) {
  return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds(ns)));
}

// Go encodes its zero time.Time this way; it stands for TimePoint{}.
inline constexpr const char* kZeroTimeRfc3339 = "0001-01-01T00:00:00Z";

// UTC, nanosecond precision with trailing zeros dropped:
// 2024-01-02T03:04:05.123Z
inline std::string format_rfc3339(TimePoint tp) {
  if (tp == TimePoint{}) {
    return kZeroTimeRfc3339;
  }
  const int64_t ns = unix_nanos(tp);
  int64_t secs = ns / 1000000000;
  int64_t frac = ns % 1000000000;
  if (frac < 0) {
    frac += 1000000000;
    --secs;
  }

  const std::time_t t = static_cast<std::time_t>(secs);
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (frac != 0) {
    std::ostringstream f;
    f << std::setw(9) << std::setfill('0') << frac;
    std::string digits = f.str();
    while (!digits.empty() && digits.back() == '0') {
      digits.pop_back();
    }
    ss << '.' << digits;
  }
  ss << 'Z';
  return ss.str();
}

// Accepts YYYY-MM-DDTHH:MM:SS[.fraction](Z|+HH:MM|-HH:MM).
inline std::optional<TimePoint> parse_rfc3339(const std::string& s) {
  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
  char sep = 0;
  int consumed = 0;
  if (std::sscanf(s.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n", &year, &month, &day, &sep, &hour, &minute, &second,
                  &consumed) != 7) {
    return std::nullopt;
  }
  if ((sep != 'T' && sep != 't' && sep != ' ') || month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 ||
      minute > 59 || second > 60) {
    return std::nullopt;
  }

  std::size_t pos = static_cast<std::size_t>(consumed);
  int64_t frac_ns = 0;
  if (pos < s.size() && s[pos] == '.') {
    ++pos;
    int digits = 0;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
      if (digits < 9) {
        frac_ns = frac_ns * 10 + (s[pos] - '0');
        ++digits;
      }
      ++pos;
    }
    if (digits == 0) {
      return std::nullopt;
    }
    for (; digits < 9; ++digits) {
      frac_ns *= 10;
    }
  }

  int64_t offset_s = 0;
  if (pos < s.size() && (s[pos] == 'Z' || s[pos] == 'z')) {
    ++pos;
  } else if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) {
    const int sign = s[pos] == '-' ? -1 : 1;
    int oh = 0, om = 0;
    if (pos + 6 > s.size() || std::sscanf(s.c_str() + pos + 1, "%2d:%2d", &oh, &om) != 2) {
      return std::nullopt;
    }
    offset_s = sign * (oh * 3600 + om * 60);
    pos += 6;
  } else {
    return std::nullopt;
  }
  if (pos != s.size()) {
    return std::nullopt;
  }

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = second;
  const int64_t secs = static_cast<int64_t>(timegm(&tm)) - offset_s;
  if (year == 1 && month == 1 && day == 1 && hour == 0 && minute == 0 && second == 0 && frac_ns == 0 &&
      offset_s == 0) {
    return TimePoint{};
  }
  // Nanoseconds since the epoch only span roughly 1677 to 2262.
  constexpr int64_t kMinSecs = std::numeric_limits<int64_t>::min() / 1000000000;
  constexpr int64_t kMaxSecs = std::numeric_limits<int64_t>::max() / 1000000000;
  if (secs <= kMinSecs || secs >= kMaxSecs) {
    return std::nullopt;
  }
  return from_unix_nanos(secs * 1000000000 + frac_ns);
}

inline std::size_t utf8_char_len(unsigned char lead) {
  if (lead < 0x80) {
    return 1;
  }
  if ((lead >> 5) == 0x6) {
    return 2;
  }
  if ((lead >> 4) == 0xe) {
    return 3;
  }
  if ((lead >> 3) == 0x1e) {
    return 4;
  }
  return 1;
}

inline std::size_t utf8_length(const std::string& s) {
  std::size_t n = 0;
  for (std::size_t i = 0; i < s.size(); i += utf8_char_len(static_cast<unsigned char>(s[i]))) {
    ++n;
  }
  return n;
}

// Byte length of the first max_chars code points of s.
inline std::size_t utf8_prefix_bytes(const std::string& s, std::size_t max_chars) {
  std::size_t i = 0;
  for (std::size_t n = 0; n < max_chars && i < s.size(); ++n) {
    i += utf8_char_len(static_cast<unsigned char>(s[i]));
  }
  return std::min(i, s.size());
}

inline std::string utf8_truncate(const std::string& s, std::size_t max_chars, const std::string& ellipsis = "") {
  if (utf8_length(s) <= max_chars) {
    return s;
  }
  return s.substr(0, utf8_prefix_bytes(s, max_chars)) + ellipsis;
}

// Byte offset of the code point that ends at pos.
inline std::size_t utf8_prev(const std::string& s, std::size_t pos) {
  if (pos == 0) {
    return 0;
  }
  std::size_t i = pos - 1;
  while (i > 0 && (static_cast<unsigned char>(s[i]) & 0xc0) == 0x80) {
    --i;
  }
  return i;
}

inline std::size_t utf8_next(const std::string& s, std::size_t pos) {
  if (pos >= s.size()) {
    return s.size();
  }
  return std::min(s.size(), pos + utf8_char_len(static_cast<unsigned char>(s[pos])));
}

inline std::string encode_utf8(char32_t cp) {
  std::string out;
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xc0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3f)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xe0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3f)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3f)));
  } else {
    out.push_back(static_cast<char>(0xf0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3f)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3f)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3f)));
  }
  return out;
}

// Log destination is an explicit object handed to the components that log,
// opened once at startup. Falls back to stderr until a file is opened; while
// the console is held (a full-screen UI owns it) those records are queued
// and written by release_console().
class Logger {
 public:
  enum class Level { kInfo, kWarn, kError, kDebug };

  Logger() = default;
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  bool open(const fs::path& path, std::string* error = nullptr) {
    std::lock_guard<std::mutex> lock(mu_);
    std::error_code ec;
    if (path.has_parent_path()) {
      fs::create_directories(path.parent_path(), ec);
    }
    out_.open(path, std::ios::out | std::ios::app);
    if (!out_) {
      if (error) {
        *error = "open " + path.string() + ": " + std::error_code(errno, std::generic_category()).message();
      }
      return false;
    }
    return true;
  }

  void set_json(bool enabled) { json_mode_.store(enabled); }
  void set_min_level(Level level) { min_level_.store(level); }

  void hold_console() {
    std::lock_guard<std::mutex> lock(mu_);
    console_held_ = true;
  }

  void release_console() {
    std::lock_guard<std::mutex> lock(mu_);
    console_held_ = false;
    for (const auto& line : held_lines_) {
      std::cerr << line << "\n";
    }
    held_lines_.clear();
    std::cerr.flush();
  }

  void log(Level level, const std::string& msg) {
    if (level_rank(level) < level_rank(min_level_.load())) {
      return;
    }
    std::string line;
    if (json_mode_.load()) {
      json j;
      j["time"] = now_iso8601();
      j["level"] = level_name(level);
      j["msg"] = msg;
      line = j.dump();
    } else {
      line = now_iso8601() + " [" + level_name(level) + "] " + msg;
    }

    std::lock_guard<std::mutex> lock(mu_);
    if (!out_.is_open() && console_held_) {
      held_lines_.push_back(std::move(line));
      return;
    }
    std::ostream& os = out_.is_open() ? static_cast<std::ostream&>(out_) : std::cerr;
    os << line << "\n";
    os.flush();
  }

 private:
  static int level_rank(Level level) {
    switch (level) {
      case Level::kDebug:
        return 0;
      case Level::kInfo:
        return 1;
      case Level::kWarn:
        return 2;
      case Level::kError:
      default:
        return 3;
    }
  }

  static const char* level_name(Level level) {
    switch (level) {
      case Level::kInfo:
        return "INFO";
      case Level::kWarn:
        return "WARN";
      case Level::kError:
        return "ERROR";
      case Level::kDebug:
      default:
        return "DEBUG";
    }
  }

  std::mutex mu_;
  std::ofstream out_;
  std::atomic<bool> json_mode_{false};
  std::atomic<Level> min_level_{Level::kInfo};
  bool console_held_{false};
  std::vector<std::string> held_lines_;
};

}  // namespace yellow
