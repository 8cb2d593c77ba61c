#pragma once

#include <string>
#include <vector>

#include "yellow/common.hpp"
#include "yellow/storage.hpp"

namespace yellow {

struct Config {
  std::string data_file{".yellow.json"};
  std::string log_file{".yellow.log"};
  int retention_days{kDefaultRetentionDays};
  std::string title{"Yellow"};
};

inline fs::path get_data_dir() { return expand_user_path("~/.yellow"); }

inline fs::path get_config_path() { return get_data_dir() / "config.json"; }

inline json default_config_json() {
  const Config d{};
  return json{{"dataFile", d.data_file}, {"logFile", d.log_file}, {"retentionDays", d.retention_days}, {"title", d.title}};
}

// A missing file yields the defaults. Problems are appended to `warnings`
// because the logger is not open yet when the config is read.
inline Config load_config(const fs::path& path = get_config_path(), std::vector<std::string>* warnings = nullptr) {
  Config cfg{};
  const auto raw = read_text_file(path);
  if (!raw || trim(*raw).empty()) {
    return cfg;
  }

  auto warn = [&](const std::string& msg) {
    if (warnings) {
      warnings->push_back(msg);
    }
  };

  try {
    const json root = json::parse(*raw);
    if (!root.is_object()) {
      warn("Config " + path.string() + " is not a JSON object; using defaults");
      return cfg;
    }

    const std::string data_file = root.value("dataFile", cfg.data_file);
    if (!trim(data_file).empty()) {
      cfg.data_file = expand_user_path(data_file).string();
    }
    const std::string log_file = root.value("logFile", cfg.log_file);
    if (!trim(log_file).empty()) {
      cfg.log_file = expand_user_path(log_file).string();
    }
    cfg.title = root.value("title", cfg.title);

    if (root.contains("retentionDays")) {
      const json& raw_days = root["retentionDays"];
      if (!raw_days.is_number()) {
        warn("retentionDays must be a number; using " + std::to_string(kDefaultRetentionDays));
      } else if (raw_days.get<double>() < 0) {
        warn("retentionDays must not be negative; using " + std::to_string(kDefaultRetentionDays));
      } else if (raw_days.get<double>() > kMaxRetentionDays) {
        warn("retentionDays is capped at " + std::to_string(kMaxRetentionDays));
        cfg.retention_days = kMaxRetentionDays;
      } else {
        cfg.retention_days = static_cast<int>(raw_days.get<double>());
      }
    }
  } catch (const std::exception& e) {
    warn(std::string("Failed to parse config: ") + e.what());
    return Config{};
  }

  return cfg;
}

}  // namespace yellow
