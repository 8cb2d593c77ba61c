#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "yellow/app.hpp"
#include "yellow/config.hpp"
#include "yellow/event_queue.hpp"
#include "yellow/storage.hpp"
#include "yellow/terminal.hpp"

namespace {

using namespace yellow;

constexpr const char* kVersion = "0.1.0";
constexpr int kPollTimeoutMs = 50;

void print_usage() {
  std::cout << "Yellow - terminal memo pad\n\n"
            << "Usage:\n"
            << "  yellow [--data PATH] [--log PATH] [--config PATH]\n"
            << "  yellow --help\n"
            << "  yellow --version\n\n"
            << "Keys:\n"
            << "  Tab new memo, Enter edit, Delete remove, / filter, q quit\n"
            << "  Esc saves the memo being edited, Ctrl+C quits without saving it\n";
}

bool has_flag(const std::vector<std::string>& args, const std::string& flag) {
  return std::find(args.begin(), args.end(), flag) != args.end();
}

std::optional<std::string> get_flag_value(const std::vector<std::string>& args, const std::string& flag) {
  for (std::size_t i = 0; i + 1 < args.size(); ++i) {
    if (args[i] == flag) {
      return args[i + 1];
    }
  }
  return std::nullopt;
}

// Returns the first argument that is neither a known flag nor its value.
std::optional<std::string> find_unknown_arg(const std::vector<std::string>& args) {
  static const std::vector<std::string> kValueFlags = {"--data", "--log", "--config"};
  for (std::size_t i = 1; i < args.size(); ++i) {
    if (std::find(kValueFlags.begin(), kValueFlags.end(), args[i]) != kValueFlags.end()) {
      if (i + 1 >= args.size()) {
        return args[i];
      }
      ++i;
      continue;
    }
    return args[i];
  }
  return std::nullopt;
}

bool env_enabled(const char* name) {
  const char* v = std::getenv(name);
  return v && *v && std::string(v) != "0";
}

int run_tui(const Config& cfg, Logger& logger) {
  Storage storage(cfg.data_file, logger, std::chrono::hours(24 * cfg.retention_days));
  EventQueue queue;
  Terminal terminal;

  std::string error;
  if (!terminal.start(&error)) {
    logger.log(Logger::Level::kError, error);
    std::cerr << "Error: " << error << "\n";
    return 1;
  }
  logger.hold_console();

  auto shutdown = [&]() {
    terminal.stop();
    logger.release_console();
  };

  try {
    App app(storage, queue, logger, cfg.title);
    const auto [w, h] = terminal.size();
    queue.publish(ResizeEvent{w, h});
    app.init();

    bool quit = false;
    while (!quit) {
      terminal.draw(app.view());
      if (auto key = terminal.poll(0)) {
        queue.publish(std::move(*key));
      }
      // Waits for input or background results; the next poll picks up keys
      // typed in the meantime.
      auto ev = queue.consume_for(std::chrono::milliseconds(kPollTimeoutMs));
      while (ev && !quit) {
        quit = app.update(*ev) == Action::kQuit;
        ev = queue.try_consume();
      }
    }
  } catch (const std::exception& e) {
    shutdown();
    logger.log(Logger::Level::kError, std::string("Fatal: ") + e.what());
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  shutdown();
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  std::vector<std::string> args;
  args.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  if (has_flag(args, "--help") || has_flag(args, "-h")) {
    print_usage();
    return 0;
  }
  if (has_flag(args, "--version") || has_flag(args, "-v")) {
    std::cout << "yellow v" << kVersion << "\n";
    return 0;
  }
  if (const auto unknown = find_unknown_arg(args)) {
    std::cerr << "Unknown or incomplete argument: " << *unknown << "\n\n";
    print_usage();
    return 2;
  }

  std::vector<std::string> warnings;
  const fs::path config_path = expand_user_path(get_flag_value(args, "--config").value_or(get_config_path().string()));
  Config cfg = load_config(config_path, &warnings);
  if (const auto v = get_flag_value(args, "--data")) {
    cfg.data_file = expand_user_path(*v).string();
  }
  if (const auto v = get_flag_value(args, "--log")) {
    cfg.log_file = expand_user_path(*v).string();
  }

  Logger logger;
  if (env_enabled("YELLOW_LOG_JSON")) {
    logger.set_json(true);
  }
  if (env_enabled("YELLOW_LOG_DEBUG")) {
    logger.set_min_level(Logger::Level::kDebug);
  }
  std::string log_error;
  if (!logger.open(cfg.log_file, &log_error)) {
    std::cerr << "Warning: Could not set up logging: " << log_error << "\n";
  }
  for (const auto& w : warnings) {
    logger.log(Logger::Level::kWarn, w);
  }

  return run_tui(cfg, logger);
}
