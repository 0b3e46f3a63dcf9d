#include "config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

namespace agentdeck {

namespace fs = std::filesystem;

Config Config::load(const fs::path &path) {
  Config config;

  if (!fs::exists(path)) {
    return config;
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    spdlog::warn("Failed to open config file: {}", path.string());
    return config;
  }

  try {
    json j = json::parse(file);

    config.message_window = j.value("message_window", config.message_window);
    if (config.message_window == 0) {
      spdlog::warn("message_window must be positive, using 50");
      config.message_window = 50;
    }

    if (j.contains("history_dir")) {
      config.history_dir = j["history_dir"].get<std::string>();
    }

    // Load replay settings
    if (j.contains("replay")) {
      const auto &replay = j["replay"];
      config.replay.event_delay_ms = replay.value("event_delay_ms", config.replay.event_delay_ms);
      config.replay.session_id = replay.value("session_id", config.replay.session_id);
    }

    config.log_level = j.value("log_level", "info");
    if (j.contains("log_file")) {
      config.log_file = j["log_file"].get<std::string>();
    }
  } catch (const std::exception &e) {
    spdlog::warn("Failed to parse config file {}: {}", path.string(), e.what());
    return Config{};
  }

  return config;
}

Config Config::load_default() {
  // Try to load from project config first, then global
  auto project_config = config_paths::project_config_file();
  if (fs::exists(project_config)) {
    return load(project_config);
  }

  auto global_config = config_paths::default_config_file();
  if (fs::exists(global_config)) {
    return load(global_config);
  }

  return Config{};
}

Config Config::from_env() {
  Config config = load_default();

  if (const char *dir = std::getenv("AGENTDECK_HISTORY_DIR")) {
    config.history_dir = dir;
  }
  if (const char *level = std::getenv("AGENTDECK_LOG_LEVEL")) {
    config.log_level = level;
  }
  if (const char *window = std::getenv("AGENTDECK_MESSAGE_WINDOW")) {
    try {
      auto value = std::stoul(window);
      if (value > 0) config.message_window = value;
    } catch (const std::exception &e) {
      spdlog::warn("Ignoring AGENTDECK_MESSAGE_WINDOW={}: {}", window, e.what());
    }
  }

  return config;
}

void Config::save(const fs::path &path) const {
  json j;
  j["message_window"] = message_window;
  j["history_dir"] = history_dir.string();
  j["replay"] = {{"event_delay_ms", replay.event_delay_ms}, {"session_id", replay.session_id}};
  j["log_level"] = log_level;
  if (log_file) {
    j["log_file"] = log_file->string();
  }

  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);

  std::ofstream file(path, std::ios::trunc);
  if (!file.is_open()) {
    spdlog::warn("Failed to open config file for writing: {}", path.string());
    return;
  }
  file << j.dump(2);
}

namespace config_paths {

fs::path home_dir() {
  const char *home = std::getenv("HOME");
  if (home) {
    return fs::path(home);
  }
  return fs::current_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "agentdeck";
}

fs::path default_config_file() {
  return config_dir() / "config.json";
}

fs::path project_config_file() {
  return fs::current_path() / ".agentdeck" / "config.json";
}

}  // namespace config_paths

}  // namespace agentdeck
