#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "core/types.hpp"

namespace agentdeck {

// Application configuration
struct Config {
  // Live messages kept in memory before older ones overflow to the history buffer
  size_t message_window = 50;

  // Directory of the per-process history buffer files
  std::filesystem::path history_dir = std::filesystem::temp_directory_path() / "agentdeck";

  // Event replay (stands in for a live SDK client)
  struct ReplaySettings {
    int64_t event_delay_ms = 50;
    std::string session_id = "replay-session";
  } replay;

  // Logging
  std::string log_level = "info";
  std::optional<std::filesystem::path> log_file;

  // Load from file
  static Config load(const std::filesystem::path &path);
  static Config load_default();

  // Load default, then apply AGENTDECK_* environment overrides
  static Config from_env();

  // Save to file
  void save(const std::filesystem::path &path) const;
};

// Configuration paths
namespace config_paths {
std::filesystem::path home_dir();
std::filesystem::path config_dir();
std::filesystem::path default_config_file();
std::filesystem::path project_config_file();
}  // namespace config_paths

}  // namespace agentdeck
