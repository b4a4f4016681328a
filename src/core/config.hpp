#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "types.hpp"

namespace chatstore {

// Application configuration
struct Config {
  // Root of the conversation folders
  std::filesystem::path data_dir;

  // Title given to conversations created without one
  std::string default_title = "New Conversation";

  // Process-wide settings; per-conversation settings.json overrides these
  json default_settings = json::object();

  // Worker threads for blocking file I/O in AsyncConversationService
  size_t io_threads = 2;

  // Logging
  std::string log_level = "info";
  std::optional<std::filesystem::path> log_file;

  // Load from file
  static Config load(const std::filesystem::path& path);

  // Load default config from project/global config files
  static Config load_default();

  // Load config from environment variables, with file config as base
  // Reads: CHATSTORE_DATA_DIR, CHATSTORE_LOG_LEVEL, CHATSTORE_LOG_FILE,
  //        CHATSTORE_IO_THREADS
  static Config from_env();

  // Save to file
  Status save(const std::filesystem::path& path) const;
};

// Configuration paths
namespace config_paths {
std::filesystem::path home_dir();

std::filesystem::path config_dir();

std::filesystem::path default_config_file();

std::filesystem::path project_config_file();

std::filesystem::path default_data_dir();
}  // namespace config_paths

}  // namespace chatstore
