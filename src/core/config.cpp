#include "config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

namespace chatstore {

namespace fs = std::filesystem;

Config Config::load(const fs::path& path) {
  Config config;
  config.data_dir = config_paths::default_data_dir();

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

    if (j.contains("data_dir") && j["data_dir"].is_string()) {
      fs::path dir = j["data_dir"].get<std::string>();
      // Relative data dirs are anchored at the config file
      config.data_dir = dir.is_relative() ? path.parent_path() / dir : dir;
    }

    config.default_title = j.value("default_title", "New Conversation");

    if (j.contains("default_settings") && j["default_settings"].is_object()) {
      config.default_settings = j["default_settings"];
    }

    config.io_threads = j.value("io_threads", size_t(2));
    if (config.io_threads == 0) {
      config.io_threads = 1;
    }

    config.log_level = j.value("log_level", "info");
    if (j.contains("log_file")) {
      config.log_file = j["log_file"].get<std::string>();
    }
  } catch (const std::exception& e) {
    spdlog::warn("Failed to parse config file {}: {}", path.string(), e.what());
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

  Config config;
  config.data_dir = config_paths::default_data_dir();
  return config;
}

Config Config::from_env() {
  Config config = load_default();

  if (const char* data_dir = std::getenv("CHATSTORE_DATA_DIR")) {
    config.data_dir = data_dir;
  }

  if (const char* level = std::getenv("CHATSTORE_LOG_LEVEL")) {
    config.log_level = level;
  }

  if (const char* log_file = std::getenv("CHATSTORE_LOG_FILE")) {
    config.log_file = fs::path(log_file);
  }

  if (const char* threads = std::getenv("CHATSTORE_IO_THREADS")) {
    char* end = nullptr;
    auto n = std::strtoul(threads, &end, 10);
    if (end != threads && n > 0) {
      config.io_threads = n;
    } else {
      spdlog::warn("Ignoring invalid CHATSTORE_IO_THREADS={}", threads);
    }
  }

  return config;
}

Status Config::save(const fs::path& path) const {
  json j;
  j["data_dir"] = data_dir.string();
  j["default_title"] = default_title;
  j["default_settings"] = default_settings;
  j["io_threads"] = io_threads;
  j["log_level"] = log_level;
  if (log_file) {
    j["log_file"] = log_file->string();
  }

  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
  }

  std::ofstream file(path);
  if (!file.is_open()) {
    return Status::failure(ErrorCode::IOFailure, "cannot open " + path.string());
  }
  file << j.dump(2);
  file.close();
  if (file.fail()) {
    return Status::failure(ErrorCode::IOFailure, "cannot write " + path.string());
  }
  return Status::success();
}

namespace config_paths {

fs::path home_dir() {
  const char* home = std::getenv("HOME");
  if (home) {
    return fs::path(home);
  }
#ifdef _WIN32
  const char* userprofile = std::getenv("USERPROFILE");
  if (userprofile) {
    return fs::path(userprofile);
  }
#endif
  return fs::current_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "chatstore";
}

fs::path default_config_file() {
  return config_dir() / "config.json";
}

fs::path project_config_file() {
  return fs::current_path() / ".chatstore" / "config.json";
}

fs::path default_data_dir() {
  return config_dir() / "conversations";
}

}  // namespace config_paths

}  // namespace chatstore
