#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "core/config.hpp"
#include "core/uuid.hpp"

using namespace chatstore;

namespace fs = std::filesystem;

// --- ConfigTest ---

TEST(ConfigTest, Defaults) {
  Config config;

  EXPECT_EQ(config.default_title, "New Conversation");
  EXPECT_TRUE(config.default_settings.is_object());
  EXPECT_EQ(config.io_threads, 2u);
  // 默认 log_level 为 "info"
  EXPECT_EQ(config.log_level, "info");
  EXPECT_FALSE(config.log_file.has_value());
}

TEST(ConfigTest, LoadMissingFileGivesDefaults) {
  auto config = Config::load(fs::temp_directory_path() / ("missing_" + UUID::generate()) / "config.json");

  EXPECT_EQ(config.data_dir, config_paths::default_data_dir());
  EXPECT_EQ(config.default_title, "New Conversation");
}

TEST(ConfigTest, LoadFromFile) {
  auto dir = fs::temp_directory_path() / ("chatstore_cfg_" + UUID::generate());
  fs::create_directories(dir);
  auto path = dir / "config.json";
  {
    std::ofstream file(path);
    file << R"({
      "data_dir": "convs",
      "default_title": "Untitled",
      "default_settings": {"temperature": 0.7},
      "io_threads": 0,
      "log_level": "debug",
      "log_file": "/tmp/chatstore-test.log"
    })";
  }

  auto config = Config::load(path);

  // 相对路径以配置文件所在目录为基准
  EXPECT_EQ(config.data_dir, dir / "convs");
  EXPECT_EQ(config.default_title, "Untitled");
  EXPECT_DOUBLE_EQ(config.default_settings["temperature"].get<double>(), 0.7);
  EXPECT_EQ(config.io_threads, 1u);
  EXPECT_EQ(config.log_level, "debug");
  ASSERT_TRUE(config.log_file.has_value());
  EXPECT_EQ(*config.log_file, fs::path("/tmp/chatstore-test.log"));

  fs::remove_all(dir);
}

TEST(ConfigTest, MalformedFileGivesDefaults) {
  auto path = fs::temp_directory_path() / ("chatstore_bad_" + UUID::generate() + ".json");
  {
    std::ofstream file(path);
    file << "{ nope";
  }

  auto config = Config::load(path);
  EXPECT_EQ(config.default_title, "New Conversation");
  EXPECT_EQ(config.data_dir, config_paths::default_data_dir());

  fs::remove(path);
}

TEST(ConfigTest, SaveAndLoad) {
  Config config;
  config.data_dir = "/var/lib/chatstore";
  config.default_title = "Chat";
  config.default_settings = {{"thinking_budget", 2048}};
  config.io_threads = 6;
  config.log_level = "warn";

  // 保存到临时文件
  auto tmp_path = fs::temp_directory_path() / ("chatstore_save_" + UUID::generate()) / "config.json";
  ASSERT_TRUE(config.save(tmp_path).ok());

  // 重新加载
  auto loaded = Config::load(tmp_path);
  EXPECT_EQ(loaded.data_dir, fs::path("/var/lib/chatstore"));
  EXPECT_EQ(loaded.default_title, "Chat");
  EXPECT_EQ(loaded.default_settings["thinking_budget"], 2048);
  EXPECT_EQ(loaded.io_threads, 6u);
  EXPECT_EQ(loaded.log_level, "warn");
  EXPECT_FALSE(loaded.log_file.has_value());

  // 清理临时文件
  fs::remove_all(tmp_path.parent_path());
}

TEST(ConfigTest, FromEnvOverrides) {
  // 保存原始环境变量
  const char* orig_dir = std::getenv("CHATSTORE_DATA_DIR");
  const char* orig_threads = std::getenv("CHATSTORE_IO_THREADS");
  const char* orig_level = std::getenv("CHATSTORE_LOG_LEVEL");
  std::string saved_dir = orig_dir ? orig_dir : "";
  std::string saved_threads = orig_threads ? orig_threads : "";
  std::string saved_level = orig_level ? orig_level : "";

  setenv("CHATSTORE_DATA_DIR", "/tmp/chatstore-env", 1);
  setenv("CHATSTORE_IO_THREADS", "3", 1);
  setenv("CHATSTORE_LOG_LEVEL", "trace", 1);

  auto config = Config::from_env();
  EXPECT_EQ(config.data_dir, fs::path("/tmp/chatstore-env"));
  EXPECT_EQ(config.io_threads, 3u);
  EXPECT_EQ(config.log_level, "trace");

  // 非法线程数被忽略
  setenv("CHATSTORE_IO_THREADS", "zero", 1);
  EXPECT_NE(Config::from_env().io_threads, 0u);

  // 恢复环境变量
  auto restore = [](const char* name, const char* orig, const std::string& saved) {
    if (orig) {
      setenv(name, saved.c_str(), 1);
    } else {
      unsetenv(name);
    }
  };
  restore("CHATSTORE_DATA_DIR", orig_dir, saved_dir);
  restore("CHATSTORE_IO_THREADS", orig_threads, saved_threads);
  restore("CHATSTORE_LOG_LEVEL", orig_level, saved_level);
}

// --- ConfigPathsTest ---

TEST(ConfigPathsTest, HomeDir) {
  auto home = config_paths::home_dir();

  EXPECT_FALSE(home.empty());
}

TEST(ConfigPathsTest, ConfigDir) {
  auto config_dir = config_paths::config_dir();

  EXPECT_FALSE(config_dir.empty());
  // 配置目录应以 "chatstore" 结尾
  EXPECT_EQ(config_dir.filename(), "chatstore");
  // 父目录应为 ".config"
  EXPECT_EQ(config_dir.parent_path().filename(), ".config");
  EXPECT_EQ(config_paths::default_data_dir(), config_dir / "conversations");
  EXPECT_EQ(config_paths::project_config_file().filename(), "config.json");
}
