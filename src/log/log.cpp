#include "log/log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

#include "core/config.hpp"

namespace chatstore {

namespace {

// 每次启动时轮转日志文件
// 策略：<stem>.log -> <stem>.0.log -> ... -> <stem>.{max_files-1}.log（最旧的被删除）
void rotate_logs_on_startup(const std::filesystem::path& current_log, size_t max_files) {
  namespace fs = std::filesystem;

  if (!fs::exists(current_log) || max_files == 0) {
    return;
  }

  auto dir = current_log.parent_path();
  auto stem = current_log.stem().string();
  auto numbered = [&](size_t i) {
    return dir / (stem + "." + std::to_string(i) + ".log");
  };

  std::error_code ec;
  fs::remove(numbered(max_files - 1), ec);

  for (size_t i = max_files - 1; i-- > 0;) {
    if (fs::exists(numbered(i))) {
      fs::rename(numbered(i), numbered(i + 1), ec);
      if (ec) {
        std::cerr << "Failed to rotate log " << numbered(i).string() << ": " << ec.message() << "\n";
      }
    }
  }

  fs::rename(current_log, numbered(0), ec);
  if (ec) {
    std::cerr << "Failed to rotate log " << current_log.string() << ": " << ec.message() << "\n";
  }
}

spdlog::level::level_enum parse_level(const std::string& level) {
  if (level == "trace") return spdlog::level::trace;
  if (level == "debug") return spdlog::level::debug;
  if (level == "info") return spdlog::level::info;
  if (level == "warn") return spdlog::level::warn;
  if (level == "err") return spdlog::level::err;
  if (level == "critical") return spdlog::level::critical;
  if (level == "off") return spdlog::level::off;
  return spdlog::level::info;
}

}  // namespace

void init_log(const std::string& log_path, size_t max_files, const std::string& level) {
  try {
    namespace fs = std::filesystem;

    fs::path actual_path = log_path.empty() ? config_paths::config_dir() / "log" / "chatstore.log" : fs::path(log_path);

    // 确保日志目录存在
    std::error_code ec;
    if (actual_path.has_parent_path()) {
      fs::create_directories(actual_path.parent_path(), ec);
      if (ec) {
        std::cerr << "Failed to create log directory: " << ec.message() << "\n";
        return;
      }
    }

    rotate_logs_on_startup(actual_path, max_files);

    // 每次启动都是新的干净文件
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(actual_path.string(), true);
    auto logger = std::make_shared<spdlog::logger>("chatstore", file_sink);

    logger->set_level(parse_level(level));

    // 日志格式：[时间] [级别] [线程 ID] 消息
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");

    // 每条日志都立即刷新，流式写入崩溃时也不丢日志
    logger->flush_on(spdlog::level::trace);

    // 同名 logger 重复初始化时先注销
    spdlog::drop("chatstore");
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    spdlog::info("=== chatstore started (log: {}) ===", actual_path.string());
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Failed to init logger: " << ex.what() << "\n";
  }
}

}  // namespace chatstore
