// Library initialization
#include "chatstore.hpp"

#include <spdlog/spdlog.h>

#include "core/version.hpp"
#include "log/log.h"

namespace chatstore {

void init(const Config& config) {
  // 初始化日志系统
  init_log(config.log_file ? config.log_file->string() : "", 10, config.log_level);
  spdlog::info("chatstore {} data_dir={}", version(), config.data_dir.string());
}

std::string version() {
  return CHATSTORE_VERSION_STRING;
}

}  // namespace chatstore
