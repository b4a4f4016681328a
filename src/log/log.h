#ifndef CHATSTORE_LOG_H
#define CHATSTORE_LOG_H

#include <string>

namespace chatstore {

/**
 * 初始化日志系统
 *
 * 日志轮转策略（按启动次数轮转）：
 * - 每次启动时，上次的 chatstore.log 重命名为 chatstore.0.log
 * - 历史日志依次向后移动：chatstore.0.log -> chatstore.1.log -> ...
 * - 超出 max_files 的最旧日志被删除
 *
 * @param log_path 日志文件路径（可选，默认 ~/.config/chatstore/log/chatstore.log）
 * @param max_files 保留的历史日志文件数量，默认 10 个
 * @param level 日志级别：trace/debug/info/warn/err/critical/off，默认 info
 */
void init_log(const std::string& log_path = "", size_t max_files = 10, const std::string& level = "info");

}  // namespace chatstore

#endif  // CHATSTORE_LOG_H
