#ifndef RELAY_LOG_H
#define RELAY_LOG_H

#include <memory>
#include <optional>
#include <string>

namespace spdlog {
class logger;
}

namespace relay {

/**
 * 初始化日志系统
 *
 * 控制台输出始终开启（彩色，格式：HH:MM:SS | LEVEL | message）。
 * 指定 log_path 时额外写文件，按启动次数轮转：
 * - 每次启动时 relay.log 重命名为 relay.0.log
 * - 历史日志依次后移：relay.0.log -> relay.1.log -> ... -> relay.{max_files-1}.log
 * - 最旧的日志被删除
 *
 * @param level 日志级别：trace / debug / info / warn / err / critical / off
 * @param log_path 日志文件路径（可选）
 * @param max_files 保留的历史日志文件数量，默认 10 个
 */
void init_log(const std::string& level = "info", const std::optional<std::string>& log_path = std::nullopt, size_t max_files = 10);

/**
 * 获取默认 logger
 */
std::shared_ptr<spdlog::logger> get_logger();

}  // namespace relay

#endif  // RELAY_LOG_H
