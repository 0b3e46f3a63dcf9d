#ifndef AGENTDECK_LOG_H
#define AGENTDECK_LOG_H

#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace agentdeck {

/**
 * 初始化日志系统
 *
 * 按启动次数轮转：
 * - 启动时上一次的 agentdeck.log 重命名为 agentdeck.0.log
 * - 更早的日志依次后移：agentdeck.0.log -> agentdeck.1.log -> ...
 * - 超出 max_files 的最旧日志被删除
 *
 * @param log_path 日志文件路径（为空时使用 ~/.config/agentdeck/log/agentdeck.log）
 * @param max_files 保留的历史日志数量
 * @param level 日志级别：trace / debug / info / warn / err / critical / off
 */
void init_log(const std::string& log_path = "", size_t max_files = 10, const std::string& level = "info");

// 解析日志级别字符串，未知值返回 info
int parse_log_level(const std::string& level);

/**
 * 获取默认 logger
 */
std::shared_ptr<spdlog::logger> get_logger();

}  // namespace agentdeck

#endif  // AGENTDECK_LOG_H
