// agentdeck initialization
#include "agentdeck/agentdeck.hpp"

#include <spdlog/spdlog.h>

#include "core/version.hpp"
#include "log/log.h"

namespace agentdeck {

void init(const Config &config) {
  // 初始化日志系统
  init_log(config.log_file ? config.log_file->string() : "", 10, config.log_level);
  spdlog::info("agentdeck {} (history dir: {})", version(), config.history_dir.string());
}

void shutdown() {
  spdlog::shutdown();
}

std::string version() {
  return AGENTDECK_VERSION_STRING;
}

}  // namespace agentdeck
