#include "log/log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

#include "core/config.hpp"

namespace agentdeck {

namespace {

namespace fs = std::filesystem;

fs::path numbered_log(const fs::path& log_dir, const std::string& stem, size_t index) {
  return log_dir / (stem + "." + std::to_string(index) + ".log");
}

// 启动时轮转：<stem>.log -> <stem>.0.log -> ... -> <stem>.{max_files-1}.log
void rotate_logs_on_startup(const fs::path& current_log, size_t max_files) {
  auto log_dir = current_log.parent_path();
  auto stem = current_log.stem().string();

  std::error_code ec;
  if (!fs::exists(current_log, ec) || max_files == 0) {
    return;
  }

  // 删除最旧的一份
  fs::remove(numbered_log(log_dir, stem, max_files - 1), ec);

  for (size_t i = max_files - 1; i > 0; --i) {
    auto from = numbered_log(log_dir, stem, i - 1);
    if (fs::exists(from, ec)) {
      fs::rename(from, numbered_log(log_dir, stem, i), ec);
    }
  }

  fs::rename(current_log, numbered_log(log_dir, stem, 0), ec);
}

}  // namespace

int parse_log_level(const std::string& level) {
  if (level == "trace") return spdlog::level::trace;
  if (level == "debug") return spdlog::level::debug;
  if (level == "warn" || level == "warning") return spdlog::level::warn;
  if (level == "err" || level == "error") return spdlog::level::err;
  if (level == "critical") return spdlog::level::critical;
  if (level == "off") return spdlog::level::off;
  return spdlog::level::info;
}

void init_log(const std::string& log_path, size_t max_files, const std::string& level) {
  try {
    fs::path actual_path = log_path.empty() ? config_paths::config_dir() / "log" / "agentdeck.log" : fs::path(log_path);

    // 确保日志目录存在
    std::error_code ec;
    fs::create_directories(actual_path.parent_path(), ec);
    if (ec) {
      std::cerr << "Failed to create log directory: " << ec.message() << "\n";
      return;
    }

    rotate_logs_on_startup(actual_path, max_files);

    // 每次启动都是新的干净文件
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(actual_path.string(), true);
    auto logger = std::make_shared<spdlog::logger>("agentdeck", file_sink);

    logger->set_level(static_cast<spdlog::level::level_enum>(parse_log_level(level)));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");

    // 每条日志立即刷新
    logger->flush_on(spdlog::level::trace);

    spdlog::drop("agentdeck");
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    spdlog::info("=== agentdeck started (log: {}) ===", actual_path.string());
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Failed to init logger: " << ex.what() << "\n";
  }
}

std::shared_ptr<spdlog::logger> get_logger() {
  return spdlog::default_logger();
}

}  // namespace agentdeck
