#include "tui_logging.hpp"
#include "tui_config.hpp"
#include <iostream>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

namespace connmgr_tui {

bool is_valid_log_level(const std::string &name) {
  return name == "off" || spdlog::level::from_str(name) != spdlog::level::off;
}

void init_logging(const AppConfig &config) {
  try {
    auto logger = spdlog::basic_logger_mt("connmgr", config.log_file);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    logger->set_level(spdlog::level::from_str(config.log_level));
    logger->flush_on(spdlog::level::info);
    spdlog::set_default_logger(logger);
  } catch (const spdlog::spdlog_ex &e) {
    std::cerr << "警告: 无法创建日志文件 " << config.log_file << ": " << e.what()
              << "，日志已关闭\n";
    spdlog::set_level(spdlog::level::off);
    return;
  }

  spdlog::info("connmgr starting, config: {}",
               config.source_path.empty() ? "<defaults>" : config.source_path);
}

} // namespace connmgr_tui
