#pragma once
#include "core/catalog_provider.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace connmgr_tui {

/// 配置文件存在但无法解析或内容非法
class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string &message) : std::runtime_error(message) {}
};

struct AppConfig {
  std::string source_path;  ///< 为空表示未找到配置文件，全部使用默认值
  std::string log_file;
  std::string log_level = "info";
  CatalogData catalog = CatalogData::builtin();
};

/**
 * @brief 配置文件搜索路径：./config.yaml，$HOME/.connectionmanager/config.yaml
 */
std::vector<std::string> config_search_paths();

std::optional<std::string> discover_config_file(const std::vector<std::string> &paths);

/**
 * @brief 从YAML文本解析配置
 * @throws ConfigError YAML语法错误、未知模块、未知状态或日志级别
 */
AppConfig parse_app_config(const std::string &yaml_text);

/**
 * @brief 从文件加载配置
 * @throws ConfigError 文件无法读取或内容非法
 */
AppConfig load_app_config(const std::string &file_path);

/// 用CONNMGR_LOG_FILE / CONNMGR_LOG_LEVEL环境变量覆盖配置
void apply_env_overrides(AppConfig &config);

/**
 * @brief 启动时的完整配置流程：搜索 → 加载（可选）→ 环境变量覆盖
 */
AppConfig load_startup_config();

} // namespace connmgr_tui
