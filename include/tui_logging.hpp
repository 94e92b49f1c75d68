#pragma once
#include <string>

namespace connmgr_tui {

struct AppConfig;

/// trace/debug/info/warn(ing)/err(or)/critical/off
bool is_valid_log_level(const std::string &name);

/**
 * @brief 安装名为connmgr的默认文件日志器
 *
 * 全屏TUI运行期间不能写stdout/stderr，日志只进文件。
 * 日志文件无法创建时在stderr打印警告并关闭日志。
 */
void init_logging(const AppConfig &config);

} // namespace connmgr_tui
