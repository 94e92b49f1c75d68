#include "core/catalog_provider.hpp"
#include "tui_config.hpp"
#include "tui_core.hpp"
#include "tui_logging.hpp"
#include "tui_logic.hpp"
#include <iostream>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>

using namespace connmgr_tui;

void show_help() {
  std::cout << "connmgr - 交互式连接管理工具\n\n用法: connmgr [选项]\n\n选项:\n";
  std::cout << "  --help, -h     显示此帮助信息\n  --version, -v  显示版本信息\n\n";
  std::cout << "配置文件: ./config.yaml 或 $HOME/.connectionmanager/config.yaml（可选）\n\n";
  std::cout << "交互控制:\n";
  std::cout << "  ←→ / H L       切换模块，回车进入层级树\n"
               "  ↑↓ / K J       在树中移动\n"
               "  → / L, ← / H   展开下钻 / 折叠上升\n"
               "  空格           切换展开\n"
               "  回车           连接层发起连接请求\n"
               "  Esc            返回模块选择\n"
               "  Q              退出（需确认）\n";
}

void show_version() { std::cout << "connmgr v1.0\n基础交互式连接管理工具\n"; }

int main(int argc, char *argv[]) {
  for (int i = 1; i < argc; ++i) {
    std::string arg(argv[i]);
    if (arg == "--help" || arg == "-h") {
      show_help();
      return 0;
    } else if (arg == "--version" || arg == "-v") {
      show_version();
      return 0;
    } else {
      std::cerr << "注意: 未知参数 " << arg << " 已忽略\n";
    }
  }

  try {
    AppConfig config = load_startup_config();
    init_logging(config);

    AppContext context(std::make_unique<CatalogProvider>(config.catalog));
    UILogic logic(context);
    int code = logic.run();

    spdlog::shutdown();
    return code;

  } catch (const ConfigError &e) {
    std::cerr << "读取配置文件错误: " << e.what() << std::endl;
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "启动错误: " << e.what() << std::endl;
    return 1;
  }
}
