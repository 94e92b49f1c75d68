#pragma once

#include "tui_core.hpp"
#include "tui_render.hpp"

namespace connmgr_tui {

/**
 * @brief UI逻辑控制器
 *
 * 负责：
 * - 运行渲染器事件循环
 * - 把运行期异常转换为退出码
 */
class UILogic {
public:
  explicit UILogic(AppContext &context);

  /**
   * @brief 运行主程序逻辑
   * @return 程序退出码：用户确认退出为0，UI错误为1
   */
  int run();

private:
  AppContext &context_;
  UIRenderer renderer_;
};

} // namespace connmgr_tui
