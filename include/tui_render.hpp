#pragma once

#include "ftxui/component/component.hpp"
#include "ftxui/dom/elements.hpp"
#include "render/view_snapshot.hpp"
#include "tui_core.hpp"
#include <functional>

namespace ftxui {
struct Event;
} // namespace ftxui

namespace connmgr_tui {

/**
 * @brief 把FTXUI事件翻译为与终端库无关的按键
 *
 * 方向键与h/j/k/l等价；q打开退出确认；y/n用于确认框；
 * 鼠标和其他按键一律为InputKey::Other。
 */
InputKey translate_event(const ftxui::Event &event);

/**
 * @brief 渲染层级树（可纵向滚动）
 *
 * 树导航时高亮行带focus，行数超出面板高度时视口跟随高亮行滚动。
 */
ftxui::Element render_tree(const ViewSnapshot &snapshot);

/**
 * @brief UI渲染器
 *
 * 负责：
 * - 三段式布局：顶部模块栏、中间主面板（层级树 + 详细信息）、底部状态栏
 * - 退出确认框覆盖在主界面之上
 * - 键盘事件翻译后交给dispatch_input
 *
 * 每一帧都从AppContext重新生成ViewSnapshot，渲染过程不修改状态。
 */
class UIRenderer {
public:
  explicit UIRenderer(AppContext &context);

  /**
   * @brief 运行全屏事件循环，直到用户确认退出
   * @return 程序退出码
   */
  int run();

private:
  AppContext &context_;

  /**
   * @brief 创建主UI组件
   * @param exit_loop 用户确认退出时调用，结束事件循环
   */
  ftxui::Component create_component(std::function<void()> exit_loop);

  // ==================== 渲染辅助方法 ====================

  ftxui::Element render_frame(const ViewSnapshot &snapshot);
  ftxui::Element render_module_bar(const ViewSnapshot &snapshot);
  ftxui::Element render_main_panel(const ViewSnapshot &snapshot);

  ftxui::Element render_status_bar(const ViewSnapshot &snapshot);
  ftxui::Element render_confirm_box();

  // ==================== 事件处理 ====================

  /**
   * @brief 处理键盘事件
   * @return 是否消费了事件
   */
  bool handle_keyboard_event(const ftxui::Event &event, const std::function<void()> &exit_loop);
};

} // namespace connmgr_tui
