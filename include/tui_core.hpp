#pragma once
#include "core/confirmation_gate.hpp"
#include "core/data_provider.hpp"
#include "core/expansion_store.hpp"
#include "core/hierarchy_navigator.hpp"
#include "core/module_selector.hpp"
#include "tui_types.hpp"
#include <memory>
#include <string>

namespace connmgr_tui {

/**
 * @brief 应用上下文 - 整个TUI唯一的可变状态
 *
 * 启动时构造一次，以引用传给输入分发和渲染；生命周期等于进程生命周期。
 * 所有状态都只在事件循环线程上读写，一个事件对应一次完整的状态迁移。
 *
 * 组成：
 * - provider：只读目录数据源（拥有）
 * - expansion：展开标志，跨游标和模块切换保留
 * - selector：模块hover/current
 * - navigator：当前模块内的层级游标
 * - mode：浏览/树导航/退出确认三选一
 * - gate：绑定mode的退出确认门
 */
struct AppContext {
  explicit AppContext(std::unique_ptr<DataProvider> data_provider);

  AppContext(const AppContext &) = delete;
  AppContext &operator=(const AppContext &) = delete;

  std::unique_ptr<DataProvider> provider;
  ExpansionStore expansion;
  ModuleSelector selector;
  HierarchyNavigator navigator;
  Mode mode = BrowsingMode{};
  ConfirmationGate gate;

  /// 最近一次叶子动作的提示，显示在状态栏
  std::string status_message;

  /// 用户已确认退出
  bool quit_requested = false;
};

enum class DispatchResult {
  Ignored,       ///< 按键与当前模式无关，原样放行
  Unchanged,     ///< 按键已识别，但位于边界等原因没有状态变化
  Swallowed,     ///< 确认框吞掉的按键，无状态变化
  Updated,       ///< 状态已变化，需要重绘
  QuitRequested  ///< 用户确认退出
};

/**
 * @brief 分发一个输入事件
 *
 * 确认框激活时由其独占；否则浏览模式交给ModuleSelector，
 * 树模式交给HierarchyNavigator。
 */
DispatchResult dispatch_input(AppContext &context, InputKey key);

} // namespace connmgr_tui
