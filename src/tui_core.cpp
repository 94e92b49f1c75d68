/**
 * @file tui_core.cpp
 * @brief 应用上下文与输入分发
 *
 * 三种模式的按键路由：
 * - 确认框：y确认退出，n/Esc取消，其余吞掉
 * - 浏览：左右切换hover模块，回车/下键提交并进入树导航，q打开确认框
 * - 树导航：上下移动，右键展开下钻，左键折叠上升，空格翻转展开，
 *   回车在连接层激活、其他层展开，Esc回到浏览
 */

#include "tui_core.hpp"
#include <spdlog/spdlog.h>

namespace connmgr_tui {

AppContext::AppContext(std::unique_ptr<DataProvider> data_provider)
    : provider(std::move(data_provider)), selector(provider->modules()),
      navigator(*provider, expansion), gate(mode) {
  // 提交模块时重建游标；展开标志保留
  selector.set_commit_callback([this](const Module &module) { navigator.reset(module); });

  navigator.set_activation_callback([this](const ActivationRequest &request) {
    status_message = "请求切换连接: " + request.connection.name + " (" +
                     request.connection.endpoint() + ", 当前" +
                     status_label(request.connection.status) + ")";
  });

  gate.set_quit_callback([this]() { quit_requested = true; });

  navigator.reset(selector.current_module());
}

namespace {

DispatchResult changed(bool state_changed) {
  return state_changed ? DispatchResult::Updated : DispatchResult::Unchanged;
}

DispatchResult dispatch_browsing(AppContext &context, InputKey key) {
  switch (key) {
  case InputKey::Left:
    return changed(context.selector.hover_previous());
  case InputKey::Right:
    return changed(context.selector.hover_next());
  case InputKey::Enter:
  case InputKey::Down:
    context.selector.commit();
    context.mode = TreeMode{};
    return DispatchResult::Updated;
  case InputKey::Quit:
    context.gate.open();
    return DispatchResult::Updated;
  default:
    return DispatchResult::Ignored;
  }
}

DispatchResult dispatch_tree(AppContext &context, InputKey key) {
  HierarchyNavigator &navigator = context.navigator;
  switch (key) {
  case InputKey::Up:
    return changed(navigator.move_up());
  case InputKey::Down:
    return changed(navigator.move_down());
  case InputKey::Right:
    return changed(navigator.expand_or_descend());
  case InputKey::Left: {
    NavOutcome outcome = navigator.collapse_or_ascend();
    if (outcome == NavOutcome::ExitTree) {
      context.mode = BrowsingMode{};
      return DispatchResult::Updated;
    }
    return changed(outcome == NavOutcome::Changed);
  }
  case InputKey::Space:
    return changed(navigator.toggle_expansion());
  case InputKey::Enter:
    if (navigator.level() == Level::Connection)
      return changed(navigator.activate());
    return changed(navigator.expand_or_descend());
  case InputKey::Escape:
    context.mode = BrowsingMode{};
    return DispatchResult::Updated;
  case InputKey::Quit:
    context.gate.open();
    return DispatchResult::Updated;
  default:
    return DispatchResult::Ignored;
  }
}

} // namespace

DispatchResult dispatch_input(AppContext &context, InputKey key) {
  if (context.gate.is_active()) {
    switch (context.gate.handle(key)) {
    case GateOutcome::Confirmed:
      return DispatchResult::QuitRequested;
    case GateOutcome::Cancelled:
      return DispatchResult::Updated;
    case GateOutcome::Swallowed:
      break;
    }
    return DispatchResult::Swallowed;
  }

  if (is_browsing(context.mode))
    return dispatch_browsing(context, key);
  return dispatch_tree(context, key);
}

} // namespace connmgr_tui
