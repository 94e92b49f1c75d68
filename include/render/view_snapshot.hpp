#pragma once

#include "../tui_core.hpp"
#include <optional>
#include <string>
#include <vector>

namespace connmgr_tui {

/// 顶部模块栏中的一项
struct ModuleTab {
  std::string name;
  bool hovered = false;
  bool current = false;
};

/// 主面板树中的一行
struct TreeRow {
  Level level = Level::Project;
  std::string label;
  bool highlighted = false;
  bool expanded = false;
  bool has_children = false;
  std::optional<ConnectionStatus> status;  ///< 只有连接行有状态
  int depth() const { return static_cast<int>(level); }
};

/**
 * @brief 一帧画面所需的全部数据
 *
 * 由build_view_snapshot从AppContext生成，渲染器只读取它，不回头访问状态。
 */
struct ViewSnapshot {
  std::string title;
  std::vector<ModuleTab> tabs;
  std::vector<TreeRow> rows;
  std::vector<std::string> details;
  std::string mode_text;
  std::string status_message;
  std::string key_hint;
  bool tree_active = false;
  bool confirm_visible = false;
};

/**
 * @brief 从当前状态生成显示快照，不修改任何输入
 *
 * 树模式下游标所在路径上的节点总是显示为展开，保证高亮行可见；
 * 其余节点按展开标志显示。
 */
ViewSnapshot build_view_snapshot(const AppContext &context);

} // namespace connmgr_tui
