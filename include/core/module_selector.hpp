#pragma once

#include "../tui_types.hpp"
#include <functional>
#include <vector>

namespace connmgr_tui {

/**
 * @brief 模块选择器
 *
 * 维护固定顺序的模块列表、hover索引（提交前的临时高亮）和current索引
 * （最后一次提交的模块，驱动主面板）。与树导航器相互独立。
 */
class ModuleSelector {
public:
  /**
   * @param modules 模块目录，不能为空
   * @throws std::invalid_argument 模块列表为空时
   */
  explicit ModuleSelector(std::vector<Module> modules);

  /**
   * @brief hover向前移动一格，已在开头时不动
   * @return 索引是否变化
   */
  bool hover_previous();

  /**
   * @brief hover向后移动一格，已在末尾时不动
   * @return 索引是否变化
   */
  bool hover_next();

  /**
   * @brief 提交hover的模块为current，并通知提交回调
   *
   * 这是current唯一的变更入口。
   */
  void commit();

  size_t hovered() const { return hovered_; }
  size_t current() const { return current_; }
  const Module &hovered_module() const { return modules_[hovered_]; }
  const Module &current_module() const { return modules_[current_]; }
  const std::vector<Module> &modules() const { return modules_; }

  /// 设置提交回调，导航器借此重置游标
  void set_commit_callback(std::function<void(const Module &)> callback);

  bool same_selection(const ModuleSelector &other) const {
    return modules_ == other.modules_ && hovered_ == other.hovered_ && current_ == other.current_;
  }

private:
  std::vector<Module> modules_;
  size_t hovered_ = 0;
  size_t current_ = 0;
  std::function<void(const Module &)> commit_callback_;
};

} // namespace connmgr_tui
