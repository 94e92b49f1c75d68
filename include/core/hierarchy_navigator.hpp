#pragma once

#include "data_provider.hpp"
#include "expansion_store.hpp"
#include <functional>

namespace connmgr_tui {

/// collapse_or_ascend的结果：ExitTree表示应交还给模块浏览
enum class NavOutcome { Unchanged, Changed, ExitTree };

/**
 * @brief 层级导航器 - 项目/环境/连接三层状态机
 *
 * 负责：
 * - 维护当前层级以及各层的选中索引
 * - 光标移动与自动下钻/上升
 * - 通过ExpansionStore记录节点的展开状态
 *
 * 移动与展开相互独立：在兄弟节点间移动不会折叠父节点。
 * 所有越界情况都被钳制为空操作，不产生错误。
 * 当前模块没有任何项目时，所有操作均为空操作。
 */
class HierarchyNavigator {
public:
  HierarchyNavigator(const DataProvider &provider, ExpansionStore &expansion);

  /**
   * @brief 切换到指定模块并重建游标（全零索引，项目层）
   *
   * 展开状态不受影响，跨模块切换保留。
   */
  void reset(const Module &module);

  // ==================== 光标移动 ====================

  /**
   * @brief 向上移动
   *
   * 当前层索引大于0时减一；否则若不在项目层则上升一层，
   * 上升到的层级索引保持不变。位于(项目层, 0)时不动。
   * @return 状态是否变化
   */
  bool move_up();

  /**
   * @brief 向下移动
   *
   * 当前层未到最后一个兄弟时加一；在最后一个环境上且该环境有连接时
   * 自动下钻到第一个连接；否则不动。项目层从不自动下钻。
   * @return 状态是否变化
   */
  bool move_down();

  // ==================== 展开/折叠 ====================

  /**
   * @brief 折叠并上升
   *
   * 连接层：上升到环境层并清除当前环境的展开标志；
   * 环境层：上升到项目层并清除当前项目的展开标志；
   * 项目层：返回ExitTree，由调用方退出树模式。
   */
  NavOutcome collapse_or_ascend();

  /**
   * @brief 展开并下钻
   *
   * 项目层/环境层：置当前节点展开标志为true，有子节点时下钻到第一个子节点。
   * 连接层为叶子，不做任何事。
   * @return 状态是否变化
   */
  bool expand_or_descend();

  /**
   * @brief 翻转当前高亮节点的展开标志，不改变层级和索引
   */
  bool toggle_expansion();

  /**
   * @brief 叶子节点动作（连接/断开）
   *
   * 只通知外部协作者，不做任何状态迁移。
   * @return 当前在连接层且已发出请求时返回true
   */
  bool activate();

  void set_activation_callback(std::function<void(const ActivationRequest &)> callback);

  // ==================== 状态查询 ====================

  const NavigationCursor &cursor() const { return cursor_; }
  const Module &module() const { return module_; }
  Level level() const { return cursor_.level; }

  /// 当前祖先路径下指定层级的兄弟数量（每次都从数据源重新获取）
  size_t count_at(Level level) const;

  /// 游标路径上指定层级节点的NodeKey
  NodeKey key_at(Level level) const;

  NodeKey current_key() const { return key_at(cursor_.level); }

  bool is_expanded(const NodeKey &key) const { return expansion_.get(key); }

  /**
   * @brief 检查游标不变式：每一层(<=当前层)的索引都小于对应的兄弟数量
   */
  bool cursor_in_bounds() const;

private:
  const DataProvider &provider_;
  ExpansionStore &expansion_;
  Module module_;
  NavigationCursor cursor_;
  std::function<void(const ActivationRequest &)> activation_callback_;

  size_t &index_ref(Level level);
  bool has_projects() const { return count_at(Level::Project) > 0; }
  void reset_below(Level level);
  void ascend();
  void descend();
};

} // namespace connmgr_tui
