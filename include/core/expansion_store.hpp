#pragma once

#include "../tui_types.hpp"
#include <unordered_map>

namespace connmgr_tui {

/**
 * @brief 展开状态存储
 *
 * NodeKey到展开标志的映射，缺省为折叠。条目在第一次展开/折叠时惰性加入，
 * 会话期间从不删除；键空间受固定目录约束，无需淘汰策略。
 */
class ExpansionStore {
public:
  bool get(const NodeKey &key) const;
  void set(const NodeKey &key, bool expanded);

  /**
   * @brief 翻转展开标志
   * @return 翻转后的值
   */
  bool toggle(const NodeKey &key);

  size_t size() const { return flags_.size(); }

  bool operator==(const ExpansionStore &other) const { return flags_ == other.flags_; }
  bool operator!=(const ExpansionStore &other) const { return !(*this == other); }

private:
  std::unordered_map<NodeKey, bool, NodeKeyHash> flags_;
};

} // namespace connmgr_tui
