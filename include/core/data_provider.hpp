#pragma once

#include "../tui_types.hpp"
#include <string>
#include <vector>

namespace connmgr_tui {

/**
 * @brief 目录数据源接口
 *
 * 导航器只读地查询项目/环境/连接列表，每次祖先选择变化后重新获取，不做缓存。
 * 对于同一模块和索引，会话内结果必须确定且无副作用。
 * 越界索引返回空列表，与“没有子节点”同等处理。
 */
class DataProvider {
public:
  virtual ~DataProvider() = default;

  /// 模块目录，顺序决定hover/current索引的含义
  virtual const std::vector<Module> &modules() const = 0;

  virtual std::vector<Project> list_projects(const std::string &module_id) const = 0;

  virtual std::vector<Environment> list_environments(const std::string &module_id,
                                                     size_t project) const = 0;

  virtual std::vector<Connection> list_connections(const std::string &module_id, size_t project,
                                                   size_t environment) const = 0;
};

} // namespace connmgr_tui
