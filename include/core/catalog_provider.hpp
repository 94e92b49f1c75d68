#pragma once

#include "data_provider.hpp"
#include <unordered_map>

namespace connmgr_tui {

struct CatalogEnvironment {
  Environment info;
  std::vector<Connection> connections;
};

struct CatalogProject {
  Project info;
  std::vector<CatalogEnvironment> environments;
};

/**
 * @brief 连接目录的内存表示
 *
 * modules保持固定顺序；projects按模块id索引。
 */
struct CatalogData {
  std::vector<Module> modules;
  std::unordered_map<std::string, std::vector<CatalogProject>> projects;

  const Module *find_module(const std::string &id) const;

  /**
   * @brief 内置演示目录：SSH、MySQL、PostgreSQL、Redis四个模块
   */
  static CatalogData builtin();
};

/**
 * @brief 基于CatalogData的只读数据源
 */
class CatalogProvider : public DataProvider {
public:
  explicit CatalogProvider(CatalogData data);

  const std::vector<Module> &modules() const override { return data_.modules; }
  std::vector<Project> list_projects(const std::string &module_id) const override;
  std::vector<Environment> list_environments(const std::string &module_id,
                                             size_t project) const override;
  std::vector<Connection> list_connections(const std::string &module_id, size_t project,
                                           size_t environment) const override;

private:
  CatalogData data_;

  const std::vector<CatalogProject> *find_projects(const std::string &module_id) const;
  const CatalogEnvironment *find_environment(const std::string &module_id, size_t project,
                                             size_t environment) const;
};

} // namespace connmgr_tui
