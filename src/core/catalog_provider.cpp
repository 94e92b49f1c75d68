#include "core/catalog_provider.hpp"
#include <stdexcept>

namespace connmgr_tui {

const Module *CatalogData::find_module(const std::string &id) const {
  for (const auto &module : modules) {
    if (module.id == id)
      return &module;
  }
  return nullptr;
}

CatalogProvider::CatalogProvider(CatalogData data) : data_(std::move(data)) {
  if (data_.modules.empty())
    throw std::invalid_argument("catalog has no modules");
}

const std::vector<CatalogProject> *
CatalogProvider::find_projects(const std::string &module_id) const {
  auto it = data_.projects.find(module_id);
  return (it != data_.projects.end()) ? &it->second : nullptr;
}

const CatalogEnvironment *CatalogProvider::find_environment(const std::string &module_id,
                                                            size_t project,
                                                            size_t environment) const {
  const auto *projects = find_projects(module_id);
  if (!projects || project >= projects->size())
    return nullptr;
  const auto &environments = (*projects)[project].environments;
  return environment < environments.size() ? &environments[environment] : nullptr;
}

std::vector<Project> CatalogProvider::list_projects(const std::string &module_id) const {
  std::vector<Project> result;
  if (const auto *projects = find_projects(module_id)) {
    result.reserve(projects->size());
    for (const auto &project : *projects)
      result.push_back(project.info);
  }
  return result;
}

std::vector<Environment> CatalogProvider::list_environments(const std::string &module_id,
                                                            size_t project) const {
  std::vector<Environment> result;
  const auto *projects = find_projects(module_id);
  if (!projects || project >= projects->size())
    return result;
  for (const auto &environment : (*projects)[project].environments)
    result.push_back(environment.info);
  return result;
}

std::vector<Connection> CatalogProvider::list_connections(const std::string &module_id,
                                                          size_t project,
                                                          size_t environment) const {
  const auto *env = find_environment(module_id, project, environment);
  return env ? env->connections : std::vector<Connection>{};
}

} // namespace connmgr_tui
