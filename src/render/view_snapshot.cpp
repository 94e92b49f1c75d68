#include "render/view_snapshot.hpp"

namespace connmgr_tui {

namespace {

const char *const BROWSING_HINT = "Q: 退出, ←→/H/L: 切换模块, 回车: 进入";
const char *const TREE_HINT = "↑↓/J/K: 移动, →/L: 展开, ←/H: 折叠, 空格: 切换展开, 回车: 连接, Esc: 返回";
const char *const CONFIRM_HINT = "Y: 确认退出, N/Esc: 取消";

void append_details(const AppContext &context, ViewSnapshot &snapshot) {
  const auto &navigator = context.navigator;
  const auto &provider = *context.provider;
  const std::string &module_id = navigator.module().id;
  const auto projects = provider.list_projects(module_id);

  if (!snapshot.tree_active) {
    snapshot.details.push_back("项目数: " + std::to_string(projects.size()));
    if (projects.empty())
      snapshot.details.push_back("该模块没有可用的项目");
    return;
  }
  if (projects.empty())
    return;

  const auto &cursor = navigator.cursor();
  const auto &project = projects[cursor.project];
  switch (cursor.level) {
  case Level::Project:
    snapshot.details.push_back("项目: " + project.name);
    snapshot.details.push_back("描述: " + (project.description.empty() ? "NULL" : project.description));
    snapshot.details.push_back("环境数: " + std::to_string(navigator.count_at(Level::Environment)));
    break;
  case Level::Environment: {
    auto environments = provider.list_environments(module_id, cursor.project);
    snapshot.details.push_back("项目: " + project.name);
    snapshot.details.push_back("环境: " + environments[cursor.environment].name);
    snapshot.details.push_back("连接数: " + std::to_string(navigator.count_at(Level::Connection)));
    break;
  }
  case Level::Connection: {
    auto connections = provider.list_connections(module_id, cursor.project, cursor.environment);
    const auto &connection = connections[cursor.connection];
    snapshot.details.push_back("主机: " + connection.host);
    snapshot.details.push_back("端口: " + std::to_string(connection.port));
    snapshot.details.push_back("用户: " + (connection.user.empty() ? "NULL" : connection.user));
    if (!connection.database.empty())
      snapshot.details.push_back("数据库: " + connection.database);
    snapshot.details.push_back(std::string("连接状态: ") + status_label(connection.status));
    break;
  }
  }
}

} // namespace

ViewSnapshot build_view_snapshot(const AppContext &context) {
  ViewSnapshot snapshot;
  const auto &provider = *context.provider;
  const auto &navigator = context.navigator;
  const Module &module = navigator.module();

  snapshot.confirm_visible = is_confirm_pending(context.mode);
  if (const auto *pending = std::get_if<ConfirmPendingMode>(&context.mode))
    snapshot.tree_active = std::holds_alternative<TreeMode>(pending->previous);
  else
    snapshot.tree_active = is_tree(context.mode);

  snapshot.title = module.name + " 连接管理";
  snapshot.mode_text = mode_label(context.mode);
  snapshot.status_message = context.status_message;
  snapshot.key_hint = snapshot.confirm_visible ? CONFIRM_HINT
                      : snapshot.tree_active   ? TREE_HINT
                                               : BROWSING_HINT;

  const auto &modules = context.selector.modules();
  for (size_t i = 0; i < modules.size(); ++i) {
    snapshot.tabs.push_back(
        {modules[i].name, i == context.selector.hovered(), i == context.selector.current()});
  }

  const auto &cursor = navigator.cursor();
  const bool tree = snapshot.tree_active;
  const auto projects = provider.list_projects(module.id);
  for (size_t p = 0; p < projects.size(); ++p) {
    const auto environments = provider.list_environments(module.id, p);
    const bool on_project_path = tree && cursor.project == p;

    TreeRow project_row;
    project_row.level = Level::Project;
    project_row.label = projects[p].name;
    project_row.highlighted = on_project_path && cursor.level == Level::Project;
    project_row.expanded = navigator.is_expanded(NodeKey{module.id, {p}}) ||
                           (on_project_path && cursor.level != Level::Project);
    project_row.has_children = !environments.empty();
    snapshot.rows.push_back(project_row);
    if (!project_row.expanded)
      continue;

    for (size_t e = 0; e < environments.size(); ++e) {
      const auto connections = provider.list_connections(module.id, p, e);
      const bool on_env_path = on_project_path && cursor.level != Level::Project && cursor.environment == e;

      TreeRow env_row;
      env_row.level = Level::Environment;
      env_row.label = environments[e].name;
      env_row.highlighted = on_env_path && cursor.level == Level::Environment;
      env_row.expanded = navigator.is_expanded(NodeKey{module.id, {p, e}}) ||
                         (on_env_path && cursor.level == Level::Connection);
      env_row.has_children = !connections.empty();
      snapshot.rows.push_back(env_row);
      if (!env_row.expanded)
        continue;

      for (size_t c = 0; c < connections.size(); ++c) {
        TreeRow conn_row;
        conn_row.level = Level::Connection;
        conn_row.label = connections[c].name + " (" + connections[c].endpoint() + ")";
        conn_row.highlighted = on_env_path && cursor.level == Level::Connection && cursor.connection == c;
        conn_row.status = connections[c].status;
        snapshot.rows.push_back(conn_row);
      }
    }
  }

  append_details(context, snapshot);
  return snapshot;
}

} // namespace connmgr_tui
