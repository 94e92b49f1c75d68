#include "core/hierarchy_navigator.hpp"
#include <spdlog/spdlog.h>

namespace connmgr_tui {

namespace {

Level deeper(Level level) {
  return level == Level::Project ? Level::Environment : Level::Connection;
}

Level shallower(Level level) {
  return level == Level::Connection ? Level::Environment : Level::Project;
}

} // namespace

HierarchyNavigator::HierarchyNavigator(const DataProvider &provider, ExpansionStore &expansion)
    : provider_(provider), expansion_(expansion) {
  if (!provider_.modules().empty())
    module_ = provider_.modules().front();
}

void HierarchyNavigator::reset(const Module &module) {
  module_ = module;
  cursor_ = NavigationCursor{};
  spdlog::debug("[HierarchyNavigator] Reset cursor for module {}", module_.id);
}

// ==================== 内部辅助 ====================

size_t &HierarchyNavigator::index_ref(Level level) {
  switch (level) {
  case Level::Environment: return cursor_.environment;
  case Level::Connection: return cursor_.connection;
  case Level::Project: break;
  }
  return cursor_.project;
}

void HierarchyNavigator::reset_below(Level level) {
  if (level == Level::Project) {
    cursor_.environment = 0;
    cursor_.connection = 0;
  } else if (level == Level::Environment) {
    cursor_.connection = 0;
  }
}

void HierarchyNavigator::ascend() {
  // 离开的层级索引清零，上升到的层级索引保持不变
  index_ref(cursor_.level) = 0;
  cursor_.level = shallower(cursor_.level);
}

void HierarchyNavigator::descend() {
  cursor_.level = deeper(cursor_.level);
  index_ref(cursor_.level) = 0;
}

// ==================== 查询 ====================

size_t HierarchyNavigator::count_at(Level level) const {
  switch (level) {
  case Level::Project:
    return provider_.list_projects(module_.id).size();
  case Level::Environment:
    return provider_.list_environments(module_.id, cursor_.project).size();
  case Level::Connection:
    return provider_.list_connections(module_.id, cursor_.project, cursor_.environment).size();
  }
  return 0;
}

NodeKey HierarchyNavigator::key_at(Level level) const {
  NodeKey key{module_.id, {cursor_.project}};
  if (level != Level::Project)
    key.path.push_back(cursor_.environment);
  if (level == Level::Connection)
    key.path.push_back(cursor_.connection);
  return key;
}

bool HierarchyNavigator::cursor_in_bounds() const {
  if (!has_projects())
    return cursor_ == NavigationCursor{};
  if (cursor_.project >= count_at(Level::Project))
    return false;
  if (cursor_.level != Level::Project && cursor_.environment >= count_at(Level::Environment))
    return false;
  if (cursor_.level == Level::Connection && cursor_.connection >= count_at(Level::Connection))
    return false;
  return true;
}

// ==================== 光标移动 ====================

bool HierarchyNavigator::move_up() {
  if (!has_projects())
    return false;

  size_t &index = index_ref(cursor_.level);
  if (index > 0) {
    --index;
    reset_below(cursor_.level);
    return true;
  }
  if (cursor_.level != Level::Project) {
    ascend();
    return true;
  }
  return false;
}

bool HierarchyNavigator::move_down() {
  if (!has_projects())
    return false;

  const Level level = cursor_.level;
  size_t &index = index_ref(level);
  if (index + 1 < count_at(level)) {
    ++index;
    reset_below(level);
    return true;
  }
  // 从项目层不会自动下钻，进入项目总要经过expand_or_descend
  if (level == Level::Environment && count_at(Level::Connection) > 0) {
    descend();
    spdlog::debug("[HierarchyNavigator] Auto-descended to {}", level_label(cursor_.level));
    return true;
  }
  return false;
}

// ==================== 展开/折叠 ====================

NavOutcome HierarchyNavigator::collapse_or_ascend() {
  if (cursor_.level == Level::Project)
    return NavOutcome::ExitTree;

  // 只清除直接祖先的标志，更深层的标志保留
  const NodeKey parent = key_at(shallower(cursor_.level));
  expansion_.set(parent, false);
  ascend();
  spdlog::debug("[HierarchyNavigator] Collapsed {}", parent.to_string());
  return NavOutcome::Changed;
}

bool HierarchyNavigator::expand_or_descend() {
  if (!has_projects() || cursor_.level == Level::Connection)
    return false;

  const NodeKey key = current_key();
  expansion_.set(key, true);
  if (count_at(deeper(cursor_.level)) > 0)
    descend();
  spdlog::debug("[HierarchyNavigator] Expanded {}", key.to_string());
  return true;
}

bool HierarchyNavigator::toggle_expansion() {
  if (!has_projects())
    return false;
  const NodeKey key = current_key();
  bool expanded = expansion_.toggle(key);
  spdlog::debug("[HierarchyNavigator] Toggled {} -> {}", key.to_string(), expanded);
  return true;
}

bool HierarchyNavigator::activate() {
  if (cursor_.level != Level::Connection)
    return false;

  auto connections = provider_.list_connections(module_.id, cursor_.project, cursor_.environment);
  if (cursor_.connection >= connections.size())
    return false;

  ActivationRequest request{module_, current_key(), connections[cursor_.connection]};
  spdlog::info("[HierarchyNavigator] Activate {} ({})", request.connection.name,
               request.key.to_string());
  if (activation_callback_)
    activation_callback_(request);
  return true;
}

void HierarchyNavigator::set_activation_callback(
    std::function<void(const ActivationRequest &)> callback) {
  activation_callback_ = std::move(callback);
}

} // namespace connmgr_tui
