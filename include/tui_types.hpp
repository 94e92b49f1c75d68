#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace connmgr_tui {

// ==================== 目录数据 ====================

struct Module {
  std::string id, name;
  bool operator==(const Module &other) const { return id == other.id && name == other.name; }
};

enum class ConnectionStatus { Connected, Disconnected, Connecting };

struct Project {
  std::string name, description;
};

struct Environment {
  std::string name;
};

struct Connection {
  std::string name, host, user, database;
  int port = 0;
  ConnectionStatus status = ConnectionStatus::Disconnected;
  std::string endpoint() const { return host + ":" + std::to_string(port); }
};

const char *status_label(ConnectionStatus status);
bool parse_status(const std::string &text, ConnectionStatus &out);

// ==================== 层级与节点标识 ====================

enum class Level { Project = 0, Environment = 1, Connection = 2 };

const char *level_label(Level level);

/**
 * @brief 节点标识：模块id + 从项目层到节点自身的索引路径
 *
 * 只用作ExpansionStore的查找键，不持有任何节点。
 * 项目键路径长度为1，环境为2，连接为3。
 */
struct NodeKey {
  std::string module_id;
  std::vector<size_t> path;

  Level level() const { return static_cast<Level>(path.empty() ? 0 : path.size() - 1); }
  bool operator==(const NodeKey &other) const {
    return module_id == other.module_id && path == other.path;
  }
  bool operator!=(const NodeKey &other) const { return !(*this == other); }
  std::string to_string() const;
};

struct NodeKeyHash {
  size_t operator()(const NodeKey &key) const;
};

/**
 * @brief 导航游标
 *
 * level以下（更深）的索引在进入对应层级之前没有意义，始终保持为0。
 */
struct NavigationCursor {
  Level level = Level::Project;
  size_t project = 0, environment = 0, connection = 0;

  size_t index_at(Level l) const {
    switch (l) {
    case Level::Project: return project;
    case Level::Environment: return environment;
    case Level::Connection: return connection;
    }
    return 0;
  }
  bool operator==(const NavigationCursor &other) const {
    return level == other.level && project == other.project &&
           environment == other.environment && connection == other.connection;
  }
  bool operator!=(const NavigationCursor &other) const { return !(*this == other); }
};

// ==================== 交互模式 ====================

struct BrowsingMode {};
struct TreeMode {};

/// 确认框关闭后要恢复的模式
using ResumableMode = std::variant<BrowsingMode, TreeMode>;

struct ConfirmPendingMode {
  ResumableMode previous;
};

using Mode = std::variant<BrowsingMode, TreeMode, ConfirmPendingMode>;

inline bool is_browsing(const Mode &mode) { return std::holds_alternative<BrowsingMode>(mode); }
inline bool is_tree(const Mode &mode) { return std::holds_alternative<TreeMode>(mode); }
inline bool is_confirm_pending(const Mode &mode) { return std::holds_alternative<ConfirmPendingMode>(mode); }

const char *mode_label(const Mode &mode);

// ==================== 输入 ====================

/// 与终端库无关的按键抽象，由渲染层从FTXUI事件翻译而来
enum class InputKey { Up, Down, Left, Right, Enter, Space, Escape, Quit, Yes, No, Other };

/// 叶子节点激活请求（连接/断开），交给外部协作者处理
struct ActivationRequest {
  Module module;
  NodeKey key;
  Connection connection;
};

} // namespace connmgr_tui
