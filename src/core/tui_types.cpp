#include "tui_types.hpp"

namespace connmgr_tui {

const char *status_label(ConnectionStatus status) {
  switch (status) {
  case ConnectionStatus::Connected: return "connected";
  case ConnectionStatus::Disconnected: return "disconnected";
  case ConnectionStatus::Connecting: return "connecting";
  }
  return "unknown";
}

bool parse_status(const std::string &text, ConnectionStatus &out) {
  if (text == "connected") out = ConnectionStatus::Connected;
  else if (text == "disconnected") out = ConnectionStatus::Disconnected;
  else if (text == "connecting") out = ConnectionStatus::Connecting;
  else return false;
  return true;
}

const char *level_label(Level level) {
  switch (level) {
  case Level::Project: return "Project";
  case Level::Environment: return "Environment";
  case Level::Connection: return "Connection";
  }
  return "Unknown";
}

std::string NodeKey::to_string() const {
  std::string text = module_id;
  for (size_t index : path)
    text += "/" + std::to_string(index);
  return text;
}

size_t NodeKeyHash::operator()(const NodeKey &key) const {
  size_t seed = std::hash<std::string>{}(key.module_id);
  for (size_t index : key.path)
    seed ^= std::hash<size_t>{}(index) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
  return seed;
}

const char *mode_label(const Mode &mode) {
  if (is_browsing(mode)) return "Browsing";
  if (is_tree(mode)) return "Tree";
  return "Confirm";
}

} // namespace connmgr_tui
