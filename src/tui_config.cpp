#include "tui_config.hpp"
#include "tui_logging.hpp"
#include <cstdlib>
#include <fstream>
#include <yaml-cpp/yaml.h>

namespace connmgr_tui {

namespace {

std::string home_dir() {
  const char *home = std::getenv("HOME");
  return home ? std::string(home) : std::string();
}

std::string default_log_file() {
  std::string home = home_dir();
  return home.empty() ? "connmgr.log" : home + "/.connectionmanager/connmgr.log";
}

Connection parse_connection(const YAML::Node &node) {
  Connection connection;
  connection.name = node["name"].as<std::string>();
  connection.host = node["host"].as<std::string>("");
  connection.port = node["port"].as<int>(0);
  connection.user = node["user"].as<std::string>("");
  connection.database = node["database"].as<std::string>("");
  const std::string status = node["status"].as<std::string>("disconnected");
  if (!parse_status(status, connection.status))
    throw ConfigError("未知的连接状态: " + status + " (" + connection.name + ")");
  return connection;
}

std::vector<CatalogProject> parse_projects(const YAML::Node &node) {
  std::vector<CatalogProject> projects;
  if (!node.IsSequence())
    throw ConfigError("catalog下的模块必须是项目列表");
  projects.reserve(node.size());
  for (const auto &item : node) {
    CatalogProject project;
    project.info.name = item["name"].as<std::string>();
    project.info.description = item["description"].as<std::string>("");
    if (const auto environments = item["environments"]) {
      if (!environments.IsSequence())
        throw ConfigError("项目 " + project.info.name + " 的environments必须是列表");
      for (const auto &env_node : environments) {
        CatalogEnvironment environment;
        environment.info.name = env_node["name"].as<std::string>();
        if (const auto connections = env_node["connections"]) {
          if (!connections.IsSequence())
            throw ConfigError("环境 " + project.info.name + "/" + environment.info.name +
                              " 的connections必须是列表");
          for (const auto &conn_node : connections)
            environment.connections.emplace_back(parse_connection(conn_node));
        }
        project.environments.emplace_back(std::move(environment));
      }
    }
    projects.emplace_back(std::move(project));
  }
  return projects;
}

AppConfig parse_node(const YAML::Node &root) {
  AppConfig config;
  config.log_file = default_log_file();
  if (!root || root.IsNull())
    return config;
  if (!root.IsMap())
    throw ConfigError("配置文件顶层必须是映射");

  if (const auto log = root["log"]) {
    config.log_file = log["file"].as<std::string>(config.log_file);
    config.log_level = log["level"].as<std::string>(config.log_level);
  }
  if (!is_valid_log_level(config.log_level))
    throw ConfigError("未知的日志级别: " + config.log_level);

  if (const auto catalog = root["catalog"]) {
    if (!catalog.IsMap())
      throw ConfigError("catalog必须是以模块id为键的映射");
    for (const auto &item : catalog) {
      const std::string module_id = item.first.as<std::string>();
      if (!config.catalog.find_module(module_id))
        throw ConfigError("未知的模块: " + module_id);
      config.catalog.projects[module_id] = parse_projects(item.second);
    }
  }
  return config;
}

} // namespace

std::vector<std::string> config_search_paths() {
  std::vector<std::string> paths = {"config.yaml"};
  std::string home = home_dir();
  if (!home.empty())
    paths.push_back(home + "/.connectionmanager/config.yaml");
  return paths;
}

std::optional<std::string> discover_config_file(const std::vector<std::string> &paths) {
  for (const auto &path : paths) {
    if (std::ifstream(path).good())
      return path;
  }
  return std::nullopt;
}

AppConfig parse_app_config(const std::string &yaml_text) {
  try {
    return parse_node(YAML::Load(yaml_text));
  } catch (const YAML::Exception &e) {
    throw ConfigError("配置解析失败: " + std::string(e.what()));
  }
}

AppConfig load_app_config(const std::string &file_path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(file_path);
  } catch (const YAML::Exception &e) {
    throw ConfigError("无法加载配置文件 " + file_path + ": " + std::string(e.what()));
  }
  try {
    AppConfig config = parse_node(root);
    config.source_path = file_path;
    return config;
  } catch (const YAML::Exception &e) {
    throw ConfigError("配置文件 " + file_path + " 内容非法: " + std::string(e.what()));
  }
}

void apply_env_overrides(AppConfig &config) {
  if (const char *file = std::getenv("CONNMGR_LOG_FILE"))
    config.log_file = file;
  if (const char *level = std::getenv("CONNMGR_LOG_LEVEL")) {
    if (!is_valid_log_level(level))
      throw ConfigError("CONNMGR_LOG_LEVEL取值非法: " + std::string(level));
    config.log_level = level;
  }
}

AppConfig load_startup_config() {
  AppConfig config;
  if (auto path = discover_config_file(config_search_paths())) {
    config = load_app_config(*path);
  } else {
    config.log_file = default_log_file();
  }
  apply_env_overrides(config);
  return config;
}

} // namespace connmgr_tui
