#include "core/catalog_provider.hpp"

namespace connmgr_tui {

namespace {

Connection make_connection(const std::string &name, const std::string &host, int port,
                           const std::string &user, const std::string &database,
                           ConnectionStatus status) {
  Connection connection;
  connection.name = name;
  connection.host = host;
  connection.port = port;
  connection.user = user;
  connection.database = database;
  connection.status = status;
  return connection;
}

} // namespace

CatalogData CatalogData::builtin() {
  CatalogData data;
  data.modules = {{"ssh", "SSH"}, {"mysql", "MySQL"}, {"postgresql", "PostgreSQL"}, {"redis", "Redis"}};

  const auto connected = ConnectionStatus::Connected;
  const auto disconnected = ConnectionStatus::Disconnected;
  const auto connecting = ConnectionStatus::Connecting;

  // SSH：密钥认证的服务器
  data.projects["ssh"] = {
      {{"infra", "基础设施主机"},
       {{{"prod"},
         {make_connection("SSH-Server-01", "192.168.1.10", 22, "user", "", connected),
          make_connection("SSH-Server-02", "192.168.1.11", 22, "user", "", disconnected)}},
        {{"staging"}, {make_connection("SSH-Staging", "192.168.2.10", 22, "deploy", "", disconnected)}}}},
      {{"web", "对外服务"},
       {{{"prod"}, {make_connection("Production-Server", "prod.example.com", 22, "user", "", connected)}}}},
  };

  // MySQL：billing只有一个环境，包含三个连接
  data.projects["mysql"] = {
      {{"myapp", "业务主库"},
       {{{"dev"}, {make_connection("MySQL-DB-01", "localhost", 3306, "root", "myapp", disconnected)}},
        {{"prod"}, {make_connection("MySQL-DB-02", "db.example.com", 3306, "root", "myapp", disconnected)}}}},
      {{"reporting", "报表库（尚未配置环境）"}, {}},
      {{"billing", "计费库"},
       {{{"prod"},
         {make_connection("billing-primary", "billing.example.com", 3306, "billing", "billing", connected),
          make_connection("billing-replica-1", "billing-r1.example.com", 3306, "billing", "billing", connecting),
          make_connection("billing-replica-2", "billing-r2.example.com", 3306, "billing", "billing", disconnected)}}}},
  };

  data.projects["postgresql"] = {
      {{"main", "主数据库"},
       {{{"prod"}, {make_connection("PostgreSQL-Main", "localhost", 5432, "postgres", "postgres", connecting)}}}},
      {{"analytics", "分析集群"},
       {{{"prod"},
         {make_connection("PostgreSQL-Analytics", "analytics.example.com", 5432, "postgres", "analytics",
                          connecting)}}}},
  };

  data.projects["redis"] = {
      {{"cache", "缓存实例"},
       {{{"prod"},
         {make_connection("Redis-Cache-01", "localhost", 6379, "", "0", connected),
          make_connection("Redis-Session", "session.example.com", 6379, "", "0", connected)}}}},
  };

  return data;
}

} // namespace connmgr_tui
