#include <gtest/gtest.h>
#include "core/catalog_provider.hpp"
#include <stdexcept>

using namespace connmgr_tui;

TEST(CatalogProviderTest, BuiltinHasFourModulesInOrder) {
    CatalogProvider provider(CatalogData::builtin());
    const auto &modules = provider.modules();
    ASSERT_EQ(modules.size(), 4u);
    EXPECT_EQ(modules[0].name, "SSH");
    EXPECT_EQ(modules[1].name, "MySQL");
    EXPECT_EQ(modules[2].name, "PostgreSQL");
    EXPECT_EQ(modules[3].name, "Redis");
}

TEST(CatalogProviderTest, BuiltinMySqlShape) {
    CatalogProvider provider(CatalogData::builtin());
    auto projects = provider.list_projects("mysql");
    ASSERT_EQ(projects.size(), 3u);

    EXPECT_TRUE(provider.list_environments("mysql", 1).empty());

    auto environments = provider.list_environments("mysql", 2);
    ASSERT_EQ(environments.size(), 1u);
    auto connections = provider.list_connections("mysql", 2, 0);
    ASSERT_EQ(connections.size(), 3u);
    EXPECT_EQ(connections[0].port, 3306);
}

TEST(CatalogProviderTest, EveryBuiltinModuleHasProjects) {
    CatalogProvider provider(CatalogData::builtin());
    for (const auto &module : provider.modules()) {
        EXPECT_FALSE(provider.list_projects(module.id).empty()) << module.id;
    }
}

TEST(CatalogProviderTest, OutOfRangeIndicesYieldEmptyLists) {
    CatalogProvider provider(CatalogData::builtin());
    EXPECT_TRUE(provider.list_environments("mysql", 99).empty());
    EXPECT_TRUE(provider.list_connections("mysql", 0, 99).empty());
    EXPECT_TRUE(provider.list_connections("mysql", 99, 0).empty());
    EXPECT_TRUE(provider.list_projects("mongodb").empty());
}

TEST(CatalogProviderTest, RepeatedQueriesAreDeterministic) {
    CatalogProvider provider(CatalogData::builtin());
    auto first = provider.list_connections("ssh", 0, 0);
    auto second = provider.list_connections("ssh", 0, 0);
    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].name, second[i].name);
        EXPECT_EQ(first[i].status, second[i].status);
    }
}

TEST(CatalogProviderTest, EmptyModuleListThrows) {
    EXPECT_THROW(CatalogProvider provider(CatalogData{}), std::invalid_argument);
}

TEST(CatalogProviderTest, FindModuleById) {
    CatalogData data = CatalogData::builtin();
    ASSERT_NE(data.find_module("redis"), nullptr);
    EXPECT_EQ(data.find_module("redis")->name, "Redis");
    EXPECT_EQ(data.find_module("mongodb"), nullptr);
}
