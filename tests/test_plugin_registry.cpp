//
//  test_plugin_registry.cpp
//  devagentd
//
//  Created on 17.10.26.
//

#include <gtest/gtest.h>

#include "FakeWorker.hpp"
#include "Plugins/PluginRegistry.hpp"

#include <libgeneral/exception.hpp>

#include <algorithm>

using namespace devagentd::test;

namespace {

class PluginRegistryTest : public ::testing::Test {
protected:
    PluginRegistry registry;

    std::shared_ptr<FakeWorker> worker(const std::string &instanceId, const std::string &definitionId){
        return std::make_shared<FakeWorker>(instanceId, PluginDefinition(definitionId, PluginDefinition::PLUGIN_TYPE_PROCESS, "/bin/true"));
    }

    static std::vector<std::string> ids(const std::vector<std::shared_ptr<PluginWorker>> &workers){
        std::vector<std::string> ret;
        for (auto &w : workers) ret.push_back(w->id());
        std::sort(ret.begin(), ret.end());
        return ret;
    }
};

TEST_F(PluginRegistryTest, ReRegisteringReplacesInPlace) {
    registry.registerDefinition(PluginDefinition("a", PluginDefinition::PLUGIN_TYPE_PROCESS, "/bin/a"));
    registry.registerDefinition(PluginDefinition("b", PluginDefinition::PLUGIN_TYPE_SCRIPT, "/opt/b.sh"));
    registry.registerDefinition(PluginDefinition("a", PluginDefinition::PLUGIN_TYPE_PROCESS, "/bin/a2"));

    auto defs = registry.getDefinitions();
    ASSERT_EQ(defs.size(), 2u);
    EXPECT_EQ(defs[0].id, "a");
    EXPECT_EQ(defs[0].executable, "/bin/a2");
    EXPECT_EQ(defs[1].id, "b");

    auto a = registry.getDefinition("a");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->executable, "/bin/a2");
    EXPECT_FALSE(registry.getDefinition("missing").has_value());
}

TEST_F(PluginRegistryTest, DefinitionWithoutIdIsRejected) {
    EXPECT_THROW(registry.registerDefinition(PluginDefinition("", PluginDefinition::PLUGIN_TYPE_PROCESS, "/bin/true")), tihmstar::exception);
    EXPECT_TRUE(registry.getDefinitions().empty());
}

TEST_F(PluginRegistryTest, LookupByDefinitionIdMatchesPrefixOnly) {
    registry.registerInstance(worker("p1", "p1"));
    registry.registerInstance(worker("p1:dev1", "p1"));
    registry.registerInstance(worker("p1:dev2", "p1"));
    registry.registerInstance(worker("p10", "p10"));
    registry.registerInstance(worker("p10:dev1", "p10"));

    EXPECT_EQ(ids(registry.getInstancesByDefinitionId("p1")), (std::vector<std::string>{"p1", "p1:dev1", "p1:dev2"}));
    EXPECT_EQ(ids(registry.getInstancesByDefinitionId("p10")), (std::vector<std::string>{"p10", "p10:dev1"}));
    EXPECT_TRUE(registry.getInstancesByDefinitionId("p").empty());
}

TEST_F(PluginRegistryTest, TryRegisterKeepsFirstInstance) {
    auto first = worker("p1", "p1");
    auto second = worker("p1", "p1");

    EXPECT_TRUE(registry.tryRegisterInstance(first));
    EXPECT_FALSE(registry.tryRegisterInstance(second));
    EXPECT_EQ(registry.getInstance("p1"), first);
    EXPECT_EQ(registry.instancesCnt(), 1u);
}

TEST_F(PluginRegistryTest, RegisterInstanceOverwrites) {
    auto first = worker("p1", "p1");
    auto second = worker("p1", "p1");

    registry.registerInstance(first);
    registry.registerInstance(second);
    EXPECT_EQ(registry.getInstance("p1"), second);
}

TEST_F(PluginRegistryTest, RemoveInstance) {
    registry.registerInstance(worker("p1", "p1"));

    EXPECT_TRUE(registry.removeInstance("p1"));
    EXPECT_FALSE(registry.removeInstance("p1"));
    EXPECT_EQ(registry.getInstance("p1"), nullptr);
    EXPECT_EQ(registry.instancesCnt(), 0u);
}

} // namespace
