//
//  test_plugin_definition.cpp
//  devagentd
//
//  Created on 17.10.26.
//

#include <gtest/gtest.h>

#include "DAException.hpp"
#include "Plugins/PluginDefinition.hpp"
#include "sysconf/plistjson.hpp"

namespace {

PluginDefinition parse(const std::string &json){
    plist_t p = plistjson_from_string(json);
    try {
        PluginDefinition ret = PluginDefinition::fromPlist(p);
        plist_free(p);
        return ret;
    } catch (tihmstar::exception &) {
        plist_free(p);
        throw;
    }
}

TEST(PluginDefinitionTest, Defaults) {
    PluginDefinition def = parse(R"({"id": "p1", "executable": "/bin/true"})");

    EXPECT_EQ(def.type, PluginDefinition::PLUGIN_TYPE_PROCESS);
    EXPECT_TRUE(def.enabled);
    EXPECT_EQ(def.restartPolicy, PluginDefinition::RESTART_ON_FAILURE);
    EXPECT_EQ(def.triggerOn, PluginDefinition::TRIGGER_NONE);
    EXPECT_FALSE(def.stopOnDisconnect);
    EXPECT_FALSE(def.healthCheckCommand.has_value());
    EXPECT_FALSE(def.workingDirectory.has_value());
    EXPECT_TRUE(def.arguments.empty());
}

TEST(PluginDefinitionTest, TagsAreCaseInsensitive) {
    PluginDefinition def = parse(R"({"id": "p1", "type": "Script", "restartPolicy": "never", "triggerOn": "Device-Disconnected"})");

    EXPECT_EQ(def.type, PluginDefinition::PLUGIN_TYPE_SCRIPT);
    EXPECT_EQ(def.restartPolicy, PluginDefinition::RESTART_NEVER);
    EXPECT_EQ(def.triggerOn, PluginDefinition::TRIGGER_DEVICE_DISCONNECTED);
}

TEST(PluginDefinitionTest, UnknownTagsAreBadConfig) {
    EXPECT_THROW(parse(R"({"id": "p1", "type": "docker"})"), tihmstar::DAException_bad_config);
    EXPECT_THROW(parse(R"({"id": "p1", "restartPolicy": "Always"})"), tihmstar::DAException_bad_config);
    EXPECT_THROW(parse(R"({"id": "p1", "triggerOn": "boot"})"), tihmstar::DAException_bad_config);
    EXPECT_THROW(parse(R"({"id": "p1", "arguments": "--verbose"})"), tihmstar::DAException_bad_config);
    EXPECT_THROW(parse(R"(["p1"])"), tihmstar::DAException_bad_config);
}

TEST(PluginDefinitionTest, PlistRoundTrip) {
    PluginDefinition def("p1", PluginDefinition::PLUGIN_TYPE_SCRIPT, "{installFolder}/run.sh", {"--udid", "{deviceId}"});
    def.environmentVariables["LOG_LEVEL"] = "debug";
    def.healthCheckCommand = "pgrep";
    def.healthCheckIntervalSeconds = 30;
    def.triggerOn = PluginDefinition::TRIGGER_DEVICE_CONNECTED;
    def.stopOnDisconnect = true;

    plist_t p = def.toPlist();
    PluginDefinition back = PluginDefinition::fromPlist(p);
    plist_free(p);

    EXPECT_EQ(back.id, def.id);
    EXPECT_EQ(back.type, def.type);
    EXPECT_EQ(back.arguments, def.arguments);
    EXPECT_EQ(back.environmentVariables, def.environmentVariables);
    EXPECT_EQ(back.healthCheckCommand, def.healthCheckCommand);
    EXPECT_EQ(back.healthCheckIntervalSeconds, def.healthCheckIntervalSeconds);
    EXPECT_EQ(back.triggerOn, def.triggerOn);
    EXPECT_TRUE(back.stopOnDisconnect);
}

} // namespace
