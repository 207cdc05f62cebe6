//
//  test_config.cpp
//  devagentd
//
//  Created on 17.10.26.
//

#include <gtest/gtest.h>

#include "TestUtils.hpp"
#include "DAException.hpp"
#include "sysconf/sysconf.hpp"

#include <algorithm>

using namespace devagentd::test;

namespace {

bool contains(const std::vector<std::string> &errors, const std::string &needle){
    return std::any_of(errors.begin(), errors.end(), [&](const std::string &e){ return e.find(needle) != std::string::npos; });
}

const char *fullConfig = R"({
    "installFolder": "/srv/devagentd",
    "enableDeviceListener": false,
    "autoStartAppium": false,
    "healthCheckTimeoutSeconds": 9,
    "pluginMonitorIntervalSeconds": 15,
    "pluginRestartBackoffSeconds": 30,
    "portRanges": {"appiumStart": 5000, "appiumEnd": 5100},
    "sessionExecutable": "/usr/local/bin/appium-session",
    "sessionArguments": ["--port", "{appiumPort}"],
    "deviceRegistry": {"enabled": true, "filePath": "/var/lib/devagentd/devices.json", "autoSave": false, "saveIntervalSeconds": 60},
    "plugins": [
        {
            "id": "syslog-forwarder",
            "type": "script",
            "executable": "{installFolder}/plugins/syslog.sh",
            "arguments": ["{deviceId}"],
            "environmentVariables": {"LOG_DIR": "/var/log"},
            "healthCheckCommand": "pgrep",
            "healthCheckArguments": ["-f", "syslog"],
            "healthCheckIntervalSeconds": 20,
            "healthCheckTimeoutSeconds": 2,
            "restartPolicy": "Never",
            "triggerOn": "device-connected",
            "stopOnDisconnect": true
        },
        {
            "id": "tunnel",
            "executable": "/usr/bin/tunnel",
            "enabled": false
        }
    ]
})";

TEST(ConfigTest, DefaultsAreValid) {
    Config config;

    EXPECT_EQ(config.installFolder, DEFAULT_INSTALL_FOLDER);
    EXPECT_EQ(config.configPath, DEFAULT_CONFIG_PATH);
    EXPECT_TRUE(config.enableDeviceListener);
    EXPECT_TRUE(config.autoStartAppium);
    EXPECT_EQ(config.appiumPortStart, 4723);
    EXPECT_EQ(config.appiumPortEnd, 4823);
    EXPECT_TRUE(config.validationErrors().empty());
    EXPECT_NO_THROW(config.validate());
}

TEST(ConfigTest, ParsesEveryKey) {
    Config config;
    config.loadFromString(fullConfig);

    EXPECT_EQ(config.installFolder, "/srv/devagentd");
    EXPECT_FALSE(config.enableDeviceListener);
    EXPECT_FALSE(config.autoStartAppium);
    EXPECT_EQ(config.healthCheckTimeoutSeconds, 9);
    EXPECT_EQ(config.pluginMonitorIntervalSeconds, 15);
    EXPECT_EQ(config.pluginRestartBackoffSeconds, 30);
    EXPECT_EQ(config.appiumPortStart, 5000);
    EXPECT_EQ(config.appiumPortEnd, 5100);
    EXPECT_EQ(config.sessionExecutable, "/usr/local/bin/appium-session");
    EXPECT_EQ(config.sessionArguments, (std::vector<std::string>{"--port", "{appiumPort}"}));
    EXPECT_TRUE(config.deviceRegistry.enabled);
    EXPECT_EQ(config.deviceRegistry.filePath, "/var/lib/devagentd/devices.json");
    EXPECT_FALSE(config.deviceRegistry.autoSave);
    EXPECT_EQ(config.deviceRegistry.saveInterval, std::chrono::seconds(60));

    ASSERT_EQ(config.plugins.size(), 2u);
    const PluginDefinition &syslog = config.plugins[0];
    EXPECT_EQ(syslog.id, "syslog-forwarder");
    EXPECT_EQ(syslog.type, PluginDefinition::PLUGIN_TYPE_SCRIPT);
    EXPECT_EQ(syslog.arguments, (std::vector<std::string>{"{deviceId}"}));
    EXPECT_EQ(syslog.environmentVariables.at("LOG_DIR"), "/var/log");
    EXPECT_EQ(syslog.healthCheckCommand, std::optional<std::string>("pgrep"));
    EXPECT_EQ(syslog.healthCheckIntervalSeconds, std::optional<int>(20));
    EXPECT_EQ(syslog.healthCheckTimeoutSeconds, std::optional<int>(2));
    EXPECT_EQ(syslog.restartPolicy, PluginDefinition::RESTART_NEVER);
    EXPECT_EQ(syslog.triggerOn, PluginDefinition::TRIGGER_DEVICE_CONNECTED);
    EXPECT_TRUE(syslog.stopOnDisconnect);

    const PluginDefinition &tunnel = config.plugins[1];
    EXPECT_EQ(tunnel.type, PluginDefinition::PLUGIN_TYPE_PROCESS);
    EXPECT_FALSE(tunnel.enabled);
    EXPECT_EQ(tunnel.restartPolicy, PluginDefinition::RESTART_ON_FAILURE);
    EXPECT_EQ(tunnel.triggerOn, PluginDefinition::TRIGGER_NONE);

    EXPECT_TRUE(config.validationErrors().empty());
}

TEST(ConfigTest, MissingKeysKeepDefaults) {
    Config config;
    config.loadFromString(R"({"installFolder": "/srv/da", "portRanges": {"appiumEnd": 4900}})");

    EXPECT_EQ(config.installFolder, "/srv/da");
    EXPECT_EQ(config.appiumPortStart, 4723);
    EXPECT_EQ(config.appiumPortEnd, 4900);
    EXPECT_EQ(config.healthCheckTimeoutSeconds, 5);
    EXPECT_TRUE(config.deviceRegistry.autoSave);
    EXPECT_TRUE(config.plugins.empty());
}

TEST(ConfigTest, MalformedInputIsBadConfig) {
    Config config;

    EXPECT_THROW(config.loadFromString("{ not json"), tihmstar::DAException_bad_config);
    EXPECT_THROW(config.loadFromString("[1, 2, 3]"), tihmstar::DAException_bad_config);
    EXPECT_THROW(config.loadFromString(R"({"healthCheckTimeoutSeconds": "five"})"), tihmstar::DAException_bad_config);
    EXPECT_THROW(config.loadFromString(R"({"plugins": {"id": "x"}})"), tihmstar::DAException_bad_config);
    EXPECT_THROW(config.loadFromString(R"({"plugins": [{"id": "x", "type": "container"}]})"), tihmstar::DAException_bad_config);
    EXPECT_THROW(config.loadFromString(R"({"plugins": [{"id": "x", "restartPolicy": "Always"}]})"), tihmstar::DAException_bad_config);
    EXPECT_THROW(config.loadFromString(R"({"plugins": [{"id": "x", "triggerOn": "device-paired"}]})"), tihmstar::DAException_bad_config);
}

TEST(ConfigTest, ValidationReportsEveryProblem) {
    Config config;
    config.loadFromString(R"({
        "pluginMonitorIntervalSeconds": 0,
        "portRanges": {"appiumStart": 5000, "appiumEnd": 4000},
        "plugins": [
            {"id": "dup", "executable": "/bin/a"},
            {"id": "dup", "executable": "/bin/b"},
            {"id": "slow", "executable": "/bin/c", "healthCheckIntervalSeconds": 0}
        ]
    })");

    auto errors = config.validationErrors();
    EXPECT_TRUE(contains(errors, "pluginMonitorIntervalSeconds"));
    EXPECT_TRUE(contains(errors, "appiumStart must not be greater"));
    EXPECT_TRUE(contains(errors, "Plugin id 'dup' is used more than once"));
    EXPECT_TRUE(contains(errors, "'slow' healthCheckIntervalSeconds"));
    EXPECT_EQ(errors.size(), 4u);
    EXPECT_THROW(config.validate(), tihmstar::DAException_bad_config);
}

TEST(ConfigTest, ValidationRejectsEmptyValues) {
    Config config;
    config.installFolder = "";
    config.sessionExecutable = "";
    config.deviceRegistry.filePath = "";
    config.appiumPortEnd = 70000;

    auto errors = config.validationErrors();
    EXPECT_TRUE(contains(errors, "installFolder"));
    EXPECT_TRUE(contains(errors, "sessionExecutable"));
    EXPECT_TRUE(contains(errors, "deviceRegistry.filePath"));
    EXPECT_TRUE(contains(errors, "appiumEnd must be within"));

    config.autoStartAppium = false;
    EXPECT_FALSE(contains(config.validationErrors(), "sessionExecutable"));
}

TEST(ConfigTest, LoadWithMissingFileKeepsDefaults) {
    TempDir dir;
    Config config;
    config.configPath = (dir / "missing.json").string();

    EXPECT_NO_THROW(config.load());
    EXPECT_EQ(config.installFolder, DEFAULT_INSTALL_FOLDER);
}

TEST(ConfigTest, LoadReadsFile) {
    TempDir dir;
    Config config;
    config.configPath = (dir / "config.json").string();
    write_file(config.configPath, fullConfig);

    config.load();
    EXPECT_EQ(config.installFolder, "/srv/devagentd");
    EXPECT_EQ(config.plugins.size(), 2u);

    write_file(config.configPath, "{\"installFolder\": ");
    EXPECT_THROW(config.load(), tihmstar::DAException_bad_config);
}

TEST(ConfigTest, MapsToComponentConfigs) {
    Config config;
    config.loadFromString(fullConfig);

    SessionManagerConfig sessions = config.sessionManagerConfig();
    EXPECT_EQ(sessions.installFolder, "/srv/devagentd");
    EXPECT_EQ(sessions.executable, "/usr/local/bin/appium-session");
    EXPECT_EQ(sessions.arguments, config.sessionArguments);

    OrchestratorConfig orchestrator = config.orchestratorConfig();
    EXPECT_EQ(orchestrator.monitorInterval, std::chrono::seconds(15));
    EXPECT_EQ(orchestrator.restartBackoff, std::chrono::seconds(30));
    EXPECT_EQ(orchestrator.healthCheckTimeoutSeconds, 9);
}

} // namespace
