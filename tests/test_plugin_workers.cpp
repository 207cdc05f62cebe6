//
//  test_plugin_workers.cpp
//  devagentd
//
//  Created on 17.10.26.
//

#include <gtest/gtest.h>

#include "TestUtils.hpp"
#include "Plugins/ProcessWorker.hpp"
#include "Plugins/ScriptWorker.hpp"

#include <mutex>
#include <vector>

using namespace devagentd::test;

namespace {

PluginDefinition sleeper(const std::string &id){
    return PluginDefinition(id, PluginDefinition::PLUGIN_TYPE_PROCESS, "/bin/sh", {"-c", "sleep 30"});
}

class ProcessWorkerTest : public ::testing::Test {
protected:
    TempDir dir;
    PluginContext ctx;

    void SetUp() override {
        ctx.installFolder = dir.path().string();
        ctx.variables["deviceId"] = "dev42";
        ctx.variables["appiumPort"] = "4723";
    }
};

TEST_F(ProcessWorkerTest, StartAndStopProcess) {
    ProcessWorker worker("p1", sleeper("p1"));
    EXPECT_EQ(worker.state(), PluginWorker::PLUGIN_STATE_DISABLED);

    ASSERT_TRUE(worker.start(ctx));
    EXPECT_EQ(worker.state(), PluginWorker::PLUGIN_STATE_RUNNING);
    ASSERT_TRUE(worker.pid().has_value());
    EXPECT_TRUE(worker.checkHealth());

    worker.stop();
    EXPECT_EQ(worker.state(), PluginWorker::PLUGIN_STATE_STOPPED);
    EXPECT_FALSE(worker.pid().has_value());
    EXPECT_FALSE(worker.checkHealth());
}

TEST_F(ProcessWorkerTest, ExitedProcessIsUnhealthy) {
    ProcessWorker worker("p1", PluginDefinition("p1", PluginDefinition::PLUGIN_TYPE_PROCESS, "/bin/true"));

    ASSERT_TRUE(worker.start(ctx));
    EXPECT_TRUE(wait_until([&]{ return !worker.checkHealth(); }));
    worker.stop();
}

TEST_F(ProcessWorkerTest, BlankExecutableIsLaunchError) {
    ProcessWorker worker("p1", PluginDefinition("p1", PluginDefinition::PLUGIN_TYPE_PROCESS, "   "));

    EXPECT_FALSE(worker.start(ctx));
    EXPECT_EQ(worker.state(), PluginWorker::PLUGIN_STATE_ERROR);
}

TEST_F(ProcessWorkerTest, MissingExecutableIsLaunchError) {
    ProcessWorker worker("p1", PluginDefinition("p1", PluginDefinition::PLUGIN_TYPE_PROCESS, "/nonexistent/devagentd-plugin"));

    EXPECT_FALSE(worker.start(ctx));
    EXPECT_EQ(worker.state(), PluginWorker::PLUGIN_STATE_ERROR);
    EXPECT_FALSE(worker.pid().has_value());
}

TEST_F(ProcessWorkerTest, LaunchInfoIsExpanded) {
    PluginDefinition def("p1", PluginDefinition::PLUGIN_TYPE_PROCESS, "{installFolder}/bin/agent", {"--udid", "{deviceId}"});
    def.environmentVariables["PORT_{deviceId}"] = "{appiumPort}";
    ProcessWorker worker("p1", def);

    auto launch = worker.launchInfo(ctx);
    EXPECT_EQ(launch.executable, ctx.installFolder + "/bin/agent");
    EXPECT_EQ(launch.arguments, (std::vector<std::string>{"--udid", "dev42"}));
    EXPECT_EQ(launch.workingDirectory, ctx.installFolder);
    EXPECT_EQ(launch.environment["PORT_dev42"], "4723");

    def.workingDirectory = "{installFolder}/work/{deviceId}";
    ProcessWorker withDir("p2", def);
    EXPECT_EQ(withDir.launchInfo(ctx).workingDirectory, ctx.installFolder + "/work/dev42");
}

TEST_F(ProcessWorkerTest, HealthCommandExitCodeDecides) {
    PluginDefinition good = sleeper("good");
    good.healthCheckCommand = "/bin/true";
    PluginDefinition bad = sleeper("bad");
    bad.healthCheckCommand = "/bin/false";
    PluginDefinition missing = sleeper("missing");
    missing.healthCheckCommand = "/nonexistent/devagentd-probe";

    EXPECT_TRUE(ProcessWorker("good", good).checkHealth());
    EXPECT_FALSE(ProcessWorker("bad", bad).checkHealth());
    EXPECT_FALSE(ProcessWorker("missing", missing).checkHealth());
}

TEST_F(ProcessWorkerTest, HealthCommandTimesOut) {
    PluginDefinition def = sleeper("slow");
    def.healthCheckCommand = "/bin/sleep";
    def.healthCheckArguments = {"5"};
    def.healthCheckTimeoutSeconds = 1;
    ProcessWorker worker("slow", def);

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(worker.checkHealth());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(4));
}

TEST_F(ProcessWorkerTest, HealthCommandUsesStartContext) {
    PluginDefinition def = sleeper("p1");
    def.healthCheckCommand = "/bin/sh";
    def.healthCheckArguments = {"-c", "test \"{deviceId}\" = dev42"};
    ProcessWorker worker("p1:dev42", def);

    ASSERT_TRUE(worker.start(ctx));
    auto launch = worker.healthCheckLaunchInfo(*worker.lastStartContext());
    EXPECT_EQ(launch.arguments[1], "test \"dev42\" = dev42");
    EXPECT_TRUE(worker.checkHealth());
    worker.stop();
}

TEST_F(ProcessWorkerTest, ObserversSeeStateChangesOnce) {
    std::mutex lck;
    std::vector<PluginWorker::plugin_state> seen;
    ProcessWorker worker("p1", sleeper("p1"));
    worker.addStateObserver([&](const std::string &instanceId, PluginWorker::plugin_state state){
        std::unique_lock<std::mutex> ul(lck);
        EXPECT_EQ(instanceId, "p1");
        seen.push_back(state);
    });

    ASSERT_TRUE(worker.start(ctx));
    worker.stop();
    worker.stop();

    std::unique_lock<std::mutex> ul(lck);
    EXPECT_EQ(seen, (std::vector<PluginWorker::plugin_state>{PluginWorker::PLUGIN_STATE_RUNNING, PluginWorker::PLUGIN_STATE_STOPPED}));
}

class ScriptWorkerTest : public ::testing::Test {
protected:
    PluginContext ctx;

    void SetUp() override {
        ctx.installFolder = "/opt/devagentd";
        ctx.variables["appiumPort"] = "4723";
    }

    static PluginDefinition script(const std::string &path, std::vector<std::string> args = {}){
        return PluginDefinition("s1", PluginDefinition::PLUGIN_TYPE_SCRIPT, path, args);
    }
};

TEST_F(ScriptWorkerTest, RuntimeHintPrecedence) {
    PluginDefinition def = script("run.sh");
    EXPECT_EQ(ScriptWorker::runtimeHint(def, "run.sh"), "bash");
    EXPECT_EQ(ScriptWorker::runtimeHint(def, "RUN.PY"), "python");
    EXPECT_EQ(ScriptWorker::runtimeHint(def, "app.js"), "node");
    EXPECT_EQ(ScriptWorker::runtimeHint(def, "setup.ps1"), "powershell");
    EXPECT_EQ(ScriptWorker::runtimeHint(def, "tool"), "");

    def.environmentVariables["runtime"] = "node";
    EXPECT_EQ(ScriptWorker::runtimeHint(def, "run.sh"), "node");

    def.runtime = "python3";
    EXPECT_EQ(ScriptWorker::runtimeHint(def, "run.sh"), "python3");
}

TEST_F(ScriptWorkerTest, ShellScriptRunsThroughBash) {
    ScriptWorker worker("s1", script("{installFolder}/scripts/run.sh", {"--port", "{appiumPort}"}));

    auto launch = worker.launchInfo(ctx);
    EXPECT_EQ(launch.executable, "/bin/bash");
    EXPECT_EQ(launch.arguments, (std::vector<std::string>{"/opt/devagentd/scripts/run.sh", "--port", "4723"}));
}

TEST_F(ScriptWorkerTest, InterpreterMapping) {
    PluginDefinition def = script("/opt/x/task.ps1");
    EXPECT_EQ(ScriptWorker("s1", def).launchInfo(ctx).executable, "pwsh");
    EXPECT_EQ(ScriptWorker("s1", def).launchInfo(ctx).arguments, (std::vector<std::string>{"-File", "/opt/x/task.ps1"}));

    def = script("/opt/x/task.py");
    EXPECT_EQ(ScriptWorker("s1", def).launchInfo(ctx).executable, "python3");

    def = script("/opt/x/task.js");
    EXPECT_EQ(ScriptWorker("s1", def).launchInfo(ctx).executable, "node");

    def = script("/opt/x/task.rb");
    def.runtime = "/usr/bin/ruby";
    EXPECT_EQ(ScriptWorker("s1", def).launchInfo(ctx).executable, "/usr/bin/ruby");

    def = script("/opt/x/task");
    auto launch = ScriptWorker("s1", def).launchInfo(ctx);
    EXPECT_EQ(launch.executable, "/bin/sh");
    EXPECT_EQ(launch.arguments, (std::vector<std::string>{"/opt/x/task"}));
}

TEST_F(ScriptWorkerTest, BashHealthRuntimeWrapsCommandLine) {
    PluginDefinition def = script("run.sh");
    def.healthCheckCommand = "curl";
    def.healthCheckArguments = {"-sf", "http://127.0.0.1:{appiumPort}/status"};
    def.healthCheckRuntime = "bash";
    ScriptWorker worker("s1", def);

    auto launch = worker.healthCheckLaunchInfo(ctx);
    EXPECT_EQ(launch.executable, "bash");
    EXPECT_EQ(launch.arguments, (std::vector<std::string>{"-c", "curl -sf http://127.0.0.1:4723/status"}));

    def.healthCheckRuntime.reset();
    EXPECT_EQ(ScriptWorker("s1", def).healthCheckLaunchInfo(ctx).executable, "curl");
}

TEST_F(ScriptWorkerTest, RunsRealShellScript) {
    TempDir dir;
    write_file(dir / "run.sh", "echo started\nsleep 30\n");
    ctx.installFolder = dir.path().string();
    ScriptWorker worker("s1", script("{installFolder}/run.sh"));

    ASSERT_TRUE(worker.start(ctx));
    EXPECT_EQ(worker.state(), PluginWorker::PLUGIN_STATE_RUNNING);
    EXPECT_TRUE(worker.checkHealth());

    worker.stop();
    EXPECT_EQ(worker.state(), PluginWorker::PLUGIN_STATE_STOPPED);
}

} // namespace
