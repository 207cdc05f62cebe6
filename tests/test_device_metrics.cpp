//
//  test_device_metrics.cpp
//  devagentd
//
//  Created on 17.10.26.
//

#include <gtest/gtest.h>

#include "Devices/DeviceMetrics.hpp"

namespace {

TEST(DeviceMetricsTest, GaugesNeverGoNegative) {
    DeviceMetrics metrics;

    metrics.recordDeviceDisconnected(Device::PLATFORM_IOS);
    metrics.recordSessionStopped(Device::PLATFORM_IOS);

    EXPECT_EQ(metrics.iosDevicesConnected(), 0u);
    EXPECT_EQ(metrics.activeSessions(), 0u);
    EXPECT_EQ(metrics.devicesDisconnectedTotal(), 1u);
}

TEST(DeviceMetricsTest, CountsPerPlatform) {
    DeviceMetrics metrics;

    metrics.recordDeviceConnected(Device::PLATFORM_IOS);
    metrics.recordDeviceConnected(Device::PLATFORM_ANDROID);
    metrics.recordDeviceConnected(Device::PLATFORM_ANDROID);
    metrics.recordDeviceDisconnected(Device::PLATFORM_ANDROID);

    EXPECT_EQ(metrics.iosDevicesConnected(), 1u);
    EXPECT_EQ(metrics.androidDevicesConnected(), 1u);
    EXPECT_EQ(metrics.devicesConnectedTotal(), 3u);
}

TEST(DeviceMetricsTest, SuccessRate) {
    DeviceMetrics metrics;
    EXPECT_DOUBLE_EQ(metrics.sessionStartSuccessRate(), 100.0);

    metrics.recordSessionStarted(Device::PLATFORM_IOS);
    metrics.recordSessionStarted(Device::PLATFORM_ANDROID);
    metrics.recordSessionFailed(Device::PLATFORM_IOS, "launch failed");
    metrics.recordSessionFailed(Device::PLATFORM_IOS, "launch failed");
    metrics.recordSessionFailed(Device::PLATFORM_IOS, "port allocation failed");

    EXPECT_DOUBLE_EQ(metrics.sessionStartSuccessRate(), 40.0);
    EXPECT_EQ(metrics.activeSessions(), 2u);
    auto reasons = metrics.sessionFailureReasons();
    EXPECT_EQ(reasons["launch failed"], 2u);
    EXPECT_EQ(reasons["port allocation failed"], 1u);
}

TEST(DeviceMetricsTest, PluginCounters) {
    DeviceMetrics metrics;

    metrics.recordPluginUnhealthy("p1");
    metrics.recordPluginRestart("p1");
    metrics.recordPluginRestart("p1");
    metrics.recordPluginRestart("p2:dev1");

    EXPECT_EQ(metrics.pluginUnhealthyTotal(), 1u);
    EXPECT_EQ(metrics.pluginRestartsTotal(), 3u);
    EXPECT_EQ(metrics.pluginRestartsFor("p1"), 2u);
    EXPECT_EQ(metrics.pluginRestartsFor("p2:dev1"), 1u);
    EXPECT_EQ(metrics.pluginRestartsFor("p3"), 0u);
}

TEST(DeviceMetricsTest, SummaryLine) {
    DeviceMetrics metrics;
    metrics.recordDeviceConnected(Device::PLATFORM_ANDROID);
    metrics.recordSessionStarted(Device::PLATFORM_ANDROID);
    metrics.recordPortAllocationFailure();

    std::string summary = metrics.summary();
    EXPECT_NE(summary.find("Devices: 1 Android, 0 iOS"), std::string::npos);
    EXPECT_NE(summary.find("1 active"), std::string::npos);
    EXPECT_NE(summary.find("100.0% success"), std::string::npos);
    EXPECT_NE(summary.find("Port Failures: 1"), std::string::npos);
}

} // namespace
