//
//  DeviceMetrics.hpp
//  devagentd
//
//  Created on 17.10.26.
//

#ifndef DeviceMetrics_hpp
#define DeviceMetrics_hpp

#include "Device.hpp"

#include <map>
#include <mutex>
#include <string>

class DeviceMetrics{
    std::mutex _lck;
    uint64_t _devicesConnectedTotal;
    uint64_t _devicesDisconnectedTotal;
    uint64_t _sessionsStartedTotal;
    uint64_t _sessionsStoppedTotal;
    uint64_t _sessionsFailedTotal;
    uint64_t _portAllocationFailuresTotal;
    uint64_t _pluginUnhealthyTotal;
    uint64_t _pluginRestartsTotal;
    uint32_t _androidDevicesConnected;
    uint32_t _iosDevicesConnected;
    uint32_t _activeSessions;
    std::map<std::string, uint64_t> _sessionFailureReasons;
    std::map<std::string, uint64_t> _pluginRestarts;

public:
    DeviceMetrics();

    void recordDeviceConnected(Device::device_platform platform) noexcept;
    void recordDeviceDisconnected(Device::device_platform platform) noexcept;
    void recordSessionStarted(Device::device_platform platform) noexcept;
    void recordSessionStopped(Device::device_platform platform) noexcept;
    void recordSessionFailed(Device::device_platform platform, const std::string &reason) noexcept;
    void recordPortAllocationFailure() noexcept;
    void recordPluginUnhealthy(const std::string &instanceId) noexcept;
    void recordPluginRestart(const std::string &instanceId) noexcept;

    uint32_t androidDevicesConnected() noexcept;
    uint32_t iosDevicesConnected() noexcept;
    uint32_t activeSessions() noexcept;
    uint64_t devicesConnectedTotal() noexcept;
    uint64_t devicesDisconnectedTotal() noexcept;
    uint64_t sessionsStartedTotal() noexcept;
    uint64_t sessionsStoppedTotal() noexcept;
    uint64_t sessionsFailedTotal() noexcept;
    uint64_t portAllocationFailuresTotal() noexcept;
    uint64_t pluginUnhealthyTotal() noexcept;
    uint64_t pluginRestartsTotal() noexcept;
    uint64_t pluginRestartsFor(const std::string &instanceId) noexcept;
    std::map<std::string, uint64_t> sessionFailureReasons();

    double sessionStartSuccessRate() noexcept;
    std::string summary();
};

#endif /* DeviceMetrics_hpp */
