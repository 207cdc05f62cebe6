//
//  DeviceMetrics.cpp
//  devagentd
//
//  Created on 17.10.26.
//

#include "DeviceMetrics.hpp"

#include <libgeneral/macros.h>

#include <stdio.h>

#define DECREMENT_FLOOR_ZERO(v) do{if (v) v--;}while(0)

DeviceMetrics::DeviceMetrics()
: _devicesConnectedTotal(0), _devicesDisconnectedTotal(0)
, _sessionsStartedTotal(0), _sessionsStoppedTotal(0), _sessionsFailedTotal(0)
, _portAllocationFailuresTotal(0)
, _pluginUnhealthyTotal(0), _pluginRestartsTotal(0)
, _androidDevicesConnected(0), _iosDevicesConnected(0), _activeSessions(0)
{
    //
}

#pragma mark record
void DeviceMetrics::recordDeviceConnected(Device::device_platform platform) noexcept{
    std::unique_lock<std::mutex> ul(_lck);
    _devicesConnectedTotal++;
    if (platform == Device::PLATFORM_ANDROID) {
        _androidDevicesConnected++;
    } else if (platform == Device::PLATFORM_IOS) {
        _iosDevicesConnected++;
    }
}

void DeviceMetrics::recordDeviceDisconnected(Device::device_platform platform) noexcept{
    std::unique_lock<std::mutex> ul(_lck);
    _devicesDisconnectedTotal++;
    if (platform == Device::PLATFORM_ANDROID) {
        DECREMENT_FLOOR_ZERO(_androidDevicesConnected);
    } else if (platform == Device::PLATFORM_IOS) {
        DECREMENT_FLOOR_ZERO(_iosDevicesConnected);
    }
}

void DeviceMetrics::recordSessionStarted(Device::device_platform platform) noexcept{
    std::unique_lock<std::mutex> ul(_lck);
    _sessionsStartedTotal++;
    _activeSessions++;
}

void DeviceMetrics::recordSessionStopped(Device::device_platform platform) noexcept{
    std::unique_lock<std::mutex> ul(_lck);
    _sessionsStoppedTotal++;
    DECREMENT_FLOOR_ZERO(_activeSessions);
}

void DeviceMetrics::recordSessionFailed(Device::device_platform platform, const std::string &reason) noexcept{
    std::unique_lock<std::mutex> ul(_lck);
    _sessionsFailedTotal++;
    _sessionFailureReasons[reason]++;
}

void DeviceMetrics::recordPortAllocationFailure() noexcept{
    std::unique_lock<std::mutex> ul(_lck);
    _portAllocationFailuresTotal++;
}

void DeviceMetrics::recordPluginUnhealthy(const std::string &instanceId) noexcept{
    std::unique_lock<std::mutex> ul(_lck);
    _pluginUnhealthyTotal++;
}

void DeviceMetrics::recordPluginRestart(const std::string &instanceId) noexcept{
    std::unique_lock<std::mutex> ul(_lck);
    _pluginRestartsTotal++;
    _pluginRestarts[instanceId]++;
}

#pragma mark read
uint32_t DeviceMetrics::androidDevicesConnected() noexcept{
    std::unique_lock<std::mutex> ul(_lck);
    return _androidDevicesConnected;
}

uint32_t DeviceMetrics::iosDevicesConnected() noexcept{
    std::unique_lock<std::mutex> ul(_lck);
    return _iosDevicesConnected;
}

uint32_t DeviceMetrics::activeSessions() noexcept{
    std::unique_lock<std::mutex> ul(_lck);
    return _activeSessions;
}

uint64_t DeviceMetrics::devicesConnectedTotal() noexcept{
    std::unique_lock<std::mutex> ul(_lck);
    return _devicesConnectedTotal;
}

uint64_t DeviceMetrics::devicesDisconnectedTotal() noexcept{
    std::unique_lock<std::mutex> ul(_lck);
    return _devicesDisconnectedTotal;
}

uint64_t DeviceMetrics::sessionsStartedTotal() noexcept{
    std::unique_lock<std::mutex> ul(_lck);
    return _sessionsStartedTotal;
}

uint64_t DeviceMetrics::sessionsStoppedTotal() noexcept{
    std::unique_lock<std::mutex> ul(_lck);
    return _sessionsStoppedTotal;
}

uint64_t DeviceMetrics::sessionsFailedTotal() noexcept{
    std::unique_lock<std::mutex> ul(_lck);
    return _sessionsFailedTotal;
}

uint64_t DeviceMetrics::portAllocationFailuresTotal() noexcept{
    std::unique_lock<std::mutex> ul(_lck);
    return _portAllocationFailuresTotal;
}

uint64_t DeviceMetrics::pluginUnhealthyTotal() noexcept{
    std::unique_lock<std::mutex> ul(_lck);
    return _pluginUnhealthyTotal;
}

uint64_t DeviceMetrics::pluginRestartsTotal() noexcept{
    std::unique_lock<std::mutex> ul(_lck);
    return _pluginRestartsTotal;
}

uint64_t DeviceMetrics::pluginRestartsFor(const std::string &instanceId) noexcept{
    std::unique_lock<std::mutex> ul(_lck);
    auto r = _pluginRestarts.find(instanceId);
    return (r == _pluginRestarts.end()) ? 0 : r->second;
}

std::map<std::string, uint64_t> DeviceMetrics::sessionFailureReasons(){
    std::unique_lock<std::mutex> ul(_lck);
    return _sessionFailureReasons;
}

double DeviceMetrics::sessionStartSuccessRate() noexcept{
    std::unique_lock<std::mutex> ul(_lck);
    uint64_t attempts = _sessionsStartedTotal + _sessionsFailedTotal;
    if (!attempts) return 100.0;
    return (double)_sessionsStartedTotal / (double)attempts * 100.0;
}

std::string DeviceMetrics::summary(){
    double rate = sessionStartSuccessRate();
    char buf[512] = {};
    std::unique_lock<std::mutex> ul(_lck);
    snprintf(buf, sizeof(buf), "Devices: %u Android, %u iOS | Sessions: %u active, %llu started, %llu failed (%.1f%% success) | Port Failures: %llu | Plugins: %llu unhealthy, %llu restarts",
             _androidDevicesConnected, _iosDevicesConnected,
             _activeSessions, (unsigned long long)_sessionsStartedTotal, (unsigned long long)_sessionsFailedTotal, rate,
             (unsigned long long)_portAllocationFailuresTotal,
             (unsigned long long)_pluginUnhealthyTotal, (unsigned long long)_pluginRestartsTotal);
    return buf;
}
