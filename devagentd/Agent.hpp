//
//  Agent.hpp
//  devagentd
//
//  Created on 17.10.26.
//

#ifndef Agent_hpp
#define Agent_hpp

#include "sysconf/sysconf.hpp"
#include "Events/EventBus.hpp"
#include "Devices/DeviceMetrics.hpp"
#include "Plugins/PluginRegistry.hpp"
#include "Plugins/PluginContext.hpp"

#include <chrono>
#include <string>

class DeviceRegistry;
class PortAllocator;
class SessionManager;
class PluginOrchestrator;
class DeviceEventTrigger;
class DeviceListener;
class IOSDeviceManager;

class Agent {
    Config _config;
    std::chrono::steady_clock::time_point _startedAt;

    EventBus _bus;
    DeviceMetrics _metrics;
    PluginRegistry _plugins;
    DeviceRegistry *_registry;
    PortAllocator *_ports;
    SessionManager *_sessions;
    PluginOrchestrator *_orchestrator;
    DeviceEventTrigger *_trigger;
    DeviceListener *_listener;
    IOSDeviceManager *_iosdevmgr;

    void destroyComponents() noexcept;

public:
    Agent(const Config &config);
    ~Agent();

    /*
     Starts enabled plugins and the health monitor
     */
    void start();

    /*
     Stops plugins and sessions, flushes the registry
     */
    void stop() noexcept;

#pragma mark Managers
    void spawnIOSDeviceManager();
    bool hasDeviceManager() noexcept;

#pragma mark Accessors
    EventBus *bus() noexcept {return &_bus;}
    DeviceMetrics *metrics() noexcept {return &_metrics;}
    PluginRegistry *pluginRegistry() noexcept {return &_plugins;}
    DeviceRegistry *registry() noexcept {return _registry;}
    SessionManager *sessions() noexcept {return _sessions;}
    PluginOrchestrator *orchestrator() noexcept {return _orchestrator;}
    DeviceListener *listener() noexcept {return _listener;}
    PluginContext baseContext() const;

    std::string statusSummary();
};

#endif /* Agent_hpp */
