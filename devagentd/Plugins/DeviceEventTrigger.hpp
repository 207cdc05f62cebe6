//
//  DeviceEventTrigger.hpp
//  devagentd
//
//  Created on 17.10.26.
//

#ifndef DeviceEventTrigger_hpp
#define DeviceEventTrigger_hpp

#include "PluginOrchestrator.hpp"
#include "../Events/EventBus.hpp"

/*
 Starts and stops plugin instances from device connectivity events
 according to each definition's trigger rule
 */
class DeviceEventTrigger{
    EventBus *_bus; //not owned
    PluginRegistry *_registry; //not owned
    PluginOrchestrator *_orchestrator; //not owned
    PluginContext _baseCtx;
    EventBus::subscription_id _connectedSub;
    EventBus::subscription_id _disconnectedSub;

public:
    DeviceEventTrigger(EventBus *bus, PluginRegistry *registry, PluginOrchestrator *orchestrator, PluginContext baseCtx = {});
    ~DeviceEventTrigger();

    void handleDeviceConnected(const Device &dev) noexcept;
    void handleDeviceDisconnected(const Device &dev) noexcept;
};

#endif /* DeviceEventTrigger_hpp */
