//
//  DeviceEventTrigger.cpp
//  devagentd
//
//  Created on 17.10.26.
//

#include "DeviceEventTrigger.hpp"
#include "../Events/Events.hpp"

#include <libgeneral/macros.h>

DeviceEventTrigger::DeviceEventTrigger(EventBus *bus, PluginRegistry *registry, PluginOrchestrator *orchestrator, PluginContext baseCtx)
: _bus(bus), _registry(registry), _orchestrator(orchestrator)
, _baseCtx(baseCtx)
, _connectedSub(0), _disconnectedSub(0)
{
    assure(_bus);
    assure(_registry);
    assure(_orchestrator);
    _connectedSub = _bus->subscribe<DeviceConnectedEvent>([this](const DeviceConnectedEvent &ev){
        handleDeviceConnected(ev.device);
    });
    _disconnectedSub = _bus->subscribe<DeviceDisconnectedEvent>([this](const DeviceDisconnectedEvent &ev){
        handleDeviceDisconnected(ev.device);
    });
}

DeviceEventTrigger::~DeviceEventTrigger(){
    _bus->unsubscribe<DeviceConnectedEvent>(_connectedSub);
    _bus->unsubscribe<DeviceDisconnectedEvent>(_disconnectedSub);
}

void DeviceEventTrigger::handleDeviceConnected(const Device &dev) noexcept{
    try {
        PluginContext ctx = PluginContext::forDevice(_baseCtx, dev);
        info("DeviceEventTrigger handling connected device %s",dev.id.c_str());
        for (auto &def : _registry->getDefinitions()) {
            if (def.triggerOn != PluginDefinition::TRIGGER_DEVICE_CONNECTED || !def.enabled) continue;
            if (!_orchestrator->startInstance(def.id, ctx)) {
                error("Failed to start plugin %s for device %s",def.id.c_str(),dev.id.c_str());
            }
        }
    } catch (tihmstar::exception &e) {
        error("DeviceEventTrigger failed to handle device connected with error=%d (%s)",e.code(),e.what());
    } catch (std::exception &e) {
        error("DeviceEventTrigger failed to handle device connected (%s)",e.what());
    }
}

void DeviceEventTrigger::handleDeviceDisconnected(const Device &dev) noexcept{
    try {
        PluginContext ctx = PluginContext::forDevice(_baseCtx, dev);
        info("DeviceEventTrigger handling disconnected device %s",dev.id.c_str());
        for (auto &def : _registry->getDefinitions()) {
            if (def.triggerOn == PluginDefinition::TRIGGER_DEVICE_DISCONNECTED && def.enabled) {
                if (!_orchestrator->startInstance(def.id, ctx)) {
                    error("Failed to start plugin %s for device disconnect %s",def.id.c_str(),dev.id.c_str());
                }
            }
            if (def.triggerOn == PluginDefinition::TRIGGER_DEVICE_CONNECTED && def.stopOnDisconnect) {
                std::string instanceId = def.id + ":" + dev.id;
                info("Stopping plugin instance %s due to device disconnect",instanceId.c_str());
                if (!_orchestrator->stopInstance(instanceId)) {
                    debug("Plugin instance %s was not running",instanceId.c_str());
                }
            }
        }
    } catch (tihmstar::exception &e) {
        error("DeviceEventTrigger failed to handle device disconnected with error=%d (%s)",e.code(),e.what());
    } catch (std::exception &e) {
        error("DeviceEventTrigger failed to handle device disconnected (%s)",e.what());
    }
}
