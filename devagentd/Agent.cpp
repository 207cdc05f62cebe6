//
//  Agent.cpp
//  devagentd
//
//  Created on 17.10.26.
//

#include "Agent.hpp"
#include "Devices/DeviceRegistry.hpp"
#include "Devices/DeviceListener.hpp"
#include "Sessions/PortAllocator.hpp"
#include "Sessions/SessionManager.hpp"
#include "Plugins/PluginOrchestrator.hpp"
#include "Plugins/DeviceEventTrigger.hpp"
#include "Manager/IOSDeviceManager.hpp"

#include <libgeneral/macros.h>

#include <sstream>

Agent::Agent(const Config &config)
: _config(config), _startedAt(std::chrono::steady_clock::now())
, _registry(nullptr), _ports(nullptr), _sessions(nullptr)
, _orchestrator(nullptr), _trigger(nullptr), _listener(nullptr), _iosdevmgr(nullptr)
{
    info("Starting Agent: installFolder=%s listener=%s autoStartAppium=%s plugins=%zu",_config.installFolder.c_str()
                                                                                      ,_config.enableDeviceListener ? "YES" : "NO"
                                                                                      ,_config.autoStartAppium ? "YES" : "NO"
                                                                                      ,_config.plugins.size());
    try {
        _registry = new DeviceRegistry(_config.deviceRegistry);
        _registry->subscribe(&_bus);

        _ports = new PortAllocator((uint16_t)_config.appiumPortStart, (uint16_t)_config.appiumPortEnd);
        _sessions = new SessionManager(_ports, &_metrics, _config.sessionManagerConfig());

        for (auto &def : _config.plugins) {
            _plugins.registerDefinition(def);
        }
        _orchestrator = new PluginOrchestrator(&_plugins, &_metrics, _config.orchestratorConfig());
        _trigger = new DeviceEventTrigger(&_bus, &_plugins, _orchestrator, baseContext());

        _listener = new DeviceListener(&_bus, _registry, _sessions, &_metrics, _config.autoStartAppium);
    } catch (tihmstar::exception &) {
        destroyComponents();
        throw;
    } catch (std::exception &) {
        destroyComponents();
        throw;
    }
}

Agent::~Agent(){
    stop();
    destroyComponents();
}

void Agent::destroyComponents() noexcept{
    safeDelete(_iosdevmgr);
    safeDelete(_listener);
    safeDelete(_trigger);
    safeDelete(_orchestrator);
    safeDelete(_sessions);
    safeDelete(_ports);
    safeDelete(_registry);
}

PluginContext Agent::baseContext() const{
    PluginContext ret;
    ret.installFolder = _config.installFolder;
    ret.healthCheckTimeoutSeconds = _config.healthCheckTimeoutSeconds;
    return ret;
}

void Agent::start(){
    PluginContext ctx = baseContext();
    _orchestrator->startEnabledDefinitions(ctx);
    _orchestrator->startMonitoring(ctx);
}

void Agent::stop() noexcept{
    info("Stopping Agent");
    if (_iosdevmgr) _iosdevmgr->stopLoop();
    if (_orchestrator) {
        _orchestrator->stopMonitoring();
        _orchestrator->stopAll();
    }
    if (_listener) _listener->disconnectAll();
    if (_sessions) _sessions->stopAll();
    if (_registry) _registry->save();
}

#pragma mark Managers
void Agent::spawnIOSDeviceManager(){
    assure(!_iosdevmgr);
    _iosdevmgr = new IOSDeviceManager(_listener);
    _iosdevmgr->startLoop();
}

bool Agent::hasDeviceManager() noexcept{
    return !!_iosdevmgr;
}

std::string Agent::statusSummary(){
    std::stringstream ss;
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - _startedAt).count();
    size_t runningPlugins = 0;
    for (auto &inst : _plugins.getInstances()) {
        if (inst->state() == PluginWorker::PLUGIN_STATE_RUNNING) runningPlugins++;
    }
    ss << "devices=" << _registry->getConnected().size()
       << " sessions=" << _sessions->sessionsCnt()
       << " plugins=" << runningPlugins << "/" << _plugins.instancesCnt()
       << " uptime=" << uptime << "s"
       << " | " << _metrics.summary();
    return ss.str();
}
