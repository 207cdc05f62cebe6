//
//  PluginOrchestrator.cpp
//  devagentd
//
//  Created on 17.10.26.
//

#include "PluginOrchestrator.hpp"
#include "ProcessWorker.hpp"
#include "ScriptWorker.hpp"

#include <libgeneral/macros.h>

#pragma mark HealthMonitor
PluginOrchestrator::HealthMonitor::HealthMonitor(PluginOrchestrator *orchestrator, PluginContext ctx)
: _orchestrator(orchestrator), _ctx(ctx)
, _stopRequested(false)
{
    //
}

PluginOrchestrator::HealthMonitor::~HealthMonitor(){
    stopLoop();
}

bool PluginOrchestrator::HealthMonitor::loopEvent(){
    _orchestrator->monitorTick(_ctx);
    {
        std::unique_lock<std::mutex> ul(_wakeLck);
        if (_wakeCond.wait_for(ul, _orchestrator->_config.monitorInterval, [this]{return _stopRequested;})) {
            return false;
        }
    }
    return true;
}

void PluginOrchestrator::HealthMonitor::stopAction() noexcept{
    std::unique_lock<std::mutex> ul(_wakeLck);
    _stopRequested = true;
    _wakeCond.notify_all();
}

void PluginOrchestrator::HealthMonitor::afterLoop() noexcept{
    info("PluginOrchestrator: health monitor stopped");
}

#pragma mark PluginOrchestrator
PluginOrchestrator::PluginOrchestrator(PluginRegistry *registry, DeviceMetrics *metrics, OrchestratorConfig config,
                                       worker_factory factory, clock_source clock)
: _registry(registry), _metrics(metrics), _config(config)
, _factory(factory ? factory : createWorker)
, _clock(clock ? clock : std::chrono::steady_clock::now)
{
    assure(_registry);
}

PluginOrchestrator::~PluginOrchestrator(){
    stopMonitoring();
}

std::shared_ptr<PluginWorker> PluginOrchestrator::createWorker(const std::string &instanceId, const PluginDefinition &definition){
    switch (definition.type) {
        case PluginDefinition::PLUGIN_TYPE_SCRIPT:
            return std::make_shared<ScriptWorker>(instanceId, definition);
        case PluginDefinition::PLUGIN_TYPE_PROCESS:
        default:
            return std::make_shared<ProcessWorker>(instanceId, definition);
    }
}

void PluginOrchestrator::forgetThrottles(const std::string &instanceId) noexcept{
    std::unique_lock<std::mutex> ul(_throttleLck);
    _lastHealthCheck.erase(instanceId);
    _lastRestart.erase(instanceId);
}

bool PluginOrchestrator::startInstance(const std::string &definitionId, const PluginContext &ctx) noexcept{
    std::string instanceId = definitionId;
    try {
        std::optional<PluginDefinition> def;
        std::shared_ptr<PluginWorker> instance;
        PluginContext startCtx = ctx;

        if (!(def = _registry->getDefinition(definitionId))) {
            warning("Plugin definition %s not found",definitionId.c_str());
            return false;
        }
        if (auto deviceId = ctx.deviceId()) {
            instanceId += ":" + *deviceId;
        }
        startCtx.healthCheckTimeoutSeconds = def->healthCheckTimeoutSeconds.value_or(_config.healthCheckTimeoutSeconds);

        if ((instance = _registry->getInstance(instanceId))) {
            PluginWorker::plugin_state state = instance->state();
            if (state != PluginWorker::PLUGIN_STATE_ERROR && state != PluginWorker::PLUGIN_STATE_STOPPED) {
                info("Plugin instance %s already running",instanceId.c_str());
                return true;
            }
            info("Plugin instance %s is in state %s, starting it again",instanceId.c_str(),PluginWorker::stateName(state));
            forgetThrottles(instanceId);
            return instance->start(startCtx);
        }

        info("Creating plugin instance %s (definition=%s)",instanceId.c_str(),definitionId.c_str());
        retassure(instance = _factory(instanceId, *def), "worker factory returned no worker for %s",instanceId.c_str());

        if (!_registry->tryRegisterInstance(instance)) {
            //a concurrent start registered it first
            info("Plugin instance %s was registered concurrently, keeping the first one",instanceId.c_str());
            return true;
        }

        if (!instance->start(startCtx)) {
            warning("Plugin instance %s failed to start",instanceId.c_str());
            return false;
        }
        return true;
    } catch (tihmstar::exception &e) {
        error("Failed to create/start plugin instance %s with error=%d (%s)",instanceId.c_str(),e.code(),e.what());
    } catch (std::exception &e) {
        error("Failed to create/start plugin instance %s (%s)",instanceId.c_str(),e.what());
    }
    return false;
}

bool PluginOrchestrator::stopInstance(const std::string &instanceId) noexcept{
    std::shared_ptr<PluginWorker> instance;
    if (!(instance = _registry->getInstance(instanceId))) {
        warning("Plugin instance %s not found",instanceId.c_str());
        return false;
    }
    info("Stopping plugin instance %s",instanceId.c_str());
    instance->stop();
    _registry->removeInstance(instanceId);
    forgetThrottles(instanceId);
    return true;
}

void PluginOrchestrator::startEnabledDefinitions(const PluginContext &ctx) noexcept{
    std::vector<PluginDefinition> defs;
    try {
        defs = _registry->getDefinitions();
    } catch (tihmstar::exception &e) {
        error("Failed to list plugin definitions with error=%d (%s)",e.code(),e.what());
        return;
    }
    for (auto &def : defs) {
        if (!def.enabled) continue;
        info("Starting plugin definition %s",def.id.c_str());
        if (!startInstance(def.id, ctx)) {
            error("Plugin definition %s did not start",def.id.c_str());
        }
    }
}

void PluginOrchestrator::stopAll() noexcept{
    std::vector<std::shared_ptr<PluginWorker>> instances;
    try {
        instances = _registry->getInstances();
    } catch (tihmstar::exception &e) {
        error("Failed to list plugin instances with error=%d (%s)",e.code(),e.what());
        return;
    }
    for (auto &inst : instances) {
        info("Stopping plugin %s",inst->id().c_str());
        inst->stop();
        _registry->removeInstance(inst->id());
        forgetThrottles(inst->id());
    }
}

#pragma mark health monitor
void PluginOrchestrator::startMonitoring(const PluginContext &ctx){
    std::unique_lock<std::mutex> ul(_monitorLck);
    if (_monitor) {
        debug("PluginOrchestrator: health monitor already running");
        return;
    }
    info("PluginOrchestrator: starting health monitor (interval=%llds backoff=%llds)",
         (long long)_config.monitorInterval.count(),(long long)_config.restartBackoff.count());
    _monitor = std::make_unique<HealthMonitor>(this, ctx);
    _monitor->startLoop();
}

void PluginOrchestrator::stopMonitoring() noexcept{
    std::unique_ptr<HealthMonitor> monitor;
    {
        std::unique_lock<std::mutex> ul(_monitorLck);
        monitor = std::move(_monitor);
    }
    //destruction stops the loop and waits for the in-flight tick
    monitor.reset();
}

bool PluginOrchestrator::isMonitoring() noexcept{
    std::unique_lock<std::mutex> ul(_monitorLck);
    return _monitor != nullptr;
}

void PluginOrchestrator::monitorTick(const PluginContext &ctx) noexcept{
    std::vector<std::shared_ptr<PluginWorker>> instances;
    try {
        instances = _registry->getInstances();
    } catch (tihmstar::exception &e) {
        warning("Plugin monitor failed to list instances with error=%d (%s)",e.code(),e.what());
        return;
    }
    for (auto &inst : instances) {
        try {
            monitorInstance(inst, ctx);
        } catch (tihmstar::exception &e) {
            warning("Error while monitoring plugin %s with error=%d (%s)",inst->id().c_str(),e.code(),e.what());
        } catch (std::exception &e) {
            warning("Error while monitoring plugin %s (%s)",inst->id().c_str(),e.what());
        }
    }
}

void PluginOrchestrator::monitorInstance(std::shared_ptr<PluginWorker> instance, const PluginContext &ctx){
    const std::string &instanceId = instance->id();
    const PluginDefinition &def = instance->definition();
    std::chrono::seconds interval = _config.monitorInterval;
    bool healthy = false;

    if (instance->state() != PluginWorker::PLUGIN_STATE_RUNNING) return;

    if (def.healthCheckIntervalSeconds && *def.healthCheckIntervalSeconds > 0) {
        interval = std::chrono::seconds(*def.healthCheckIntervalSeconds);
    }

    {
        std::unique_lock<std::mutex> ul(_throttleLck);
        auto now = _clock();
        auto last = _lastHealthCheck.find(instanceId);
        if (last != _lastHealthCheck.end() && now - last->second < interval) return;
        _lastHealthCheck[instanceId] = now;
    }

    try {
        healthy = instance->checkHealth();
    } catch (tihmstar::exception &e) {
        warning("Health check for plugin %s threw error=%d (%s)",instanceId.c_str(),e.code(),e.what());
        healthy = false;
    } catch (std::exception &e) {
        warning("Health check for plugin %s threw (%s)",instanceId.c_str(),e.what());
        healthy = false;
    }
    if (healthy) return;

    warning("Plugin %s reported unhealthy; applying restart policy %s",instanceId.c_str(),PluginDefinition::restartPolicyName(def.restartPolicy));
    if (_metrics) _metrics->recordPluginUnhealthy(instanceId);

    if (def.restartPolicy == PluginDefinition::RESTART_NEVER) {
        info("Restart disabled for plugin %s",instanceId.c_str());
        return;
    }

    {
        std::unique_lock<std::mutex> ul(_throttleLck);
        auto now = _clock();
        auto last = _lastRestart.find(instanceId);
        if (last != _lastRestart.end() && now - last->second < _config.restartBackoff) {
            info("Skipping restart for %s due to recent restart",instanceId.c_str());
            return;
        }
        _lastRestart[instanceId] = now;
    }

    {
        PluginContext restartCtx = instance->lastStartContext().value_or(ctx);
        instance->stop();
        if (instance->start(restartCtx)) {
            info("Plugin %s restarted successfully",instanceId.c_str());
            if (_metrics) _metrics->recordPluginRestart(instanceId);
        } else {
            error("Failed to restart plugin %s",instanceId.c_str());
        }
    }
}
