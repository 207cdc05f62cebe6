//
//  PluginOrchestrator.hpp
//  devagentd
//
//  Created on 17.10.26.
//

#ifndef PluginOrchestrator_hpp
#define PluginOrchestrator_hpp

#include "PluginRegistry.hpp"
#include "../Devices/DeviceMetrics.hpp"

#include <libgeneral/Manager.hpp>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

struct OrchestratorConfig{
    std::chrono::seconds monitorInterval = std::chrono::seconds(10);
    std::chrono::seconds restartBackoff = std::chrono::seconds(5);
    int healthCheckTimeoutSeconds = 5;
};

class PluginOrchestrator{
public:
    using worker_factory = std::function<std::shared_ptr<PluginWorker>(const std::string &instanceId, const PluginDefinition &definition)>;
    using clock_source = std::function<std::chrono::steady_clock::time_point()>;

private:
    class HealthMonitor : public tihmstar::Manager{
        PluginOrchestrator *_orchestrator; //not owned
        PluginContext _ctx;
        std::mutex _wakeLck;
        std::condition_variable _wakeCond;
        bool _stopRequested;

        virtual bool loopEvent() override;
        virtual void stopAction() noexcept override;
        virtual void afterLoop() noexcept override;
    public:
        HealthMonitor(PluginOrchestrator *orchestrator, PluginContext ctx);
        virtual ~HealthMonitor() override;
    };

    PluginRegistry *_registry; //not owned
    DeviceMetrics *_metrics; //not owned, may be null
    OrchestratorConfig _config;
    worker_factory _factory;
    clock_source _clock;

    std::mutex _throttleLck;
    std::map<std::string, std::chrono::steady_clock::time_point> _lastHealthCheck;
    std::map<std::string, std::chrono::steady_clock::time_point> _lastRestart;

    std::mutex _monitorLck;
    std::unique_ptr<HealthMonitor> _monitor;

    void forgetThrottles(const std::string &instanceId) noexcept;
    void monitorInstance(std::shared_ptr<PluginWorker> instance, const PluginContext &ctx);

public:
    PluginOrchestrator(PluginRegistry *registry, DeviceMetrics *metrics, OrchestratorConfig config = {},
                       worker_factory factory = nullptr, clock_source clock = nullptr);
    ~PluginOrchestrator();

    /*
     Starts an instance of a definition.
     The instance id is "<definitionId>" or "<definitionId>:<deviceId>" if ctx carries a deviceId.
     An instance that already exists and did not fail counts as started.
     */
    bool startInstance(const std::string &definitionId, const PluginContext &ctx) noexcept;
    bool stopInstance(const std::string &instanceId) noexcept;
    void startEnabledDefinitions(const PluginContext &ctx) noexcept;
    void stopAll() noexcept;

#pragma mark health monitor
    void startMonitoring(const PluginContext &ctx);
    void stopMonitoring() noexcept;
    bool isMonitoring() noexcept;

    /*
     One pass of the health monitor over all running instances
     */
    void monitorTick(const PluginContext &ctx) noexcept;

    const OrchestratorConfig &config() const noexcept {return _config;}

    static std::shared_ptr<PluginWorker> createWorker(const std::string &instanceId, const PluginDefinition &definition);
};

#endif /* PluginOrchestrator_hpp */
