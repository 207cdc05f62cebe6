//
//  ProcessWorker.hpp
//  devagentd
//
//  Created on 17.10.26.
//

#ifndef ProcessWorker_hpp
#define ProcessWorker_hpp

#include "PluginWorker.hpp"
#include "../Process/ChildProcess.hpp"

#include <chrono>
#include <memory>

#define DEFAULT_HEALTHCHECK_TIMEOUT_SECONDS 5
#define WORKER_STOP_TIMEOUT_MS 5000

/*
 Runs the definition's executable directly
 */
class ProcessWorker : public PluginWorker{
protected:
    std::mutex _processLck;
    std::unique_ptr<ChildProcess> _process;

    std::chrono::milliseconds healthCheckTimeout();

public:
    ProcessWorker(std::string id, PluginDefinition definition);
    virtual ~ProcessWorker() override;

    /*
     Command lines after template expansion
     */
    virtual ChildProcess::LaunchInfo launchInfo(const PluginContext &ctx);
    virtual ChildProcess::LaunchInfo healthCheckLaunchInfo(const PluginContext &ctx);

    virtual bool start(const PluginContext &ctx) noexcept override;
    virtual void stop() noexcept override;
    virtual bool checkHealth() override;

    std::optional<pid_t> pid();
};

#endif /* ProcessWorker_hpp */
