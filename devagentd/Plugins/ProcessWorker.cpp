//
//  ProcessWorker.cpp
//  devagentd
//
//  Created on 17.10.26.
//

#include "ProcessWorker.hpp"
#include "TemplateExpander.hpp"
#include "../DAException.hpp"

#include <libgeneral/macros.h>

#include <algorithm>

#include <ctype.h>

static bool is_blank(const std::string &str){
    return std::all_of(str.begin(), str.end(), [](char c){return isspace((unsigned char)c);});
}

#pragma mark ProcessWorker
ProcessWorker::ProcessWorker(std::string id, PluginDefinition definition)
: PluginWorker(id, definition)
{
    //
}

ProcessWorker::~ProcessWorker(){
    std::unique_lock<std::mutex> ul(_processLck);
    _process.reset();
}

ChildProcess::LaunchInfo ProcessWorker::launchInfo(const PluginContext &ctx){
    ChildProcess::LaunchInfo ret;
    ret.executable = TemplateExpander::expand(_definition.executable, ctx);
    ret.arguments = TemplateExpander::expandList(_definition.arguments, ctx);
    ret.workingDirectory = TemplateExpander::expand(_definition.workingDirectory.value_or(ctx.installFolder), ctx);
    ret.environment = TemplateExpander::expandMap(_definition.environmentVariables, ctx);
    return ret;
}

ChildProcess::LaunchInfo ProcessWorker::healthCheckLaunchInfo(const PluginContext &ctx){
    ChildProcess::LaunchInfo ret;
    ret.executable = TemplateExpander::expand(*_definition.healthCheckCommand, ctx);
    ret.arguments = TemplateExpander::expandList(_definition.healthCheckArguments, ctx);
    return ret;
}

std::chrono::milliseconds ProcessWorker::healthCheckTimeout(){
    int seconds = DEFAULT_HEALTHCHECK_TIMEOUT_SECONDS;
    if (_definition.healthCheckTimeoutSeconds) {
        seconds = *_definition.healthCheckTimeoutSeconds;
    } else if (auto ctx = lastStartContext(); ctx && ctx->healthCheckTimeoutSeconds) {
        seconds = *ctx->healthCheckTimeoutSeconds;
    }
    return std::chrono::milliseconds(std::max(100, seconds * 1000));
}

bool ProcessWorker::start(const PluginContext &ctx) noexcept{
    std::string instanceId = _id;
    try {
        rememberContext(ctx);
        if (is_blank(_definition.executable)) {
            retcustomerror(DAException_launch_failed, "%s plugin %s has no executable configured",typeName(),_id.c_str());
        }
        ChildProcess::LaunchInfo launch = launchInfo(ctx);

        std::unique_lock<std::mutex> ul(_processLck);
        if (_process && _process->isRunning()) {
            info("%s plugin %s is already running (pid=%d)",typeName(),_id.c_str(),_process->pid());
            return true;
        }
        _process = std::make_unique<ChildProcess>(launch, [instanceId](const std::string &line, bool isStderr){
            if (isStderr) {
                warning("[%s] %s",instanceId.c_str(),line.c_str());
            } else {
                info("[%s] %s",instanceId.c_str(),line.c_str());
            }
        });
        info("%s plugin %s started (pid=%d)",typeName(),_id.c_str(),_process->pid());
    } catch (tihmstar::exception &e) {
        error("Failed to start %s plugin %s with error=%d (%s)",typeName(),_id.c_str(),e.code(),e.what());
        setState(PLUGIN_STATE_ERROR);
        return false;
    } catch (std::exception &e) {
        error("Failed to start %s plugin %s (%s)",typeName(),_id.c_str(),e.what());
        setState(PLUGIN_STATE_ERROR);
        return false;
    }
    setState(PLUGIN_STATE_RUNNING);
    return true;
}

void ProcessWorker::stop() noexcept{
    {
        std::unique_lock<std::mutex> ul(_processLck);
        if (_process) {
            if (_process->isRunning()) {
                info("Killing process for %s plugin %s",typeName(),_id.c_str());
                if (!_process->killTree(std::chrono::milliseconds(WORKER_STOP_TIMEOUT_MS))) {
                    warning("%s plugin %s did not exit in time",typeName(),_id.c_str());
                }
            }
            _process.reset();
        }
    }
    setState(PLUGIN_STATE_STOPPED);
}

bool ProcessWorker::checkHealth(){
    if (_definition.healthCheckCommand && !is_blank(*_definition.healthCheckCommand)) {
        PluginContext ctx = lastStartContext().value_or(PluginContext{});
        std::chrono::milliseconds timeout = healthCheckTimeout();
        try {
            std::optional<int> exitCode = ChildProcess::runWithTimeout(healthCheckLaunchInfo(ctx), timeout);
            if (!exitCode) {
                warning("Health check for %s timed out after %lld ms",_id.c_str(),(long long)timeout.count());
                return false;
            }
            debug("Health check for %s exited with %d",_id.c_str(),*exitCode);
            return *exitCode == 0;
        } catch (tihmstar::exception &e) {
            warning("Health check for %s could not run with error=%d (%s)",_id.c_str(),e.code(),e.what());
            return false;
        }
    }

    std::unique_lock<std::mutex> ul(_processLck);
    return _process && _process->isRunning();
}

std::optional<pid_t> ProcessWorker::pid(){
    std::unique_lock<std::mutex> ul(_processLck);
    if (!_process) return std::nullopt;
    return _process->pid();
}
