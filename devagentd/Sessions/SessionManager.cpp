//
//  SessionManager.cpp
//  devagentd
//
//  Created on 17.10.26.
//

#include "SessionManager.hpp"
#include "../Devices/DeviceMetrics.hpp"
#include "../Plugins/TemplateExpander.hpp"
#include "../DAException.hpp"

#include <libgeneral/macros.h>

#include <algorithm>

#define IOS_PORTS_NEEDED 3
#define ANDROID_PORTS_NEEDED 2
#define SESSION_STOP_TIMEOUT_MS 5000

#pragma mark SessionManager
SessionManager::SessionManager(PortAllocator *allocator, DeviceMetrics *metrics, SessionManagerConfig config)
: _allocator(allocator), _metrics(metrics), _config(config)
{
    assure(_allocator);
}

SessionManager::~SessionManager(){
    stopAll();
}

std::string SessionManager::sessionIdFor(const std::string &deviceId){
    std::string ret = deviceId;
    std::replace_if(ret.begin(), ret.end(), [](char c){return c == ':' || c == '-' || c == ' ';}, '_');
    return "devagentd_" + ret;
}

void SessionManager::recordFailure(Device::device_platform platform, const std::string &reason) noexcept{
    if (_metrics) _metrics->recordSessionFailed(platform, reason);
}

std::optional<Session> SessionManager::startSession(const Device &dev) noexcept{
    std::vector<uint16_t> ports;
    Session session;
    std::unique_ptr<ChildProcess> process;
    bool portsHeld = false;
    cleanup([&]{
        if (portsHeld) _allocator->release(ports);
    });

    {
        std::unique_lock<std::mutex> ul(_sessionsLck);
        if (auto s = _sessions.find(dev.id); s != _sessions.end()) {
            info("Session %s for device %s already exists",s->second.session.sessionId.c_str(),dev.id.c_str());
            return s->second.session;
        }
    }

    info("Starting session for device %s",dev.id.c_str());
    {
        size_t needed = dev.platform == Device::PLATFORM_IOS ? IOS_PORTS_NEEDED : ANDROID_PORTS_NEEDED;
        auto allocated = _allocator->allocateConsecutive(needed);
        if (!allocated) {
            error("No %zu consecutive free ports in %u-%u for device %s",needed,_allocator->minPort(),_allocator->maxPort(),dev.id.c_str());
            if (_metrics) _metrics->recordPortAllocationFailure();
            recordFailure(dev.platform, "port allocation failed");
            return std::nullopt;
        }
        ports = *allocated;
        portsHeld = true;
    }

    session.sessionId = sessionIdFor(dev.id);
    session.appiumPort = ports.at(0);
    if (dev.platform == Device::PLATFORM_IOS) {
        session.wdaLocalPort = ports.at(1);
        session.mjpegServerPort = ports.at(2);
        info("Allocated iOS ports appium=%u wda=%u mjpeg=%u",session.appiumPort,*session.wdaLocalPort,*session.mjpegServerPort);
    } else {
        session.systemPort = ports.at(1);
        info("Allocated Android ports appium=%u system=%u",session.appiumPort,*session.systemPort);
    }

    try {
        PluginContext ctx;
        ChildProcess::LaunchInfo launch;
        std::string sessionId = session.sessionId;

        ctx.installFolder = _config.installFolder;
        ctx.variables["deviceId"] = dev.id;
        ctx.variables["deviceName"] = dev.name;
        ctx.variables["platform"] = Device::platformName(dev.platform);
        ctx.variables["appiumPort"] = std::to_string(session.appiumPort);
        ctx.variables["wdaPort"] = std::to_string(session.wdaLocalPort.value_or(0));
        ctx.variables["mjpegPort"] = std::to_string(session.mjpegServerPort.value_or(0));
        ctx.variables["systemPort"] = std::to_string(session.systemPort.value_or(0));

        launch.executable = TemplateExpander::expand(_config.executable, ctx);
        launch.arguments = TemplateExpander::expandList(_config.arguments, ctx);
        launch.workingDirectory = _config.installFolder;

        process = std::make_unique<ChildProcess>(launch, [sessionId](const std::string &line, bool isStderr){
            if (isStderr) {
                warning("[%s] %s",sessionId.c_str(),line.c_str());
            } else {
                info("[%s] %s",sessionId.c_str(),line.c_str());
            }
        });
    } catch (tihmstar::exception &e) {
        error("Failed to launch session for device %s with error=%d (%s)",dev.id.c_str(),e.code(),e.what());
        recordFailure(dev.platform, "launch failed");
        return std::nullopt;
    } catch (std::exception &e) {
        error("Failed to launch session for device %s (%s)",dev.id.c_str(),e.what());
        recordFailure(dev.platform, "launch failed");
        return std::nullopt;
    }

    if (process->waitForExit(_config.startupGrace)) {
        error("Session process for device %s exited during startup with code %d",dev.id.c_str(),process->exitCode().value_or(-1));
        recordFailure(dev.platform, "exited during startup");
        return std::nullopt;
    }

    session.processId = process->pid();
    session.startedAt = timestamp_now();
    session.status = Session::SESSION_RUNNING;

    {
        std::unique_lock<std::mutex> ul(_sessionsLck);
        auto [entry, inserted] = _sessions.try_emplace(dev.id);
        if (!inserted) {
            //a concurrent start for the same device committed first
            Session existing = entry->second.session;
            ul.unlock();
            warning("Session %s for device %s was started concurrently, dropping duplicate (pid=%d)",existing.sessionId.c_str(),dev.id.c_str(),*session.processId);
            if (!process->killTree(std::chrono::milliseconds(SESSION_STOP_TIMEOUT_MS))) {
                warning("Duplicate session process %d for %s did not exit in time",*session.processId,dev.id.c_str());
            }
            process.reset();
            return existing;
        }
        entry->second = {session, dev.platform, std::move(process)};
    }
    portsHeld = false;
    if (_metrics) _metrics->recordSessionStarted(dev.platform);
    info("Session %s started for device %s on port %u (pid=%d)",session.sessionId.c_str(),dev.id.c_str(),session.appiumPort,*session.processId);
    return session;
}

bool SessionManager::stopSession(const Device &dev) noexcept{
    SessionEntry entry;
    {
        std::unique_lock<std::mutex> ul(_sessionsLck);
        auto s = _sessions.find(dev.id);
        if (s == _sessions.end()) return false;
        entry = std::move(s->second);
        _sessions.erase(s);
    }
    info("Stopping session %s",entry.session.sessionId.c_str());
    if (entry.process && !entry.process->killTree(std::chrono::milliseconds(SESSION_STOP_TIMEOUT_MS))) {
        warning("Session process %d for %s did not exit in time",entry.process->pid(),entry.session.sessionId.c_str());
    }
    entry.process.reset();
    _allocator->release(entry.session.ports());
    entry.session.status = Session::SESSION_STOPPED;
    if (_metrics) _metrics->recordSessionStopped(entry.platform);
    return true;
}

void SessionManager::stopAll() noexcept{
    std::vector<std::pair<std::string, Device::device_platform>> ids;
    {
        std::unique_lock<std::mutex> ul(_sessionsLck);
        for (auto &s : _sessions) ids.push_back({s.first, s.second.platform});
    }
    for (auto &id : ids) {
        stopSession(Device(id.first, id.second));
    }
}

std::optional<Session> SessionManager::getSession(const std::string &deviceId){
    std::unique_lock<std::mutex> ul(_sessionsLck);
    auto s = _sessions.find(deviceId);
    if (s == _sessions.end()) return std::nullopt;
    return s->second.session;
}

std::vector<Session> SessionManager::getSessions(){
    std::vector<Session> ret;
    std::unique_lock<std::mutex> ul(_sessionsLck);
    for (auto &s : _sessions) ret.push_back(s.second.session);
    return ret;
}

size_t SessionManager::sessionsCnt(){
    std::unique_lock<std::mutex> ul(_sessionsLck);
    return _sessions.size();
}
