//
//  SessionManager.hpp
//  devagentd
//
//  Created on 17.10.26.
//

#ifndef SessionManager_hpp
#define SessionManager_hpp

#include "PortAllocator.hpp"
#include "../Devices/Device.hpp"
#include "../Process/ChildProcess.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class DeviceMetrics;

struct SessionManagerConfig{
    std::string installFolder;
    std::string executable = "/bin/bash";
    std::vector<std::string> arguments = {
        "{installFolder}/Platform/Linux/Scripts/StartAppiumServer.sh",
        "{installFolder}",
        "{installFolder}/bin",
        "{appiumPort}",
        "{wdaPort}",
        "{mjpegPort}"
    };
    std::chrono::milliseconds startupGrace = std::chrono::milliseconds(2000);
};

class SessionManager{
    struct SessionEntry{
        Session session;
        Device::device_platform platform;
        std::unique_ptr<ChildProcess> process;
    };

    PortAllocator *_allocator; //not owned
    DeviceMetrics *_metrics; //not owned, may be null
    SessionManagerConfig _config;
    std::mutex _sessionsLck;
    std::map<std::string, SessionEntry> _sessions;

    void recordFailure(Device::device_platform platform, const std::string &reason) noexcept;

public:
    SessionManager(PortAllocator *allocator, DeviceMetrics *metrics, SessionManagerConfig config);
    ~SessionManager();

    /*
     Allocates ports and launches the session command for dev.
     Returns nothing if no ports are left or the command dies during startup.
     If dev already has a session, that session is returned
     */
    std::optional<Session> startSession(const Device &dev) noexcept;

    /*
     Returns false if dev had no session
     */
    bool stopSession(const Device &dev) noexcept;
    void stopAll() noexcept;

    std::optional<Session> getSession(const std::string &deviceId);
    std::vector<Session> getSessions();
    size_t sessionsCnt();

    static std::string sessionIdFor(const std::string &deviceId);
};

#endif /* SessionManager_hpp */
