//
//  DeviceListener.hpp
//  devagentd
//
//  Created on 17.10.26.
//

#ifndef DeviceListener_hpp
#define DeviceListener_hpp

#include "Device.hpp"

#include <mutex>
#include <string>

class EventBus;
class DeviceRegistry;
class DeviceMetrics;
class SessionManager;

/*
 Entry point for device detectors.
 Turns attach/detach notifications into bus events, session lifecycle and
 registry updates
 */
class DeviceListener{
    EventBus *_bus; //not owned
    DeviceRegistry *_registry; //not owned
    SessionManager *_sessions; //not owned, may be null
    DeviceMetrics *_metrics; //not owned, may be null
    bool _autoStartSessions;
    std::mutex _attachLck;

public:
    DeviceListener(EventBus *bus, DeviceRegistry *registry, SessionManager *sessions, DeviceMetrics *metrics, bool autoStartSessions);
    ~DeviceListener();

    /*
     Ignored if the registry already lists dev as connected
     */
    void deviceAttached(Device dev) noexcept;
    void deviceDetached(const std::string &deviceId) noexcept;

    /*
     Shutdown: stops every session and marks all connected devices
     disconnected. No events are published
     */
    void disconnectAll() noexcept;
};

#endif /* DeviceListener_hpp */
