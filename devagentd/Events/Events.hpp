//
//  Events.hpp
//  devagentd
//
//  Created on 17.10.26.
//

#ifndef Events_hpp
#define Events_hpp

#include "../Devices/Device.hpp"

struct DeviceConnectedEvent{
    static constexpr const char *name = "DeviceConnected";
    Device device;
};

struct DeviceDisconnectedEvent{
    static constexpr const char *name = "DeviceDisconnected";
    Device device;
};

struct SessionStartedEvent{
    static constexpr const char *name = "SessionStarted";
    Device device;
    Session session;
};

struct SessionStoppedEvent{
    static constexpr const char *name = "SessionStopped";
    Device device;
    Session session;
};

struct SessionFailedEvent{
    static constexpr const char *name = "SessionFailed";
    Device device;
    std::string reason;
};

#endif /* Events_hpp */
