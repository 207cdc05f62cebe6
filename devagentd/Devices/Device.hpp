//
//  Device.hpp
//  devagentd
//
//  Created on 17.10.26.
//

#ifndef Device_hpp
#define Device_hpp

#include <plist/plist.h>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <stdint.h>
#include <sys/types.h>

using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

Timestamp timestamp_now() noexcept;
std::string timestamp_to_string(Timestamp ts);
Timestamp timestamp_from_string(const std::string &str);

class Session{
public:
    enum session_status{
        SESSION_STARTING = 0,
        SESSION_RUNNING,
        SESSION_FAILED,
        SESSION_STOPPED
    };

    std::string sessionId;
    uint16_t appiumPort;
    std::optional<uint16_t> wdaLocalPort;   //iOS
    std::optional<uint16_t> mjpegServerPort; //iOS
    std::optional<uint16_t> systemPort;     //Android
    Timestamp startedAt;
    std::optional<pid_t> processId;
    session_status status;

    Session();

    std::vector<uint16_t> ports() const;

    plist_t toPlist() const;
    static Session fromPlist(plist_t p_session);

    static const char *statusName(session_status status) noexcept;
    static session_status statusFromName(const std::string &name);

    bool operator==(const Session &o) const = default;
};

class Device{
public:
    enum device_platform{
        PLATFORM_ANDROID = 0,
        PLATFORM_IOS
    };
    enum device_type{
        TYPE_PHYSICAL = 0,
        TYPE_EMULATOR,
        TYPE_SIMULATOR
    };
    enum device_state{
        STATE_CONNECTED = 0,
        STATE_DISCONNECTED,
        STATE_OFFLINE,
        STATE_UNAUTHORIZED
    };

    std::string id; //serial (Android) or UDID (iOS)
    device_platform platform;
    device_type type;
    std::string name;
    device_state state;
    Timestamp connectedAt;
    Timestamp lastSeen;
    std::optional<Timestamp> disconnectedAt;
    std::optional<Session> session;

    Device();
    Device(std::string id_, device_platform platform_, std::string name_ = "Unknown", device_type type_ = TYPE_PHYSICAL);

    plist_t toPlist() const;
    static Device fromPlist(plist_t p_device);

    static const char *platformName(device_platform platform) noexcept;
    static const char *typeName(device_type type) noexcept;
    static const char *stateName(device_state state) noexcept;
    static device_platform platformFromName(const std::string &name);
    static device_type typeFromName(const std::string &name);
    static device_state stateFromName(const std::string &name);

    bool operator==(const Device &o) const = default;
};

#endif /* Device_hpp */
