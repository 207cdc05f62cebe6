//
//  Device.cpp
//  devagentd
//
//  Created on 17.10.26.
//

#include "Device.hpp"
#include "../sysconf/plistjson.hpp"

#include <libgeneral/macros.h>

#include <string.h>
#include <strings.h>
#include <stdio.h>
#include <time.h>

#pragma mark timestamps
Timestamp timestamp_now() noexcept{
    return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

std::string timestamp_to_string(Timestamp ts){
    int64_t msecs = ts.time_since_epoch().count();
    time_t secs = (time_t)(msecs / 1000);
    int millis = (int)(msecs % 1000);
    struct tm tp = {};
    char buf[64] = {};
    if (millis < 0) {
        millis += 1000;
        secs -= 1;
    }
    assure(gmtime_r(&secs, &tp));
    assure(strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tp));
    snprintf(buf+strlen(buf), sizeof(buf)-strlen(buf), ".%03dZ", millis);
    return buf;
}

Timestamp timestamp_from_string(const std::string &str){
    struct tm tp = {};
    int millis = 0;
    int consumed = 0;
    const char *frac = NULL;

    retassure(sscanf(str.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &tp.tm_year, &tp.tm_mon, &tp.tm_mday,
                     &tp.tm_hour, &tp.tm_min, &tp.tm_sec, &consumed) == 6, "malformed timestamp '%s'",str.c_str());
    tp.tm_year -= 1900;
    tp.tm_mon -= 1;

    //fractional part may carry any number of digits, only milliseconds are kept
    frac = str.c_str() + consumed;
    if (*frac == '.') {
        int digits = 0;
        for (frac++; *frac >= '0' && *frac <= '9'; frac++, digits++) {
            if (digits < 3) millis = millis*10 + (*frac - '0');
        }
        for (; digits < 3; digits++) millis *= 10;
    }

    return Timestamp(std::chrono::milliseconds((int64_t)timegm(&tp) * 1000 + millis));
}

#pragma mark Session
Session::Session()
: appiumPort(0), startedAt(timestamp_now()), status(SESSION_STARTING)
{
    //
}

std::vector<uint16_t> Session::ports() const{
    std::vector<uint16_t> ret{appiumPort};
    if (wdaLocalPort) ret.push_back(*wdaLocalPort);
    if (mjpegServerPort) ret.push_back(*mjpegServerPort);
    if (systemPort) ret.push_back(*systemPort);
    return ret;
}

plist_t Session::toPlist() const{
    plist_t p_session = plist_new_dict();
    plistjson_dict_set_string(p_session, "sessionId", sessionId);
    plistjson_dict_set_int(p_session, "appiumPort", appiumPort);
    if (wdaLocalPort) plistjson_dict_set_int(p_session, "wdaLocalPort", *wdaLocalPort);
    if (mjpegServerPort) plistjson_dict_set_int(p_session, "mjpegServerPort", *mjpegServerPort);
    if (systemPort) plistjson_dict_set_int(p_session, "systemPort", *systemPort);
    plistjson_dict_set_string(p_session, "startedAt", timestamp_to_string(startedAt));
    if (processId) plistjson_dict_set_int(p_session, "processId", *processId);
    plistjson_dict_set_string(p_session, "status", statusName(status));
    return p_session;
}

Session Session::fromPlist(plist_t p_session){
    Session ret;
    retassure(plist_get_node_type(p_session) == PLIST_DICT, "session is not an object");
    ret.sessionId = plistjson_dict_string(p_session, "sessionId").value_or("");
    ret.appiumPort = (uint16_t)plistjson_dict_int(p_session, "appiumPort").value_or(0);
    if (auto v = plistjson_dict_int(p_session, "wdaLocalPort")) ret.wdaLocalPort = (uint16_t)*v;
    if (auto v = plistjson_dict_int(p_session, "mjpegServerPort")) ret.mjpegServerPort = (uint16_t)*v;
    if (auto v = plistjson_dict_int(p_session, "systemPort")) ret.systemPort = (uint16_t)*v;
    if (auto v = plistjson_dict_string(p_session, "startedAt")) ret.startedAt = timestamp_from_string(*v);
    if (auto v = plistjson_dict_int(p_session, "processId")) ret.processId = (pid_t)*v;
    if (auto v = plistjson_dict_string(p_session, "status")) ret.status = statusFromName(*v);
    return ret;
}

const char *Session::statusName(session_status status) noexcept{
    switch (status) {
        case SESSION_STARTING:  return "Starting";
        case SESSION_RUNNING:   return "Running";
        case SESSION_FAILED:    return "Failed";
        case SESSION_STOPPED:   return "Stopped";
    }
    return "Unknown";
}

Session::session_status Session::statusFromName(const std::string &name){
    for (int i = SESSION_STARTING; i <= SESSION_STOPPED; i++) {
        if (!strcasecmp(name.c_str(), statusName((session_status)i))) return (session_status)i;
    }
    reterror("unknown session status '%s'",name.c_str());
}

#pragma mark Device
Device::Device()
: platform(PLATFORM_ANDROID), type(TYPE_PHYSICAL), name("Unknown"), state(STATE_CONNECTED)
, connectedAt(timestamp_now()), lastSeen(connectedAt)
{
    //
}

Device::Device(std::string id_, device_platform platform_, std::string name_, device_type type_)
: id(id_), platform(platform_), type(type_), name(name_), state(STATE_CONNECTED)
, connectedAt(timestamp_now()), lastSeen(connectedAt)
{
    //
}

plist_t Device::toPlist() const{
    plist_t p_device = plist_new_dict();
    plistjson_dict_set_string(p_device, "id", id);
    plistjson_dict_set_string(p_device, "platform", platformName(platform));
    plistjson_dict_set_string(p_device, "type", typeName(type));
    plistjson_dict_set_string(p_device, "name", name);
    plistjson_dict_set_string(p_device, "state", stateName(state));
    plistjson_dict_set_string(p_device, "connectedAt", timestamp_to_string(connectedAt));
    plistjson_dict_set_string(p_device, "lastSeen", timestamp_to_string(lastSeen));
    if (disconnectedAt) plistjson_dict_set_string(p_device, "disconnectedAt", timestamp_to_string(*disconnectedAt));
    if (session) plist_dict_set_item(p_device, "appiumSession", session->toPlist());
    return p_device;
}

Device Device::fromPlist(plist_t p_device){
    Device ret;
    plist_t p_session = NULL;
    retassure(plist_get_node_type(p_device) == PLIST_DICT, "device is not an object");
    ret.id = plistjson_dict_string(p_device, "id").value_or("");
    retassure(ret.id.size(), "device without id");
    if (auto v = plistjson_dict_string(p_device, "platform")) ret.platform = platformFromName(*v);
    if (auto v = plistjson_dict_string(p_device, "type")) ret.type = typeFromName(*v);
    if (auto v = plistjson_dict_string(p_device, "name")) ret.name = *v;
    if (auto v = plistjson_dict_string(p_device, "state")) ret.state = stateFromName(*v);
    if (auto v = plistjson_dict_string(p_device, "connectedAt")) ret.connectedAt = timestamp_from_string(*v);
    if (auto v = plistjson_dict_string(p_device, "lastSeen")) ret.lastSeen = timestamp_from_string(*v);
    if (auto v = plistjson_dict_string(p_device, "disconnectedAt")) ret.disconnectedAt = timestamp_from_string(*v);
    if ((p_session = plist_dict_get_item(p_device, "appiumSession")) && plist_get_node_type(p_session) != PLIST_NULL) {
        ret.session = Session::fromPlist(p_session);
    }
    return ret;
}

const char *Device::platformName(device_platform platform) noexcept{
    switch (platform) {
        case PLATFORM_ANDROID:  return "Android";
        case PLATFORM_IOS:      return "iOS";
    }
    return "Unknown";
}

const char *Device::typeName(device_type type) noexcept{
    switch (type) {
        case TYPE_PHYSICAL:     return "Physical";
        case TYPE_EMULATOR:     return "Emulator";
        case TYPE_SIMULATOR:    return "Simulator";
    }
    return "Unknown";
}

const char *Device::stateName(device_state state) noexcept{
    switch (state) {
        case STATE_CONNECTED:       return "Connected";
        case STATE_DISCONNECTED:    return "Disconnected";
        case STATE_OFFLINE:         return "Offline";
        case STATE_UNAUTHORIZED:    return "Unauthorized";
    }
    return "Unknown";
}

Device::device_platform Device::platformFromName(const std::string &name){
    if (!strcasecmp(name.c_str(), "Android")) return PLATFORM_ANDROID;
    if (!strcasecmp(name.c_str(), "iOS")) return PLATFORM_IOS;
    reterror("unknown platform '%s'",name.c_str());
}

Device::device_type Device::typeFromName(const std::string &name){
    for (int i = TYPE_PHYSICAL; i <= TYPE_SIMULATOR; i++) {
        if (!strcasecmp(name.c_str(), typeName((device_type)i))) return (device_type)i;
    }
    reterror("unknown device type '%s'",name.c_str());
}

Device::device_state Device::stateFromName(const std::string &name){
    for (int i = STATE_CONNECTED; i <= STATE_UNAUTHORIZED; i++) {
        if (!strcasecmp(name.c_str(), stateName((device_state)i))) return (device_state)i;
    }
    reterror("unknown device state '%s'",name.c_str());
}
