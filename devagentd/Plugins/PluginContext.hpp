//
//  PluginContext.hpp
//  devagentd
//
//  Created on 17.10.26.
//

#ifndef PluginContext_hpp
#define PluginContext_hpp

#include "../Devices/Device.hpp"

#include <map>
#include <optional>
#include <string>

#include <strings.h>

struct case_insensitive_less{
    bool operator()(const std::string &a, const std::string &b) const noexcept{
        return strcasecmp(a.c_str(), b.c_str()) < 0;
    }
};

using variable_map = std::map<std::string, std::string, case_insensitive_less>;

/*
 Per-start variable bag used to parameterize worker commands
 */
class PluginContext{
public:
    std::string installFolder;
    variable_map variables;
    std::optional<int> healthCheckTimeoutSeconds;
    std::optional<Device> device;

    std::optional<std::string> deviceId() const{
        auto v = variables.find("deviceId");
        if (v == variables.end() || v->second.empty()) return std::nullopt;
        return v->second;
    }

    static PluginContext forDevice(const PluginContext &base, const Device &dev){
        PluginContext ret = base;
        ret.device = dev;
        ret.variables["device"] = dev.name;
        ret.variables["deviceId"] = dev.id;
        ret.variables["deviceName"] = dev.name;
        ret.variables["platform"] = Device::platformName(dev.platform);
        ret.variables["deviceType"] = Device::typeName(dev.type);
        return ret;
    }
};

#endif /* PluginContext_hpp */
