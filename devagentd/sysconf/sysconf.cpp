//
//  sysconf.cpp
//  devagentd
//
//  Created on 17.10.26.
//

#include "sysconf.hpp"
#include "plistjson.hpp"
#include "../DAException.hpp"

#include <libgeneral/macros.h>

#include <set>

#include <stdint.h>
#include <sys/stat.h>

#define MAX_PORT 65535

static int config_int(plist_t dict, const char *key, int defaultValue){
    std::optional<int64_t> val = plistjson_dict_int(dict, key);
    if (!val) return defaultValue;
    retassure(*val >= INT32_MIN && *val <= INT32_MAX, "'%s' is out of range",key);
    return (int)*val;
}

#pragma mark Config
Config::Config() :
//config
installFolder(DEFAULT_INSTALL_FOLDER),
enableDeviceListener(true),
autoStartAppium(true),
healthCheckTimeoutSeconds(5),
pluginMonitorIntervalSeconds(10),
pluginRestartBackoffSeconds(5),
appiumPortStart(4723),
appiumPortEnd(4823),
//commandline
configPath(DEFAULT_CONFIG_PATH),
daemonize(false),
useLogfile(false),
debugLevel(0)
{
    SessionManagerConfig sessionDefaults;
    sessionExecutable = sessionDefaults.executable;
    sessionArguments = sessionDefaults.arguments;
}

void Config::load(){
    plist_t p_config = NULL;
    cleanup([&]{
        safeFreeCustom(p_config, plist_free);
    });
    struct stat st = {};

    if (stat(configPath.c_str(), &st)) {
        warning("Config file '%s' does not exist, using defaults",configPath.c_str());
        return;
    }
    try {
        p_config = plistjson_read_file(configPath.c_str());
    } catch (tihmstar::exception &e) {
        retcustomerror(DAException_bad_config, "Failed to parse config '%s': %s",configPath.c_str(),e.what());
    }
    loadFromPlist(p_config);
    info("Loaded config from %s",configPath.c_str());
}

void Config::loadFromString(const std::string &json){
    plist_t p_config = NULL;
    cleanup([&]{
        safeFreeCustom(p_config, plist_free);
    });
    try {
        p_config = plistjson_from_string(json);
    } catch (tihmstar::exception &e) {
        retcustomerror(DAException_bad_config, "Failed to parse config: %s",e.what());
    }
    loadFromPlist(p_config);
}

void Config::loadFromPlist(plist_t p_config){
    if (plist_get_node_type(p_config) != PLIST_DICT) {
        retcustomerror(DAException_bad_config, "config root is not an object");
    }
    try {
        if (auto v = plistjson_dict_string(p_config, "installFolder")) installFolder = *v;
        enableDeviceListener = plistjson_dict_bool(p_config, "enableDeviceListener").value_or(enableDeviceListener);
        autoStartAppium = plistjson_dict_bool(p_config, "autoStartAppium").value_or(autoStartAppium);
        healthCheckTimeoutSeconds = config_int(p_config, "healthCheckTimeoutSeconds", healthCheckTimeoutSeconds);
        pluginMonitorIntervalSeconds = config_int(p_config, "pluginMonitorIntervalSeconds", pluginMonitorIntervalSeconds);
        pluginRestartBackoffSeconds = config_int(p_config, "pluginRestartBackoffSeconds", pluginRestartBackoffSeconds);

        if (plist_t p_ports = plist_dict_get_item(p_config, "portRanges")) {
            appiumPortStart = config_int(p_ports, "appiumStart", appiumPortStart);
            appiumPortEnd = config_int(p_ports, "appiumEnd", appiumPortEnd);
        }

        if (auto v = plistjson_dict_string(p_config, "sessionExecutable")) sessionExecutable = *v;
        if (plist_dict_get_item(p_config, "sessionArguments")) {
            sessionArguments = plistjson_dict_string_array(p_config, "sessionArguments");
        }

        if (plist_t p_registry = plist_dict_get_item(p_config, "deviceRegistry")) {
            deviceRegistry.enabled = plistjson_dict_bool(p_registry, "enabled").value_or(deviceRegistry.enabled);
            if (auto v = plistjson_dict_string(p_registry, "filePath")) deviceRegistry.filePath = *v;
            deviceRegistry.autoSave = plistjson_dict_bool(p_registry, "autoSave").value_or(deviceRegistry.autoSave);
            deviceRegistry.saveInterval = std::chrono::seconds(config_int(p_registry, "saveIntervalSeconds", (int)deviceRegistry.saveInterval.count()));
        }

        if (plist_t p_plugins = plist_dict_get_item(p_config, "plugins")) {
            retassure(plist_get_node_type(p_plugins) == PLIST_ARRAY, "'plugins' is not an array");
            plugins.clear();
            for (uint32_t i = 0; i < plist_array_get_size(p_plugins); i++) {
                plugins.push_back(PluginDefinition::fromPlist(plist_array_get_item(p_plugins, i)));
            }
        }
    } catch (tihmstar::DAException_bad_config &e) {
        throw;
    } catch (tihmstar::exception &e) {
        retcustomerror(DAException_bad_config, "Invalid config: %s",e.what());
    }
}

std::vector<std::string> Config::validationErrors() const{
    std::vector<std::string> errors;
    std::set<std::string> seenIds;

    if (installFolder.empty()) errors.push_back("installFolder cannot be empty");
    if (healthCheckTimeoutSeconds < 1) errors.push_back("healthCheckTimeoutSeconds must be >= 1");
    if (pluginMonitorIntervalSeconds < 1) errors.push_back("pluginMonitorIntervalSeconds must be >= 1");
    if (pluginRestartBackoffSeconds < 1) errors.push_back("pluginRestartBackoffSeconds must be >= 1");
    if (appiumPortStart < 1 || appiumPortStart > MAX_PORT) errors.push_back("portRanges.appiumStart must be within 1-65535");
    if (appiumPortEnd < 1 || appiumPortEnd > MAX_PORT) errors.push_back("portRanges.appiumEnd must be within 1-65535");
    if (appiumPortStart > appiumPortEnd) errors.push_back("portRanges.appiumStart must not be greater than portRanges.appiumEnd");
    if (deviceRegistry.enabled && deviceRegistry.filePath.empty()) errors.push_back("deviceRegistry.filePath cannot be empty");
    if (deviceRegistry.saveInterval.count() < 1) errors.push_back("deviceRegistry.saveIntervalSeconds must be >= 1");
    if (autoStartAppium && sessionExecutable.empty()) errors.push_back("sessionExecutable cannot be empty");

    for (size_t i = 0; i < plugins.size(); i++) {
        const PluginDefinition &def = plugins[i];
        if (def.id.empty()) {
            errors.push_back("Plugin at index " + std::to_string(i) + " has no id");
            continue;
        }
        if (!seenIds.insert(def.id).second) {
            errors.push_back("Plugin id '" + def.id + "' is used more than once");
        }
        if (def.healthCheckIntervalSeconds && *def.healthCheckIntervalSeconds < 1) {
            errors.push_back("Plugin '" + def.id + "' healthCheckIntervalSeconds must be >= 1");
        }
        if (def.healthCheckTimeoutSeconds && *def.healthCheckTimeoutSeconds < 1) {
            errors.push_back("Plugin '" + def.id + "' healthCheckTimeoutSeconds must be >= 1");
        }
    }
    return errors;
}

void Config::validate() const{
    std::vector<std::string> errors = validationErrors();
    if (errors.empty()) return;
    error("Configuration validation failed with %zu error(s):",errors.size());
    for (auto &e : errors) {
        error("  - %s",e.c_str());
    }
    retcustomerror(DAException_bad_config, "Configuration validation failed with %zu error(s)",errors.size());
}

SessionManagerConfig Config::sessionManagerConfig() const{
    SessionManagerConfig ret;
    ret.installFolder = installFolder;
    ret.executable = sessionExecutable;
    ret.arguments = sessionArguments;
    return ret;
}

OrchestratorConfig Config::orchestratorConfig() const{
    OrchestratorConfig ret;
    ret.monitorInterval = std::chrono::seconds(pluginMonitorIntervalSeconds);
    ret.restartBackoff = std::chrono::seconds(pluginRestartBackoffSeconds);
    ret.healthCheckTimeoutSeconds = healthCheckTimeoutSeconds;
    return ret;
}
