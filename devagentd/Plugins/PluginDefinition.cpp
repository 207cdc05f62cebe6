//
//  PluginDefinition.cpp
//  devagentd
//
//  Created on 17.10.26.
//

#include "PluginDefinition.hpp"
#include "../DAException.hpp"
#include "../sysconf/plistjson.hpp"

#include <libgeneral/macros.h>

#include <strings.h>

#pragma mark PluginDefinition
PluginDefinition::PluginDefinition()
: type(PLUGIN_TYPE_PROCESS)
, restartPolicy(RESTART_ON_FAILURE), enabled(true)
, triggerOn(TRIGGER_NONE), stopOnDisconnect(false)
{
    //
}

PluginDefinition::PluginDefinition(std::string id_, plugin_type type_, std::string executable_, std::vector<std::string> arguments_)
: id(id_), type(type_), executable(executable_), arguments(arguments_)
, restartPolicy(RESTART_ON_FAILURE), enabled(true)
, triggerOn(TRIGGER_NONE), stopOnDisconnect(false)
{
    //
}

PluginDefinition PluginDefinition::fromPlist(plist_t p_def){
    PluginDefinition ret;
    if (plist_get_node_type(p_def) != PLIST_DICT) {
        retcustomerror(DAException_bad_config, "plugin definition is not an object");
    }
    try {
        ret.id = plistjson_dict_string(p_def, "id").value_or("");
        if (auto v = plistjson_dict_string(p_def, "type")) ret.type = typeFromName(*v);
        ret.executable = plistjson_dict_string(p_def, "executable").value_or("");
        ret.arguments = plistjson_dict_string_array(p_def, "arguments");
        ret.workingDirectory = plistjson_dict_string(p_def, "workingDirectory");
        ret.environmentVariables = plistjson_dict_string_map(p_def, "environmentVariables");
        ret.healthCheckCommand = plistjson_dict_string(p_def, "healthCheckCommand");
        ret.healthCheckArguments = plistjson_dict_string_array(p_def, "healthCheckArguments");
        if (auto v = plistjson_dict_int(p_def, "healthCheckIntervalSeconds")) ret.healthCheckIntervalSeconds = (int)*v;
        if (auto v = plistjson_dict_int(p_def, "healthCheckTimeoutSeconds")) ret.healthCheckTimeoutSeconds = (int)*v;
        ret.healthCheckRuntime = plistjson_dict_string(p_def, "healthCheckRuntime");
        ret.runtime = plistjson_dict_string(p_def, "runtime");
        if (auto v = plistjson_dict_string(p_def, "restartPolicy")) ret.restartPolicy = restartPolicyFromName(*v);
        ret.enabled = plistjson_dict_bool(p_def, "enabled").value_or(true);
        if (auto v = plistjson_dict_string(p_def, "triggerOn")) ret.triggerOn = triggerFromName(*v);
        ret.stopOnDisconnect = plistjson_dict_bool(p_def, "stopOnDisconnect").value_or(false);
    } catch (tihmstar::DAException_bad_config &e) {
        throw;
    } catch (tihmstar::exception &e) {
        retcustomerror(DAException_bad_config, "plugin definition '%s' is malformed: %s",ret.id.c_str(),e.what());
    }
    return ret;
}

plist_t PluginDefinition::toPlist() const{
    plist_t p_def = plist_new_dict();
    plistjson_dict_set_string(p_def, "id", id);
    plistjson_dict_set_string(p_def, "type", typeName(type));
    plistjson_dict_set_string(p_def, "executable", executable);
    plistjson_dict_set_string_array(p_def, "arguments", arguments);
    if (workingDirectory) plistjson_dict_set_string(p_def, "workingDirectory", *workingDirectory);
    if (environmentVariables.size()) plistjson_dict_set_string_map(p_def, "environmentVariables", environmentVariables);
    if (healthCheckCommand) plistjson_dict_set_string(p_def, "healthCheckCommand", *healthCheckCommand);
    if (healthCheckArguments.size()) plistjson_dict_set_string_array(p_def, "healthCheckArguments", healthCheckArguments);
    if (healthCheckIntervalSeconds) plistjson_dict_set_int(p_def, "healthCheckIntervalSeconds", *healthCheckIntervalSeconds);
    if (healthCheckTimeoutSeconds) plistjson_dict_set_int(p_def, "healthCheckTimeoutSeconds", *healthCheckTimeoutSeconds);
    if (healthCheckRuntime) plistjson_dict_set_string(p_def, "healthCheckRuntime", *healthCheckRuntime);
    if (runtime) plistjson_dict_set_string(p_def, "runtime", *runtime);
    plistjson_dict_set_string(p_def, "restartPolicy", restartPolicyName(restartPolicy));
    plistjson_dict_set_bool(p_def, "enabled", enabled);
    if (triggerOn != TRIGGER_NONE) plistjson_dict_set_string(p_def, "triggerOn", triggerName(triggerOn));
    plistjson_dict_set_bool(p_def, "stopOnDisconnect", stopOnDisconnect);
    return p_def;
}

#pragma mark names
const char *PluginDefinition::typeName(plugin_type type) noexcept{
    switch (type) {
        case PLUGIN_TYPE_PROCESS:   return "process";
        case PLUGIN_TYPE_SCRIPT:    return "script";
    }
    return "unknown";
}

const char *PluginDefinition::restartPolicyName(restart_policy policy) noexcept{
    switch (policy) {
        case RESTART_NEVER:         return "Never";
        case RESTART_ON_FAILURE:    return "OnFailure";
    }
    return "unknown";
}

const char *PluginDefinition::triggerName(trigger_rule trigger) noexcept{
    switch (trigger) {
        case TRIGGER_NONE:                  return "none";
        case TRIGGER_DEVICE_CONNECTED:      return "device-connected";
        case TRIGGER_DEVICE_DISCONNECTED:   return "device-disconnected";
    }
    return "unknown";
}

PluginDefinition::plugin_type PluginDefinition::typeFromName(const std::string &name){
    if (name.empty() || !strcasecmp(name.c_str(), "process")) return PLUGIN_TYPE_PROCESS;
    if (!strcasecmp(name.c_str(), "script")) return PLUGIN_TYPE_SCRIPT;
    retcustomerror(DAException_bad_config, "unknown plugin type '%s'",name.c_str());
}

PluginDefinition::restart_policy PluginDefinition::restartPolicyFromName(const std::string &name){
    if (!strcasecmp(name.c_str(), "Never")) return RESTART_NEVER;
    if (!strcasecmp(name.c_str(), "OnFailure")) return RESTART_ON_FAILURE;
    retcustomerror(DAException_bad_config, "unknown restart policy '%s'",name.c_str());
}

PluginDefinition::trigger_rule PluginDefinition::triggerFromName(const std::string &name){
    if (name.empty() || !strcasecmp(name.c_str(), "none")) return TRIGGER_NONE;
    if (!strcasecmp(name.c_str(), "device-connected")) return TRIGGER_DEVICE_CONNECTED;
    if (!strcasecmp(name.c_str(), "device-disconnected")) return TRIGGER_DEVICE_DISCONNECTED;
    retcustomerror(DAException_bad_config, "unknown trigger '%s'",name.c_str());
}
