//
//  PluginDefinition.hpp
//  devagentd
//
//  Created on 17.10.26.
//

#ifndef PluginDefinition_hpp
#define PluginDefinition_hpp

#include <plist/plist.h>

#include <map>
#include <optional>
#include <string>
#include <vector>

class PluginDefinition{
public:
    enum plugin_type{
        PLUGIN_TYPE_PROCESS = 0,
        PLUGIN_TYPE_SCRIPT
    };
    enum restart_policy{
        RESTART_NEVER = 0,
        RESTART_ON_FAILURE
    };
    enum trigger_rule{
        TRIGGER_NONE = 0,
        TRIGGER_DEVICE_CONNECTED,
        TRIGGER_DEVICE_DISCONNECTED
    };

    std::string id;
    plugin_type type;
    std::string executable;
    std::vector<std::string> arguments;
    std::optional<std::string> workingDirectory;
    std::map<std::string,std::string> environmentVariables;
    std::optional<std::string> healthCheckCommand;
    std::vector<std::string> healthCheckArguments;
    std::optional<int> healthCheckIntervalSeconds;
    std::optional<int> healthCheckTimeoutSeconds;
    std::optional<std::string> healthCheckRuntime;
    std::optional<std::string> runtime;
    restart_policy restartPolicy;
    bool enabled;
    trigger_rule triggerOn;
    bool stopOnDisconnect;

    PluginDefinition();
    PluginDefinition(std::string id_, plugin_type type_, std::string executable_, std::vector<std::string> arguments_ = {});

    /*
     Parses one entry of the "plugins" config array.
     Throws DAException_bad_config on unknown tags
     */
    static PluginDefinition fromPlist(plist_t p_def);
    plist_t toPlist() const;

    static const char *typeName(plugin_type type) noexcept;
    static const char *restartPolicyName(restart_policy policy) noexcept;
    static const char *triggerName(trigger_rule trigger) noexcept;
    static plugin_type typeFromName(const std::string &name);
    static restart_policy restartPolicyFromName(const std::string &name);
    static trigger_rule triggerFromName(const std::string &name);
};

#endif /* PluginDefinition_hpp */
