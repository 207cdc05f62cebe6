//
//  sysconf.hpp
//  devagentd
//
//  Created on 17.10.26.
//

#ifndef sysconf_hpp
#define sysconf_hpp

#include "../Devices/DeviceRegistry.hpp"
#include "../Plugins/PluginDefinition.hpp"
#include "../Plugins/PluginOrchestrator.hpp"
#include "../Sessions/SessionManager.hpp"

#include <plist/plist.h>

#include <string>
#include <vector>

#define DEFAULT_CONFIG_PATH "/etc/devagentd/config.json"
#define DEFAULT_INSTALL_FOLDER "/opt/devagentd"

class Config{
public:
    //config
    std::string installFolder;
    bool enableDeviceListener;
    bool autoStartAppium;
    int healthCheckTimeoutSeconds;
    int pluginMonitorIntervalSeconds;
    int pluginRestartBackoffSeconds;
    int appiumPortStart;
    int appiumPortEnd;
    std::string sessionExecutable;
    std::vector<std::string> sessionArguments;
    DeviceRegistryConfig deviceRegistry;
    std::vector<PluginDefinition> plugins;

    //commandline
    std::string configPath;
    bool daemonize;
    bool useLogfile;
    int debugLevel;

    Config();

    /*
     Loads configPath. A missing file keeps the defaults,
     a file that can't be parsed throws DAException_bad_config
     */
    void load();
    void loadFromPlist(plist_t p_config);
    void loadFromString(const std::string &json);

    std::vector<std::string> validationErrors() const;

    /*
     Logs every problem and throws DAException_bad_config if there is any
     */
    void validate() const;

    SessionManagerConfig sessionManagerConfig() const;
    OrchestratorConfig orchestratorConfig() const;
};

#endif /* sysconf_hpp */
