//
//  ScriptWorker.hpp
//  devagentd
//
//  Created on 17.10.26.
//

#ifndef ScriptWorker_hpp
#define ScriptWorker_hpp

#include "ProcessWorker.hpp"

/*
 Runs the definition's executable as a script through an interpreter
 */
class ScriptWorker : public ProcessWorker{
public:
    ScriptWorker(std::string id, PluginDefinition definition);
    virtual ~ScriptWorker() override;

    virtual ChildProcess::LaunchInfo launchInfo(const PluginContext &ctx) override;
    virtual ChildProcess::LaunchInfo healthCheckLaunchInfo(const PluginContext &ctx) override;

    /*
     Explicit runtime, then environmentVariables["runtime"], then the file extension.
     Empty if nothing matched
     */
    static std::string runtimeHint(const PluginDefinition &definition, const std::string &script);
};

#endif /* ScriptWorker_hpp */
