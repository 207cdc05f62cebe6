//
//  ScriptWorker.cpp
//  devagentd
//
//  Created on 17.10.26.
//

#include "ScriptWorker.hpp"
#include "TemplateExpander.hpp"

#include <libgeneral/macros.h>

#include <string.h>
#include <strings.h>

#define DEFAULT_SCRIPT_HOST "/bin/sh"

static bool has_suffix(const std::string &str, const char *suffix){
    size_t slen = strlen(suffix);
    return str.size() >= slen && !strcasecmp(str.c_str() + str.size() - slen, suffix);
}

#pragma mark ScriptWorker
ScriptWorker::ScriptWorker(std::string id, PluginDefinition definition)
: ProcessWorker(id, definition)
{
    //
}

ScriptWorker::~ScriptWorker(){
    //
}

std::string ScriptWorker::runtimeHint(const PluginDefinition &definition, const std::string &script){
    if (definition.runtime && definition.runtime->size()) return *definition.runtime;
    {
        auto r = definition.environmentVariables.find("runtime");
        if (r != definition.environmentVariables.end() && r->second.size()) return r->second;
    }
    if (has_suffix(script, ".sh")) return "bash";
    if (has_suffix(script, ".py")) return "python";
    if (has_suffix(script, ".js")) return "node";
    if (has_suffix(script, ".ps1")) return "powershell";
    return "";
}

ChildProcess::LaunchInfo ScriptWorker::launchInfo(const PluginContext &ctx){
    ChildProcess::LaunchInfo ret = ProcessWorker::launchInfo(ctx);
    std::string script = ret.executable;
    std::string hint = runtimeHint(_definition, script);
    std::vector<std::string> args;

    if (!strcasecmp(hint.c_str(), "bash") || !strcasecmp(hint.c_str(), "sh")) {
        ret.executable = "/bin/bash";
    } else if (!strcasecmp(hint.c_str(), "python") || !strcasecmp(hint.c_str(), "python3")) {
        ret.executable = "python3";
    } else if (!strcasecmp(hint.c_str(), "node")) {
        ret.executable = "node";
    } else if (!strcasecmp(hint.c_str(), "powershell") || !strcasecmp(hint.c_str(), "pwsh")) {
        ret.executable = "pwsh";
        args.push_back("-File");
    } else if (hint.size()) {
        ret.executable = hint;
    } else {
        ret.executable = DEFAULT_SCRIPT_HOST;
    }
    args.push_back(script);
    args.insert(args.end(), ret.arguments.begin(), ret.arguments.end());
    ret.arguments = args;

    debug("[%s] script '%s' runs through '%s'",_id.c_str(),script.c_str(),ret.executable.c_str());
    return ret;
}

ChildProcess::LaunchInfo ScriptWorker::healthCheckLaunchInfo(const PluginContext &ctx){
    ChildProcess::LaunchInfo ret = ProcessWorker::healthCheckLaunchInfo(ctx);
    if (_definition.healthCheckRuntime && !strcasecmp(_definition.healthCheckRuntime->c_str(), "bash")) {
        std::string cmdline = ret.executable;
        for (auto &a : ret.arguments) {
            cmdline += " ";
            cmdline += a;
        }
        ret.executable = "bash";
        ret.arguments = {"-c", cmdline};
    }
    return ret;
}
