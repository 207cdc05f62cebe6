//
//  PluginWorker.cpp
//  devagentd
//
//  Created on 17.10.26.
//

#include "PluginWorker.hpp"

#include <libgeneral/macros.h>

#pragma mark PluginWorker
PluginWorker::PluginWorker(std::string id, PluginDefinition definition)
: _id(id), _definition(definition)
, _state(PLUGIN_STATE_DISABLED)
{
    //
}

PluginWorker::~PluginWorker(){
    //
}

void PluginWorker::setState(plugin_state state) noexcept{
    std::vector<state_observer> observers;
    if (_state.exchange(state) == state) return;
    debug("[%s] state -> %s",_id.c_str(),stateName(state));
    {
        std::unique_lock<std::mutex> ul(_observersLck);
        observers = _observers;
    }
    for (auto &o : observers) {
        try {
            o(_id, state);
        } catch (tihmstar::exception &e) {
            error("[%s] state observer failed with error=%d (%s)",_id.c_str(),e.code(),e.what());
        } catch (std::exception &e) {
            error("[%s] state observer failed (%s)",_id.c_str(),e.what());
        }
    }
}

void PluginWorker::rememberContext(const PluginContext &ctx){
    std::unique_lock<std::mutex> ul(_contextLck);
    _startContext = ctx;
}

std::optional<PluginContext> PluginWorker::lastStartContext(){
    std::unique_lock<std::mutex> ul(_contextLck);
    return _startContext;
}

void PluginWorker::addStateObserver(state_observer observer){
    std::unique_lock<std::mutex> ul(_observersLck);
    _observers.push_back(observer);
}

const char *PluginWorker::stateName(plugin_state state) noexcept{
    switch (state) {
        case PLUGIN_STATE_DISABLED: return "Disabled";
        case PLUGIN_STATE_RUNNING:  return "Running";
        case PLUGIN_STATE_STOPPED:  return "Stopped";
        case PLUGIN_STATE_ERROR:    return "Error";
    }
    return "Unknown";
}
