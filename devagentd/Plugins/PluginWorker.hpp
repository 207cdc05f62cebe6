//
//  PluginWorker.hpp
//  devagentd
//
//  Created on 17.10.26.
//

#ifndef PluginWorker_hpp
#define PluginWorker_hpp

#include "PluginDefinition.hpp"
#include "PluginContext.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/*
 Abstract class
 One live instance of a plugin definition
 */
class PluginWorker{
public:
    enum plugin_state{
        PLUGIN_STATE_DISABLED = 0,
        PLUGIN_STATE_RUNNING,
        PLUGIN_STATE_STOPPED,
        PLUGIN_STATE_ERROR
    };
    using state_observer = std::function<void(const std::string &instanceId, plugin_state state)>;

protected:
    const std::string _id;
    const PluginDefinition _definition;
    std::atomic<plugin_state> _state;

    std::mutex _observersLck;
    std::vector<state_observer> _observers;

    std::mutex _contextLck;
    std::optional<PluginContext> _startContext;

    void setState(plugin_state state) noexcept;
    void rememberContext(const PluginContext &ctx);

public:
    PluginWorker(const PluginWorker&) = delete;
    PluginWorker(std::string id, PluginDefinition definition);
    virtual ~PluginWorker();

    const std::string &id() const noexcept {return _id;}
    const PluginDefinition &definition() const noexcept {return _definition;}
    plugin_state state() const noexcept {return _state;}
    const char *typeName() const noexcept {return PluginDefinition::typeName(_definition.type);}
    std::optional<PluginContext> lastStartContext();

    void addStateObserver(state_observer observer);

    /*
     Launch failures are logged, leave the worker in Error and return false
     */
    virtual bool start(const PluginContext &ctx) noexcept = 0;
    virtual void stop() noexcept = 0;
    virtual bool checkHealth() = 0;

    static const char *stateName(plugin_state state) noexcept;
};

#endif /* PluginWorker_hpp */
