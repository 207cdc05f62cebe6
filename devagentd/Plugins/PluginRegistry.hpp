//
//  PluginRegistry.hpp
//  devagentd
//
//  Created on 17.10.26.
//

#ifndef PluginRegistry_hpp
#define PluginRegistry_hpp

#include "PluginDefinition.hpp"
#include "PluginWorker.hpp"

#include <libgeneral/GuardAccess.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class PluginRegistry{
    std::vector<PluginDefinition> _definitions; //registration order
    std::map<std::string, size_t> _definitionsLookup;
    tihmstar::GuardAccess _definitionsGuard;

    std::map<std::string, std::shared_ptr<PluginWorker>> _instances;
    tihmstar::GuardAccess _instancesGuard;

public:
    PluginRegistry();
    ~PluginRegistry();

#pragma mark definitions
    /*
     Re-registering an id replaces the definition in place
     */
    void registerDefinition(const PluginDefinition &definition);
    std::vector<PluginDefinition> getDefinitions();
    std::optional<PluginDefinition> getDefinition(const std::string &definitionId);

#pragma mark instances
    void registerInstance(std::shared_ptr<PluginWorker> instance);

    /*
     Inserts only if no instance with the same id exists.
     Returns false if one was already present
     */
    bool tryRegisterInstance(std::shared_ptr<PluginWorker> instance);
    std::vector<std::shared_ptr<PluginWorker>> getInstances();
    std::shared_ptr<PluginWorker> getInstance(const std::string &instanceId);

    /*
     Exact id or any "<definitionId>:" prefixed instance
     */
    std::vector<std::shared_ptr<PluginWorker>> getInstancesByDefinitionId(const std::string &definitionId);
    bool removeInstance(const std::string &instanceId);
    size_t instancesCnt();
};

#endif /* PluginRegistry_hpp */
