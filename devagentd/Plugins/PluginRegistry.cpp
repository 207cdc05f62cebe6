//
//  PluginRegistry.cpp
//  devagentd
//
//  Created on 17.10.26.
//

#include "PluginRegistry.hpp"

#include <libgeneral/macros.h>

#pragma mark PluginRegistry
PluginRegistry::PluginRegistry(){
    //
}

PluginRegistry::~PluginRegistry(){
    //
}

#pragma mark definitions
void PluginRegistry::registerDefinition(const PluginDefinition &definition){
    retassure(definition.id.size(), "Plugin definition without id");
    guardWrite(_definitionsGuard);
    auto known = _definitionsLookup.find(definition.id);
    if (known != _definitionsLookup.end()) {
        debug("Replacing plugin definition %s",definition.id.c_str());
        _definitions.at(known->second) = definition;
        return;
    }
    _definitionsLookup[definition.id] = _definitions.size();
    _definitions.push_back(definition);
    debug("Registered plugin definition %s",definition.id.c_str());
}

std::vector<PluginDefinition> PluginRegistry::getDefinitions(){
    guardRead(_definitionsGuard);
    return _definitions;
}

std::optional<PluginDefinition> PluginRegistry::getDefinition(const std::string &definitionId){
    guardRead(_definitionsGuard);
    auto known = _definitionsLookup.find(definitionId);
    if (known == _definitionsLookup.end()) return std::nullopt;
    return _definitions.at(known->second);
}

#pragma mark instances
void PluginRegistry::registerInstance(std::shared_ptr<PluginWorker> instance){
    assure(instance);
    guardWrite(_instancesGuard);
    _instances[instance->id()] = instance;
}

bool PluginRegistry::tryRegisterInstance(std::shared_ptr<PluginWorker> instance){
    assure(instance);
    guardWrite(_instancesGuard);
    return _instances.emplace(instance->id(), instance).second;
}

std::vector<std::shared_ptr<PluginWorker>> PluginRegistry::getInstances(){
    std::vector<std::shared_ptr<PluginWorker>> ret;
    guardRead(_instancesGuard);
    for (auto &i : _instances) ret.push_back(i.second);
    return ret;
}

std::shared_ptr<PluginWorker> PluginRegistry::getInstance(const std::string &instanceId){
    guardRead(_instancesGuard);
    auto inst = _instances.find(instanceId);
    if (inst == _instances.end()) return nullptr;
    return inst->second;
}

std::vector<std::shared_ptr<PluginWorker>> PluginRegistry::getInstancesByDefinitionId(const std::string &definitionId){
    std::vector<std::shared_ptr<PluginWorker>> ret;
    std::string prefix = definitionId + ":";
    guardRead(_instancesGuard);
    for (auto &i : _instances) {
        if (i.first == definitionId || i.first.compare(0, prefix.size(), prefix) == 0) {
            ret.push_back(i.second);
        }
    }
    return ret;
}

bool PluginRegistry::removeInstance(const std::string &instanceId){
    guardWrite(_instancesGuard);
    return _instances.erase(instanceId) > 0;
}

size_t PluginRegistry::instancesCnt(){
    guardRead(_instancesGuard);
    return _instances.size();
}
