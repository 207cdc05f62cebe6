//
//  DeviceRegistry.cpp
//  devagentd
//
//  Created on 17.10.26.
//

#include "DeviceRegistry.hpp"
#include "../Events/Events.hpp"
#include "../sysconf/plistjson.hpp"

#include <libgeneral/macros.h>

#include <sys/stat.h>

#pragma mark DeviceRegistry
DeviceRegistry::DeviceRegistry(DeviceRegistryConfig config)
: _config(config)
, _lastUpdated(timestamp_now())
, _stopRequested(false)
, _bus(nullptr), _connectedSub(0), _disconnectedSub(0)
{
    if (!_config.enabled) {
        info("DeviceRegistry is disabled, keeping devices in memory only");
        return;
    }
    load();
    if (_config.autoSave) {
        retassure(_config.saveInterval.count() > 0, "invalid autosave interval %lld",(long long)_config.saveInterval.count());
        startLoop();
    }
}

DeviceRegistry::~DeviceRegistry(){
    unsubscribe();
    stopLoop();
    if (_config.enabled) save();
}

void DeviceRegistry::load() noexcept{
    plist_t p_registry = NULL;
    cleanup([&]{
        safeFreeCustom(p_registry, plist_free);
    });
    struct stat st = {};

    if (stat(_config.filePath.c_str(), &st)) {
        info("No existing device registry found at '%s'",_config.filePath.c_str());
        return;
    }

    try {
        std::map<std::string, Device> loaded;
        plist_t p_devices = NULL;

        p_registry = plistjson_read_file(_config.filePath.c_str());
        retassure(plist_get_node_type(p_registry) == PLIST_DICT, "registry root is not an object");

        if ((p_devices = plist_dict_get_item(p_registry, "devices"))) {
            retassure(plist_get_node_type(p_devices) == PLIST_ARRAY, "'devices' is not an array");
            for (uint32_t i = 0; i < plist_array_get_size(p_devices); i++) {
                Device dev = Device::fromPlist(plist_array_get_item(p_devices, i));
                loaded.emplace(dev.id, dev);
            }
        }

        {
            std::unique_lock<std::mutex> ul(_devicesLck);
            _devices = std::move(loaded);
            if (auto v = plistjson_dict_string(p_registry, "lastUpdated")) _lastUpdated = timestamp_from_string(*v);
        }
        info("Loaded %zu devices from registry '%s'",_devices.size(),_config.filePath.c_str());
    } catch (tihmstar::exception &e) {
        error("Failed to load device registry '%s', starting empty. error=%d (%s)",_config.filePath.c_str(),e.code(),e.what());
    }
}

void DeviceRegistry::touch() noexcept{
    Timestamp now = timestamp_now();
    if (now > _lastUpdated) _lastUpdated = now;
}

void DeviceRegistry::upsert(Device device){
    std::unique_lock<std::mutex> ul(_devicesLck);
    device.lastSeen = timestamp_now();
    info("Device %s (%s) updated in registry",device.id.c_str(),Device::platformName(device.platform));
    _devices.insert_or_assign(device.id, device);
    touch();
}

std::optional<Device> DeviceRegistry::get(const std::string &deviceId){
    std::unique_lock<std::mutex> ul(_devicesLck);
    auto dev = _devices.find(deviceId);
    if (dev == _devices.end()) return std::nullopt;
    return dev->second;
}

std::vector<Device> DeviceRegistry::getAll(){
    std::vector<Device> ret;
    std::unique_lock<std::mutex> ul(_devicesLck);
    for (auto &d : _devices) ret.push_back(d.second);
    return ret;
}

std::vector<Device> DeviceRegistry::getConnected(){
    std::vector<Device> ret;
    std::unique_lock<std::mutex> ul(_devicesLck);
    for (auto &d : _devices) {
        if (d.second.state == Device::STATE_CONNECTED) ret.push_back(d.second);
    }
    return ret;
}

bool DeviceRegistry::markDisconnected(const std::string &deviceId){
    std::unique_lock<std::mutex> ul(_devicesLck);
    auto dev = _devices.find(deviceId);
    if (dev == _devices.end()) {
        debug("markDisconnected: device %s is not in the registry",deviceId.c_str());
        return false;
    }
    dev->second.state = Device::STATE_DISCONNECTED;
    dev->second.disconnectedAt = timestamp_now();
    dev->second.session.reset();
    touch();
    info("Device %s marked as disconnected",deviceId.c_str());
    return true;
}

bool DeviceRegistry::prune(const std::string &deviceId){
    std::unique_lock<std::mutex> ul(_devicesLck);
    if (!_devices.erase(deviceId)) return false;
    touch();
    info("Device %s pruned from registry",deviceId.c_str());
    return true;
}

Timestamp DeviceRegistry::lastUpdated(){
    std::unique_lock<std::mutex> ul(_devicesLck);
    return _lastUpdated;
}

bool DeviceRegistry::save() noexcept{
    plist_t p_registry = NULL;
    cleanup([&]{
        safeFreeCustom(p_registry, plist_free);
    });
    if (!_config.enabled) return false;

    std::unique_lock<std::mutex> sl(_saveLck);
    try {
        plist_t p_devices = NULL;
        p_registry = plist_new_dict();
        p_devices = plist_new_array();
        plist_dict_set_item(p_registry, "devices", p_devices);
        {
            std::unique_lock<std::mutex> ul(_devicesLck);
            plistjson_dict_set_string(p_registry, "lastUpdated", timestamp_to_string(_lastUpdated));
            for (auto &d : _devices) {
                plist_array_append_item(p_devices, d.second.toPlist());
            }
        }
        plistjson_write_file(p_registry, _config.filePath.c_str());
        debug("Device registry saved to '%s'",_config.filePath.c_str());
        return true;
    } catch (tihmstar::exception &e) {
        error("Failed to save device registry to '%s' with error=%d (%s)",_config.filePath.c_str(),e.code(),e.what());
    }
    return false;
}

#pragma mark autosave loop
bool DeviceRegistry::loopEvent(){
    {
        std::unique_lock<std::mutex> ul(_wakeLck);
        if (_wakeCond.wait_for(ul, _config.saveInterval, [this]{return _stopRequested;})) {
            return false;
        }
    }
    save();
    return true;
}

void DeviceRegistry::stopAction() noexcept{
    std::unique_lock<std::mutex> ul(_wakeLck);
    _stopRequested = true;
    _wakeCond.notify_all();
}

#pragma mark event bus
void DeviceRegistry::subscribe(EventBus *bus){
    assure(bus);
    assure(!_bus);
    _bus = bus;
    _connectedSub = _bus->subscribe<DeviceConnectedEvent>([this](const DeviceConnectedEvent &ev){
        upsert(ev.device);
    });
    _disconnectedSub = _bus->subscribe<DeviceDisconnectedEvent>([this](const DeviceDisconnectedEvent &ev){
        markDisconnected(ev.device.id);
    });
}

void DeviceRegistry::unsubscribe() noexcept{
    if (!_bus) return;
    _bus->unsubscribe<DeviceConnectedEvent>(_connectedSub);
    _bus->unsubscribe<DeviceDisconnectedEvent>(_disconnectedSub);
    _bus = nullptr;
}
