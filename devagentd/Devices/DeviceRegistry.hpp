//
//  DeviceRegistry.hpp
//  devagentd
//
//  Created on 17.10.26.
//

#ifndef DeviceRegistry_hpp
#define DeviceRegistry_hpp

#include "Device.hpp"
#include "../Events/EventBus.hpp"

#include <libgeneral/Manager.hpp>

#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

struct DeviceRegistryConfig{
    bool enabled = true;
    std::string filePath = "device-registry.json";
    bool autoSave = true;
    std::chrono::seconds saveInterval = std::chrono::seconds(30);
};

/*
 Durable device store.
 The Manager loop is the autosave timer, it only runs if the registry is
 enabled and autosave is on.
 */
class DeviceRegistry : public tihmstar::Manager{
    DeviceRegistryConfig _config;
    std::mutex _devicesLck;
    std::map<std::string, Device> _devices;
    Timestamp _lastUpdated;
    std::mutex _saveLck;

    std::mutex _wakeLck;
    std::condition_variable _wakeCond;
    bool _stopRequested;

    EventBus *_bus; //not owned
    EventBus::subscription_id _connectedSub;
    EventBus::subscription_id _disconnectedSub;

    virtual bool loopEvent() override;
    virtual void stopAction() noexcept override;

    void load() noexcept;
    void touch() noexcept;

public:
    DeviceRegistry(DeviceRegistryConfig config);
    virtual ~DeviceRegistry() override;

    void upsert(Device device);
    std::optional<Device> get(const std::string &deviceId);
    std::vector<Device> getAll();
    std::vector<Device> getConnected();

    /*
     Sets the state to Disconnected, stamps disconnectedAt and drops the session.
     The entry itself stays until it is pruned
     */
    bool markDisconnected(const std::string &deviceId);
    bool prune(const std::string &deviceId);

    /*
     Writes the registry to disk via a temp file and rename.
     Failures are logged, returns whether a file was written
     */
    bool save() noexcept;

    Timestamp lastUpdated();
    const DeviceRegistryConfig &config() const noexcept {return _config;}

#pragma mark event bus
    void subscribe(EventBus *bus);
    void unsubscribe() noexcept;
};

#endif /* DeviceRegistry_hpp */
