//
//  IOSDeviceManager.hpp
//  devagentd
//
//  Created on 17.10.26.
//

#ifndef IOSDeviceManager_hpp
#define IOSDeviceManager_hpp

#include "DeviceManager.hpp"
#include <libgeneral/DeliveryEvent.hpp>

#include <string>

#ifdef HAVE_LIBIMOBILEDEVICE
#include <libimobiledevice/libimobiledevice.h>
#endif //HAVE_LIBIMOBILEDEVICE

/*
 Detects USB-multiplexed iOS devices through libimobiledevice events.
 Callbacks only queue the event, attach/detach run on the Manager thread
 */
class IOSDeviceManager : public DeviceManager{
public:
    struct ios_event{
        bool added;
        std::string udid;
    };

private:
    tihmstar::DeliveryEvent<ios_event> _events;
    bool _subscribed;

#pragma mark inheritance override
    virtual bool loopEvent() override;
    virtual void stopAction() noexcept override;

    void handleEvent(const ios_event &ev) noexcept;

public:
    IOSDeviceManager(DeviceListener *listener);
    virtual ~IOSDeviceManager() override;

    static std::string queryDeviceName(const std::string &udid) noexcept;

#ifdef HAVE_LIBIMOBILEDEVICE
#pragma mark friends
    friend void idevice_event_cb(const idevice_event_t *event, void *user_data) noexcept;
#endif //HAVE_LIBIMOBILEDEVICE
};

#endif /* IOSDeviceManager_hpp */
