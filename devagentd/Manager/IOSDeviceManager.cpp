//
//  IOSDeviceManager.cpp
//  devagentd
//
//  Created on 17.10.26.
//

#include "IOSDeviceManager.hpp"

#include <libgeneral/macros.h>

#ifdef HAVE_LIBIMOBILEDEVICE
#include <libimobiledevice/lockdown.h>
#endif //HAVE_LIBIMOBILEDEVICE

#include <stdlib.h>

#define UNKNOWN_IOS_DEVICE_NAME "Unknown iOS Device"

#ifdef HAVE_LIBIMOBILEDEVICE
#pragma mark libimobiledevice callback
void idevice_event_cb(const idevice_event_t *event, void *user_data) noexcept{
    IOSDeviceManager *devmgr = (IOSDeviceManager*)user_data;
    if (!event || !event->udid) return;
    if (event->conn_type != CONNECTION_USBMUXD) {
        debug("Ignoring network event for %s",event->udid);
        return;
    }
    switch (event->event) {
        case IDEVICE_DEVICE_ADD:
            devmgr->_events.post({true, event->udid});
            break;
        case IDEVICE_DEVICE_REMOVE:
            devmgr->_events.post({false, event->udid});
            break;
        default:
            debug("Unhandled idevice event %d for %s",event->event,event->udid);
            break;
    }
}
#endif //HAVE_LIBIMOBILEDEVICE

#pragma mark IOSDeviceManager
IOSDeviceManager::IOSDeviceManager(DeviceListener *listener)
: DeviceManager(listener), _subscribed(false)
{
#ifndef HAVE_LIBIMOBILEDEVICE
    reterror("Compiled without libimobiledevice");
#else
    idevice_error_t err = IDEVICE_E_SUCCESS;
    retassure(!(err = idevice_event_subscribe(idevice_event_cb, this)), "Failed to subscribe to idevice events with error=%d",err);
    _subscribed = true;
#endif //HAVE_LIBIMOBILEDEVICE
}

IOSDeviceManager::~IOSDeviceManager(){
#ifdef HAVE_LIBIMOBILEDEVICE
    if (_subscribed) {
        idevice_event_unsubscribe(); _subscribed = false;
    }
#endif //HAVE_LIBIMOBILEDEVICE
    stopLoop();
}

bool IOSDeviceManager::loopEvent(){
    ios_event ev;
    try {
        ev = _events.wait();
    } catch (tihmstar::exception &e) {
        debug("IOSDeviceManager event queue died, stopping");
        return false;
    }
    handleEvent(ev);
    return true;
}

void IOSDeviceManager::stopAction() noexcept{
    _events.kill();
}

void IOSDeviceManager::handleEvent(const ios_event &ev) noexcept{
    if (ev.added) {
        std::string name = queryDeviceName(ev.udid);
        _listener->deviceAttached(Device(ev.udid, Device::PLATFORM_IOS, name, Device::TYPE_PHYSICAL));
    } else {
        _listener->deviceDetached(ev.udid);
    }
}

std::string IOSDeviceManager::queryDeviceName(const std::string &udid) noexcept{
#ifndef HAVE_LIBIMOBILEDEVICE
    return UNKNOWN_IOS_DEVICE_NAME;
#else
    idevice_t idev = NULL;
    lockdownd_client_t lockdown = NULL;
    char *name = NULL;
    cleanup([&]{
        safeFree(name);
        safeFreeCustom(lockdown, lockdownd_client_free);
        safeFreeCustom(idev, idevice_free);
    });
    lockdownd_error_t lret = LOCKDOWN_E_SUCCESS;

    if (idevice_new_with_options(&idev, udid.c_str(), IDEVICE_LOOKUP_USBMUX)) {
        warning("Could not open device %s to query its name",udid.c_str());
        return UNKNOWN_IOS_DEVICE_NAME;
    }
    if ((lret = lockdownd_client_new(idev, &lockdown, "devagentd"))) {
        warning("Could not connect to lockdownd on device %s, lockdown error %d",udid.c_str(),lret);
        return UNKNOWN_IOS_DEVICE_NAME;
    }
    if ((lret = lockdownd_get_device_name(lockdown, &name)) || !name) {
        warning("Could not read the name of device %s, lockdown error %d",udid.c_str(),lret);
        return UNKNOWN_IOS_DEVICE_NAME;
    }
    return name;
#endif //HAVE_LIBIMOBILEDEVICE
}
