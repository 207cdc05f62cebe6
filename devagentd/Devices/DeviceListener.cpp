//
//  DeviceListener.cpp
//  devagentd
//
//  Created on 17.10.26.
//

#include "DeviceListener.hpp"
#include "DeviceRegistry.hpp"
#include "DeviceMetrics.hpp"
#include "../Events/Events.hpp"
#include "../Sessions/SessionManager.hpp"

#include <libgeneral/macros.h>

#include <vector>

#pragma mark DeviceListener
DeviceListener::DeviceListener(EventBus *bus, DeviceRegistry *registry, SessionManager *sessions, DeviceMetrics *metrics, bool autoStartSessions)
: _bus(bus), _registry(registry), _sessions(sessions), _metrics(metrics), _autoStartSessions(autoStartSessions)
{
    assure(_bus);
    assure(_registry);
}

DeviceListener::~DeviceListener(){
    //
}

void DeviceListener::deviceAttached(Device dev) noexcept{
    std::unique_lock<std::mutex> ul(_attachLck);
    try {
        if (auto known = _registry->get(dev.id); known && known->state == Device::STATE_CONNECTED) {
            debug("Device %s is already connected, ignoring",dev.id.c_str());
            return;
        }
        info("Device connected: %s (%s, %s) - %s",dev.id.c_str(),Device::platformName(dev.platform),Device::typeName(dev.type),dev.name.c_str());
        dev.state = Device::STATE_CONNECTED;
        dev.connectedAt = timestamp_now();
        dev.lastSeen = dev.connectedAt;
        dev.disconnectedAt.reset();
        dev.session.reset();

        _bus->publish(DeviceConnectedEvent{dev});
        if (_metrics) _metrics->recordDeviceConnected(dev.platform);

        if (!_autoStartSessions || !_sessions) return;

        if (std::optional<Session> session = _sessions->startSession(dev)) {
            dev.session = session;
            _registry->upsert(dev);
            info("Session started for %s on port %u",dev.id.c_str(),session->appiumPort);
            _bus->publish(SessionStartedEvent{dev, *session});
        } else {
            warning("Failed to start a session for %s",dev.id.c_str());
            _bus->publish(SessionFailedEvent{dev, "session start failed"});
        }
    } catch (tihmstar::exception &e) {
        error("Failed to handle attach of device %s with error=%d (%s)",dev.id.c_str(),e.code(),e.what());
    } catch (std::exception &e) {
        error("Failed to handle attach of device %s (%s)",dev.id.c_str(),e.what());
    }
}

void DeviceListener::deviceDetached(const std::string &deviceId) noexcept{
    std::unique_lock<std::mutex> ul(_attachLck);
    try {
        std::optional<Device> dev = _registry->get(deviceId);
        if (!dev || dev->state != Device::STATE_CONNECTED) {
            debug("Detach of unknown device %s, ignoring",deviceId.c_str());
            return;
        }
        info("Device disconnected: %s",deviceId.c_str());

        if (dev->session && _sessions) {
            Session session = *dev->session;
            _sessions->stopSession(*dev);
            session.status = Session::SESSION_STOPPED;
            dev->session.reset();
            _registry->upsert(*dev);
            _bus->publish(SessionStoppedEvent{*dev, session});
        }

        _bus->publish(DeviceDisconnectedEvent{*dev});
        if (_metrics) _metrics->recordDeviceDisconnected(dev->platform);
    } catch (tihmstar::exception &e) {
        error("Failed to handle detach of device %s with error=%d (%s)",deviceId.c_str(),e.code(),e.what());
    } catch (std::exception &e) {
        error("Failed to handle detach of device %s (%s)",deviceId.c_str(),e.what());
    }
}

void DeviceListener::disconnectAll() noexcept{
    std::unique_lock<std::mutex> ul(_attachLck);
    std::vector<Device> connected;
    try {
        connected = _registry->getConnected();
    } catch (std::exception &e) {
        error("Failed to list connected devices (%s)",e.what());
        return;
    }
    for (auto &dev : connected) {
        try {
            if (dev.session && _sessions) _sessions->stopSession(dev);
            _registry->markDisconnected(dev.id);
            if (_metrics) _metrics->recordDeviceDisconnected(dev.platform);
        } catch (tihmstar::exception &e) {
            error("Failed to disconnect device %s with error=%d (%s)",dev.id.c_str(),e.code(),e.what());
        } catch (std::exception &e) {
            error("Failed to disconnect device %s (%s)",dev.id.c_str(),e.what());
        }
    }
}
