//
//  DeviceManager.hpp
//  devagentd
//
//  Created on 17.10.26.
//

#ifndef DeviceManager_hpp
#define DeviceManager_hpp

#include <libgeneral/Manager.hpp>
#include "../Devices/DeviceListener.hpp"

class DeviceManager : public tihmstar::Manager {
protected:
    DeviceListener *_listener; //not owned
public:
    DeviceManager(DeviceListener *listener);
    virtual ~DeviceManager();
};
#endif /* DeviceManager_hpp */
