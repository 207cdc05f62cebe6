//
//  DeviceManager.cpp
//  devagentd
//
//  Created on 17.10.26.
//

#include "DeviceManager.hpp"

#include <libgeneral/macros.h>

DeviceManager::DeviceManager(DeviceListener *listener)
: _listener(listener)
{
    assure(_listener);
}

DeviceManager::~DeviceManager(){
    //
}
