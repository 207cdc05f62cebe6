//
//  PortAllocator.cpp
//  devagentd
//
//  Created on 17.10.26.
//

#include "PortAllocator.hpp"

#include <libgeneral/macros.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#pragma mark PortAllocator
PortAllocator::PortAllocator(uint16_t minPort, uint16_t maxPort, port_probe probe)
: _minPort(minPort), _maxPort(maxPort)
, _probe(probe ? probe : bindProbe)
{
    retassure(minPort && minPort <= maxPort, "invalid port range %u-%u",minPort,maxPort);
    info("PortAllocator initialized with range %u-%u",minPort,maxPort);
}

PortAllocator::~PortAllocator(){
    //
}

std::optional<std::vector<uint16_t>> PortAllocator::allocateConsecutive(size_t count) noexcept{
    if (!count) {
        warning("[PortAllocator] invalid port count requested: %zu",count);
        return std::nullopt;
    }
    if (count > (size_t)(_maxPort - _minPort) + 1) {
        warning("[PortAllocator] %zu ports can never fit in range %u-%u",count,_minPort,_maxPort);
        return std::nullopt;
    }

    std::unique_lock<std::mutex> ul(_allocatedLck);
    for (uint32_t start = _minPort; start + count - 1 <= _maxPort; start++) {
        size_t i = 0;
        for (; i < count; i++) {
            uint16_t port = (uint16_t)(start + i);
            if (_allocated.count(port) || !_probe(port)) break;
        }
        if (i != count) {
            //no run can include the blocking port
            start += i;
            continue;
        }

        std::vector<uint16_t> ret;
        for (i = 0; i < count; i++) {
            ret.push_back((uint16_t)(start + i));
            _allocated.insert((uint16_t)(start + i));
        }
        debug("[PortAllocator] allocated %zu consecutive ports starting at %u",count,start);
        return ret;
    }

    warning("[PortAllocator] failed to allocate %zu consecutive ports in range %u-%u",count,_minPort,_maxPort);
    return std::nullopt;
}

void PortAllocator::release(const std::vector<uint16_t> &ports) noexcept{
    std::unique_lock<std::mutex> ul(_allocatedLck);
    for (uint16_t port : ports) {
        if (_allocated.erase(port)) {
            debug("[PortAllocator] released port %u",port);
        }
    }
}

bool PortAllocator::isInUse(uint16_t port) noexcept{
    {
        std::unique_lock<std::mutex> ul(_allocatedLck);
        if (_allocated.count(port)) return true;
    }
    return !_probe(port);
}

std::vector<uint16_t> PortAllocator::allocatedPorts() noexcept{
    std::unique_lock<std::mutex> ul(_allocatedLck);
    return {_allocated.begin(), _allocated.end()};
}

#pragma mark static
bool PortAllocator::bindProbe(uint16_t port) noexcept{
    int fd = -1;
    cleanup([&]{
        safeClose(fd);
    });
    struct sockaddr_in addr = {};

    if ((fd = socket(AF_INET, SOCK_STREAM, 0)) < 0) {
        warning("[PortAllocator] socket() failed while probing port %u",port);
        return false;
    }
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    if (bind(fd, (struct sockaddr*)&addr, sizeof(addr))) return false;
    if (listen(fd, 1)) return false;
    return true;
}
