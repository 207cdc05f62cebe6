//
//  PortAllocator.hpp
//  devagentd
//
//  Created on 17.10.26.
//

#ifndef PortAllocator_hpp
#define PortAllocator_hpp

#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

#include <stdint.h>

class PortAllocator{
public:
    using port_probe = std::function<bool(uint16_t port)>; //true if the port can be bound

private:
    uint16_t _minPort;
    uint16_t _maxPort;
    port_probe _probe;
    std::mutex _allocatedLck;
    std::set<uint16_t> _allocated;

public:
    /*
     Allocates from the inclusive range [minPort, maxPort].
     Without a probe, candidates are verified with a loopback bind
     */
    PortAllocator(uint16_t minPort, uint16_t maxPort, port_probe probe = nullptr);
    ~PortAllocator();

    /*
     Returns the first run of count consecutive ports that are neither
     allocated nor bound by someone else, or nothing if the range is exhausted
     */
    std::optional<std::vector<uint16_t>> allocateConsecutive(size_t count) noexcept;
    void release(const std::vector<uint16_t> &ports) noexcept;
    bool isInUse(uint16_t port) noexcept;
    std::vector<uint16_t> allocatedPorts() noexcept;

    uint16_t minPort() const noexcept {return _minPort;}
    uint16_t maxPort() const noexcept {return _maxPort;}

    static bool bindProbe(uint16_t port) noexcept;
};

#endif /* PortAllocator_hpp */
