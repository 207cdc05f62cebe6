//
//  EventBus.cpp
//  devagentd
//
//  Created on 17.10.26.
//

#include "EventBus.hpp"

#include <libgeneral/macros.h>

#pragma mark EventBus
EventBus::EventBus()
: _nextId(1)
{
    //
}

EventBus::~EventBus(){
    //
}

EventBus::subscription_id EventBus::subscribeRaw(std::type_index type, std::function<void(const void *event)> handler){
    assure(handler);
    std::unique_lock<std::mutex> ul(_subscriptionsLck);
    subscription_id id = _nextId++;
    _subscriptions[type].push_back({id, handler});
    return id;
}

bool EventBus::unsubscribeRaw(std::type_index type, subscription_id id) noexcept{
    std::unique_lock<std::mutex> ul(_subscriptionsLck);
    auto subs = _subscriptions.find(type);
    if (subs == _subscriptions.end()) return false;
    for (auto it = subs->second.begin(); it != subs->second.end(); it++) {
        if (it->id == id) {
            subs->second.erase(it);
            return true;
        }
    }
    return false;
}

void EventBus::publishRaw(std::type_index type, const char *eventName, const void *event) noexcept{
    std::vector<Subscription> snapshot;
    {
        std::unique_lock<std::mutex> ul(_subscriptionsLck);
        auto subs = _subscriptions.find(type);
        if (subs == _subscriptions.end() || subs->second.empty()) {
            debug("[EventBus] no subscribers for %s",eventName);
            return;
        }
        snapshot = subs->second;
    }

    debug("[EventBus] publishing %s to %zu subscribers",eventName,snapshot.size());
    for (auto &sub : snapshot) {
        try {
            sub.handler(event);
        } catch (tihmstar::exception &e) {
            error("[EventBus] subscriber %llu for %s failed with error=%d (%s)",(unsigned long long)sub.id,eventName,e.code(),e.what());
        } catch (std::exception &e) {
            error("[EventBus] subscriber %llu for %s failed (%s)",(unsigned long long)sub.id,eventName,e.what());
        }
    }
}

size_t EventBus::subscriberCountRaw(std::type_index type) noexcept{
    std::unique_lock<std::mutex> ul(_subscriptionsLck);
    auto subs = _subscriptions.find(type);
    return (subs == _subscriptions.end()) ? 0 : subs->second.size();
}
