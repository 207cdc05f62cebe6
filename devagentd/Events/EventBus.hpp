//
//  EventBus.hpp
//  devagentd
//
//  Created on 17.10.26.
//

#ifndef EventBus_hpp
#define EventBus_hpp

#include <functional>
#include <map>
#include <mutex>
#include <typeindex>
#include <vector>

#include <stdint.h>

/*
 Typed publish/subscribe dispatcher.
 Handlers of one event type run synchronously in subscription order,
 outside of the bus lock, on the publishing thread.
 A throwing handler is logged and does not affect the others.
 */
class EventBus{
public:
    using subscription_id = uint64_t;

private:
    struct Subscription{
        subscription_id id;
        std::function<void(const void *event)> handler;
    };
    std::mutex _subscriptionsLck;
    subscription_id _nextId;
    std::map<std::type_index, std::vector<Subscription>> _subscriptions;

    subscription_id subscribeRaw(std::type_index type, std::function<void(const void *event)> handler);
    bool unsubscribeRaw(std::type_index type, subscription_id id) noexcept;
    void publishRaw(std::type_index type, const char *eventName, const void *event) noexcept;
    size_t subscriberCountRaw(std::type_index type) noexcept;

public:
    EventBus();
    EventBus(const EventBus&) = delete;
    ~EventBus();

    template <typename E>
    subscription_id subscribe(std::function<void(const E &event)> handler){
        return subscribeRaw(typeid(E), [handler](const void *event){
            handler(*static_cast<const E*>(event));
        });
    }

    template <typename E>
    bool unsubscribe(subscription_id id) noexcept{
        return unsubscribeRaw(typeid(E), id);
    }

    template <typename E>
    void publish(const E &event) noexcept{
        publishRaw(typeid(E), E::name, &event);
    }

    template <typename E>
    size_t subscriberCount() noexcept{
        return subscriberCountRaw(typeid(E));
    }
};

#endif /* EventBus_hpp */
