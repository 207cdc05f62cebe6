//
//  test_event_bus.cpp
//  devagentd
//
//  Created on 17.10.26.
//

#include <gtest/gtest.h>

#include "Events/EventBus.hpp"
#include "Events/Events.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct PingEvent{
    static constexpr const char *name = "Ping";
    int value;
};

class EventBusTest : public ::testing::Test {
protected:
    EventBus bus;
    std::vector<std::string> calls;
};

TEST_F(EventBusTest, HandlersRunInSubscriptionOrder) {
    bus.subscribe<PingEvent>([this](const PingEvent &ev){ calls.push_back("a" + std::to_string(ev.value)); });
    bus.subscribe<PingEvent>([this](const PingEvent &ev){ calls.push_back("b" + std::to_string(ev.value)); });
    bus.subscribe<PingEvent>([this](const PingEvent &ev){ calls.push_back("c" + std::to_string(ev.value)); });

    bus.publish(PingEvent{7});

    EXPECT_EQ(calls, (std::vector<std::string>{"a7", "b7", "c7"}));
}

TEST_F(EventBusTest, ThrowingHandlerDoesNotStopOthers) {
    bus.subscribe<PingEvent>([this](const PingEvent &){ calls.push_back("first"); });
    bus.subscribe<PingEvent>([](const PingEvent &){ throw std::runtime_error("handler failure"); });
    bus.subscribe<PingEvent>([this](const PingEvent &){ calls.push_back("third"); });

    EXPECT_NO_THROW(bus.publish(PingEvent{1}));
    EXPECT_EQ(calls, (std::vector<std::string>{"first", "third"}));
}

TEST_F(EventBusTest, UnsubscribeRemovesOnlyThatHandler) {
    auto a = bus.subscribe<PingEvent>([this](const PingEvent &){ calls.push_back("a"); });
    bus.subscribe<PingEvent>([this](const PingEvent &){ calls.push_back("b"); });

    EXPECT_TRUE(bus.unsubscribe<PingEvent>(a));
    EXPECT_FALSE(bus.unsubscribe<PingEvent>(a));
    EXPECT_EQ(bus.subscriberCount<PingEvent>(), 1u);

    bus.publish(PingEvent{0});
    EXPECT_EQ(calls, (std::vector<std::string>{"b"}));
}

TEST_F(EventBusTest, EventTypesAreIndependent) {
    bus.subscribe<DeviceConnectedEvent>([this](const DeviceConnectedEvent &ev){ calls.push_back("connected:" + ev.device.id); });
    bus.subscribe<DeviceDisconnectedEvent>([this](const DeviceDisconnectedEvent &ev){ calls.push_back("disconnected:" + ev.device.id); });

    bus.publish(DeviceConnectedEvent{Device("dev1", Device::PLATFORM_ANDROID)});

    EXPECT_EQ(calls, (std::vector<std::string>{"connected:dev1"}));
    EXPECT_EQ(bus.subscriberCount<DeviceConnectedEvent>(), 1u);
    EXPECT_EQ(bus.subscriberCount<SessionStartedEvent>(), 0u);
}

TEST_F(EventBusTest, PublishWithoutSubscribersIsNoop) {
    EXPECT_NO_THROW(bus.publish(SessionFailedEvent{Device("dev1", Device::PLATFORM_IOS), "no ports"}));
}

TEST_F(EventBusTest, HandlerMayUnsubscribeItselfDuringPublish) {
    EventBus::subscription_id self = 0;
    self = bus.subscribe<PingEvent>([this, &self](const PingEvent &){
        calls.push_back("once");
        bus.unsubscribe<PingEvent>(self);
    });
    bus.subscribe<PingEvent>([this](const PingEvent &){ calls.push_back("always"); });

    bus.publish(PingEvent{1});
    bus.publish(PingEvent{2});

    EXPECT_EQ(calls, (std::vector<std::string>{"once", "always", "always"}));
}

TEST_F(EventBusTest, HandlerSubscribedDuringPublishSeesNextEventOnly) {
    bus.subscribe<PingEvent>([this](const PingEvent &ev){
        calls.push_back("outer");
        if (ev.value == 1) {
            bus.subscribe<PingEvent>([this](const PingEvent &){ calls.push_back("late"); });
        }
    });

    bus.publish(PingEvent{1});
    EXPECT_EQ(calls, (std::vector<std::string>{"outer"}));

    bus.publish(PingEvent{2});
    EXPECT_EQ(calls, (std::vector<std::string>{"outer", "outer", "late"}));
}

} // namespace
