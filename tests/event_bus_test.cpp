#include <gtest/gtest.h>
#include "../libmediagrab/include/event_bus.hpp"
#include "../libmediagrab/include/events.hpp"

#include <string>
#include <vector>

using namespace mediagrab;

TEST(EventBusTest, DeliversOnlyToMatchingType) {
    EventBus bus;
    std::vector<std::string> started;
    int completed = 0;
    bus.subscribe<RouteStartEvent>([&](const RouteStartEvent& e) { started.push_back(e.url); });
    bus.subscribe<RouteCompleteEvent>([&](const RouteCompleteEvent&) { ++completed; });

    bus.publish(RouteStartEvent{"https://example.com/a.mp4"});

    ASSERT_EQ(started.size(), 1u);
    EXPECT_EQ(started[0], "https://example.com/a.mp4");
    EXPECT_EQ(completed, 0);
}

TEST(EventBusTest, UnsubscribeStopsDelivery) {
    EventBus bus;
    int calls = 0;
    const auto id = bus.subscribe<RouteStartEvent>([&](const RouteStartEvent&) { ++calls; });
    bus.publish(RouteStartEvent{"x"});
    bus.unsubscribe(id);
    bus.publish(RouteStartEvent{"x"});

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(bus.subscriber_count<RouteStartEvent>(), 0u);
    bus.unsubscribe(id + 100);
}

TEST(EventBusTest, HandlerMaySubscribeWhilePublishing) {
    EventBus bus;
    int late_calls = 0;
    bus.subscribe<RouteStartEvent>([&](const RouteStartEvent&) {
        bus.subscribe<RouteStartEvent>([&](const RouteStartEvent&) { ++late_calls; });
    });

    bus.publish(RouteStartEvent{"first"});
    EXPECT_EQ(late_calls, 0);
    EXPECT_EQ(bus.subscriber_count<RouteStartEvent>(), 2u);

    bus.publish(RouteStartEvent{"second"});
    EXPECT_EQ(late_calls, 1);
}
