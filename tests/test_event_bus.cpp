#include "../include/events/event_bus.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace econ;
using namespace econ::events;

#define TEST(name) void name()
#define RUN_TEST(name)                                                                                                 \
    do {                                                                                                               \
        std::cout << "Running " << #name << "... ";                                                                    \
        name();                                                                                                        \
        std::cout << "PASSED\n";                                                                                       \
    } while (0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))

TEST(test_publish_only_queues) {
    EventBus bus;
    int calls = 0;
    bus.subscribe([&](const EventEnvelope&) { ++calls; });

    bus.publish(ItemViewed{"p1", "sword"}, 100);
    ASSERT_EQ(calls, 0);
    ASSERT_EQ(bus.pending(), 1u);

    ASSERT_EQ(bus.dispatch(), 1u);
    ASSERT_EQ(calls, 1);
    ASSERT_EQ(bus.pending(), 0u);
    ASSERT_EQ(bus.dispatch(), 0u);
}

TEST(test_delivery_order) {
    EventBus bus;
    std::vector<std::string> order;
    bus.subscribe([&](const EventEnvelope& e) { order.push_back("a" + std::to_string(e.sequence)); });
    bus.subscribe([&](const EventEnvelope& e) { order.push_back("b" + std::to_string(e.sequence)); });

    bus.publish(ItemViewed{"p1", "x"}, 1);
    bus.publish(ItemViewed{"p1", "y"}, 2);
    bus.dispatch();

    std::vector<std::string> expected = {"a1", "b1", "a2", "b2"};
    ASSERT_EQ(order, expected);
}

TEST(test_partial_dispatch) {
    EventBus bus;
    for (int i = 0; i < 5; ++i) {
        bus.publish(ItemViewed{"p1", "x"}, static_cast<Timestamp>(i));
    }
    ASSERT_EQ(bus.dispatch(2), 2u);
    ASSERT_EQ(bus.pending(), 3u);
    ASSERT_EQ(bus.delivered(), 2u);
    ASSERT_EQ(bus.published(), 5u);
}

TEST(test_failing_handler_isolated) {
    EventBus bus;
    int healthy = 0;
    bus.subscribe([](const EventEnvelope&) { throw std::runtime_error("boom"); });
    bus.subscribe([&](const EventEnvelope&) { ++healthy; });

    bus.publish(ItemViewed{"p1", "x"}, 1);
    bus.publish(ItemViewed{"p1", "y"}, 2);
    bus.dispatch();

    ASSERT_EQ(healthy, 2);
    ASSERT_EQ(bus.handler_failures(), 2u);
}

TEST(test_handler_may_publish) {
    EventBus bus;
    int purchases = 0;
    bus.subscribe([&](const EventEnvelope& e) {
        if (std::holds_alternative<ItemViewed>(e.event)) {
            bus.publish(ItemPurchased{"p1", "x", {}}, e.timestamp);
        } else if (std::holds_alternative<ItemPurchased>(e.event)) {
            ++purchases;
        }
    });

    bus.publish(ItemViewed{"p1", "x"}, 1);
    bus.dispatch();
    ASSERT_EQ(purchases, 0);
    ASSERT_EQ(bus.pending(), 1u);
    bus.dispatch();
    ASSERT_EQ(purchases, 1);
}

TEST(test_unsubscribe) {
    EventBus bus;
    int calls = 0;
    auto id = bus.subscribe([&](const EventEnvelope&) { ++calls; });
    ASSERT_TRUE(bus.unsubscribe(id));
    ASSERT_FALSE(bus.unsubscribe(id));
    ASSERT_EQ(bus.subscriber_count(), 0u);

    bus.publish(ItemViewed{"p1", "x"}, 1);
    bus.dispatch();
    ASSERT_EQ(calls, 0);
}

TEST(test_visit_with_overloaded) {
    EventBus bus;
    int viewed = 0;
    int other = 0;
    bus.subscribe([&](const EventEnvelope& e) {
        std::visit(Overloaded{[&](const ItemViewed&) { ++viewed; }, [&](const auto&) { ++other; }}, e.event);
    });

    bus.publish(ItemViewed{"p1", "x"}, 1);
    bus.publish(BalanceChanged{"p1", "coins", 0, 10}, 2);
    bus.dispatch();
    ASSERT_EQ(viewed, 1);
    ASSERT_EQ(other, 1);
}

int main() {
    std::cout << "=== Event Bus Tests ===\n";

    RUN_TEST(test_publish_only_queues);
    RUN_TEST(test_delivery_order);
    RUN_TEST(test_partial_dispatch);
    RUN_TEST(test_failing_handler_isolated);
    RUN_TEST(test_handler_may_publish);
    RUN_TEST(test_unsubscribe);
    RUN_TEST(test_visit_with_overloaded);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}
