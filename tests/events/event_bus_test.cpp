#include <gtest/gtest.h>
#include "rup/events/event_bus.hpp"
#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace rup::events;

// Test event types
struct TestEvent {
    int value;
    std::string message;
};

struct AnotherEvent {
    double data;
};

TEST(EventBus, SubscribeAndEmit) {
    EventBus bus;

    bool handler_called = false;
    int received_value = 0;

    auto sub = bus.subscribe<TestEvent>([&](const TestEvent& e) {
        handler_called = true;
        received_value = e.value;
    });

    bus.emit(TestEvent{42, "test"});

    EXPECT_TRUE(handler_called);
    EXPECT_EQ(received_value, 42);
}

TEST(EventBus, MultipleSubscribers) {
    EventBus bus;

    int count = 0;

    auto a = bus.subscribe<TestEvent>([&](const TestEvent&) { count++; });
    auto b = bus.subscribe<TestEvent>([&](const TestEvent&) { count++; });
    auto c = bus.subscribe<TestEvent>([&](const TestEvent&) { count++; });

    bus.emit(TestEvent{1, "test"});

    EXPECT_EQ(count, 3);
}

TEST(EventBus, DifferentEventTypes) {
    EventBus bus;

    int test_count = 0;
    int another_count = 0;

    auto a = bus.subscribe<TestEvent>([&](const TestEvent&) { test_count++; });
    auto b = bus.subscribe<AnotherEvent>([&](const AnotherEvent&) { another_count++; });

    bus.emit(TestEvent{1, "test"});
    bus.emit(AnotherEvent{3.14});
    bus.emit(TestEvent{2, "test2"});

    EXPECT_EQ(test_count, 2);
    EXPECT_EQ(another_count, 1);
}

TEST(EventBus, SubscriptionGoingOutOfScopeUnsubscribes) {
    EventBus bus;

    int count = 0;
    {
        auto sub = bus.subscribe<TestEvent>([&](const TestEvent&) { count++; });
        bus.emit(TestEvent{1, "test"});
        EXPECT_EQ(count, 1);
    }

    bus.emit(TestEvent{2, "test"});
    EXPECT_EQ(count, 1);  // Still 1, handler was removed
    EXPECT_EQ(bus.subscriber_count<TestEvent>(), 0);
}

TEST(EventBus, ResetAndMerge) {
    EventBus bus;

    int count = 0;
    Subscription all;
    all.merge(bus.subscribe<TestEvent>([&](const TestEvent&) { count++; }));
    all.merge(bus.subscribe<AnotherEvent>([&](const AnotherEvent&) { count++; }));
    EXPECT_TRUE(all.active());

    bus.emit(TestEvent{1, "test"});
    bus.emit(AnotherEvent{1.0});
    EXPECT_EQ(count, 2);

    all.reset();
    EXPECT_FALSE(all.active());

    bus.emit(TestEvent{1, "test"});
    EXPECT_EQ(count, 2);
}

TEST(EventBus, MovedSubscriptionKeepsHandler) {
    EventBus bus;

    int count = 0;
    Subscription outer;
    {
        auto inner = bus.subscribe<TestEvent>([&](const TestEvent&) { count++; });
        outer = std::move(inner);
    }

    bus.emit(TestEvent{1, "test"});
    EXPECT_EQ(count, 1);
}

TEST(EventBus, NoSubscribers) {
    EventBus bus;

    // Should not crash when no subscribers
    EXPECT_NO_THROW(bus.emit(TestEvent{1, "test"}));
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;

    int count = 0;
    auto a = bus.subscribe<TestEvent>([](const TestEvent&) { throw std::runtime_error("boom"); });
    auto b = bus.subscribe<TestEvent>([&](const TestEvent&) { count++; });

    EXPECT_NO_THROW(bus.emit(TestEvent{1, "test"}));
    EXPECT_EQ(count, 1);
}

TEST(EventBus, HandlerMayUnsubscribeItself) {
    EventBus bus;

    int count = 0;
    Subscription self;
    self = bus.subscribe<TestEvent>([&](const TestEvent&) {
        count++;
        self.reset();
    });

    bus.emit(TestEvent{1, "test"});
    bus.emit(TestEvent{2, "test"});

    EXPECT_EQ(count, 1);
}

TEST(EventBus, ThreadSafety) {
    EventBus bus;
    std::atomic<int> count{0};

    // Subscribe from multiple threads
    std::vector<Subscription> subs(10);
    std::vector<std::thread> threads;
    for (int i = 0; i < 10; ++i) {
        threads.emplace_back([&bus, &count, &subs, i]() {
            subs[i] = bus.subscribe<TestEvent>([&count](const TestEvent&) {
                count++;
            });
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    // Emit event
    bus.emit(TestEvent{42, "test"});

    EXPECT_EQ(count, 10);
}

TEST(EventBus, ConcurrentEmit) {
    EventBus bus;
    std::atomic<int> count{0};

    auto sub = bus.subscribe<TestEvent>([&count](const TestEvent& e) {
        count += e.value;
    });

    // Emit from multiple threads
    std::vector<std::thread> threads;
    for (int i = 0; i < 100; ++i) {
        threads.emplace_back([&bus]() {
            bus.emit(TestEvent{1, "test"});
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(count, 100);
}

TEST(EventBus, SubscriberCount) {
    EventBus bus;

    EXPECT_EQ(bus.subscriber_count<TestEvent>(), 0);

    auto first = bus.subscribe<TestEvent>([](const TestEvent&) {});
    EXPECT_EQ(bus.subscriber_count<TestEvent>(), 1);

    auto second = bus.subscribe<TestEvent>([](const TestEvent&) {});
    EXPECT_EQ(bus.subscriber_count<TestEvent>(), 2);

    first.reset();
    EXPECT_EQ(bus.subscriber_count<TestEvent>(), 1);
}

TEST(EventBus, Clear) {
    EventBus bus;

    auto a = bus.subscribe<TestEvent>([](const TestEvent&) {});
    auto b = bus.subscribe<AnotherEvent>([](const AnotherEvent&) {});

    EXPECT_EQ(bus.subscriber_count<TestEvent>(), 1);
    EXPECT_EQ(bus.subscriber_count<AnotherEvent>(), 1);

    bus.clear();

    EXPECT_EQ(bus.subscriber_count<TestEvent>(), 0);
    EXPECT_EQ(bus.subscriber_count<AnotherEvent>(), 0);
}
