#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <tabshell/task_scheduler.hpp>
#include <vector>

#include "shell/event_bus.hpp"

using namespace tabshell;

namespace
{

ShellEvent make(EventType type, ViewId view = 1)
{
    ShellEvent e;
    e.type    = type;
    e.view_id = view;
    return e;
}

}   // namespace

TEST(EventBus, DeliversToAllSubscribersInOrder)
{
    EventBus         bus;
    std::vector<int> calls;
    bus.subscribe([&](const ShellEvent&) { calls.push_back(1); });
    bus.subscribe([&](const ShellEvent&) { calls.push_back(2); });

    bus.emit(make(EventType::TabCreated));
    EXPECT_EQ(calls, (std::vector<int>{1, 2}));
    EXPECT_EQ(bus.subscriber_count(), 2u);
}

TEST(EventBus, UnsubscribeStopsDelivery)
{
    EventBus bus;
    int      n  = 0;
    auto     id = bus.subscribe([&](const ShellEvent&) { ++n; });
    bus.emit(make(EventType::TabCreated));
    bus.unsubscribe(id);
    bus.emit(make(EventType::TabCreated));
    EXPECT_EQ(n, 1);
}

TEST(EventBus, NestedEmitIsQueuedBehindCurrentEvent)
{
    EventBus                 bus;
    std::vector<std::string> a;
    std::vector<std::string> b;

    bus.subscribe(
        [&](const ShellEvent& e)
        {
            a.push_back(event_type_name(e.type));
            if (e.type == EventType::TabCreated)
                bus.emit(make(EventType::TabActivated));
        });
    bus.subscribe([&](const ShellEvent& e) { b.push_back(event_type_name(e.type)); });

    bus.emit(make(EventType::TabCreated));

    // Both subscribers see the same global order.
    EXPECT_EQ(a, (std::vector<std::string>{"tab-created", "tab-activated"}));
    EXPECT_EQ(b, a);
    EXPECT_EQ(bus.queued(), 0u);
}

TEST(EventBus, ThrowingSubscriberDoesNotBlockOthers)
{
    EventBus bus;
    int      n = 0;
    bus.subscribe([](const ShellEvent&) { throw std::runtime_error("bad handler"); });
    bus.subscribe([&](const ShellEvent&) { ++n; });

    bus.emit(make(EventType::TabClosed));
    bus.emit(make(EventType::TabClosed));
    EXPECT_EQ(n, 2);
}

TEST(EventBus, HandlerMayUnsubscribeItself)
{
    EventBus       bus;
    int            n  = 0;
    SubscriptionId id = 0;
    id = bus.subscribe(
        [&](const ShellEvent&)
        {
            ++n;
            bus.unsubscribe(id);
        });

    bus.emit(make(EventType::TabPinned));
    bus.emit(make(EventType::TabPinned));
    EXPECT_EQ(n, 1);
    EXPECT_EQ(bus.subscriber_count(), 0u);
}

// ─── Holds ───────────────────────────────────────────────────────────────────

TEST(EventBus, HoldDefersDeliveryUntilReleased)
{
    EventBus                 bus;
    std::vector<std::string> seen;
    bus.subscribe([&](const ShellEvent& e) { seen.push_back(event_type_name(e.type)); });

    {
        EventBus::Hold outer(bus);
        bus.emit(make(EventType::TabCreated));
        {
            EventBus::Hold inner(bus);
            bus.emit(make(EventType::TabActivated));
        }
        EXPECT_TRUE(seen.empty());
        EXPECT_EQ(bus.queued(), 2u);
        EXPECT_TRUE(bus.held());
    }

    EXPECT_FALSE(bus.held());
    EXPECT_EQ(seen, (std::vector<std::string>{"tab-created", "tab-activated"}));
}

TEST(EventBus, HoldTakenByHandlerDoesNotReenterDelivery)
{
    EventBus                 bus;
    std::vector<std::string> seen;
    bus.subscribe(
        [&](const ShellEvent& e)
        {
            seen.push_back(event_type_name(e.type));
            if (e.type == EventType::TabCreated)
            {
                EventBus::Hold hold(bus);
                bus.emit(make(EventType::TabClosed));
            }
            seen.push_back("/");
        });

    bus.emit(make(EventType::TabCreated));
    EXPECT_EQ(seen, (std::vector<std::string>{"tab-created", "/", "tab-closed", "/"}));
}

TEST(EventBus, NonStdThrowDropsQueueAndPropagates)
{
    EventBus                 bus;
    std::vector<std::string> seen;
    bus.subscribe(
        [&](const ShellEvent& e)
        {
            if (e.type == EventType::TabClosed)
                throw 7;
            seen.push_back(event_type_name(e.type));
        });

    bus.hold();
    bus.emit(make(EventType::TabCreated));
    bus.emit(make(EventType::TabClosed));
    bus.emit(make(EventType::TabPinned));
    EXPECT_THROW(bus.release(), int);

    EXPECT_EQ(bus.queued(), 0u);
    EXPECT_FALSE(bus.held());

    // The dropped tab-pinned does not resurface with a later event.
    bus.emit(make(EventType::TabActivated));
    EXPECT_EQ(seen, (std::vector<std::string>{"tab-created", "tab-activated"}));
}

TEST(HoldingTaskScheduler, TaskEventsArriveAfterTheTask)
{
    EventBus             bus;
    ManualTaskScheduler  inner;
    HoldingTaskScheduler scheduler(inner, bus);

    int delivered        = 0;
    int delivered_inside = -1;
    bus.subscribe([&](const ShellEvent&) { ++delivered; });

    scheduler.schedule(std::chrono::milliseconds(10),
                       [&]()
                       {
                           bus.emit(make(EventType::NetworkActivity));
                           bus.emit(make(EventType::LoadFinished));
                           delivered_inside = delivered;
                       });
    EXPECT_EQ(scheduler.pending(), 1u);

    inner.advance(std::chrono::milliseconds(10));
    EXPECT_EQ(delivered_inside, 0);
    EXPECT_EQ(delivered, 2);
    EXPECT_EQ(scheduler.pending(), 0u);
}

TEST(HoldingTaskScheduler, CancelReachesInnerScheduler)
{
    EventBus             bus;
    ManualTaskScheduler  inner;
    HoldingTaskScheduler scheduler(inner, bus);

    bool   ran = false;
    TaskId id  = scheduler.schedule(std::chrono::milliseconds(5), [&]() { ran = true; });
    EXPECT_TRUE(scheduler.cancel(id));
    inner.advance(std::chrono::milliseconds(10));
    EXPECT_FALSE(ran);
}

TEST(EventTypeName, WireNames)
{
    EXPECT_STREQ(event_type_name(EventType::TabLoading), "tab-loading");
    EXPECT_STREQ(event_type_name(EventType::TabMoved), "tab-moved");
    EXPECT_STREQ(event_type_name(EventType::WindowFocused), "window-focused");
    EXPECT_STREQ(event_type_name(EventType::DownloadStarted), "download-started");
    EXPECT_STREQ(event_type_name(EventType::Navigation), "navigation");
    EXPECT_STREQ(event_type_name(EventType::LoadFinished), "load-end");
}
