#include <gtest/gtest.h>

#include <tabshell/task_scheduler.hpp>
#include <vector>

using namespace tabshell;
using std::chrono::milliseconds;

// ─── ManualTaskScheduler ─────────────────────────────────────────────────────

TEST(ManualTaskScheduler, NothingRunsBeforeDue)
{
    ManualTaskScheduler s;
    int                 ran = 0;
    s.schedule(milliseconds(100), [&]() { ++ran; });

    EXPECT_EQ(s.advance(milliseconds(99)), 0u);
    EXPECT_EQ(ran, 0);
    EXPECT_EQ(s.advance(milliseconds(1)), 1u);
    EXPECT_EQ(ran, 1);
    EXPECT_EQ(s.pending(), 0u);
}

TEST(ManualTaskScheduler, RunsInDueThenScheduleOrder)
{
    ManualTaskScheduler s;
    std::vector<int>    order;
    s.schedule(milliseconds(20), [&]() { order.push_back(3); });
    s.schedule(milliseconds(10), [&]() { order.push_back(1); });
    s.schedule(milliseconds(10), [&]() { order.push_back(2); });

    s.advance(milliseconds(50));
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(s.elapsed(), milliseconds(50));
}

TEST(ManualTaskScheduler, CancelPreventsRun)
{
    ManualTaskScheduler s;
    int                 ran = 0;
    TaskId              id  = s.schedule(milliseconds(10), [&]() { ++ran; });

    EXPECT_TRUE(s.cancel(id));
    EXPECT_FALSE(s.cancel(id));
    s.run_all();
    EXPECT_EQ(ran, 0);
}

TEST(ManualTaskScheduler, CancelUnknownIdFails)
{
    ManualTaskScheduler s;
    EXPECT_FALSE(s.cancel(INVALID_TASK_ID));
    EXPECT_FALSE(s.cancel(12345));
}

TEST(ManualTaskScheduler, TaskIdsAreUniqueAndValid)
{
    ManualTaskScheduler s;
    TaskId              a = s.schedule(milliseconds(1), []() {});
    TaskId              b = s.schedule(milliseconds(1), []() {});
    EXPECT_NE(a, INVALID_TASK_ID);
    EXPECT_NE(a, b);
}

TEST(ManualTaskScheduler, NegativeDelayRunsOnNextAdvance)
{
    ManualTaskScheduler s;
    int                 ran = 0;
    s.schedule(milliseconds(-5), [&]() { ++ran; });
    s.advance(milliseconds(0));
    EXPECT_EQ(ran, 1);
}

TEST(ManualTaskScheduler, TaskScheduledFromTaskIsRelativeToItsDueTime)
{
    ManualTaskScheduler s;
    std::vector<milliseconds> at;
    s.schedule(milliseconds(10),
               [&]()
               {
                   at.push_back(s.elapsed());
                   s.schedule(milliseconds(10), [&]() { at.push_back(s.elapsed()); });
               });

    s.advance(milliseconds(100));
    ASSERT_EQ(at.size(), 2u);
    EXPECT_EQ(at[0], milliseconds(10));
    EXPECT_EQ(at[1], milliseconds(20));
}

TEST(ManualTaskScheduler, TaskMayCancelSibling)
{
    ManualTaskScheduler s;
    int                 ran    = 0;
    TaskId              second = INVALID_TASK_ID;
    s.schedule(milliseconds(10), [&]() { s.cancel(second); });
    second = s.schedule(milliseconds(20), [&]() { ++ran; });

    s.run_all();
    EXPECT_EQ(ran, 0);
}

TEST(ManualTaskScheduler, RunAllDrainsEverything)
{
    ManualTaskScheduler s;
    int                 ran = 0;
    s.schedule(milliseconds(5), [&]() { ++ran; });
    s.schedule(milliseconds(5000), [&]() { ++ran; });

    EXPECT_EQ(s.run_all(), 2u);
    EXPECT_EQ(ran, 2);
    EXPECT_EQ(s.elapsed(), milliseconds(5000));
}

// ─── SteadyTaskScheduler ─────────────────────────────────────────────────────

TEST(SteadyTaskScheduler, ZeroDelayRunsOnPoll)
{
    SteadyTaskScheduler s;
    int                 ran = 0;
    s.schedule(milliseconds(0), [&]() { ++ran; });
    EXPECT_EQ(s.poll(), 1u);
    EXPECT_EQ(ran, 1);
}

TEST(SteadyTaskScheduler, FarTaskDoesNotRun)
{
    SteadyTaskScheduler s;
    int                 ran = 0;
    s.schedule(milliseconds(60000), [&]() { ++ran; });
    EXPECT_EQ(s.poll(), 0u);
    EXPECT_EQ(ran, 0);
    EXPECT_GT(s.time_until_next(milliseconds(16)), milliseconds(1000));
}

TEST(SteadyTaskScheduler, IdleWaitWhenEmpty)
{
    SteadyTaskScheduler s;
    EXPECT_EQ(s.time_until_next(milliseconds(16)), milliseconds(16));
}
