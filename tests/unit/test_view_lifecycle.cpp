#include <gtest/gtest.h>

#include <string>
#include <tabshell/task_scheduler.hpp>
#include <vector>

#include "lifecycle/view_lifecycle_controller.hpp"

using namespace tabshell;
using std::chrono::milliseconds;

// Records every callback as "name:epoch[:extra]".
class LifecycleTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        ViewLifecycleController::Callbacks cb;
        cb.on_load_start = [this](uint64_t e, const std::string& loc)
        { log_.push_back("start:" + std::to_string(e) + ":" + loc); };
        cb.on_network = [this](uint64_t e, const std::string&)
        { log_.push_back("network:" + std::to_string(e)); };
        cb.on_load_end = [this](uint64_t e, const std::string& loc, bool failed)
        { log_.push_back("end:" + std::to_string(e) + ":" + loc + (failed ? ":failed" : "")); };
        cb.on_dom_ready = [this](uint64_t e) { log_.push_back("dom:" + std::to_string(e)); };
        cb.on_cancelled = [this](uint64_t e, bool superseded)
        { log_.push_back("cancel:" + std::to_string(e) + (superseded ? ":superseded" : "")); };
        lc_.set_callbacks(std::move(cb));
    }

    ManualTaskScheduler      scheduler_;
    ViewLifecycleController  lc_{scheduler_, ViewLifecycleController::Timing{}};
    std::vector<std::string> log_;
};

TEST_F(LifecycleTest, StartsIdle)
{
    EXPECT_EQ(lc_.state(), ViewLifecycleController::State::Idle);
    EXPECT_FALSE(lc_.is_loading());
    EXPECT_EQ(lc_.epoch(), 0u);
}

TEST_F(LifecycleTest, FullLoadRunsBothPhasesInOrder)
{
    lc_.start("A");
    EXPECT_TRUE(lc_.is_loading());
    EXPECT_EQ(lc_.pending_phases(), 2u);

    scheduler_.advance(milliseconds(99));
    EXPECT_EQ(log_, (std::vector<std::string>{"start:1:A"}));

    scheduler_.advance(milliseconds(1));
    EXPECT_EQ(log_.back(), "network:1");
    EXPECT_EQ(lc_.pending_phases(), 1u);

    scheduler_.advance(milliseconds(400));
    EXPECT_EQ(log_, (std::vector<std::string>{"start:1:A", "network:1", "end:1:A", "dom:1"}));
    EXPECT_EQ(lc_.state(), ViewLifecycleController::State::Loaded);
    EXPECT_FALSE(lc_.is_loading());
    EXPECT_EQ(lc_.pending_phases(), 0u);
}

TEST_F(LifecycleTest, CancelSuppressesLoadEnd)
{
    lc_.start("A");
    scheduler_.advance(milliseconds(150));
    lc_.cancel();
    scheduler_.run_all();

    EXPECT_EQ(log_, (std::vector<std::string>{"start:1:A", "network:1", "cancel:1"}));
    EXPECT_EQ(lc_.state(), ViewLifecycleController::State::Idle);
    EXPECT_EQ(scheduler_.pending(), 0u);
}

TEST_F(LifecycleTest, CancelWhenIdleIsSilent)
{
    lc_.cancel();
    lc_.stop();
    EXPECT_TRUE(log_.empty());
}

TEST_F(LifecycleTest, RestartCancelsPriorEpoch)
{
    lc_.start("A");
    scheduler_.advance(milliseconds(50));
    lc_.start("B");
    EXPECT_EQ(lc_.epoch(), 2u);
    EXPECT_EQ(lc_.pending_phases(), 2u);
    EXPECT_EQ(scheduler_.pending(), 2u);

    scheduler_.run_all();
    EXPECT_EQ(log_,
              (std::vector<std::string>{"start:1:A", "cancel:1:superseded", "start:2:B", "network:2",
                                        "end:2:B", "dom:2"}));
}

TEST_F(LifecycleTest, RestartAfterLoadedOpensNewEpoch)
{
    lc_.start("A");
    scheduler_.run_all();
    log_.clear();

    lc_.start("A");
    scheduler_.run_all();
    EXPECT_EQ(log_, (std::vector<std::string>{"start:2:A", "network:2", "end:2:A", "dom:2"}));
}

TEST_F(LifecycleTest, CompleteNowSkipsRemainingPhases)
{
    lc_.start("A");
    lc_.complete_now();
    scheduler_.run_all();

    EXPECT_EQ(log_, (std::vector<std::string>{"start:1:A", "end:1:A", "dom:1"}));
}

TEST_F(LifecycleTest, FailReportsFailedLoadEnd)
{
    lc_.start("A");
    scheduler_.advance(milliseconds(100));
    lc_.fail();

    EXPECT_EQ(log_.back(), "dom:1");
    EXPECT_EQ(log_[2], "end:1:A:failed");
    EXPECT_FALSE(lc_.is_loading());
}

TEST_F(LifecycleTest, CompleteAndFailIgnoredWhenNotLoading)
{
    lc_.complete_now();
    lc_.fail();
    EXPECT_TRUE(log_.empty());
}

TEST_F(LifecycleTest, RestartFromLoadEndHandlerKeepsNewEpochLive)
{
    bool restarted = false;
    ViewLifecycleController::Callbacks cb;
    cb.on_load_end = [&](uint64_t, const std::string&, bool)
    {
        if (!restarted)
        {
            restarted = true;
            lc_.start("B");
        }
    };
    cb.on_dom_ready = [this](uint64_t e) { log_.push_back("dom:" + std::to_string(e)); };
    lc_.set_callbacks(std::move(cb));

    lc_.start("A");
    scheduler_.advance(milliseconds(500));
    // dom-ready of epoch 1 is dropped: epoch 2 already started.
    EXPECT_TRUE(log_.empty());
    EXPECT_TRUE(lc_.is_loading());

    scheduler_.run_all();
    EXPECT_EQ(log_, (std::vector<std::string>{"dom:2"}));
}

TEST_F(LifecycleTest, DestructionCancelsPendingPhases)
{
    ManualTaskScheduler scheduler;
    {
        ViewLifecycleController lc(scheduler, ViewLifecycleController::Timing{});
        lc.start("A");
        EXPECT_EQ(scheduler.pending(), 2u);
    }
    EXPECT_EQ(scheduler.pending(), 0u);
}

TEST_F(LifecycleTest, CustomTiming)
{
    ManualTaskScheduler     scheduler;
    ViewLifecycleController lc(scheduler, {.network_delay = milliseconds(10),
                                           .completion_delay = milliseconds(20)});
    lc.start("A");
    scheduler.advance(milliseconds(20));
    EXPECT_EQ(lc.state(), ViewLifecycleController::State::Loaded);
}

TEST(LifecycleStateName, Names)
{
    EXPECT_STREQ(lifecycle_state_name(ViewLifecycleController::State::Idle), "idle");
    EXPECT_STREQ(lifecycle_state_name(ViewLifecycleController::State::Loading), "loading");
    EXPECT_STREQ(lifecycle_state_name(ViewLifecycleController::State::Loaded), "loaded");
}
